#pragma once
#include "dropwire/codec.hpp"
#include "dropwire/transport.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace dropwire {
namespace test {

// Wraps one end of a connection. Channel::send writes exactly one frame per
// send_all, so every outgoing frame can be inspected, dropped or damaged.
class FaultTransport final : public ITransport {
public:
  enum class Action { Pass, Drop, Corrupt };
  using Rule = std::function<Action(const Message&)>;
  using Hook = std::function<void(const Message&)>;

  explicit FaultTransport(ITransport& inner) : inner_(inner) {}

  void set_rule(Rule r) { rule_ = std::move(r); }
  void set_hook(Hook h) { hook_ = std::move(h); }

  void send_all(const std::uint8_t* data, std::size_t n) override {
    Bytes frame(data, data + n);
    DecodeResult r = decode(frame);
    Action a = Action::Pass;
    if (r.status == DecodeStatus::Ok) {
      {
        std::lock_guard<std::mutex> lk(mu_);
        sent_.push_back(r.message);
      }
      if (rule_) a = rule_(r.message);
      if (hook_) hook_(r.message);
    }
    if (a == Action::Drop) return;
    if (a == Action::Corrupt) frame.back() ^= 0x5A;
    inner_.send_all(frame.data(), frame.size());
  }

  std::size_t recv_some(std::uint8_t* out, std::size_t n, Millis timeout) override {
    return inner_.recv_some(out, n, timeout);
  }

  bool is_open() const noexcept override { return inner_.is_open(); }
  void close() noexcept override { inner_.close(); }

  std::vector<Message> sent() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sent_;
  }

private:
  ITransport& inner_;
  Rule rule_;
  Hook hook_;
  mutable std::mutex mu_;
  std::vector<Message> sent_;
};

// Plaintext ChunkData/ChunkAck index, or kNoChunk for anything else.
inline std::uint32_t chunk_index_of(const Message& m) {
  if (m.encrypted) return kNoChunk;
  if (m.type == MsgType::ChunkData) return ChunkDataPayload::parse(m.payload).index;
  if (m.type == MsgType::ChunkAck) return ChunkAckPayload::parse(m.payload).index;
  return kNoChunk;
}

// Applies action to the first `times` frames matching pred.
inline FaultTransport::Rule first_matching(std::function<bool(const Message&)> pred,
                                           FaultTransport::Action action, int times = 1) {
  auto left = std::make_shared<int>(times);
  return [pred, action, left](const Message& m) {
    if (*left > 0 && pred(m)) {
      --*left;
      return action;
    }
    return FaultTransport::Action::Pass;
  };
}

} // namespace test
} // namespace dropwire

#pragma once
#include "codec.hpp"
#include "crypto.hpp"
#include "transport.hpp"
#include <memory>

namespace dropwire {

// The peer ended the session with an Abort or Error message.
class PeerTerminated : public Error {
public:
  PeerTerminated(ErrorKind kind, const std::string& msg, FailureReason reason)
    : Error(kind, msg, reason) {}
};

enum class RecvStatus {
  Ok,        // verified message, payload is plaintext
  Timeout,   // nothing complete arrived in time
  Rejected   // hash or tag mismatch; the message was dropped
};

struct Inbound {
  RecvStatus status{RecvStatus::Timeout};
  MsgType type{MsgType::Handshake};  // header type, also set for Rejected
  Bytes payload;
};

// Message-level view of a transport: framing, payload hashing and,
// once keys are installed, encryption. Invalid frames throw Error(Protocol).
class Channel {
public:
  Channel(ITransport& t, const char* log_tag);

  void enable_encryption(Role role, const TrafficKeys& keys);
  bool encrypted() const { return crypto_ != nullptr; }

  void send(MsgType type, const Bytes& plaintext);

  // Waits at most timeout for one complete frame.
  Inbound recv(Millis timeout);

  ITransport& transport() { return t_; }

private:
  ITransport& t_;
  const char* tag_;
  FrameDecoder decoder_;
  std::unique_ptr<CryptoChannel> crypto_;

  Inbound verify(Message m);
};

// Throws PeerTerminated for a verified Abort or Error message.
[[noreturn]] void raise_peer_termination(const Inbound& in);

} // namespace dropwire

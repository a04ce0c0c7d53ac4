#include "dropwire/transport.hpp"
#include "dropwire/errors.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace dropwire {

// One direction of a loopback connection.
struct LoopbackPipe {
  std::mutex mu;
  std::condition_variable cv;
  std::deque<std::uint8_t> bytes;
  bool closed{false};
};

std::pair<std::unique_ptr<LoopbackTransport>, std::unique_ptr<LoopbackTransport>>
LoopbackTransport::make_pair() {
  auto a_to_b = std::make_shared<LoopbackPipe>();
  auto b_to_a = std::make_shared<LoopbackPipe>();
  return {std::make_unique<LoopbackTransport>(b_to_a, a_to_b),
          std::make_unique<LoopbackTransport>(a_to_b, b_to_a)};
}

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackPipe> in, std::shared_ptr<LoopbackPipe> out)
  : in_(std::move(in)), out_(std::move(out)) {}

LoopbackTransport::~LoopbackTransport() { close(); }

void LoopbackTransport::send_all(const std::uint8_t* data, std::size_t n) {
  ensure(open_, ErrorKind::Transport, "send on closed socket");
  {
    std::lock_guard<std::mutex> lk(out_->mu);
    ensure(!out_->closed, ErrorKind::Transport, "connection closed by peer");
    out_->bytes.insert(out_->bytes.end(), data, data + n);
  }
  out_->cv.notify_all();
}

std::size_t LoopbackTransport::recv_some(std::uint8_t* out, std::size_t n, Millis timeout) {
  ensure(open_, ErrorKind::Transport, "recv on closed socket");
  std::unique_lock<std::mutex> lk(in_->mu);
  in_->cv.wait_for(lk, timeout, [this] { return !in_->bytes.empty() || in_->closed; });
  if (in_->bytes.empty()) {
    ensure(!in_->closed, ErrorKind::Transport, "connection closed by peer");
    return 0;
  }
  std::size_t k = std::min(n, in_->bytes.size());
  std::copy(in_->bytes.begin(), in_->bytes.begin() + (std::ptrdiff_t)k, out);
  in_->bytes.erase(in_->bytes.begin(), in_->bytes.begin() + (std::ptrdiff_t)k);
  return k;
}

void LoopbackTransport::close() noexcept {
  if (!open_) return;
  open_ = false;
  for (auto* pipe : {in_.get(), out_.get()}) {
    {
      std::lock_guard<std::mutex> lk(pipe->mu);
      pipe->closed = true;
    }
    pipe->cv.notify_all();
  }
}

} // namespace dropwire

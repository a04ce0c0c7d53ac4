#pragma once
#include "errors.hpp"
#include "transport.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace dropwire {

// Inbound from the UI layer. Unset fields (empty host, port 0, no
// encryption choice) fall back to the SenderConfig values.
struct SendRequest {
  std::string file_path;
  std::string receiver_host;
  std::uint16_t receiver_port{0};
  std::optional<bool> encryption_enabled;
};

// Emitted after each acknowledged chunk.
struct ProgressUpdate {
  std::uint32_t chunks_sent{0};
  std::uint32_t chunks_total{0};
  std::uint64_t bytes_sent{0};
  std::uint64_t bytes_total{0};
};

enum class Outcome { Success, Aborted, Failed };

const char* to_string(Outcome o);

// Emitted exactly once when a session terminates.
struct TransferResult {
  Outcome outcome{Outcome::Failed};
  FailureReason reason{FailureReason::None};
  std::string detail;
};

// Receiver side: a file was verified and stored under its final name.
struct FileReceived {
  std::string path;
  std::uint64_t size{0};
};

using Event = std::variant<ProgressUpdate, TransferResult, FileReceived>;

// Mutex/condvar queue with a fixed capacity.
template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {}

  // false if full or closed
  bool try_push(T v) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_ || q_.size() >= capacity_) return false;
      q_.push_back(std::move(v));
    }
    cv_.notify_all();
    return true;
  }

  // Blocks while full; false once closed.
  bool push(T v) {
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return closed_ || q_.size() < capacity_; });
      if (closed_) return false;
      q_.push_back(std::move(v));
    }
    cv_.notify_all();
    return true;
  }

  std::optional<T> pop_for(Millis timeout) {
    std::optional<T> out;
    {
      std::unique_lock<std::mutex> lk(mu_);
      if (!cv_.wait_for(lk, timeout, [this] { return closed_ || !q_.empty(); })) return out;
      if (q_.empty()) return out;
      out = std::move(q_.front());
      q_.pop_front();
    }
    cv_.notify_all();
    return out;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
  }

private:
  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> q_;
  bool closed_{false};
};

} // namespace dropwire

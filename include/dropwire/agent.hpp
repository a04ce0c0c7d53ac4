#pragma once
#include "session.hpp"
#include "transport.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace dropwire {

// Runs send requests on a worker thread, one at a time. Events for every
// session go to events(); a request submitted while busy is refused.
class SendAgent {
public:
  explicit SendAgent(SenderConfig cfg, std::size_t event_capacity = 64);
  ~SendAgent();

  SendAgent(const SendAgent&) = delete;
  SendAgent& operator=(const SendAgent&) = delete;

  // false if a transfer is already running
  bool submit(SendRequest req);

  // Cancels the running transfer, if any.
  void cancel();

  bool busy() const { return busy_.load(); }
  BoundedQueue<Event>& events() { return events_; }

private:
  void worker();

  SenderConfig cfg_;
  BoundedQueue<Event> events_;
  BoundedQueue<SendRequest> requests_{1};
  std::atomic<bool> busy_{false};
  std::atomic<bool> stopping_{false};

  std::mutex mu_;
  SenderSession* active_{nullptr};  // guarded by mu_
  bool cancel_pending_{false};      // guarded by mu_

  std::thread thread_;
};

// Listens on the configured port and runs one ReceiverSession per
// connection, sequentially. Connections arriving meanwhile wait in the
// listen backlog.
class ReceiverServer {
public:
  explicit ReceiverServer(ReceiverConfig cfg, std::size_t event_capacity = 64);

  ReceiverServer(const ReceiverServer&) = delete;
  ReceiverServer& operator=(const ReceiverServer&) = delete;

  // Removes temp files left by an earlier run, then listens.
  void bind();

  std::uint16_t port() const { return listener_.local_port(); }

  // Accepts until stop(). Returns after the current session ends.
  void serve();

  // Accepts at most one connection within poll and runs its session.
  // Returns the result, or nothing if no client connected.
  std::optional<TransferResult> serve_one(Millis poll);

  // Safe from any thread: stops serve() and cancels the active session.
  void stop();

  BoundedQueue<Event>& events() { return events_; }
  const FileStore& store() const { return store_; }

private:
  ReceiverConfig cfg_;
  FileStore store_;
  BoundedQueue<Event> events_;
  TcpListener listener_;
  std::atomic<bool> stopping_{false};

  std::mutex mu_;
  ReceiverSession* active_{nullptr};  // guarded by mu_
};

} // namespace dropwire

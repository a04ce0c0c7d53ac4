#include "dropwire/agent.hpp"
#include "dropwire/util.hpp"

namespace dropwire {

// ------------------------------ SendAgent ------------------------------

SendAgent::SendAgent(SenderConfig cfg, std::size_t event_capacity)
  : cfg_(std::move(cfg)), events_(event_capacity) {
  thread_ = std::thread([this] { worker(); });
}

SendAgent::~SendAgent() {
  stopping_.store(true);
  cancel();
  requests_.close();
  events_.close();
  if (thread_.joinable()) thread_.join();
}

bool SendAgent::submit(SendRequest req) {
  bool expected = false;
  if (!busy_.compare_exchange_strong(expected, true)) {
    log_line("sender", "busy; request for " + req.file_path + " refused");
    return false;
  }
  if (!requests_.try_push(std::move(req))) {
    busy_.store(false);
    return false;
  }
  return true;
}

void SendAgent::cancel() {
  std::lock_guard<std::mutex> lk(mu_);
  if (active_) {
    active_->cancel();
  } else if (busy_.load()) {
    cancel_pending_ = true;
  }
}

void SendAgent::worker() {
  while (!stopping_.load()) {
    std::optional<SendRequest> req = requests_.pop_for(Millis(200));
    if (!req) continue;

    SenderSession session(cfg_, &events_);
    // idle again before the result is visible, so a resubmit is accepted
    session.on_finished([this](const TransferResult&) {
      {
        std::lock_guard<std::mutex> lk(mu_);
        active_ = nullptr;
      }
      busy_.store(false);
    });
    {
      std::lock_guard<std::mutex> lk(mu_);
      active_ = &session;
      if (cancel_pending_) session.cancel();
      cancel_pending_ = false;
    }

    TransferResult r = session.run(*req);
    log_line("sender", req->file_path + ": " + to_string(r.outcome));
  }
}

// ------------------------------ ReceiverServer ------------------------------

ReceiverServer::ReceiverServer(ReceiverConfig cfg, std::size_t event_capacity)
  : cfg_(std::move(cfg)), store_(cfg_.receive_directory), events_(event_capacity) {}

void ReceiverServer::bind() {
  std::size_t stale = store_.remove_stale_temp_files();
  if (stale) log_line("receiver", "removed " + std::to_string(stale) + " stale temp files");
  listener_.listen(cfg_.listen_host, cfg_.listen_port);
  log_line("receiver", "listening on port " + std::to_string(listener_.local_port()));
}

void ReceiverServer::serve() {
  while (!stopping_.load()) {
    serve_one(Millis(500));
  }
  listener_.close();
}

std::optional<TransferResult> ReceiverServer::serve_one(Millis poll) {
  std::unique_ptr<TcpTransport> conn = listener_.accept(poll);
  if (!conn) return std::nullopt;
  log_line("receiver", "connection from " + conn->peer_address());

  ReceiverSession session(cfg_, store_, &events_);
  {
    std::lock_guard<std::mutex> lk(mu_);
    active_ = &session;
    if (stopping_.load()) session.cancel();
  }

  TransferResult r = session.run(*conn);
  conn->close();

  {
    std::lock_guard<std::mutex> lk(mu_);
    active_ = nullptr;
  }
  return r;
}

void ReceiverServer::stop() {
  stopping_.store(true);
  std::lock_guard<std::mutex> lk(mu_);
  if (active_) active_->cancel();
}

} // namespace dropwire

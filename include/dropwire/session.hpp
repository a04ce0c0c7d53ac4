#pragma once
#include "channel.hpp"
#include "chunk_engine.hpp"
#include "config.hpp"
#include "events.hpp"
#include "file_store.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>

namespace dropwire {

enum class State {
  Idle,
  Connecting,        // sender only
  Handshaking,
  KeyExchanging,     // only when both peers agreed to encrypt
  MetadataExchange,
  Transferring,
  Completing,
  Complete,
  Aborted,
  Failed
};

const char* to_string(State s);
bool is_terminal(State s);

// One transfer over one connection. Session objects are single-use:
// run() may be called once, after which state() is terminal.
class TransferSession {
public:
  virtual ~TransferSession() = default;

  Role role() const { return role_; }
  State state() const { return state_.load(); }
  bool encrypted() const { return encrypted_; }

  // Cooperative: observed at the next state transition or between chunks.
  void cancel() { cancel_.store(true); }

  // Called on the session's thread once it is terminal, before the
  // TransferResult is pushed to the event queue.
  void on_finished(std::function<void(const TransferResult&)> fn) { on_finished_ = std::move(fn); }

protected:
  TransferSession(Role role, BoundedQueue<Event>* events);

  // Moves to next after checking the cancel flag; throws on an illegal edge.
  void transition(State next);

  // Waits for a verified message of the given type. Rejected frames are
  // dropped; Abort/Error raise PeerTerminated; stale ChunkAcks are skipped
  // when skip_acks is set; anything else is a protocol error.
  Inbound expect(Channel& ch, MsgType type, Millis timeout, const char* what, bool skip_acks = false);

  // Both sides send their ephemeral public key; the sender goes first.
  void key_exchange(Channel& ch, Millis timeout);

  // Terminal bookkeeping shared by both roles.
  TransferResult complete_ok();
  TransferResult terminate(Channel* ch, const Error& e, bool notify_peer);

  void publish(const TransferResult& r);
  void emit(Event ev, bool droppable);

  // Tells the peer why the session ended, if the link still works.
  virtual void notify_peer(Channel& ch, const Error& e) = 0;

  const char* tag() const { return to_string(role_); }

  Role role_;
  std::atomic<State> state_{State::Idle};
  std::atomic<bool> cancel_{false};
  bool encrypted_{false};
  BoundedQueue<Event>* events_;
  std::function<void(const TransferResult&)> on_finished_;
};

class SenderSession final : public TransferSession {
public:
  explicit SenderSession(SenderConfig cfg, BoundedQueue<Event>* events = nullptr);

  // Connects over TCP to the request's host and port, or the configured
  // ones when the request leaves them unset.
  TransferResult run(const SendRequest& req);

  // Uses an already-connected transport.
  TransferResult run(const SendRequest& req, ITransport& t);

private:
  // Fills fields the request left unset from cfg_.
  SendRequest resolve(const SendRequest& req) const;
  TransferResult execute(const SendRequest& req, const std::function<ITransport&()>& connect);

  bool handshake(Channel& ch, bool want_encryption);
  void send_metadata(Channel& ch, const FileMetadata& meta);
  void notify_peer(Channel& ch, const Error& e) override;

  SenderConfig cfg_;
};

class ReceiverSession final : public TransferSession {
public:
  ReceiverSession(const ReceiverConfig& cfg, const FileStore& store,
                  BoundedQueue<Event>* events = nullptr);

  TransferResult run(ITransport& t);

  // Set once the file was verified and stored.
  const std::optional<FileReceived>& received() const { return received_; }

private:
  bool handshake(Channel& ch);
  FileMetadata receive_metadata(Channel& ch);
  // Sanitizes the name in place; throws Error(Validation).
  void validate(FileMetadata& meta) const;
  void transfer(Channel& ch, ChunkReceiver& chunks);
  void await_complete(Channel& ch, ChunkReceiver& chunks);
  void notify_peer(Channel& ch, const Error& e) override;

  const ReceiverConfig& cfg_;
  const FileStore& store_;
  std::optional<FileReceived> received_;
};

} // namespace dropwire

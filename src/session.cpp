#include "dropwire/session.hpp"
#include "dropwire/util.hpp"
#include <thread>

namespace dropwire {

const char* to_string(State s) {
  switch (s) {
    case State::Idle: return "Idle";
    case State::Connecting: return "Connecting";
    case State::Handshaking: return "Handshaking";
    case State::KeyExchanging: return "KeyExchanging";
    case State::MetadataExchange: return "MetadataExchange";
    case State::Transferring: return "Transferring";
    case State::Completing: return "Completing";
    case State::Complete: return "Complete";
    case State::Aborted: return "Aborted";
    case State::Failed: return "Failed";
  }
  return "?";
}

bool is_terminal(State s) {
  return s == State::Complete || s == State::Aborted || s == State::Failed;
}

const char* to_string(Outcome o) {
  switch (o) {
    case Outcome::Success: return "success";
    case Outcome::Aborted: return "aborted";
    case Outcome::Failed: return "failed";
  }
  return "?";
}

static bool edge_allowed(State from, State to) {
  switch (from) {
    case State::Idle: return to == State::Connecting || to == State::Handshaking;
    case State::Connecting: return to == State::Handshaking;
    case State::Handshaking: return to == State::KeyExchanging || to == State::MetadataExchange;
    case State::KeyExchanging: return to == State::MetadataExchange;
    case State::MetadataExchange: return to == State::Transferring;
    case State::Transferring: return to == State::Completing;
    case State::Completing: return to == State::Complete;
    default: return false;
  }
}

// ------------------------------ TransferSession ------------------------------

TransferSession::TransferSession(Role role, BoundedQueue<Event>* events)
  : role_(role), events_(events) {}

void TransferSession::transition(State next) {
  if (cancel_.load()) fail(ErrorKind::UserAbort, "transfer cancelled");
  const State cur = state_.load();
  ensure(edge_allowed(cur, next), "illegal state transition");
  state_.store(next);
  log_line(tag(), std::string(to_string(cur)) + " -> " + to_string(next));
}

Inbound TransferSession::expect(Channel& ch, MsgType type, Millis timeout, const char* what, bool skip_acks) {
  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + timeout;

  for (;;) {
    auto left = std::chrono::duration_cast<Millis>(deadline - Clock::now());
    if (left.count() <= 0) {
      fail(ErrorKind::Transport, std::string("timed out waiting for ") + what, FailureReason::Timeout);
    }
    Inbound in = ch.recv(left);
    if (in.status == RecvStatus::Timeout) {
      fail(ErrorKind::Transport, std::string("timed out waiting for ") + what, FailureReason::Timeout);
    }
    if (in.status == RecvStatus::Rejected) continue;

    if (in.type == type) return in;
    if (skip_acks && in.type == MsgType::ChunkAck) continue;
    if (in.type == MsgType::Abort || in.type == MsgType::Error) raise_peer_termination(in);
    fail(ErrorKind::Protocol, std::string("expected ") + to_string(type) + ", got " + to_string(in.type));
  }
}

void TransferSession::key_exchange(Channel& ch, Millis timeout) {
  KeyPair kp = generate_keypair();
  KeyExchangePayload mine;
  mine.public_key = kp.public_key;
  KeyExchangePayload theirs;

  if (role_ == Role::Sender) {
    ch.send(MsgType::KeyExchange, mine.serialize());
    theirs = KeyExchangePayload::parse(expect(ch, MsgType::KeyExchange, timeout, "key exchange").payload);
  } else {
    theirs = KeyExchangePayload::parse(expect(ch, MsgType::KeyExchange, timeout, "key exchange").payload);
    ch.send(MsgType::KeyExchange, mine.serialize());
  }

  SecureBytes shared = x25519_shared_secret(kp.private_key, theirs.public_key);
  TrafficKeys tk = role_ == Role::Sender
                     ? derive_traffic_keys(shared, mine.public_key, theirs.public_key)
                     : derive_traffic_keys(shared, theirs.public_key, mine.public_key);
  ch.enable_encryption(role_, tk);
  secure_bzero(&tk, sizeof(tk));
  log_line(tag(), "session keys installed");
}

TransferResult TransferSession::complete_ok() {
  ensure(state_.load() == State::Completing, "illegal state transition");
  state_.store(State::Complete);
  log_line(tag(), "Completing -> Complete");

  TransferResult r;
  r.outcome = Outcome::Success;
  publish(r);
  return r;
}

TransferResult TransferSession::terminate(Channel* ch, const Error& e, bool notify) {
  const bool aborted = e.kind() == ErrorKind::UserAbort;

  if (notify && ch && ch->transport().is_open()) {
    try {
      notify_peer(*ch, e);
    } catch (const Error& ne) {
      log_line(tag(), std::string("could not notify peer: ") + ne.what());
    }
  }

  TransferResult r;
  r.outcome = aborted ? Outcome::Aborted : Outcome::Failed;
  r.reason = e.reason();
  r.detail = e.what();
  state_.store(aborted ? State::Aborted : State::Failed);

  if (aborted) {
    log_line(tag(), std::string("transfer aborted: ") + e.what());
  } else {
    log_warn(tag(), std::string("transfer failed (") + to_string(r.reason) + "): " + e.what());
  }
  publish(r);
  return r;
}

void TransferSession::publish(const TransferResult& r) {
  if (on_finished_) on_finished_(r);
  emit(r, false);
}

void TransferSession::emit(Event ev, bool droppable) {
  if (!events_) return;
  if (droppable) {
    if (!events_->try_push(std::move(ev))) log_line(tag(), "event queue full; progress update dropped");
  } else {
    events_->push(std::move(ev));
  }
}

// ------------------------------ SenderSession ------------------------------

SenderSession::SenderSession(SenderConfig cfg, BoundedQueue<Event>* events)
  : TransferSession(Role::Sender, events), cfg_(std::move(cfg)) {}

SendRequest SenderSession::resolve(const SendRequest& req) const {
  SendRequest out = req;
  if (out.receiver_host.empty()) out.receiver_host = cfg_.receiver_host;
  if (out.receiver_port == 0) out.receiver_port = cfg_.receiver_port;
  if (!out.encryption_enabled) out.encryption_enabled = cfg_.encryption_enabled;
  return out;
}

TransferResult SenderSession::run(const SendRequest& request) {
  const SendRequest req = resolve(request);
  TcpTransport tcp;
  return execute(req, [&]() -> ITransport& {
    tcp.connect(req.receiver_host, req.receiver_port, cfg_.timeouts.connect);
    log_line(tag(), "connected to " + tcp.peer_address());
    return tcp;
  });
}

TransferResult SenderSession::run(const SendRequest& request, ITransport& t) {
  return execute(resolve(request), [&]() -> ITransport& { return t; });
}

TransferResult SenderSession::execute(const SendRequest& req,
                                      const std::function<ITransport&()>& connect) {
  ensure(state() == State::Idle, "session already used");
  std::unique_ptr<Channel> ch;

  try {
    ChunkReader reader(req.file_path);
    FileMetadata meta;
    meta.filename = sanitize_filename(req.file_path);
    ensure(!meta.filename.empty(), ErrorKind::Validation, "file name is empty after sanitizing");
    meta.total_size = reader.size();
    meta.chunk_count = reader.chunk_count();
    meta.file_hash = hash_file(req.file_path);

    transition(State::Connecting);
    ITransport& t = connect();
    ch = std::make_unique<Channel>(t, tag());

    transition(State::Handshaking);
    if (handshake(*ch, req.encryption_enabled.value_or(false))) {
      transition(State::KeyExchanging);
      key_exchange(*ch, cfg_.timeouts.key_exchange);
    }

    transition(State::MetadataExchange);
    send_metadata(*ch, meta);

    transition(State::Transferring);
    ChunkSender chunks(*ch, reader, cfg_.retry, cfg_.timeouts.chunk_ack);
    chunks.run(cancel_, [this](const ProgressUpdate& p) { emit(p, true); });
    if (!digest_equal(reader.digest(), meta.file_hash)) {
      fail(ErrorKind::Integrity, "source file changed while sending", FailureReason::IntegrityMismatch);
    }
    if (chunks.retransmissions() > 0) {
      log_line(tag(), std::to_string(chunks.retransmissions()) + " chunk retransmissions");
    }

    transition(State::Completing);
    ch->send(MsgType::Complete, Bytes{});
    expect(*ch, MsgType::Complete, cfg_.timeouts.chunk_ack, "completion", true);
    log_line(tag(), "sent " + meta.filename + " (" + std::to_string(meta.total_size) + " bytes)");
    return complete_ok();
  } catch (const PeerTerminated& e) {
    return terminate(ch.get(), e, false);
  } catch (const Error& e) {
    return terminate(ch.get(), e, true);
  } catch (const std::exception& e) {
    return terminate(ch.get(), Error(ErrorKind::Protocol, e.what()), true);
  }
}

bool SenderSession::handshake(Channel& ch, bool want_encryption) {
  HandshakePayload hs;
  hs.protocol_version = kVersion;
  hs.encryption_requested = want_encryption;
  hs.peer_name = cfg_.peer_name;
  ch.send(MsgType::Handshake, hs.serialize());

  HandshakePayload reply =
    HandshakePayload::parse(expect(ch, MsgType::Handshake, cfg_.timeouts.handshake, "handshake reply").payload);
  if (reply.protocol_version != kVersion) {
    fail(ErrorKind::Protocol,
         "receiver speaks protocol version " + std::to_string(reply.protocol_version),
         FailureReason::VersionMismatch);
  }

  encrypted_ = want_encryption && reply.encryption_requested;
  if (want_encryption && !encrypted_) {
    log_warn(tag(), "receiver declined encryption; sending in plaintext");
  }
  log_line(tag(), "handshake with " + (reply.peer_name.empty() ? std::string("receiver") : reply.peer_name));
  return encrypted_;
}

void SenderSession::send_metadata(Channel& ch, const FileMetadata& meta) {
  const Bytes payload = meta.serialize();

  for (unsigned attempt = 1;; ++attempt) {
    ch.send(MsgType::Metadata, payload);
    if (await_ack(ch, kNoChunk, cfg_.timeouts.chunk_ack) == AckWait::Acked) return;

    if (attempt >= cfg_.retry.max_attempts) {
      fail(ErrorKind::Transport,
           "metadata not acknowledged after " + std::to_string(attempt) + " attempts",
           FailureReason::RetryLimitExceeded);
    }
    log_warn(tag(), "metadata attempt " + std::to_string(attempt) + " not acknowledged");
    std::this_thread::sleep_for(cfg_.retry.backoff * attempt);
  }
}

void SenderSession::notify_peer(Channel& ch, const Error& e) {
  AbortPayload ab;
  ab.reason = e.kind() == ErrorKind::UserAbort ? FailureReason::UserCancelled : e.reason();
  ch.send(MsgType::Abort, ab.serialize());
}

// ------------------------------ ReceiverSession ------------------------------

ReceiverSession::ReceiverSession(const ReceiverConfig& cfg, const FileStore& store,
                                 BoundedQueue<Event>* events)
  : TransferSession(Role::Receiver, events), cfg_(cfg), store_(store) {}

TransferResult ReceiverSession::run(ITransport& t) {
  ensure(state() == State::Idle, "session already used");
  Channel ch(t, tag());
  std::unique_ptr<IncomingFile> file;

  try {
    transition(State::Handshaking);
    if (handshake(ch)) {
      transition(State::KeyExchanging);
      key_exchange(ch, cfg_.timeouts.key_exchange);
    }

    transition(State::MetadataExchange);
    FileMetadata meta = receive_metadata(ch);
    file = std::make_unique<IncomingFile>(store_, meta);
    ch.send(MsgType::ChunkAck, ChunkAckPayload{kNoChunk, AckStatus::Ok}.serialize());
    log_line(tag(), "receiving " + meta.filename + " (" + std::to_string(meta.total_size) + " bytes, " +
             std::to_string(meta.chunk_count) + " chunks)");

    transition(State::Transferring);
    ChunkReceiver chunks(ch, *file);
    transfer(ch, chunks);

    if (chunks.duplicates() > 0) {
      log_line(tag(), std::to_string(chunks.duplicates()) + " duplicate chunks acknowledged again");
    }

    transition(State::Completing);
    await_complete(ch, chunks);
    const std::string path = file->finalize();
    received_ = FileReceived{path, meta.total_size};

    try {
      ch.send(MsgType::Complete, Bytes{});
    } catch (const Error& e) {
      // the file is verified and stored either way
      log_warn(tag(), std::string("completion not delivered: ") + e.what());
    }
    log_line(tag(), "stored " + path);
    emit(*received_, false);
    return complete_ok();
  } catch (const PeerTerminated& e) {
    return terminate(&ch, e, false);
  } catch (const Error& e) {
    return terminate(&ch, e, true);
  } catch (const std::exception& e) {
    return terminate(&ch, Error(ErrorKind::Protocol, e.what()), true);
  }
}

bool ReceiverSession::handshake(Channel& ch) {
  HandshakePayload hs =
    HandshakePayload::parse(expect(ch, MsgType::Handshake, cfg_.timeouts.handshake, "handshake").payload);
  log_line(tag(), "handshake from " + (hs.peer_name.empty() ? std::string("sender") : hs.peer_name) +
           (hs.encryption_requested ? ", encryption requested" : ""));
  if (hs.protocol_version != kVersion) {
    fail(ErrorKind::Protocol,
         "sender speaks protocol version " + std::to_string(hs.protocol_version),
         FailureReason::VersionMismatch);
  }

  encrypted_ = hs.encryption_requested && cfg_.encryption_allowed;
  if (hs.encryption_requested && !encrypted_) log_line(tag(), "encryption declined by configuration");

  HandshakePayload reply;
  reply.protocol_version = kVersion;
  reply.encryption_requested = encrypted_;
  reply.peer_name = "receiver";
  ch.send(MsgType::Handshake, reply.serialize());
  return encrypted_;
}

FileMetadata ReceiverSession::receive_metadata(Channel& ch) {
  for (;;) {
    Inbound in = ch.recv(cfg_.timeouts.idle);
    if (in.status == RecvStatus::Timeout) {
      fail(ErrorKind::Transport, "timed out waiting for metadata", FailureReason::Timeout);
    }
    if (in.status == RecvStatus::Rejected) {
      if (in.type == MsgType::Metadata) {
        ch.send(MsgType::ChunkAck, ChunkAckPayload{kNoChunk, AckStatus::Retry}.serialize());
      }
      continue;
    }

    if (in.type == MsgType::Metadata) {
      FileMetadata meta = FileMetadata::parse(in.payload);
      validate(meta);
      return meta;
    }
    if (in.type == MsgType::Abort || in.type == MsgType::Error) raise_peer_termination(in);
    fail(ErrorKind::Protocol, std::string("expected Metadata, got ") + to_string(in.type));
  }
}

void ReceiverSession::validate(FileMetadata& meta) const {
  const std::string name = sanitize_filename(meta.filename);
  if (name.empty()) fail(ErrorKind::Validation, "metadata carries no usable file name");
  if (name != meta.filename) log_line(tag(), "file name \"" + meta.filename + "\" stored as \"" + name + "\"");
  meta.filename = name;

  if (meta.total_size == 0) fail(ErrorKind::Validation, "metadata announces an empty file");
  if (meta.total_size > (std::uint64_t)(kNoChunk - 1) * kChunkSize) {
    fail(ErrorKind::Validation, "file of " + std::to_string(meta.total_size) + " bytes exceeds the chunk index space");
  }
  if (meta.chunk_count != chunk_count_for(meta.total_size)) {
    fail(ErrorKind::Validation,
         "chunk count " + std::to_string(meta.chunk_count) + " does not match size " +
         std::to_string(meta.total_size));
  }
  if (cfg_.max_file_size != 0 && meta.total_size > cfg_.max_file_size) {
    fail(ErrorKind::Validation,
         "file of " + std::to_string(meta.total_size) + " bytes exceeds the limit of " +
         std::to_string(cfg_.max_file_size));
  }
}

void ReceiverSession::transfer(Channel& ch, ChunkReceiver& chunks) {
  while (!chunks.complete()) {
    if (cancel_.load()) fail(ErrorKind::UserAbort, "receive cancelled");

    Inbound in = ch.recv(cfg_.timeouts.idle);
    if (in.status == RecvStatus::Timeout) {
      fail(ErrorKind::Transport, "sender went silent mid-transfer", FailureReason::Timeout);
    }
    if (in.status == RecvStatus::Rejected) {
      if (in.type == MsgType::ChunkData) chunks.on_rejected();
      continue;
    }

    switch (in.type) {
      case MsgType::ChunkData:
        chunks.on_chunk(in.payload);
        break;
      case MsgType::Metadata:
        // our metadata ack was lost; acknowledge again
        if (chunks.next_expected() == 0) {
          ch.send(MsgType::ChunkAck, ChunkAckPayload{kNoChunk, AckStatus::Ok}.serialize());
        }
        break;
      case MsgType::Abort:
      case MsgType::Error:
        raise_peer_termination(in);
      default:
        fail(ErrorKind::Protocol, std::string("unexpected ") + to_string(in.type) + " during transfer");
    }
  }
}

void ReceiverSession::await_complete(Channel& ch, ChunkReceiver& chunks) {
  for (;;) {
    Inbound in = ch.recv(cfg_.timeouts.idle);
    if (in.status == RecvStatus::Timeout) {
      fail(ErrorKind::Transport, "timed out waiting for completion", FailureReason::Timeout);
    }
    if (in.status == RecvStatus::Rejected) {
      if (in.type == MsgType::ChunkData) chunks.on_rejected();
      continue;
    }

    switch (in.type) {
      case MsgType::Complete:
        return;
      case MsgType::ChunkData:
        // resent last chunk after a lost ack
        chunks.on_chunk(in.payload);
        break;
      case MsgType::Abort:
      case MsgType::Error:
        raise_peer_termination(in);
      default:
        fail(ErrorKind::Protocol, std::string("unexpected ") + to_string(in.type) + " while completing");
    }
  }
}

void ReceiverSession::notify_peer(Channel& ch, const Error& e) {
  if (e.kind() == ErrorKind::UserAbort) {
    ch.send(MsgType::Abort, AbortPayload{FailureReason::UserCancelled}.serialize());
    return;
  }
  ErrorPayload ep;
  ep.code = e.reason();
  ep.message = e.what();
  ch.send(MsgType::Error, ep.serialize());
}

} // namespace dropwire

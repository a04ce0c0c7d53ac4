#include "dropwire/chunk_engine.hpp"
#include "dropwire/util.hpp"

#include <algorithm>
#include <filesystem>
#include <thread>

namespace dropwire {

static std::size_t expected_chunk_len(std::uint64_t total, std::uint32_t index) {
  const std::uint64_t off = (std::uint64_t)index * kChunkSize;
  return (std::size_t)std::min<std::uint64_t>(kChunkSize, total - off);
}

// ------------------------------ ChunkReader ------------------------------

ChunkReader::ChunkReader(const std::string& path) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) fail(ErrorKind::Validation, "not a regular file: " + path);
  size_ = fs::file_size(path, ec);
  if (ec) fail(ErrorKind::Validation, "cannot stat " + path + ": " + ec.message());
  if (size_ == 0) fail(ErrorKind::Validation, "refusing to send empty file " + path);

  chunk_count_ = chunk_count_for(size_);
  in_.open(path, std::ios::binary);
  if (!in_) fail(ErrorKind::Validation, "cannot open " + path);
}

ChunkRecord ChunkReader::read(std::uint32_t index) {
  ensure(index == next_index_ && index < chunk_count_, "chunks must be read sequentially");

  ChunkRecord rec;
  rec.index = index;
  rec.data.resize(expected_chunk_len(size_, index));
  in_.read((char*)rec.data.data(), (std::streamsize)rec.data.size());
  if ((std::size_t)in_.gcount() != rec.data.size()) {
    fail(ErrorKind::Storage, "source file shrank while sending (chunk " + std::to_string(index) + ")");
  }
  rec.hash = hash(rec.data);
  hasher_.update(rec.data);
  ++next_index_;
  return rec;
}

// ------------------------------ ChunkSender ------------------------------

AckWait await_ack(Channel& ch, std::uint32_t index, Millis timeout) {
  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + timeout;

  for (;;) {
    auto left = std::chrono::duration_cast<Millis>(deadline - Clock::now());
    if (left.count() <= 0) return AckWait::Retry;

    Inbound in = ch.recv(left);
    if (in.status == RecvStatus::Timeout) return AckWait::Retry;
    if (in.status == RecvStatus::Rejected) {
      // a corrupted ack counts as a NACK
      if (in.type == MsgType::ChunkAck) return AckWait::Retry;
      continue;
    }

    if (in.type == MsgType::ChunkAck) {
      ChunkAckPayload ack = ChunkAckPayload::parse(in.payload);
      if (ack.index != index) {
        log_line("sender", "ignoring ack for " + std::to_string(ack.index) +
                 " while waiting for " + std::to_string(index));
        continue;
      }
      return ack.status == AckStatus::Ok ? AckWait::Acked : AckWait::Retry;
    }
    if (in.type == MsgType::Abort || in.type == MsgType::Error) raise_peer_termination(in);
    fail(ErrorKind::Protocol, std::string("unexpected ") + to_string(in.type) + " during transfer");
  }
}


ChunkSender::ChunkSender(Channel& ch, ChunkReader& reader, const RetryPolicy& retry, Millis ack_timeout)
  : ch_(ch), reader_(reader), retry_(retry), ack_timeout_(ack_timeout) {}

void ChunkSender::run(const std::atomic<bool>& cancel, const ProgressFn& on_progress) {
  const std::uint32_t total = reader_.chunk_count();
  std::uint64_t bytes_sent = 0;

  for (std::uint32_t i = 0; i < total; ++i) {
    if (cancel.load()) fail(ErrorKind::UserAbort, "transfer cancelled");

    ChunkRecord rec = reader_.read(i);
    deliver(rec);
    bytes_sent += rec.data.size();

    log_line("sender", "chunk " + std::to_string(i + 1) + "/" + std::to_string(total) +
             " acked (" + to_hex(rec.hash).substr(0, 12) + ")");
    if (on_progress) on_progress(ProgressUpdate{i + 1, total, bytes_sent, reader_.size()});
  }
}

void ChunkSender::deliver(ChunkRecord& rec) {
  const Bytes payload = ChunkDataPayload{rec.index, rec.data}.serialize();

  for (;;) {
    if (rec.attempt_count >= retry_.max_attempts) {
      rec.ack_state = AckState::Failed;
      fail(ErrorKind::Transport,
           "chunk " + std::to_string(rec.index) + " not acknowledged after " +
           std::to_string(rec.attempt_count) + " attempts",
           FailureReason::RetryLimitExceeded);
    }
    if (rec.attempt_count > 0) {
      ++retransmissions_;
      std::this_thread::sleep_for(retry_.backoff * rec.attempt_count);
    }

    ++rec.attempt_count;
    rec.ack_state = AckState::Sent;
    ch_.send(MsgType::ChunkData, payload);

    if (await_ack(ch_, rec.index, ack_timeout_) == AckWait::Acked) {
      rec.ack_state = AckState::Acked;
      return;
    }
    log_warn("sender", "chunk " + std::to_string(rec.index) + " attempt " +
             std::to_string(rec.attempt_count) + "/" + std::to_string(retry_.max_attempts) +
             " not acknowledged");
  }
}

// ------------------------------ ChunkReceiver ------------------------------

ChunkReceiver::ChunkReceiver(Channel& ch, IncomingFile& file) : ch_(ch), file_(file) {}

void ChunkReceiver::on_chunk(const Bytes& payload) {
  ChunkDataPayload cd = ChunkDataPayload::parse(payload);
  const FileMetadata& meta = file_.metadata();

  if (complete() || cd.index != next_expected_) {
    ++duplicates_;
    log_line("receiver", "chunk " + std::to_string(cd.index) + " is not the expected " +
             std::to_string(next_expected_) + "; re-acking last received");
    ack(last_received(), AckStatus::Ok);
    return;
  }

  if (cd.data.size() != expected_chunk_len(meta.total_size, cd.index)) {
    fail(ErrorKind::Protocol, "chunk " + std::to_string(cd.index) + " has length " +
         std::to_string(cd.data.size()));
  }

  file_.append(cd.data);
  ++next_expected_;
  ack(cd.index, AckStatus::Ok);
}

void ChunkReceiver::on_rejected() {
  ack(next_expected_, AckStatus::Retry);
}

void ChunkReceiver::ack(std::uint32_t index, AckStatus status) {
  ch_.send(MsgType::ChunkAck, ChunkAckPayload{index, status}.serialize());
}

} // namespace dropwire

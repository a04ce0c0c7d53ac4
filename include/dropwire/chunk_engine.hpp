#pragma once
#include "channel.hpp"
#include "config.hpp"
#include "events.hpp"
#include "file_store.hpp"
#include "integrity.hpp"
#include <atomic>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>

namespace dropwire {

enum class AckState { Unsent, Sent, Acked, Failed };

// One chunk in flight; discarded once acknowledged.
struct ChunkRecord {
  std::uint32_t index{0};
  Bytes data;
  Digest hash{};
  AckState ack_state{AckState::Unsent};
  unsigned attempt_count{0};
};

// Sequential reader for the file being sent.
class ChunkReader {
public:
  // Throws Error(Validation) for a missing, unreadable or empty file.
  explicit ChunkReader(const std::string& path);

  std::uint64_t size() const { return size_; }
  std::uint32_t chunk_count() const { return chunk_count_; }

  // Chunks must be read in index order, each exactly once.
  ChunkRecord read(std::uint32_t index);

  // Digest of everything read so far; call once after the last chunk.
  Digest digest() { return hasher_.finish(); }

private:
  std::ifstream in_;
  std::uint64_t size_{0};
  std::uint32_t chunk_count_{0};
  std::uint32_t next_index_{0};
  StreamHasher hasher_;
};

enum class AckWait { Acked, Retry };

// Waits for the ChunkAck of one index. Acks for other indices are stale
// and skipped; a corrupted ack, a Retry status or the timeout yield Retry.
AckWait await_ack(Channel& ch, std::uint32_t index, Millis timeout);

// Lock-step sender: one chunk in flight, retried on timeout, NACK or a
// corrupted ack, up to RetryPolicy::max_attempts sends per chunk.
class ChunkSender {
public:
  using ProgressFn = std::function<void(const ProgressUpdate&)>;

  ChunkSender(Channel& ch, ChunkReader& reader, const RetryPolicy& retry, Millis ack_timeout);

  // Throws Error(UserAbort) when cancel is observed between chunks and
  // Error(Transport, RetryLimitExceeded) when a chunk exhausts its attempts.
  void run(const std::atomic<bool>& cancel, const ProgressFn& on_progress);

  std::uint64_t retransmissions() const { return retransmissions_; }

private:
  void deliver(ChunkRecord& rec);

  Channel& ch_;
  ChunkReader& reader_;
  RetryPolicy retry_;
  Millis ack_timeout_;
  std::uint64_t retransmissions_{0};
};

// Receiver half: accepts only the next expected index and acknowledges
// duplicates with the last accepted index, without writing them again.
class ChunkReceiver {
public:
  ChunkReceiver(Channel& ch, IncomingFile& file);

  // Verified ChunkData payload.
  void on_chunk(const Bytes& payload);

  // ChunkData that failed verification: ask for the expected chunk again.
  void on_rejected();

  bool complete() const { return next_expected_ == file_.metadata().chunk_count; }
  std::uint32_t next_expected() const { return next_expected_; }
  std::uint32_t last_received() const { return next_expected_ == 0 ? kNoChunk : next_expected_ - 1; }
  std::uint64_t duplicates() const { return duplicates_; }

private:
  void ack(std::uint32_t index, AckStatus status);

  Channel& ch_;
  IncomingFile& file_;
  std::uint32_t next_expected_{0};
  std::uint64_t duplicates_{0};
};

} // namespace dropwire

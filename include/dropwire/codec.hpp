#pragma once
#include "dropwire.hpp"
#include "errors.hpp"
#include "integrity.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace dropwire {

// Frame header:
//   magic(4) version(1) type(1) encrypted(1) payload_len(4, BE) payload_hash(32)
static constexpr std::array<std::uint8_t, 4> kMagic = {0x00, 0x00, 0xDE, 0x0F};
static constexpr std::size_t kHeaderLen = 4 + 1 + 1 + 1 + 4 + kDigestLen;
static constexpr std::uint32_t kMaxPayloadSize = 16 * 1024 * 1024;

// ChunkAck index meaning "nothing received yet"; also acknowledges metadata.
static constexpr std::uint32_t kNoChunk = 0xFFFFFFFFu;

enum class MsgType : std::uint8_t {
  Handshake   = 1,
  KeyExchange = 2,
  Metadata    = 3,
  ChunkData   = 4,
  ChunkAck    = 5,
  Complete    = 6,
  Abort       = 7,
  Error       = 8
};

const char* to_string(MsgType t);

struct Message {
  MsgType type{MsgType::Handshake};
  Bytes payload;          // as carried on the wire (ciphertext when encrypted)
  Digest payload_hash{};  // SHA-256 of the plaintext payload
  bool encrypted{false};

  bool operator==(const Message& o) const {
    return type == o.type && payload == o.payload &&
           payload_hash == o.payload_hash && encrypted == o.encrypted;
  }
};

// Plaintext message with its hash filled in.
Message make_message(MsgType type, Bytes payload);

Bytes encode(const Message& m);

enum class DecodeStatus { Ok, NeedMoreData, InvalidFrame };

enum class FrameFault { None, BadMagic, BadVersion, BadType, BadFlag, Oversized };

struct DecodeResult {
  DecodeStatus status{DecodeStatus::NeedMoreData};
  Message message;
  FrameFault fault{FrameFault::None};  // set for InvalidFrame
};

const char* to_string(FrameFault f);

// Incremental decoder: feed arbitrary read fragments, pull whole frames.
// Once InvalidFrame is reported the decoder stays invalid.
class FrameDecoder {
public:
  void feed(const std::uint8_t* data, std::size_t n);
  void feed(const Bytes& data) { feed(data.data(), data.size()); }

  DecodeResult next();

  std::size_t buffered() const { return buf_.size() - off_; }

private:
  Bytes buf_;
  std::size_t off_{0};
  FrameFault fault_{FrameFault::None};
};

// Single-shot decode of a complete buffer.
DecodeResult decode(const Bytes& frame);

// ------------------------------ Payloads ------------------------------

struct HandshakePayload {
  std::uint8_t protocol_version{kVersion};
  bool encryption_requested{false};
  std::string peer_name;

  Bytes serialize() const;
  static HandshakePayload parse(const Bytes& in);
};

struct KeyExchangePayload {
  std::array<std::uint8_t, kPublicKeyLen> public_key{};

  Bytes serialize() const;
  static KeyExchangePayload parse(const Bytes& in);
};

struct FileMetadata {
  std::string filename;
  std::uint64_t total_size{0};
  std::uint32_t chunk_count{0};
  Digest file_hash{};

  Bytes serialize() const;
  static FileMetadata parse(const Bytes& in);
};

// ceil(size / chunk_size)
std::uint32_t chunk_count_for(std::uint64_t size, std::size_t chunk_size = kChunkSize);

struct ChunkDataPayload {
  std::uint32_t index{0};
  Bytes data;

  Bytes serialize() const;
  static ChunkDataPayload parse(const Bytes& in);
};

enum class AckStatus : std::uint8_t { Ok = 0, Retry = 1 };

struct ChunkAckPayload {
  std::uint32_t index{kNoChunk};
  AckStatus status{AckStatus::Ok};

  Bytes serialize() const;
  static ChunkAckPayload parse(const Bytes& in);
};

struct AbortPayload {
  FailureReason reason{FailureReason::UserCancelled};

  Bytes serialize() const;
  static AbortPayload parse(const Bytes& in);
};

struct ErrorPayload {
  FailureReason code{FailureReason::PeerError};
  std::string message;

  Bytes serialize() const;
  static ErrorPayload parse(const Bytes& in);
};

} // namespace dropwire

#include "dropwire/codec.hpp"
#include "dropwire/util.hpp"

#include <cstring>
#include <limits>

namespace dropwire {

const char* to_string(MsgType t) {
  switch (t) {
    case MsgType::Handshake:   return "Handshake";
    case MsgType::KeyExchange: return "KeyExchange";
    case MsgType::Metadata:    return "Metadata";
    case MsgType::ChunkData:   return "ChunkData";
    case MsgType::ChunkAck:    return "ChunkAck";
    case MsgType::Complete:    return "Complete";
    case MsgType::Abort:       return "Abort";
    case MsgType::Error:       return "Error";
  }
  return "Unknown";
}

const char* to_string(FrameFault f) {
  switch (f) {
    case FrameFault::None:       return "none";
    case FrameFault::BadMagic:   return "bad magic";
    case FrameFault::BadVersion: return "unsupported protocol version";
    case FrameFault::BadType:    return "unknown message type";
    case FrameFault::BadFlag:    return "bad encrypted flag";
    case FrameFault::Oversized:  return "payload too large";
  }
  return "unknown";
}

static bool known_type(std::uint8_t t) {
  return t >= (std::uint8_t)MsgType::Handshake && t <= (std::uint8_t)MsgType::Error;
}

Message make_message(MsgType type, Bytes payload) {
  Message m;
  m.type = type;
  m.payload_hash = hash(payload);
  m.payload = std::move(payload);
  m.encrypted = false;
  return m;
}

// ------------------------------ Frames ------------------------------

Bytes encode(const Message& m) {
  ensure(m.payload.size() <= kMaxPayloadSize, ErrorKind::Protocol, "frame too large");

  Bytes out;
  out.reserve(kHeaderLen + m.payload.size());
  out.insert(out.end(), kMagic.begin(), kMagic.end());
  out.push_back(kVersion);
  out.push_back((std::uint8_t)m.type);
  out.push_back(m.encrypted ? 1 : 0);
  append_u32(out, (std::uint32_t)m.payload.size());
  out.insert(out.end(), m.payload_hash.begin(), m.payload_hash.end());
  out.insert(out.end(), m.payload.begin(), m.payload.end());
  return out;
}

void FrameDecoder::feed(const std::uint8_t* data, std::size_t n) {
  if (fault_ != FrameFault::None || n == 0) return;
  // drop consumed prefix before growing
  if (off_ > 0 && off_ >= buf_.size() / 2) {
    buf_.erase(buf_.begin(), buf_.begin() + (std::ptrdiff_t)off_);
    off_ = 0;
  }
  buf_.insert(buf_.end(), data, data + n);
}

DecodeResult FrameDecoder::next() {
  DecodeResult r;
  if (fault_ != FrameFault::None) {
    r.status = DecodeStatus::InvalidFrame;
    r.fault = fault_;
    return r;
  }
  if (buffered() < kHeaderLen) return r;

  const std::uint8_t* p = buf_.data() + off_;
  const std::uint8_t* end = buf_.data() + buf_.size();
  const std::uint8_t* start = p;

  if (std::memcmp(p, kMagic.data(), kMagic.size()) != 0) {
    fault_ = FrameFault::BadMagic;
  } else if (p[4] != kVersion) {
    fault_ = FrameFault::BadVersion;
  } else if (!known_type(p[5])) {
    fault_ = FrameFault::BadType;
  } else if (p[6] > 1) {
    fault_ = FrameFault::BadFlag;
  }
  if (fault_ != FrameFault::None) return next();

  p += 4;
  read_u8(p, end);  // version, checked above
  const auto type = (MsgType)read_u8(p, end);
  const bool encrypted = read_u8(p, end) == 1;
  const std::uint32_t len = read_u32(p, end);
  if (len > kMaxPayloadSize) {
    fault_ = FrameFault::Oversized;
    return next();
  }
  if ((std::size_t)(end - p) < kDigestLen + len) return r;

  r.message.type = type;
  r.message.encrypted = encrypted;
  std::memcpy(r.message.payload_hash.data(), p, kDigestLen);
  p += kDigestLen;
  r.message.payload.assign(p, p + len);
  p += len;

  off_ += (std::size_t)(p - start);
  if (off_ == buf_.size()) {
    buf_.clear();
    off_ = 0;
  }
  r.status = DecodeStatus::Ok;
  return r;
}

DecodeResult decode(const Bytes& frame) {
  FrameDecoder d;
  d.feed(frame);
  return d.next();
}

// ------------------------------ Payloads ------------------------------

static void append_str16(Bytes& out, const std::string& s) {
  ensure(s.size() <= (std::numeric_limits<std::uint16_t>::max)(), ErrorKind::Validation, "string too long");
  append_u16(out, (std::uint16_t)s.size());
  out.insert(out.end(), s.begin(), s.end());
}

static std::string read_str16(const std::uint8_t*& p, const std::uint8_t* end) {
  std::uint16_t n = read_u16(p, end);
  Bytes raw = read_vec(p, end, n);
  return std::string(raw.begin(), raw.end());
}

static void expect_end(const std::uint8_t* p, const std::uint8_t* end) {
  ensure(p == end, ErrorKind::Protocol, "trailing bytes");
}

Bytes HandshakePayload::serialize() const {
  Bytes out;
  out.push_back(protocol_version);
  out.push_back(encryption_requested ? 1 : 0);
  append_str16(out, peer_name);
  return out;
}

HandshakePayload HandshakePayload::parse(const Bytes& in) {
  const std::uint8_t* p = in.data();
  const std::uint8_t* end = in.data() + in.size();

  HandshakePayload hs;
  hs.protocol_version = read_u8(p, end);
  hs.encryption_requested = read_u8(p, end) != 0;
  hs.peer_name = read_str16(p, end);
  expect_end(p, end);
  return hs;
}

Bytes KeyExchangePayload::serialize() const {
  return Bytes(public_key.begin(), public_key.end());
}

KeyExchangePayload KeyExchangePayload::parse(const Bytes& in) {
  const std::uint8_t* p = in.data();
  const std::uint8_t* end = in.data() + in.size();

  KeyExchangePayload kx;
  auto pk = read_vec(p, end, kPublicKeyLen);
  std::memcpy(kx.public_key.data(), pk.data(), kPublicKeyLen);
  expect_end(p, end);
  return kx;
}

Bytes FileMetadata::serialize() const {
  Bytes out;
  append_str16(out, filename);
  append_u64(out, total_size);
  append_u32(out, chunk_count);
  out.insert(out.end(), file_hash.begin(), file_hash.end());
  return out;
}

FileMetadata FileMetadata::parse(const Bytes& in) {
  const std::uint8_t* p = in.data();
  const std::uint8_t* end = in.data() + in.size();

  FileMetadata md;
  md.filename = read_str16(p, end);
  md.total_size = read_u64(p, end);
  md.chunk_count = read_u32(p, end);
  auto fh = read_vec(p, end, kDigestLen);
  std::memcpy(md.file_hash.data(), fh.data(), kDigestLen);
  expect_end(p, end);
  return md;
}

std::uint32_t chunk_count_for(std::uint64_t size, std::size_t chunk_size) {
  std::uint64_t n = size / chunk_size + (size % chunk_size != 0 ? 1 : 0);
  ensure(n < kNoChunk, ErrorKind::Validation, "file too large for chunk index space");
  return (std::uint32_t)n;
}

Bytes ChunkDataPayload::serialize() const {
  Bytes out;
  out.reserve(4 + data.size());
  append_u32(out, index);
  out.insert(out.end(), data.begin(), data.end());
  return out;
}

ChunkDataPayload ChunkDataPayload::parse(const Bytes& in) {
  const std::uint8_t* p = in.data();
  const std::uint8_t* end = in.data() + in.size();

  ChunkDataPayload cd;
  cd.index = read_u32(p, end);
  cd.data.assign(p, end);
  return cd;
}

Bytes ChunkAckPayload::serialize() const {
  Bytes out;
  append_u32(out, index);
  out.push_back((std::uint8_t)status);
  return out;
}

ChunkAckPayload ChunkAckPayload::parse(const Bytes& in) {
  const std::uint8_t* p = in.data();
  const std::uint8_t* end = in.data() + in.size();

  ChunkAckPayload ack;
  ack.index = read_u32(p, end);
  std::uint8_t st = read_u8(p, end);
  ensure(st <= (std::uint8_t)AckStatus::Retry, ErrorKind::Protocol, "bad ack status");
  ack.status = (AckStatus)st;
  expect_end(p, end);
  return ack;
}

Bytes AbortPayload::serialize() const {
  return Bytes{(std::uint8_t)reason};
}

AbortPayload AbortPayload::parse(const Bytes& in) {
  const std::uint8_t* p = in.data();
  const std::uint8_t* end = in.data() + in.size();

  AbortPayload ab;
  ab.reason = (FailureReason)read_u8(p, end);
  expect_end(p, end);
  return ab;
}

Bytes ErrorPayload::serialize() const {
  Bytes out;
  out.push_back((std::uint8_t)code);
  append_str16(out, message);
  return out;
}

ErrorPayload ErrorPayload::parse(const Bytes& in) {
  const std::uint8_t* p = in.data();
  const std::uint8_t* end = in.data() + in.size();

  ErrorPayload ep;
  ep.code = (FailureReason)read_u8(p, end);
  ep.message = read_str16(p, end);
  expect_end(p, end);
  return ep;
}

} // namespace dropwire

#include "dropwire/channel.hpp"
#include "dropwire/util.hpp"

namespace dropwire {

Channel::Channel(ITransport& t, const char* log_tag) : t_(t), tag_(log_tag) {}

void Channel::enable_encryption(Role role, const TrafficKeys& keys) {
  crypto_ = std::make_unique<CryptoChannel>(role, keys);
}

void Channel::send(MsgType type, const Bytes& plaintext) {
  Message m;
  m.type = type;
  m.payload_hash = hash(plaintext);
  if (crypto_) {
    m.payload = crypto_->seal(type, plaintext);
    m.encrypted = true;
  } else {
    m.payload = plaintext;
  }
  Bytes frame = encode(m);
  t_.send_all(frame.data(), frame.size());
}

Inbound Channel::recv(Millis timeout) {
  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + timeout;
  std::uint8_t buf[16 * 1024];

  for (;;) {
    DecodeResult r = decoder_.next();
    if (r.status == DecodeStatus::Ok) return verify(std::move(r.message));
    if (r.status == DecodeStatus::InvalidFrame) {
      fail(ErrorKind::Protocol, std::string("invalid frame: ") + to_string(r.fault),
           r.fault == FrameFault::BadVersion ? FailureReason::VersionMismatch
                                             : FailureReason::ProtocolError);
    }

    auto left = std::chrono::duration_cast<Millis>(deadline - Clock::now());
    if (left.count() <= 0) return Inbound{};
    std::size_t n = t_.recv_some(buf, sizeof(buf), left);
    if (n == 0) return Inbound{};
    decoder_.feed(buf, n);
  }
}

Inbound Channel::verify(Message m) {
  Inbound in;
  in.type = m.type;
  in.status = RecvStatus::Rejected;

  if (m.encrypted != encrypted()) {
    // a plaintext frame after key exchange, or a sealed one without keys
    log_warn(tag_, std::string("dropped ") + to_string(m.type) + ": unexpected encryption state");
    return in;
  }

  Bytes plaintext;
  if (crypto_) {
    try {
      plaintext = crypto_->open(m.type, m.payload);
    } catch (const Error& e) {
      if (e.kind() != ErrorKind::Integrity) throw;
      log_warn(tag_, std::string("dropped ") + to_string(m.type) + ": " + e.what());
      return in;
    }
  } else {
    plaintext = std::move(m.payload);
  }

  if (!digest_equal(hash(plaintext), m.payload_hash)) {
    log_warn(tag_, std::string("dropped ") + to_string(m.type) + ": payload hash mismatch");
    return in;
  }

  in.status = RecvStatus::Ok;
  in.payload = std::move(plaintext);
  return in;
}

void raise_peer_termination(const Inbound& in) {
  if (in.type == MsgType::Abort) {
    AbortPayload ab = AbortPayload::parse(in.payload);
    if (ab.reason == FailureReason::UserCancelled) {
      throw PeerTerminated(ErrorKind::UserAbort, "peer cancelled the transfer", ab.reason);
    }
    throw PeerTerminated(ErrorKind::Protocol,
                         std::string("peer aborted: ") + to_string(ab.reason), ab.reason);
  }
  if (in.type == MsgType::Error) {
    ErrorPayload ep = ErrorPayload::parse(in.payload);
    const ErrorKind kind = ep.code == FailureReason::IntegrityMismatch ? ErrorKind::Integrity
                         : ep.code == FailureReason::ValidationError   ? ErrorKind::Validation
                                                                      : ErrorKind::Protocol;
    throw PeerTerminated(kind, "peer error (" + std::string(to_string(ep.code)) + "): " + ep.message,
                         ep.code);
  }
  fail(ErrorKind::Protocol, std::string("unexpected ") + to_string(in.type));
}

} // namespace dropwire

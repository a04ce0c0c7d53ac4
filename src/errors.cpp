#include "dropwire/errors.hpp"

namespace dropwire {

const char* to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::Protocol:   return "protocol error";
    case ErrorKind::Integrity:  return "integrity error";
    case ErrorKind::Transport:  return "transport error";
    case ErrorKind::Validation: return "validation error";
    case ErrorKind::UserAbort:  return "user abort";
    case ErrorKind::Crypto:     return "crypto error";
    case ErrorKind::Storage:    return "storage error";
  }
  return "unknown error";
}

FailureReason Error::reason() const noexcept {
  if (reason_ != FailureReason::None) return reason_;
  switch (kind_) {
    case ErrorKind::Protocol:   return FailureReason::ProtocolError;
    case ErrorKind::Integrity:  return FailureReason::IntegrityMismatch;
    case ErrorKind::Transport:  return FailureReason::TransportError;
    case ErrorKind::Validation: return FailureReason::ValidationError;
    case ErrorKind::UserAbort:  return FailureReason::UserCancelled;
    case ErrorKind::Crypto:     return FailureReason::ProtocolError;
    case ErrorKind::Storage:    return FailureReason::StorageError;
  }
  return FailureReason::ProtocolError;
}

void fail(ErrorKind kind, const std::string& msg, FailureReason reason) {
  throw Error(kind, msg, reason);
}

void ensure(bool ok, const char* msg) {
  if (!ok) throw std::runtime_error(msg);
}

void ensure(bool ok, ErrorKind kind, const char* msg) {
  if (!ok) throw Error(kind, msg);
}

const char* to_string(FailureReason r) {
  switch (r) {
    case FailureReason::None:               return "none";
    case FailureReason::ProtocolError:      return "protocol error";
    case FailureReason::VersionMismatch:    return "version mismatch";
    case FailureReason::IntegrityMismatch:  return "integrity mismatch";
    case FailureReason::RetryLimitExceeded: return "retry limit exceeded";
    case FailureReason::Timeout:            return "timeout";
    case FailureReason::TransportError:     return "transport error";
    case FailureReason::ValidationError:    return "validation error";
    case FailureReason::PeerError:          return "peer error";
    case FailureReason::Busy:               return "busy";
    case FailureReason::UserCancelled:      return "cancelled";
    case FailureReason::StorageError:       return "storage error";
  }
  return "unknown";
}

} // namespace dropwire

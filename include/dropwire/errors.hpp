#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace dropwire {

enum class ErrorKind {
  Protocol,    // bad magic/version/frame or malformed payload; never retried
  Integrity,   // payload hash or GCM tag mismatch
  Transport,   // socket failure, peer closed, timeout
  Validation,  // malformed metadata or send request
  UserAbort,   // explicit cancellation
  Crypto,      // an OpenSSL call failed
  Storage      // local file could not be read, written or renamed
};

const char* to_string(ErrorKind k);

// Surfaced in TransferResult and carried by Error/Abort messages.
enum class FailureReason : std::uint8_t {
  None               = 0,
  ProtocolError      = 1,
  VersionMismatch    = 2,
  IntegrityMismatch  = 3,
  RetryLimitExceeded = 4,
  Timeout            = 5,
  TransportError     = 6,
  ValidationError    = 7,
  PeerError          = 8,
  Busy               = 9,
  UserCancelled      = 10,
  StorageError       = 11
};

const char* to_string(FailureReason r);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& msg,
        FailureReason reason = FailureReason::None)
    : std::runtime_error(msg), kind_(kind), reason_(reason) {}

  ErrorKind kind() const noexcept { return kind_; }

  // Explicit reason if one was given, otherwise the default for kind().
  FailureReason reason() const noexcept;

private:
  ErrorKind kind_;
  FailureReason reason_;
};

[[noreturn]] void fail(ErrorKind kind, const std::string& msg,
                       FailureReason reason = FailureReason::None);

void ensure(bool ok, const char* msg);
void ensure(bool ok, ErrorKind kind, const char* msg);

} // namespace dropwire

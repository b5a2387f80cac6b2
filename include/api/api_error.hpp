#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace aigate {

// Closed set of failure kinds surfaced by the client. Grouped as transport,
// serialization, credential/identity, replay protection, attestation, quota
// and generic.
enum class ErrorKind {
  Timeout,
  NetworkFailure,
  StreamInterrupted,

  EncodingFailed,
  DecodingFailed,

  InvalidCredential,
  InvalidAppIdentity,
  InvalidTeamIdentity,

  TimestampExpired,
  NonceReused,
  InvalidSignature,

  AttestationRequired,
  DeviceNotRegistered,
  InvalidAttestation,
  AttestationRevoked,
  AttestationUnsupported,
  AttestationFailed,
  AttestationKeyMissing,
  SimulatorNotAllowed,

  RateLimited,
  QuotaExceeded,
  InsufficientBalance,

  MalformedRequest,
  ServerError,
  HttpStatus,
  Unknown,
};

const char *to_string(ErrorKind kind);

// Numeric code from my_error_codes.hpp for a kind.
int error_code_for(ErrorKind kind);

struct Error {
  ErrorKind kind{ErrorKind::Unknown};
  int code{0};
  std::string what;
  int response_status{0};
  std::optional<std::int64_t> retry_after;
  std::optional<std::string> server_code;

  friend std::ostream &operator<<(std::ostream &os, const Error &e) {
    os << "[" << to_string(e.kind) << "/" << e.code << "]";
    if (e.response_status != 0) {
      os << " status=" << e.response_status;
    }
    if (e.server_code) {
      os << " server_code=" << *e.server_code;
    }
    if (e.retry_after) {
      os << " retry_after=" << *e.retry_after << "s";
    }
    os << " " << e.what;
    return os;
  }
};

Error make_error(ErrorKind kind, std::string what);

class ApiException : public std::runtime_error {
public:
  explicit ApiException(Error error);

  const Error &error() const noexcept { return error_; }
  ErrorKind kind() const noexcept { return error_.kind; }

private:
  Error error_;
};

[[noreturn]] void throw_error(ErrorKind kind, std::string what);

} // namespace aigate

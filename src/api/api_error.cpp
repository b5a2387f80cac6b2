#include "api/api_error.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"

namespace aigate {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::NetworkFailure:
    return "network_failure";
  case ErrorKind::StreamInterrupted:
    return "stream_interrupted";
  case ErrorKind::EncodingFailed:
    return "encoding_failed";
  case ErrorKind::DecodingFailed:
    return "decoding_failed";
  case ErrorKind::InvalidCredential:
    return "invalid_credential";
  case ErrorKind::InvalidAppIdentity:
    return "invalid_app_identity";
  case ErrorKind::InvalidTeamIdentity:
    return "invalid_team_identity";
  case ErrorKind::TimestampExpired:
    return "timestamp_expired";
  case ErrorKind::NonceReused:
    return "nonce_reused";
  case ErrorKind::InvalidSignature:
    return "invalid_signature";
  case ErrorKind::AttestationRequired:
    return "attestation_required";
  case ErrorKind::DeviceNotRegistered:
    return "device_not_registered";
  case ErrorKind::InvalidAttestation:
    return "invalid_attestation";
  case ErrorKind::AttestationRevoked:
    return "attestation_revoked";
  case ErrorKind::AttestationUnsupported:
    return "attestation_unsupported";
  case ErrorKind::AttestationFailed:
    return "attestation_failed";
  case ErrorKind::AttestationKeyMissing:
    return "attestation_key_missing";
  case ErrorKind::SimulatorNotAllowed:
    return "simulator_not_allowed";
  case ErrorKind::RateLimited:
    return "rate_limited";
  case ErrorKind::QuotaExceeded:
    return "quota_exceeded";
  case ErrorKind::InsufficientBalance:
    return "insufficient_balance";
  case ErrorKind::MalformedRequest:
    return "malformed_request";
  case ErrorKind::ServerError:
    return "server_error";
  case ErrorKind::HttpStatus:
    return "http_status";
  case ErrorKind::Unknown:
    return "unknown";
  }
  return "unknown";
}

int error_code_for(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Timeout:
    return my_errors::NETWORK::TIMEOUT_ERROR;
  case ErrorKind::NetworkFailure:
    return my_errors::NETWORK::CONNECT_ERROR;
  case ErrorKind::StreamInterrupted:
    return my_errors::NETWORK::STREAM_INTERRUPTED;
  case ErrorKind::EncodingFailed:
    return my_errors::JSON::ENCODE_ERROR;
  case ErrorKind::DecodingFailed:
    return my_errors::JSON::DECODE_ERROR;
  case ErrorKind::InvalidCredential:
    return my_errors::AUTH::INVALID_CREDENTIAL;
  case ErrorKind::InvalidAppIdentity:
    return my_errors::AUTH::INVALID_APP_IDENTITY;
  case ErrorKind::InvalidTeamIdentity:
    return my_errors::AUTH::INVALID_TEAM_IDENTITY;
  case ErrorKind::TimestampExpired:
    return my_errors::AUTH::TIMESTAMP_EXPIRED;
  case ErrorKind::NonceReused:
    return my_errors::AUTH::NONCE_REUSED;
  case ErrorKind::InvalidSignature:
    return my_errors::AUTH::INVALID_SIGNATURE;
  case ErrorKind::AttestationRequired:
    return my_errors::ATTESTATION::REQUIRED;
  case ErrorKind::DeviceNotRegistered:
    return my_errors::ATTESTATION::DEVICE_NOT_REGISTERED;
  case ErrorKind::InvalidAttestation:
    return my_errors::ATTESTATION::INVALID;
  case ErrorKind::AttestationRevoked:
    return my_errors::ATTESTATION::REVOKED;
  case ErrorKind::AttestationUnsupported:
    return my_errors::ATTESTATION::UNSUPPORTED;
  case ErrorKind::AttestationFailed:
    return my_errors::ATTESTATION::FAILED;
  case ErrorKind::AttestationKeyMissing:
    return my_errors::ATTESTATION::KEY_MISSING;
  case ErrorKind::SimulatorNotAllowed:
    return my_errors::ATTESTATION::SIMULATOR_NOT_ALLOWED;
  case ErrorKind::RateLimited:
    return my_errors::QUOTA::RATE_LIMITED;
  case ErrorKind::QuotaExceeded:
    return my_errors::QUOTA::QUOTA_EXCEEDED;
  case ErrorKind::InsufficientBalance:
    return my_errors::QUOTA::INSUFFICIENT_BALANCE;
  case ErrorKind::MalformedRequest:
    return my_errors::HTTP::MALFORMED_REQUEST;
  case ErrorKind::ServerError:
    return my_errors::HTTP::SERVER_ERROR;
  case ErrorKind::HttpStatus:
    return my_errors::HTTP::UNEXPECTED_STATUS;
  case ErrorKind::Unknown:
    return my_errors::GENERAL::UNKNOWN;
  }
  return my_errors::GENERAL::UNKNOWN;
}

Error make_error(ErrorKind kind, std::string what) {
  Error err;
  err.kind = kind;
  err.code = error_code_for(kind);
  err.what = std::move(what);
  return err;
}

ApiException::ApiException(Error error)
    : std::runtime_error(fmt::format("{}: {}", to_string(error.kind),
                                     error.what)),
      error_(std::move(error)) {}

void throw_error(ErrorKind kind, std::string what) {
  throw ApiException(make_error(kind, std::move(what)));
}

} // namespace aigate

#include "api/error_classifier.hpp"

#include <boost/json.hpp>
#include <fmt/format.h>

#include <array>
#include <charconv>
#include <utility>

namespace aigate {
namespace json = boost::json;
namespace http = boost::beast::http;

namespace {

constexpr std::array<std::pair<std::string_view, ErrorKind>, 18> kCodeTable{{
    {"rate_limit_exceeded", ErrorKind::RateLimited},
    {"quota_exceeded", ErrorKind::QuotaExceeded},
    {"insufficient_credits", ErrorKind::InsufficientBalance},
    {"insufficient_balance", ErrorKind::InsufficientBalance},
    {"invalid_api_key", ErrorKind::InvalidCredential},
    {"missing_api_key", ErrorKind::InvalidCredential},
    {"invalid_signature", ErrorKind::InvalidSignature},
    {"missing_signature_headers", ErrorKind::InvalidSignature},
    {"timestamp_expired", ErrorKind::TimestampExpired},
    {"invalid_timestamp", ErrorKind::TimestampExpired},
    {"nonce_reused", ErrorKind::NonceReused},
    {"invalid_bundle_id", ErrorKind::InvalidAppIdentity},
    {"invalid_team_id", ErrorKind::InvalidTeamIdentity},
    {"attestation_required", ErrorKind::AttestationRequired},
    {"device_not_registered", ErrorKind::DeviceNotRegistered},
    {"invalid_attestation", ErrorKind::InvalidAttestation},
    {"attestation_revoked", ErrorKind::AttestationRevoked},
    {"simulator_not_allowed", ErrorKind::SimulatorNotAllowed},
}};

std::optional<std::string> string_member(const json::object &obj,
                                         std::string_view key) {
  if (auto *p = obj.if_contains(key)) {
    if (p->is_string()) {
      return std::string(p->as_string());
    }
  }
  return std::nullopt;
}

ErrorKind kind_for_status(int status) {
  if (status == 401) {
    return ErrorKind::InvalidCredential;
  }
  if (status == 429) {
    return ErrorKind::RateLimited;
  }
  if (status == 400) {
    return ErrorKind::MalformedRequest;
  }
  if (status >= 500 && status <= 599) {
    return ErrorKind::ServerError;
  }
  return ErrorKind::HttpStatus;
}

} // namespace

std::optional<ApiErrorBody> parse_api_error_body(std::string_view body) {
  boost::system::error_code ec;
  auto jv = json::parse(body, ec);
  if (ec || !jv.is_object()) {
    return std::nullopt;
  }
  auto *error_val = jv.as_object().if_contains("error");
  if (!error_val || !error_val->is_object()) {
    return std::nullopt;
  }
  const auto &eobj = error_val->as_object();
  // An error object without a message is not a gateway error body.
  auto message = string_member(eobj, "message");
  if (!message) {
    return std::nullopt;
  }
  ApiErrorBody parsed;
  parsed.message = std::move(*message);
  parsed.type = string_member(eobj, "type");
  parsed.code = string_member(eobj, "code");
  return parsed;
}

std::optional<std::int64_t> parse_retry_after(std::string_view value) {
  if (value.empty()) {
    return std::nullopt;
  }
  std::int64_t seconds = 0;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), seconds);
  if (ec != std::errc{} || ptr != value.data() + value.size() || seconds < 0) {
    return std::nullopt;
  }
  return seconds;
}

std::optional<ErrorKind> kind_for_server_code(std::string_view code) {
  for (const auto &[name, kind] : kCodeTable) {
    if (name == code) {
      return kind;
    }
  }
  return std::nullopt;
}

Error classify_http_error(int status, const http::fields &headers,
                          std::string_view body) {
  auto parsed = parse_api_error_body(body);

  std::optional<ErrorKind> kind;
  if (parsed && parsed->code) {
    kind = kind_for_server_code(*parsed->code);
  }
  if (!kind) {
    kind = kind_for_status(status);
  }

  std::string message;
  if (parsed && !parsed->message.empty()) {
    message = parsed->message;
  } else if (!body.empty()) {
    message = std::string(body);
  } else {
    message = "Unknown error";
  }

  Error err = make_error(*kind, std::move(message));
  err.response_status = status;
  if (parsed) {
    err.server_code = parsed->code;
  }
  if (*kind == ErrorKind::RateLimited) {
    auto it = headers.find("Retry-After");
    if (it != headers.end()) {
      err.retry_after = parse_retry_after(
          std::string_view(it->value().data(), it->value().size()));
    }
  }
  return err;
}

} // namespace aigate

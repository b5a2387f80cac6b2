#include <gtest/gtest.h>

#include <boost/beast/http/fields.hpp>

#include "api/api_response.hpp"
#include "api/error_classifier.hpp"

namespace {

namespace http = boost::beast::http;
using aigate::ErrorKind;

std::string error_body(const std::string &code,
                       const std::string &message = "boom") {
  return R"({"error":{"message":")" + message + R"(","type":"api_error","code":")" +
         code + R"("}})";
}

TEST(ErrorClassifierTest, ServerCodeWinsOverStatus) {
  struct Case {
    const char *code;
    ErrorKind kind;
  };
  const Case cases[] = {
      {"rate_limit_exceeded", ErrorKind::RateLimited},
      {"quota_exceeded", ErrorKind::QuotaExceeded},
      {"insufficient_credits", ErrorKind::InsufficientBalance},
      {"invalid_api_key", ErrorKind::InvalidCredential},
      {"invalid_signature", ErrorKind::InvalidSignature},
      {"timestamp_expired", ErrorKind::TimestampExpired},
      {"nonce_reused", ErrorKind::NonceReused},
      {"invalid_bundle_id", ErrorKind::InvalidAppIdentity},
      {"invalid_team_id", ErrorKind::InvalidTeamIdentity},
      {"attestation_required", ErrorKind::AttestationRequired},
      {"device_not_registered", ErrorKind::DeviceNotRegistered},
      {"invalid_attestation", ErrorKind::InvalidAttestation},
      {"attestation_revoked", ErrorKind::AttestationRevoked},
      {"simulator_not_allowed", ErrorKind::SimulatorNotAllowed},
  };
  http::fields none;
  for (const auto &c : cases) {
    auto err = aigate::classify_http_error(403, none, error_body(c.code));
    EXPECT_EQ(err.kind, c.kind) << c.code;
    EXPECT_EQ(err.response_status, 403);
    EXPECT_EQ(err.server_code.value_or(""), c.code);
    EXPECT_EQ(err.what, "boom");
  }
}

TEST(ErrorClassifierTest, FallsBackToStatus) {
  http::fields none;
  EXPECT_EQ(aigate::classify_http_error(401, none, "").kind,
            ErrorKind::InvalidCredential);
  EXPECT_EQ(aigate::classify_http_error(429, none, "").kind,
            ErrorKind::RateLimited);
  EXPECT_EQ(aigate::classify_http_error(400, none, "").kind,
            ErrorKind::MalformedRequest);
  EXPECT_EQ(aigate::classify_http_error(503, none, "").kind,
            ErrorKind::ServerError);
  EXPECT_EQ(aigate::classify_http_error(404, none, "").kind,
            ErrorKind::HttpStatus);
  EXPECT_EQ(
      aigate::classify_http_error(418, none, error_body("brand_new_code")).kind,
      ErrorKind::HttpStatus);
}

TEST(ErrorClassifierTest, RetryAfterOnlyForRateLimits) {
  http::fields headers;
  headers.set("Retry-After", "30");
  auto limited = aigate::classify_http_error(
      429, headers, error_body("rate_limit_exceeded"));
  EXPECT_EQ(limited.kind, ErrorKind::RateLimited);
  EXPECT_EQ(limited.retry_after.value_or(-1), 30);

  auto server = aigate::classify_http_error(503, headers, "");
  EXPECT_FALSE(server.retry_after.has_value());

  http::fields bad;
  bad.set("Retry-After", "Wed, 21 Oct 2015 07:28:00 GMT");
  EXPECT_FALSE(aigate::classify_http_error(429, bad, "").retry_after);
}

TEST(ErrorClassifierTest, MessageFallsBackToBodyThenDefault) {
  http::fields none;
  EXPECT_EQ(aigate::classify_http_error(502, none, "Bad Gateway").what,
            "Bad Gateway");
  EXPECT_EQ(aigate::classify_http_error(502, none, "").what, "Unknown error");
  auto no_message =
      aigate::classify_http_error(400, none, R"({"error":{"code":"x"}})");
  EXPECT_EQ(no_message.what, R"({"error":{"code":"x"}})");
}

TEST(ErrorClassifierTest, ParsesErrorBody) {
  auto parsed = aigate::parse_api_error_body(error_body("nonce_reused", "dup"));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->message, "dup");
  EXPECT_EQ(parsed->type.value(), "api_error");
  EXPECT_EQ(parsed->code.value(), "nonce_reused");

  EXPECT_FALSE(aigate::parse_api_error_body("<html/>").has_value());
  EXPECT_FALSE(aigate::parse_api_error_body(R"({"message":"x"})").has_value());
  EXPECT_FALSE(
      aigate::parse_api_error_body(R"({"error":{"code":"nonce_reused"}})")
          .has_value());
}

TEST(ErrorClassifierTest, UnknownCodeUsesStatusMapping) {
  http::fields none;
  auto err = aigate::classify_http_error(
      401, none, error_body("missing_attestation", "m"));
  EXPECT_EQ(err.kind, ErrorKind::InvalidCredential);
  EXPECT_EQ(err.server_code.value_or(""), "missing_attestation");
  EXPECT_EQ(err.what, "m");
}

TEST(ErrorClassifierTest, ErrorBodyWithoutMessageUsesStatusMapping) {
  http::fields none;
  const std::string body = R"({"error":{"code":"nonce_reused"}})";
  auto err = aigate::classify_http_error(401, none, body);
  EXPECT_EQ(err.kind, ErrorKind::InvalidCredential);
  EXPECT_FALSE(err.server_code.has_value());
  EXPECT_EQ(err.what, body);
}

TEST(ErrorClassifierTest, RetryAfterParsing) {
  EXPECT_EQ(aigate::parse_retry_after("0").value(), 0);
  EXPECT_EQ(aigate::parse_retry_after("120").value(), 120);
  EXPECT_FALSE(aigate::parse_retry_after(""));
  EXPECT_FALSE(aigate::parse_retry_after("-5"));
  EXPECT_FALSE(aigate::parse_retry_after("12s"));
}

TEST(BillingInfoTest, RequiresAllHeaders) {
  http::fields headers;
  headers.set("X-Credits-Used", "12");
  headers.set("X-Credits-Remaining", "988");
  EXPECT_FALSE(aigate::parse_billing_info(headers).has_value());

  headers.set("X-Credits-Overage", "false");
  auto info = aigate::parse_billing_info(headers);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->credits_used_cents, 12);
  EXPECT_EQ(info->credits_remaining_cents, 988);
  EXPECT_FALSE(info->is_overage);

  headers.set("X-Credits-Overage", "TRUE");
  EXPECT_TRUE(aigate::parse_billing_info(headers)->is_overage);
  headers.set("X-Credits-Overage", "1");
  EXPECT_TRUE(aigate::parse_billing_info(headers)->is_overage);

  headers.set("X-Credits-Used", "twelve");
  EXPECT_FALSE(aigate::parse_billing_info(headers).has_value());
}

} // namespace

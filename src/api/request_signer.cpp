#include "api/request_signer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <chrono>

#include "openssl/crypt_util.hpp"

namespace aigate {

RequestSigner::RequestSigner(std::string api_key, std::string bundle_id)
    : api_key_(std::move(api_key)), bundle_id_(std::move(bundle_id)) {}

std::string RequestSigner::signing_key() const {
  std::string normalized = bundle_id_;
  std::transform(
      normalized.begin(), normalized.end(), normalized.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return cryptutil::sha256(api_key_ + normalized);
}

SignedEnvelope RequestSigner::sign(std::optional<std::string_view> body) const {
  SignedEnvelope envelope;
  envelope.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
  envelope.nonce = cryptutil::generate_uuid_v4();
  envelope.signature =
      compute_signature(envelope.timestamp, envelope.nonce, body);
  return envelope;
}

std::string
RequestSigner::compute_signature(std::int64_t timestamp, std::string_view nonce,
                                 std::optional<std::string_view> body) const {
  const std::string body_hash_hex =
      cryptutil::sha256_hex(body.value_or(std::string_view{}));
  const std::string message =
      fmt::format("{}\n{}\n{}", timestamp, nonce, body_hash_hex);
  return cryptutil::base64_encode(
      cryptutil::hmac_sha256(signing_key(), message));
}

} // namespace aigate

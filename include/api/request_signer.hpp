#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace aigate {

struct SignedEnvelope {
  std::int64_t timestamp{0};
  std::string nonce;
  std::string signature;
};

// Signs requests with HMAC-SHA256 keyed by SHA256(api_key + lowercase(bundle
// id)). Stateless after construction; safe to share between threads.
class RequestSigner {
public:
  RequestSigner(std::string api_key, std::string bundle_id);

  // Current time in seconds plus a fresh UUID nonce.
  SignedEnvelope sign(std::optional<std::string_view> body) const;

  // message = "{timestamp}\n{nonce}\n{hex(SHA256(body))}", an absent body
  // hashes like an empty one. Result is base64 of the 32-byte MAC.
  std::string compute_signature(std::int64_t timestamp, std::string_view nonce,
                                std::optional<std::string_view> body) const;

private:
  std::string signing_key() const;

  std::string api_key_;
  std::string bundle_id_;
};

} // namespace aigate

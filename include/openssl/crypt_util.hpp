#pragma once

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <stddef.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace aigate {
namespace cryptutil {

using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// Raw 32-byte SHA-256 digest.
std::string sha256(std::string_view data);
std::string sha256_hex(std::string_view data);

// Raw 32-byte HMAC-SHA256 of msg under key.
std::string hmac_sha256(std::string_view key, std::string_view msg);

std::string to_hex(std::string_view raw);

// Standard alphabet, padded.
std::string base64_encode(std::string_view raw);

// Returns std::nullopt for input that is not valid padded base64.
std::optional<std::string> base64_decode(std::string_view encoded);

// Eight bytes, most significant first.
std::string big_endian_bytes(std::int64_t value);

// RFC 4122 version 4, uppercase 8-4-4-4-12.
std::string generate_uuid_v4();

} // namespace cryptutil
} // namespace aigate

#include "openssl/crypt_util.hpp"

#include <fmt/format.h>
#include <openssl/crypto.h>

#include <stdexcept>

namespace aigate {
namespace cryptutil {

std::string sha256(std::string_view data) {
  EVP_MD_CTX_ptr context{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
  if (!context) throw std::runtime_error("Failed to create context");

  if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize SHA256 digest.");
  }
  if (!data.empty() &&
      EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("Failed to update SHA256 digest.");
  }
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(context.get(), hash, &hash_len) != 1) {
    throw std::runtime_error("Failed to finalize SHA256 digest.");
  }
  return std::string(reinterpret_cast<const char*>(hash), hash_len);
}

std::string sha256_hex(std::string_view data) { return to_hex(sha256(data)); }

std::string hmac_sha256(std::string_view key, std::string_view msg) {
  unsigned char mac[EVP_MAX_MD_SIZE];
  unsigned int mac_len = 0;
  // HMAC rejects a null key pointer even when the length is zero.
  static const unsigned char empty_key = 0;
  const void* key_ptr = key.empty() ? static_cast<const void*>(&empty_key)
                                    : static_cast<const void*>(key.data());
  if (HMAC(EVP_sha256(), key_ptr, static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char*>(msg.data()), msg.size(), mac,
           &mac_len) == nullptr) {
    throw std::runtime_error("HMAC-SHA256 computation failed");
  }
  return std::string(reinterpret_cast<const char*>(mac), mac_len);
}

std::string to_hex(std::string_view raw) {
  std::string hex_str;
  hex_str.reserve(raw.size() * 2);
  for (unsigned char c : raw) {
    hex_str += fmt::format("{:02x}", c);
  }
  return hex_str;
}

std::string base64_encode(std::string_view raw) {
  if (raw.empty()) return {};
  std::string out(4 * ((raw.size() + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(
      reinterpret_cast<unsigned char*>(out.data()),
      reinterpret_cast<const unsigned char*>(raw.data()),
      static_cast<int>(raw.size()));
  if (written < 0) {
    throw std::runtime_error("base64 encoding failed");
  }
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::optional<std::string> base64_decode(std::string_view encoded) {
  if (encoded.empty()) return std::string{};
  if (encoded.size() % 4 != 0) return std::nullopt;

  std::string out(3 * (encoded.size() / 4), '\0');
  const int written = EVP_DecodeBlock(
      reinterpret_cast<unsigned char*>(out.data()),
      reinterpret_cast<const unsigned char*>(encoded.data()),
      static_cast<int>(encoded.size()));
  if (written < 0) return std::nullopt;

  // EVP_DecodeBlock counts padding as zero bytes.
  std::size_t padding = 0;
  if (encoded.back() == '=') ++padding;
  if (encoded.size() >= 2 && encoded[encoded.size() - 2] == '=') ++padding;
  out.resize(static_cast<std::size_t>(written) - padding);
  return out;
}

std::string big_endian_bytes(std::int64_t value) {
  const auto bits = static_cast<std::uint64_t>(value);
  std::string out(8, '\0');
  for (int i = 0; i < 8; ++i) {
    out[static_cast<std::size_t>(i)] =
        static_cast<char>((bits >> (8 * (7 - i))) & 0xFF);
  }
  return out;
}

std::string generate_uuid_v4() {
  unsigned char b[16];
  if (RAND_bytes(b, sizeof(b)) != 1) {
    throw std::runtime_error("RAND_bytes failed generating UUID");
  }
  b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
  b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);
  return fmt::format(
      "{:02X}{:02X}{:02X}{:02X}-{:02X}{:02X}-{:02X}{:02X}-{:02X}{:02X}-"
      "{:02X}{:02X}{:02X}{:02X}{:02X}{:02X}",
      b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8], b[9], b[10], b[11],
      b[12], b[13], b[14], b[15]);
}

} // namespace cryptutil
} // namespace aigate

#pragma once

#include <sodium.h>

#include <array>
#include <filesystem>
#include <optional>
#include <string>

namespace aigate {
namespace cryptutil {

// Symmetric key for sealing values at rest with crypto_secretbox.
class SecretBoxKey {
 public:
  static constexpr size_t KEY_SIZE = crypto_secretbox_KEYBYTES;

  SecretBoxKey();  // random key
  explicit SecretBoxKey(const std::string& raw);

  const unsigned char* data() const { return key_.data(); }
  std::string raw() const;

  ~SecretBoxKey();

 private:
  std::array<unsigned char, KEY_SIZE> key_{};
};

// Loads the key stored at path, creating it with owner-only permissions
// when absent. Returns std::nullopt and sets error when that fails.
std::optional<SecretBoxKey> load_or_create_secret_box_key(
    const std::filesystem::path& path, std::string& error);

// nonce || ciphertext, base64 encoded.
std::string seal_value(const SecretBoxKey& key, const std::string& plain);

// std::nullopt when the value was not produced by seal_value with this key.
std::optional<std::string> open_value(const SecretBoxKey& key,
                                      const std::string& sealed_b64);

}  // namespace cryptutil
}  // namespace aigate

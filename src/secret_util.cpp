#include "util/secret_util.hpp"

#include <sodium/randombytes.h>

#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "openssl/crypt_util.hpp"

namespace aigate {
namespace cryptutil {

namespace {

void ensure_sodium() {
  if (sodium_init() < 0) {
    throw std::runtime_error("libsodium initialization failed");
  }
}

}  // namespace

SecretBoxKey::SecretBoxKey() {
  ensure_sodium();
  crypto_secretbox_keygen(key_.data());
}

SecretBoxKey::SecretBoxKey(const std::string& raw) {
  if (raw.size() != KEY_SIZE) {
    throw std::runtime_error("Invalid secretbox key size");
  }
  std::memcpy(key_.data(), raw.data(), KEY_SIZE);
}

SecretBoxKey::~SecretBoxKey() { sodium_memzero(key_.data(), key_.size()); }

std::string SecretBoxKey::raw() const {
  return std::string(reinterpret_cast<const char*>(key_.data()), KEY_SIZE);
}

std::optional<SecretBoxKey> load_or_create_secret_box_key(
    const std::filesystem::path& path, std::string& error) {
  namespace fs = std::filesystem;
  ensure_sodium();

  if (fs::exists(path)) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
      error = "Unable to open key file: " + path.string();
      return std::nullopt;
    }
    std::string raw((std::istreambuf_iterator<char>(ifs)),
                    std::istreambuf_iterator<char>());
    if (raw.size() != SecretBoxKey::KEY_SIZE) {
      error = "Key file has unexpected size: " + path.string();
      return std::nullopt;
    }
    return SecretBoxKey(raw);
  }

  SecretBoxKey key;
  {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      error = "Unable to create key file: " + path.string();
      return std::nullopt;
    }
    const std::string raw = key.raw();
    ofs.write(raw.data(), static_cast<std::streamsize>(raw.size()));
    if (!ofs) {
      error = "Unable to write key file: " + path.string();
      return std::nullopt;
    }
  }
  std::error_code ec;
  fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                  fs::perm_options::replace, ec);
  if (ec) {
    error = "Unable to restrict key file permissions: " + ec.message();
    return std::nullopt;
  }
  return key;
}

std::string seal_value(const SecretBoxKey& key, const std::string& plain) {
  std::vector<unsigned char> out(crypto_secretbox_NONCEBYTES +
                                 crypto_secretbox_MACBYTES + plain.size());
  unsigned char* nonce = out.data();
  randombytes_buf(nonce, crypto_secretbox_NONCEBYTES);
  if (crypto_secretbox_easy(
          out.data() + crypto_secretbox_NONCEBYTES,
          reinterpret_cast<const unsigned char*>(plain.data()), plain.size(),
          nonce, key.data()) != 0) {
    throw std::runtime_error("crypto_secretbox_easy failed");
  }
  return base64_encode(
      std::string_view(reinterpret_cast<const char*>(out.data()), out.size()));
}

std::optional<std::string> open_value(const SecretBoxKey& key,
                                      const std::string& sealed_b64) {
  auto sealed = base64_decode(sealed_b64);
  if (!sealed ||
      sealed->size() < crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES) {
    return std::nullopt;
  }
  const auto* bytes = reinterpret_cast<const unsigned char*>(sealed->data());
  const std::size_t cipher_len = sealed->size() - crypto_secretbox_NONCEBYTES;
  const std::size_t plain_len = cipher_len - crypto_secretbox_MACBYTES;
  std::vector<unsigned char> plain(plain_len + 1);
  if (crypto_secretbox_open_easy(plain.data(),
                                 bytes + crypto_secretbox_NONCEBYTES,
                                 cipher_len, bytes, key.data()) != 0) {
    return std::nullopt;
  }
  return std::string(reinterpret_cast<const char*>(plain.data()), plain_len);
}

}  // namespace cryptutil
}  // namespace aigate

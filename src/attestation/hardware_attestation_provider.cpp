#include "attestation/attestation_provider.hpp"

#include <exception>

#include "api/api_error.hpp"
#include "openssl/crypt_util.hpp"

namespace aigate {

std::string UnavailablePlatformAttestationService::generate_key() {
  throw_error(ErrorKind::AttestationUnsupported,
              "no platform attestation service on this host");
}

std::string UnavailablePlatformAttestationService::attest_key(
    const std::string &, const std::string &) {
  throw_error(ErrorKind::AttestationUnsupported,
              "no platform attestation service on this host");
}

std::string UnavailablePlatformAttestationService::generate_assertion(
    const std::string &, const std::string &) {
  throw_error(ErrorKind::AttestationUnsupported,
              "no platform attestation service on this host");
}

HardwareAttestationProvider::HardwareAttestationProvider(
    IAttestationKeyStore &key_store,
    std::shared_ptr<IPlatformAttestationService> service)
    : key_store_(key_store), service_(std::move(service)) {}

bool HardwareAttestationProvider::is_supported() const {
  return service_ && service_->is_supported();
}

std::optional<std::string> HardwareAttestationProvider::get_key_id() const {
  return key_store_.get_key_id(AttestationKeySlot::Hardware);
}

std::string HardwareAttestationProvider::ensure_key_exists() {
  if (auto existing = get_key_id()) {
    return *existing;
  }
  if (!is_supported()) {
    throw_error(ErrorKind::AttestationUnsupported,
                "hardware attestation is not available on this device");
  }

  std::string key_id;
  try {
    key_id = service_->generate_key();
  } catch (const ApiException &) {
    throw;
  } catch (const std::exception &e) {
    throw_error(ErrorKind::AttestationFailed,
                std::string("key generation failed: ") + e.what());
  }
  if (auto err = key_store_.save_key_id(AttestationKeySlot::Hardware, key_id)) {
    throw_error(ErrorKind::AttestationFailed,
                "failed to persist attestation key id: " + *err);
  }
  BOOST_LOG_SEV(lg, trivial::info) << "Generated hardware attestation key";
  return key_id;
}

std::string
HardwareAttestationProvider::attest_key(const std::string &challenge_b64) {
  auto challenge = cryptutil::base64_decode(challenge_b64);
  if (!challenge) {
    throw_error(ErrorKind::AttestationFailed,
                "attestation challenge is not valid base64");
  }
  const std::string key_id = ensure_key_exists();
  const std::string client_data_hash = cryptutil::sha256(*challenge);
  try {
    return cryptutil::base64_encode(
        service_->attest_key(key_id, client_data_hash));
  } catch (const ApiException &) {
    throw;
  } catch (const std::exception &e) {
    throw_error(ErrorKind::AttestationFailed,
                std::string("key attestation failed: ") + e.what());
  }
}

std::string HardwareAttestationProvider::generate_assertion(
    std::string_view body, std::int64_t counter) {
  auto key_id = get_key_id();
  if (!key_id) {
    throw_error(ErrorKind::AttestationKeyMissing,
                "no attestation key; call ensure_key_exists first");
  }
  if (!is_supported()) {
    throw_error(ErrorKind::AttestationUnsupported,
                "hardware attestation is not available on this device");
  }
  std::string client_data(body);
  client_data += cryptutil::big_endian_bytes(counter);
  try {
    return cryptutil::base64_encode(service_->generate_assertion(
        *key_id, cryptutil::sha256(client_data)));
  } catch (const ApiException &) {
    throw;
  } catch (const std::exception &e) {
    throw_error(ErrorKind::AttestationFailed,
                std::string("assertion generation failed: ") + e.what());
  }
}

void HardwareAttestationProvider::clear_attestation() {
  if (auto err = key_store_.clear_key_id(AttestationKeySlot::Hardware)) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "Failed to clear hardware key id: " << *err;
  }
}

} // namespace aigate

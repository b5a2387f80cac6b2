#include "attestation/attestation_provider.hpp"

#include <boost/json.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <ctime>

#include "api/api_error.hpp"
#include "openssl/crypt_util.hpp"

namespace aigate {

namespace {

std::string iso8601_now() {
  const std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(now));
}

} // namespace

SimulatorAttestationProvider::SimulatorAttestationProvider(
    IAttestationKeyStore &key_store, std::string bundle_id)
    : key_store_(key_store), bundle_id_(std::move(bundle_id)) {}

std::optional<std::string> SimulatorAttestationProvider::get_key_id() const {
  return key_store_.get_key_id(AttestationKeySlot::Simulator);
}

std::string SimulatorAttestationProvider::ensure_key_exists() {
  if (auto existing = get_key_id()) {
    return *existing;
  }
  std::string key_id = "SIM-" + cryptutil::generate_uuid_v4();
  if (auto err =
          key_store_.save_key_id(AttestationKeySlot::Simulator, key_id)) {
    throw_error(ErrorKind::AttestationFailed,
                "failed to persist simulator key id: " + *err);
  }
  BOOST_LOG_SEV(lg, trivial::info)
      << "Generated simulator attestation key " << key_id;
  return key_id;
}

std::string
SimulatorAttestationProvider::attest_key(const std::string &challenge_b64) {
  const std::string key_id = ensure_key_exists();
  json::object doc{{"keyId", key_id},
                   {"challenge", challenge_b64},
                   {"environment", "simulator"},
                   {"timestamp", iso8601_now()},
                   {"bundleId", bundle_id_},
                   {"mockAttestation", true}};
  return cryptutil::base64_encode(json::serialize(doc));
}

std::string SimulatorAttestationProvider::generate_assertion(
    std::string_view body, std::int64_t counter) {
  auto key_id = get_key_id();
  if (!key_id) {
    throw_error(ErrorKind::AttestationKeyMissing,
                "no simulator key; call ensure_key_exists first");
  }
  std::string client_data(body);
  client_data += cryptutil::big_endian_bytes(counter);
  json::object doc{
      {"keyId", *key_id},
      {"counter", counter},
      {"signature", cryptutil::base64_encode(cryptutil::sha256(client_data))},
      {"environment", "simulator"},
      {"timestamp", iso8601_now()},
      {"mockAssertion", true}};
  return cryptutil::base64_encode(json::serialize(doc));
}

void SimulatorAttestationProvider::clear_attestation() {
  if (auto err = key_store_.clear_key_id(AttestationKeySlot::Simulator)) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "Failed to clear simulator key id: " << *err;
  }
}

std::shared_ptr<IAttestationProvider> make_attestation_provider(
    AttestationMode mode, IAttestationKeyStore &key_store,
    std::shared_ptr<IPlatformAttestationService> platform_service,
    const std::string &bundle_id) {
  switch (mode) {
  case AttestationMode::None:
    return nullptr;
  case AttestationMode::Hardware:
    return std::make_shared<HardwareAttestationProvider>(
        key_store, std::move(platform_service));
  case AttestationMode::Simulator:
    return std::make_shared<SimulatorAttestationProvider>(key_store, bundle_id);
  case AttestationMode::Auto:
    if (platform_service && platform_service->is_supported()) {
      return std::make_shared<HardwareAttestationProvider>(
          key_store, std::move(platform_service));
    }
    return std::make_shared<SimulatorAttestationProvider>(key_store, bundle_id);
  }
  return nullptr;
}

} // namespace aigate

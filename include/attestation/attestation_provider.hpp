#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "conf/aigate_config.hpp"
#include "state/attestation_state_store.hpp"
#include "util/my_logging.hpp"

namespace aigate {

// Secure-hardware key service of the host platform. Implementations throw on
// failure; the hardware provider maps those failures onto attestation errors.
class IPlatformAttestationService {
public:
  virtual ~IPlatformAttestationService() = default;

  virtual bool is_supported() const = 0;
  // New hardware-bound key, returned by its identifier.
  virtual std::string generate_key() = 0;
  // Raw attestation object for key_id over a 32-byte client data hash.
  virtual std::string attest_key(const std::string &key_id,
                                 const std::string &client_data_hash) = 0;
  // Raw assertion for key_id over a 32-byte client data hash.
  virtual std::string generate_assertion(const std::string &key_id,
                                         const std::string &client_data_hash) = 0;
};

// Hosts with no secure key hardware exposed to this process.
class UnavailablePlatformAttestationService
    : public IPlatformAttestationService {
public:
  bool is_supported() const override { return false; }
  std::string generate_key() override;
  std::string attest_key(const std::string &key_id,
                         const std::string &client_data_hash) override;
  std::string generate_assertion(const std::string &key_id,
                                 const std::string &client_data_hash) override;
};

class IAttestationProvider {
public:
  virtual ~IAttestationProvider() = default;

  virtual const char *variant() const = 0;
  virtual bool is_supported() const = 0;
  virtual std::optional<std::string> get_key_id() const = 0;
  // Idempotent. Generates and persists a key on the first call.
  virtual std::string ensure_key_exists() = 0;
  // challenge_b64 is the server challenge as received. Returns base64.
  virtual std::string attest_key(const std::string &challenge_b64) = 0;
  // Assertion over SHA256(body || be64(counter)), base64. Throws
  // AttestationKeyMissing when no key exists yet.
  virtual std::string generate_assertion(std::string_view body,
                                         std::int64_t counter) = 0;
  // Forgets the local key id. Nothing is revoked remotely.
  virtual void clear_attestation() = 0;
};

class HardwareAttestationProvider : public IAttestationProvider {
public:
  HardwareAttestationProvider(
      IAttestationKeyStore &key_store,
      std::shared_ptr<IPlatformAttestationService> service);

  const char *variant() const override { return "hardware"; }
  bool is_supported() const override;
  std::optional<std::string> get_key_id() const override;
  std::string ensure_key_exists() override;
  std::string attest_key(const std::string &challenge_b64) override;
  std::string generate_assertion(std::string_view body,
                                 std::int64_t counter) override;
  void clear_attestation() override;

private:
  IAttestationKeyStore &key_store_;
  std::shared_ptr<IPlatformAttestationService> service_;
  Logger lg;
};

// Produces base64 JSON documents shaped like real attestations and tagged as
// mock, so hosts without secure hardware exercise the same request paths.
class SimulatorAttestationProvider : public IAttestationProvider {
public:
  SimulatorAttestationProvider(IAttestationKeyStore &key_store,
                               std::string bundle_id);

  const char *variant() const override { return "simulator"; }
  bool is_supported() const override { return true; }
  std::optional<std::string> get_key_id() const override;
  std::string ensure_key_exists() override;
  std::string attest_key(const std::string &challenge_b64) override;
  std::string generate_assertion(std::string_view body,
                                 std::int64_t counter) override;
  void clear_attestation() override;

private:
  IAttestationKeyStore &key_store_;
  std::string bundle_id_;
  Logger lg;
};

// Selected once per client. Returns nullptr for AttestationMode::None; Auto
// picks hardware when the platform service reports support.
std::shared_ptr<IAttestationProvider> make_attestation_provider(
    AttestationMode mode, IAttestationKeyStore &key_store,
    std::shared_ptr<IPlatformAttestationService> platform_service,
    const std::string &bundle_id);

} // namespace aigate

#pragma once

#include <boost/json.hpp>

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "attestation/attestation_provider.hpp"
#include "util/device_info.hpp"
#include "util/my_logging.hpp"

namespace aigate {

enum class RegistrationState {
  Unregistered,
  Attesting,
  Registering,
  Registered,
  Failed,
};

const char *to_string(RegistrationState state);

// POSTs a JSON body to path and returns the decoded JSON response. Must not
// trigger registration itself.
using RegistrationSender = std::function<boost::json::value(
    std::string_view path, const boost::json::value &body)>;

// Runs challenge -> attest -> register. Callers arriving while a registration
// is running wait for it and share its outcome instead of starting another.
class DeviceRegistrar {
public:
  DeviceRegistrar(std::shared_ptr<IAttestationProvider> provider,
                  RegistrationSender send, std::string bundle_id,
                  std::optional<std::string> team_id,
                  device::DeviceInfo device_info);

  // Throws ApiException on failure.
  void register_device(const std::string &reason);
  RegistrationState state() const;

  // Id the server assigned in the last successful registration.
  std::optional<std::string> device_id() const;

private:
  void run_registration(const std::string &reason);
  void transition(RegistrationState next);

  std::shared_ptr<IAttestationProvider> provider_;
  RegistrationSender send_;
  std::string bundle_id_;
  std::optional<std::string> team_id_;
  device::DeviceInfo device_info_;

  mutable std::mutex mutex_;
  RegistrationState state_{RegistrationState::Unregistered};
  std::optional<std::string> device_id_;
  std::optional<std::shared_future<void>> inflight_;
  Logger lg;
};

} // namespace aigate

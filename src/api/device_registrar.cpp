#include "api/device_registrar.hpp"

#include "api/api_error.hpp"
#include "data/attestation_dto.hpp"

namespace aigate {
namespace json = boost::json;

namespace {

constexpr std::string_view kChallengePath = "/v1/attestation/challenge";
constexpr std::string_view kRegisterPath = "/v1/attestation/register";

template <typename T> T decode_as(const json::value &jv, const char *what) {
  try {
    return json::value_to<T>(jv);
  } catch (const std::exception &e) {
    throw ApiException(make_error(ErrorKind::DecodingFailed,
                                  std::string(what) + ": " + e.what()));
  }
}

} // namespace

const char *to_string(RegistrationState state) {
  switch (state) {
  case RegistrationState::Unregistered:
    return "unregistered";
  case RegistrationState::Attesting:
    return "attesting";
  case RegistrationState::Registering:
    return "registering";
  case RegistrationState::Registered:
    return "registered";
  case RegistrationState::Failed:
    return "failed";
  }
  return "unknown";
}

DeviceRegistrar::DeviceRegistrar(std::shared_ptr<IAttestationProvider> provider,
                                 RegistrationSender send, std::string bundle_id,
                                 std::optional<std::string> team_id,
                                 device::DeviceInfo device_info)
    : provider_(std::move(provider)), send_(std::move(send)),
      bundle_id_(std::move(bundle_id)), team_id_(std::move(team_id)),
      device_info_(std::move(device_info)) {}

RegistrationState DeviceRegistrar::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::optional<std::string> DeviceRegistrar::device_id() const {
  std::lock_guard lock(mutex_);
  return device_id_;
}

void DeviceRegistrar::transition(RegistrationState next) {
  std::lock_guard lock(mutex_);
  BOOST_LOG_SEV(lg, trivial::debug) << "device registration "
                                    << to_string(state_) << " -> "
                                    << to_string(next);
  state_ = next;
}

void DeviceRegistrar::register_device(const std::string &reason) {
  std::shared_future<void> done;
  std::optional<std::promise<void>> owner;
  {
    std::lock_guard lock(mutex_);
    if (inflight_) {
      done = *inflight_;
    } else {
      owner.emplace();
      done = owner->get_future().share();
      inflight_ = done;
    }
  }

  if (!owner) {
    BOOST_LOG_SEV(lg, trivial::debug)
        << "joining in-flight device registration (" << reason << ")";
    done.get();
    return;
  }

  try {
    run_registration(reason);
    owner->set_value();
  } catch (const std::exception &) {
    owner->set_exception(std::current_exception());
  }
  {
    std::lock_guard lock(mutex_);
    inflight_.reset();
  }
  done.get();
}

void DeviceRegistrar::run_registration(const std::string &reason) {
  if (!provider_) {
    throw_error(ErrorKind::AttestationUnsupported,
                "no attestation provider configured");
  }
  BOOST_LOG_SEV(lg, trivial::info)
      << "registering device with " << provider_->variant()
      << " attestation: " << reason;

  try {
    transition(RegistrationState::Attesting);
    auto challenge_jv = send_(
        kChallengePath,
        json::value_from(data::AttestationChallengeRequest{bundle_id_}));
    auto challenge = decode_as<data::AttestationChallengeResponse>(
        challenge_jv, "attestation challenge response");

    const std::string key_id = provider_->ensure_key_exists();
    const std::string attestation = provider_->attest_key(challenge.challenge);

    transition(RegistrationState::Registering);
    data::AttestationRegisterRequest request;
    request.key_id = key_id;
    request.attestation_object = attestation;
    request.bundle_id = bundle_id_;
    request.team_id = team_id_;
    request.device_model = device_info_.device_model();
    request.os_version = device_info_.os_version;
    auto register_jv = send_(kRegisterPath, json::value_from(request));
    auto registered = decode_as<data::AttestationRegisterResponse>(
        register_jv, "attestation register response");
    if (!registered.success) {
      throw_error(ErrorKind::AttestationFailed,
                  "server rejected device registration");
    }

    {
      std::lock_guard lock(mutex_);
      device_id_ = registered.device_id;
    }
    transition(RegistrationState::Registered);
    BOOST_LOG_SEV(lg, trivial::info)
        << "device registered, id=" << registered.device_id.value_or("-");
  } catch (const ApiException &e) {
    transition(RegistrationState::Failed);
    BOOST_LOG_SEV(lg, trivial::error)
        << "device registration failed: " << e.error();
    throw;
  } catch (const std::exception &e) {
    transition(RegistrationState::Failed);
    throw ApiException(make_error(ErrorKind::AttestationFailed, e.what()));
  }
}

} // namespace aigate

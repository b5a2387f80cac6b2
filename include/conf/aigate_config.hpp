#pragma once

#include <boost/json.hpp>

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "conf/config_sources.hpp"

namespace aigate {

namespace fs = std::filesystem;

inline constexpr const char kProductionBaseUrl[] = "https://api.swiftaikit.com";
inline constexpr const char kTestBaseUrl[] = "https://api-test.swiftaikit.com";

enum class Environment { Production, Test, Custom };

enum class AttestationMode { Auto, Hardware, Simulator, None };

inline Environment parse_environment(const std::string &value) {
  if (value == "production") return Environment::Production;
  if (value == "test") return Environment::Test;
  if (value == "custom") return Environment::Custom;
  throw std::runtime_error("unknown environment '" + value + "'");
}

inline AttestationMode parse_attestation_mode(const std::string &value) {
  if (value == "auto") return AttestationMode::Auto;
  if (value == "hardware") return AttestationMode::Hardware;
  if (value == "simulator") return AttestationMode::Simulator;
  if (value == "none") return AttestationMode::None;
  throw std::runtime_error("unknown attestation_mode '" + value + "'");
}

// Value of the X-Environment header.
inline const char *environment_tag(Environment env) {
  return env == Environment::Production ? "production" : "test";
}

struct AigateConfig {
  std::string api_key{};
  std::string bundle_id{};
  std::string team_id{};
  Environment environment{Environment::Production};
  std::string base_url{};
  int timeout_seconds{60};
  AttestationMode attestation_mode{AttestationMode::Auto};
  bool verify_tls{true};
  fs::path runtime_dir{};
  std::size_t stream_buffer_chunks{64};
  int worker_threads{2};
  std::string verbose{};

  // base_url when set, otherwise the environment's default host.
  std::string resolved_base_url() const {
    if (!base_url.empty()) {
      return base_url;
    }
    switch (environment) {
    case Environment::Production:
      return kProductionBaseUrl;
    case Environment::Test:
      return kTestBaseUrl;
    case Environment::Custom:
      break;
    }
    throw std::runtime_error("environment 'custom' requires url_base");
  }

  friend AigateConfig tag_invoke(const json::value_to_tag<AigateConfig> &,
                                 const json::value &jv) {
    const auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("AigateConfig is not an object");
    }
    try {
      AigateConfig cc{};
      if (auto *p = jo_p->if_contains("api_key"))
        cc.api_key = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("bundle_id"))
        cc.bundle_id = p->as_string().c_str();
      else
        std::cerr << "bundle_id not found, requests carry an empty X-Bundle-Id"
                  << std::endl;
      if (auto *p = jo_p->if_contains("team_id"))
        cc.team_id = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("environment"))
        cc.environment = parse_environment(p->as_string().c_str());
      if (auto *p = jo_p->if_contains("url_base"))
        cc.base_url = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("timeout_seconds"))
        cc.timeout_seconds = p->to_number<int>();
      if (auto *p = jo_p->if_contains("attestation_mode"))
        cc.attestation_mode = parse_attestation_mode(p->as_string().c_str());
      if (auto *p = jo_p->if_contains("verify_tls"))
        cc.verify_tls = p->as_bool();
      if (auto *p = jo_p->if_contains("runtime_dir"))
        cc.runtime_dir = fs::path(p->as_string().c_str());
      else
        std::cerr << "runtime_dir not found, attestation state is disabled"
                  << std::endl;
      if (auto *p = jo_p->if_contains("stream_buffer_chunks"))
        cc.stream_buffer_chunks = p->to_number<std::size_t>();
      if (auto *p = jo_p->if_contains("worker_threads"))
        cc.worker_threads = p->to_number<int>();
      if (auto *p = jo_p->if_contains("verbose"))
        cc.verbose = p->as_string().c_str();

      if (cc.timeout_seconds <= 0) {
        throw std::runtime_error("timeout_seconds must be positive");
      }
      if (cc.stream_buffer_chunks == 0) {
        cc.stream_buffer_chunks = 1;
      }
      if (cc.worker_threads <= 0) {
        cc.worker_threads = 1;
      }
      return cc;
    } catch (const std::exception &e) {
      throw std::runtime_error(
          std::string("error in parsing AigateConfig: ") + e.what());
    }
  }
};

class IAigateConfigProvider {
public:
  virtual ~IAigateConfigProvider() = default;

  virtual const AigateConfig &get() const = 0;
  virtual AigateConfig &get() = 0;
};

// Reads the merged "application" config. AIGATE_API_KEY, when set, replaces
// api_key so the secret can stay out of files.
class AigateConfigProviderFile : public IAigateConfigProvider {
private:
  AigateConfig config_;

public:
  explicit AigateConfigProviderFile(ConfigSources &config_sources) {
    if (!config_sources.application_json) {
      throw std::runtime_error("Failed to load App config.");
    }
    config_ = json::value_to<AigateConfig>(*config_sources.application_json);
    if (const char *env_key = std::getenv("AIGATE_API_KEY");
        env_key && *env_key) {
      config_.api_key = env_key;
    }
  }

  const AigateConfig &get() const override { return config_; }
  AigateConfig &get() override { return config_; }
};

// Fixed config, used where values come from code rather than files.
class AigateConfigProviderStatic : public IAigateConfigProvider {
  AigateConfig config_;

public:
  explicit AigateConfigProviderStatic(AigateConfig config)
      : config_(std::move(config)) {}

  const AigateConfig &get() const override { return config_; }
  AigateConfig &get() override { return config_; }
};

} // namespace aigate

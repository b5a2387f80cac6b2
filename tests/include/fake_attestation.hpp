#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "attestation/attestation_provider.hpp"
#include "state/attestation_state_store.hpp"

namespace testinfra {

class InMemoryAttestationStore : public aigate::IAttestationKeyStore,
                                 public aigate::IReplayCounter {
public:
  std::optional<std::string>
  get_key_id(aigate::AttestationKeySlot slot) const override {
    std::lock_guard lock(mutex_);
    auto it = keys_.find(slot);
    if (it == keys_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::optional<std::string> save_key_id(aigate::AttestationKeySlot slot,
                                         const std::string &key_id) override {
    std::lock_guard lock(mutex_);
    keys_[slot] = key_id;
    return std::nullopt;
  }

  std::optional<std::string>
  clear_key_id(aigate::AttestationKeySlot slot) override {
    std::lock_guard lock(mutex_);
    keys_.erase(slot);
    return std::nullopt;
  }

  std::int64_t get_counter() const override {
    std::lock_guard lock(mutex_);
    return counter_;
  }

  std::pair<std::int64_t, std::optional<std::string>>
  increment_counter() override {
    std::lock_guard lock(mutex_);
    return {++counter_, std::nullopt};
  }

  std::optional<std::string> clear_counter() override {
    std::lock_guard lock(mutex_);
    counter_ = 0;
    return std::nullopt;
  }

private:
  mutable std::mutex mutex_;
  std::map<aigate::AttestationKeySlot, std::string> keys_;
  std::int64_t counter_{0};
};

// Deterministic stand-in for a secure-hardware key service.
class FakePlatformService : public aigate::IPlatformAttestationService {
public:
  bool supported{true};
  bool fail_generate{false};
  bool fail_assertion{false};
  std::atomic<int> generated{0};
  std::vector<std::string> attested_hashes;
  std::vector<std::string> assertion_hashes;

  bool is_supported() const override { return supported; }

  std::string generate_key() override {
    if (fail_generate) {
      throw std::runtime_error("secure enclave unavailable");
    }
    return "HW-KEY-" + std::to_string(++generated);
  }

  std::string attest_key(const std::string &key_id,
                         const std::string &client_data_hash) override {
    std::lock_guard lock(mutex_);
    attested_hashes.push_back(client_data_hash);
    return "attestation-for-" + key_id;
  }

  std::string generate_assertion(const std::string &key_id,
                                 const std::string &client_data_hash) override {
    if (fail_assertion) {
      throw std::runtime_error("assertion rejected by platform");
    }
    std::lock_guard lock(mutex_);
    assertion_hashes.push_back(client_data_hash);
    return "assertion-for-" + key_id;
  }

private:
  std::mutex mutex_;
};

} // namespace testinfra

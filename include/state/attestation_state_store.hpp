#pragma once

#include <cstdint>
#include <filesystem> // IWYU pragma: keep
#include <functional> // IWYU pragma: keep
#include <mutex>      // IWYU pragma: keep
#include <optional>
#include <string>
#include <utility>

#include "conf/aigate_config.hpp"
#include "util/my_logging.hpp"
#include "util/secret_util.hpp"

struct sqlite3;

namespace aigate {

// Hardware and simulator key ids are kept apart so switching attestation
// modes never hands one variant the other's identifier.
enum class AttestationKeySlot { Hardware, Simulator };

const char *to_string(AttestationKeySlot slot);

class IAttestationKeyStore {
public:
  virtual ~IAttestationKeyStore() = default;

  virtual std::optional<std::string>
  get_key_id(AttestationKeySlot slot) const = 0;
  // Mutators return an error message, std::nullopt on success.
  virtual std::optional<std::string> save_key_id(AttestationKeySlot slot,
                                                 const std::string &key_id) = 0;
  virtual std::optional<std::string> clear_key_id(AttestationKeySlot slot) = 0;
};

class IReplayCounter {
public:
  virtual ~IReplayCounter() = default;

  // 0 when never incremented.
  virtual std::int64_t get_counter() const = 0;
  // Atomic read-modify-write. Returns the new value, or an error message.
  virtual std::pair<std::int64_t, std::optional<std::string>>
  increment_counter() = 0;
  virtual std::optional<std::string> clear_counter() = 0;
};

// Key ids and the replay counter in runtime_dir/state/attestation_state.db.
// Values are sealed with a per-install key kept in a 0600 file beside the
// database. Increments run inside BEGIN IMMEDIATE so separate processes sharing
// the runtime directory serialize as well as threads.
class SqliteAttestationStateStore : public IAttestationKeyStore,
                                    public IReplayCounter {
public:
  explicit SqliteAttestationStateStore(IAigateConfigProvider &config_provider);
  ~SqliteAttestationStateStore() override;

  std::optional<std::string>
  get_key_id(AttestationKeySlot slot) const override;
  std::optional<std::string> save_key_id(AttestationKeySlot slot,
                                         const std::string &key_id) override;
  std::optional<std::string> clear_key_id(AttestationKeySlot slot) override;

  std::int64_t get_counter() const override;
  std::pair<std::int64_t, std::optional<std::string>>
  increment_counter() override;
  std::optional<std::string> clear_counter() override;

  bool available() const;

private:
  bool ensure_initialized() const;
  void close_db() const;

  std::optional<std::string> get_value(const std::string &key) const;
  // Unsealed value in out; returns an error when the stored value is
  // unreadable with the current key.
  std::optional<std::string> load_sealed(const std::string &key,
                                         std::optional<std::string> &out) const;
  std::optional<std::string> upsert_value(const std::string &key,
                                          const std::string &value) const;
  std::optional<std::string> erase_value(const std::string &key) const;
  std::optional<std::string>
  with_transaction(const std::function<std::optional<std::string>()> &body) const;

  IAigateConfigProvider &config_provider_;
  mutable std::mutex mutex_;
  mutable std::filesystem::path db_path_;
  mutable sqlite3 *db_{nullptr};
  mutable bool initialized_{false};
  mutable std::optional<cryptutil::SecretBoxKey> seal_key_;
  mutable Logger lg;
};

} // namespace aigate

#include "state/attestation_state_store.hpp"

#include <sqlite3.h>

#include <charconv>
#include <filesystem>
#include <system_error>

namespace {
constexpr const char kHardwareKeyIdKey[] = "attestation/hardware_key_id";
constexpr const char kSimulatorKeyIdKey[] = "attestation/simulator_key_id";
constexpr const char kCounterKey[] = "attestation/replay_counter";

constexpr const char kCreateTableSql[] = R"SQL(
CREATE TABLE IF NOT EXISTS kv_store (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL,
  updated_at INTEGER NOT NULL DEFAULT (strftime('%s','now'))
);
)SQL";

constexpr const char kUpsertSql[] = R"SQL(
INSERT INTO kv_store(key, value, updated_at)
VALUES(?1, ?2, strftime('%s','now'))
ON CONFLICT(key) DO UPDATE SET
  value = excluded.value,
  updated_at = excluded.updated_at;
)SQL";

constexpr const char kDeleteSql[] = R"SQL(
DELETE FROM kv_store WHERE key = ?1;
)SQL";

constexpr const char kSelectSql[] = R"SQL(
SELECT value FROM kv_store WHERE key = ?1 LIMIT 1;
)SQL";

const char *slot_key(aigate::AttestationKeySlot slot) {
  return slot == aigate::AttestationKeySlot::Hardware ? kHardwareKeyIdKey
                                                      : kSimulatorKeyIdKey;
}

std::optional<std::int64_t> parse_int64(const std::string &value) {
  std::int64_t out = 0;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return out;
}
} // namespace

namespace aigate {

const char *to_string(AttestationKeySlot slot) {
  return slot == AttestationKeySlot::Hardware ? "hardware" : "simulator";
}

SqliteAttestationStateStore::SqliteAttestationStateStore(
    IAigateConfigProvider &config_provider)
    : config_provider_(config_provider) {}

SqliteAttestationStateStore::~SqliteAttestationStateStore() {
  std::scoped_lock lock(mutex_);
  close_db();
}

bool SqliteAttestationStateStore::available() const {
  std::scoped_lock lock(mutex_);
  return ensure_initialized();
}

std::optional<std::string>
SqliteAttestationStateStore::get_key_id(AttestationKeySlot slot) const {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::nullopt;
  }
  std::optional<std::string> key_id;
  if (auto err = load_sealed(slot_key(slot), key_id)) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "Ignoring unreadable " << to_string(slot) << " key id: " << *err;
    return std::nullopt;
  }
  return key_id;
}

std::optional<std::string>
SqliteAttestationStateStore::save_key_id(AttestationKeySlot slot,
                                         const std::string &key_id) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{"Attestation state database unavailable"};
  }
  return with_transaction([&]() -> std::optional<std::string> {
    return upsert_value(slot_key(slot), cryptutil::seal_value(*seal_key_, key_id));
  });
}

std::optional<std::string>
SqliteAttestationStateStore::clear_key_id(AttestationKeySlot slot) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{"Attestation state database unavailable"};
  }
  return with_transaction([&]() { return erase_value(slot_key(slot)); });
}

std::int64_t SqliteAttestationStateStore::get_counter() const {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return 0;
  }
  std::optional<std::string> raw;
  if (auto err = load_sealed(kCounterKey, raw)) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "Replay counter unreadable: " << *err;
    return 0;
  }
  if (!raw) {
    return 0;
  }
  return parse_int64(*raw).value_or(0);
}

std::pair<std::int64_t, std::optional<std::string>>
SqliteAttestationStateStore::increment_counter() {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return {0, std::string{"Attestation state database unavailable"}};
  }

  std::int64_t next = 0;
  auto body = [&]() -> std::optional<std::string> {
    std::optional<std::string> raw;
    if (auto err = load_sealed(kCounterKey, raw)) {
      return err;
    }
    std::int64_t current = 0;
    if (raw) {
      auto parsed = parse_int64(*raw);
      if (!parsed || *parsed < 0) {
        return std::string{"Stored replay counter is corrupt"};
      }
      current = *parsed;
    }
    next = current + 1;
    return upsert_value(kCounterKey, cryptutil::seal_value(
                                         *seal_key_, std::to_string(next)));
  };

  if (auto err = with_transaction(body)) {
    return {0, err};
  }
  return {next, std::nullopt};
}

std::optional<std::string> SqliteAttestationStateStore::clear_counter() {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{"Attestation state database unavailable"};
  }
  return with_transaction([&]() { return erase_value(kCounterKey); });
}

bool SqliteAttestationStateStore::ensure_initialized() const {
  if (initialized_) {
    return db_ != nullptr;
  }

  const auto runtime_dir = config_provider_.get().runtime_dir;
  if (runtime_dir.empty()) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "AttestationStateStore disabled: runtime_dir not configured";
    initialized_ = true;
    return false;
  }

  auto state_dir = runtime_dir / "state";
  std::error_code ec;
  std::filesystem::create_directories(state_dir, ec);
  if (ec) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Failed to create state directory '" << state_dir.string()
        << "': " << ec.message();
    initialized_ = true;
    return false;
  }

  std::string key_error;
  seal_key_ = cryptutil::load_or_create_secret_box_key(
      state_dir / "attestation.key", key_error);
  if (!seal_key_) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Failed to load attestation state key: " << key_error;
    initialized_ = true;
    return false;
  }

  db_path_ = state_dir / "attestation_state.db";
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr) !=
      SQLITE_OK) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Failed to open attestation_state.db: " << sqlite3_errmsg(db_);
    close_db();
    initialized_ = true;
    return false;
  }

  sqlite3_busy_timeout(db_, 5000);
  char *errmsg = nullptr;
  if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                   &errmsg) != SQLITE_OK) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "Failed to enable WAL mode: " << (errmsg ? errmsg : "unknown");
    sqlite3_free(errmsg);
    errmsg = nullptr;
  }
  if (sqlite3_exec(db_, "PRAGMA synchronous=FULL;", nullptr, nullptr,
                   &errmsg) != SQLITE_OK) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "Failed to set synchronous=FULL: " << (errmsg ? errmsg : "unknown");
    sqlite3_free(errmsg);
    errmsg = nullptr;
  }
  if (sqlite3_exec(db_, kCreateTableSql, nullptr, nullptr, &errmsg) !=
      SQLITE_OK) {
    BOOST_LOG_SEV(lg, trivial::error) << "Failed to initialize kv_store table: "
                                      << (errmsg ? errmsg : "unknown");
    sqlite3_free(errmsg);
    close_db();
    initialized_ = true;
    return false;
  }

  BOOST_LOG_SEV(lg, trivial::debug)
      << "Attestation state store opened at " << db_path_.string();
  initialized_ = true;
  return true;
}

void SqliteAttestationStateStore::close_db() const {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

std::optional<std::string>
SqliteAttestationStateStore::get_value(const std::string &key) const {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kSelectSql, -1, &stmt, nullptr) != SQLITE_OK) {
    return std::nullopt;
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  std::optional<std::string> result;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    const auto *text =
        reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
    if (text) {
      result = std::string(text);
    }
  }
  sqlite3_finalize(stmt);
  return result;
}

std::optional<std::string>
SqliteAttestationStateStore::load_sealed(const std::string &key,
                                         std::optional<std::string> &out) const {
  out.reset();
  auto sealed = get_value(key);
  if (!sealed) {
    return std::nullopt;
  }
  auto plain = cryptutil::open_value(*seal_key_, *sealed);
  if (!plain) {
    return std::string{"Failed to unseal value for "} + key;
  }
  out = std::move(plain);
  return std::nullopt;
}

std::optional<std::string>
SqliteAttestationStateStore::upsert_value(const std::string &key,
                                          const std::string &value) const {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kUpsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
    return std::string{"Failed to prepare upsert statement"};
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return std::string{"Failed to execute upsert statement: "} +
           sqlite3_errmsg(db_);
  }
  return std::nullopt;
}

std::optional<std::string>
SqliteAttestationStateStore::erase_value(const std::string &key) const {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kDeleteSql, -1, &stmt, nullptr) != SQLITE_OK) {
    return std::string{"Failed to prepare delete statement"};
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return std::string{"Failed to execute delete statement: "} +
           sqlite3_errmsg(db_);
  }
  return std::nullopt;
}

std::optional<std::string> SqliteAttestationStateStore::with_transaction(
    const std::function<std::optional<std::string>()> &body) const {
  char *errmsg = nullptr;
  if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, &errmsg) !=
      SQLITE_OK) {
    std::string err = errmsg ? errmsg : "unknown";
    sqlite3_free(errmsg);
    return std::string{"Failed to begin transaction: "} + err;
  }

  if (auto err = body()) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    return err;
  }

  if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, &errmsg) != SQLITE_OK) {
    std::string err = errmsg ? errmsg : "unknown";
    sqlite3_free(errmsg);
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    return std::string{"Failed to commit transaction: "} + err;
  }
  return std::nullopt;
}

} // namespace aigate

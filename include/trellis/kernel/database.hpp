#pragma once

/** \file database.hpp
 *  \brief Database lifecycle: startup (legacy check, recovery, writer), transactions,
 *         checkpoints and shutdown.
 *
 * Notes
 * - open() records its outcome in the DatabaseStateService; a failed start affects only
 *   the database of that name.
 * - A start aborted by the availability guard still yields a handle; every transaction on
 *   it fails with start_aborted until the guard is released and the database reopened.
 * - close() writes the shutdown checkpoint. Destroying an open database does not: it
 *   leaves the files as a crash would.
 * - Commits are serialized by one mutex, which checkpoints also take.
 * - A failed log flush stops the database: later transactions, checkpoints and close()
 *   fail with unavailable, carrying the original cause.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "trellis/core/config.hpp"
#include "trellis/core/logging.hpp"
#include "trellis/error.hpp"
#include "trellis/kernel/check_pointer.hpp"
#include "trellis/recovery/availability_guard.hpp"
#include "trellis/recovery/collaborators.hpp"
#include "trellis/recovery/recovery.hpp"
#include "trellis/store/metadata_store.hpp"
#include "trellis/store/node_store.hpp"
#include "trellis/wal/checkpoint.hpp"
#include "trellis/wal/log_files.hpp"
#include "trellis/wal/transaction_log_file.hpp"

namespace trellis::kernel {

constexpr auto SHUTDOWN_CHECKPOINT_REASON = "Database shutdown.";

/** \brief Per-database startup outcome, keyed by database name. Thread-safe. */
class DatabaseStateService {
public:
  void record_started(const std::string& name);
  void record_failure(const std::string& name, core::error cause);

  /** \brief Why the last start of `name` failed; nullopt when it started or never ran. */
  [[nodiscard]] auto cause_of_failure(const std::string& name) const -> std::optional<core::error>;
  [[nodiscard]] auto has_failed(const std::string& name) const -> bool;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::optional<core::error>> states_;
};

struct DatabaseOptions {
  recovery::RecoveryMonitor monitor{};
  std::shared_ptr<recovery::AvailabilityGuard> guard{};  /**< created when empty */
  core::LogSink sink{};                                   /**< null sink when empty */
  wal::SyncInterceptor sync_interceptor{};                /**< passed to the log writer */
};

/** \brief Files recovery inspects for `config`. */
auto database_layout(const core::DatabaseConfig& config) -> recovery::RecoveryLayout;

auto is_recovery_required(const core::DatabaseConfig& config) -> std::expected<bool, core::error>;

/** \brief Log files sitting directly in the store directory while logs belong in `<store>/tx-logs`. */
auto find_legacy_logs(const core::DatabaseConfig& config) -> std::vector<std::filesystem::path>;

class Database;

/** \brief Buffered mutations of one transaction; nothing reaches the log before commit(). */
class Transaction {
public:
  auto create_node() -> std::expected<std::uint64_t, core::error>;
  auto delete_node(std::uint64_t id) -> std::expected<void, core::error>;
  auto set_property(std::uint64_t id, std::string key, std::string value) -> std::expected<void, core::error>;

  /** \brief Log, flush and apply; returns the transaction id. */
  auto commit() -> std::expected<std::uint64_t, core::error>;

  [[nodiscard]] auto size() const noexcept -> std::size_t { return commands_.size(); }

private:
  friend class Database;
  explicit Transaction(Database& db) : db_(&db) {}

  auto exists(std::uint64_t id) const -> bool;

  Database* db_;
  std::vector<store::NodeCommand> commands_;
  std::set<std::uint64_t> created_;
  std::set<std::uint64_t> deleted_;
  bool done_{false};
};

class Database {
public:
  static auto open(core::DatabaseConfig config, DatabaseStateService& states, DatabaseOptions options = {})
      -> std::expected<std::unique_ptr<Database>, core::error>;

  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  auto begin_transaction() -> std::expected<Transaction, core::error>;

  /** \brief Flush the store and record a checkpoint at the current log tail. */
  auto checkpoint(const std::string& reason) -> std::expected<wal::CheckpointInfo, core::error>;

  /** \brief Clean shutdown: checkpoint, close the log. Idempotent. */
  auto close() -> std::expected<void, core::error>;

  /** \brief Wait up to `timeout` for the availability guard. */
  [[nodiscard]] auto is_available(std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) const -> bool;

  auto node_count() const -> std::size_t;
  auto has_node(std::uint64_t id) const -> bool;
  auto property(std::uint64_t id, const std::string& key) const -> std::optional<std::string>;

  [[nodiscard]] auto config() const noexcept -> const core::DatabaseConfig& { return config_; }
  [[nodiscard]] auto last_recovery() const noexcept -> const std::optional<recovery::RecoveryOutcome>& { return recovery_; }
  [[nodiscard]] auto start_aborted() const noexcept -> bool { return aborted_; }
  /** Failure that stopped the database; nullopt while it accepts transactions. */
  [[nodiscard]] auto failure() const -> std::optional<core::error>;
  [[nodiscard]] auto log_files() const noexcept -> const wal::LogFiles& { return *files_; }
  [[nodiscard]] auto checkpoints() const noexcept -> const wal::CheckpointFile& { return *checkpoints_; }
  [[nodiscard]] auto metadata() const noexcept -> const store::MetaDataStore& { return *metadata_; }
  [[nodiscard]] auto check_pointer() noexcept -> CheckPointer& { return *check_pointer_; }
  /** Writer; nullptr when the start was aborted. */
  [[nodiscard]] auto log() noexcept -> wal::TransactionLogFile* { return writer_.get(); }

private:
  friend class Transaction;

  Database(core::DatabaseConfig config, std::shared_ptr<recovery::AvailabilityGuard> guard, core::LogPtr log);

  auto commit(std::vector<store::NodeCommand> commands) -> std::expected<std::uint64_t, core::error>;
  auto checkpoint_locked(const std::string& reason) -> std::expected<wal::CheckpointInfo, core::error>;
  auto usable_locked(const char* op) const -> std::expected<void, core::error>;
  auto stop_locked(core::error cause) -> core::error;

  core::DatabaseConfig config_;
  std::shared_ptr<recovery::AvailabilityGuard> guard_;
  core::LogPtr log_;
  std::unique_ptr<store::MetaDataStore> metadata_;
  std::unique_ptr<wal::LogFiles> files_;
  std::unique_ptr<store::NodeStore> nodes_;
  std::unique_ptr<wal::TransactionLogFile> writer_;
  std::unique_ptr<wal::CheckpointFile> checkpoints_;
  std::optional<recovery::RecoveryOutcome> recovery_;
  bool aborted_{false};
  bool closed_{false};
  std::optional<core::error> failure_;

  mutable std::mutex commit_mutex_;
  std::uint64_t since_checkpoint_{0};
  std::unique_ptr<CheckPointer> check_pointer_;
};

} // namespace trellis::kernel

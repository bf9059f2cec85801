#pragma once

/** \file metadata_store.hpp
 *  \brief Store metadata: identity, current log version and transaction id bookkeeping.
 *
 * On disk: `trellis.meta`, a text file replaced atomically (tmp, fsync, rename, dir fsync):
 *   trellis-metadata v1
 *   store_id=<u64>
 *   log_version=<u64>
 *   last_committed_tx_id=<u64>
 *   last_closed_tx_id=<u64>
 *   last_closed_log_version=<u64>
 *   last_closed_byte_offset=<u64>
 *   last_missing_logs_recovery_timestamp=<i64, -1 when never>
 *
 * The log version is persisted on every increment; the rest is persisted by flush(),
 * which the database calls at checkpoints.
 */

#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>

#include "trellis/error.hpp"
#include "trellis/wal/log_version_repository.hpp"
#include "trellis/wal/transaction_id_store.hpp"

namespace trellis::store {

constexpr auto METADATA_FILE_NAME = "trellis.meta";

struct MetaDataRecord {
  std::uint64_t store_id{0};
  std::uint64_t log_version{0};
  std::uint64_t last_committed_tx_id{0};
  std::uint64_t last_closed_tx_id{0};
  wal::LogPosition last_closed_position{};
  std::int64_t last_missing_logs_recovery_timestamp{-1};
};

auto metadata_path(const std::filesystem::path& store_dir) -> std::filesystem::path;
auto load_metadata(const std::filesystem::path& store_dir) -> std::expected<MetaDataRecord, core::error>;
auto save_metadata(const std::filesystem::path& store_dir, const MetaDataRecord& rec) -> std::expected<void, core::error>;

class MetaDataStore final : public wal::LogVersionRepository, public wal::TransactionIdStore {
public:
  /** \brief Load `trellis.meta`; with create_if_missing a fresh record with a new store id is persisted. */
  static auto open(const std::filesystem::path& store_dir, bool create_if_missing)
      -> std::expected<std::unique_ptr<MetaDataStore>, core::error>;

  // LogVersionRepository
  auto current_log_version() const noexcept -> std::uint64_t override;
  auto increment_and_get() -> std::expected<std::uint64_t, core::error> override;
  auto set_current_log_version(std::uint64_t version) -> std::expected<void, core::error> override;

  // TransactionIdStore
  auto committing_transaction_id() const noexcept -> std::uint64_t override;
  auto next_committing_transaction_id() noexcept -> std::uint64_t override;
  auto last_committed_transaction_id() const noexcept -> std::uint64_t override;
  auto last_closed_transaction() const noexcept -> wal::ClosedTransaction override;
  void transaction_closed(std::uint64_t tx_id, wal::LogPosition position) noexcept override;

  auto store_id() const noexcept -> std::uint64_t;
  auto last_missing_logs_recovery_timestamp() const noexcept -> std::int64_t;
  void set_last_missing_logs_recovery_timestamp(std::int64_t ts) noexcept;
  auto snapshot() const -> MetaDataRecord;

  /** \brief Persist the current record. */
  auto flush() -> std::expected<void, core::error>;

private:
  MetaDataStore(std::filesystem::path dir, MetaDataRecord rec);

  std::filesystem::path dir_;
  mutable std::mutex mutex_;
  MetaDataRecord rec_;
  std::atomic<std::uint64_t> log_version_;
  std::atomic<std::uint64_t> committing_;
};

} // namespace trellis::store

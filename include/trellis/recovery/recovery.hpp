#pragma once

/** \file recovery.hpp
 *  \brief Startup recovery: decide whether the log must be replayed, then replay it.
 *
 * Notes
 * - is_recovery_required() only reads; it creates, truncates or locks nothing.
 * - perform() runs once per startup attempt and is safe to re-run after any interruption:
 *   nothing is truncated and no checkpoint is written before replay completes.
 * - Damage is tolerated only at the exact tail of the log. A damaged record followed by a
 *   later valid log version fails with data_integrity naming the file and offset.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "trellis/core/config.hpp"
#include "trellis/core/logging.hpp"
#include "trellis/error.hpp"
#include "trellis/recovery/availability_guard.hpp"
#include "trellis/recovery/collaborators.hpp"
#include "trellis/store/metadata_store.hpp"
#include "trellis/wal/checkpoint.hpp"
#include "trellis/wal/log_files.hpp"

namespace trellis::recovery {

/** Reason recorded in the checkpoint written at the end of recovery. */
constexpr auto RECOVERY_CHECKPOINT_REASON = "Recovery completed.";

/** \brief Where a database keeps the files recovery looks at. */
struct RecoveryLayout {
  std::filesystem::path store_dir;
  std::filesystem::path log_dir;
  std::string log_prefix{"wal-"};
  core::CheckpointLayout checkpoint_layout{core::CheckpointLayout::interleaved};
  std::vector<std::filesystem::path> auxiliary_files; /**< regenerable files that must exist */
};

/** \brief True when the store must be recovered before it can serve transactions.
 *
 * False for a store that was never created, and for one without log files that never
 * committed a transaction and has no checkpoint. True when an auxiliary file is missing,
 * when every log file of a store that committed is missing, when the log tail is damaged,
 * or when a transaction entry exists at or after the latest checkpoint (anywhere in the
 * log without a checkpoint).
 */
auto is_recovery_required(const RecoveryLayout& layout) -> std::expected<bool, core::error>;

enum class RecoveryState : std::uint8_t {
  not_started,
  reverse_scan,
  forward_replay,
  checkpoint_written,
  done,
  aborted,
};

auto to_string(RecoveryState s) -> std::string_view;

struct RecoveryOptions {
  bool fail_on_missing_files{true}; /**< false: regenerate auxiliary files, tolerate missing logs */
};

/** \brief Collaborators; all pointers must outlive the engine. auxiliary and guard may be null. */
struct RecoveryDependencies {
  wal::LogFiles* files{nullptr};
  wal::CheckpointFile* checkpoints{nullptr};
  store::MetaDataStore* metadata{nullptr};
  StoreApplier* store{nullptr};
  AuxiliaryRebuilder* auxiliary{nullptr};
  AvailabilityGuard* guard{nullptr};
  RecoveryMonitor monitor{};
};

struct RecoveryOutcome {
  std::uint64_t recovered_transactions{0};
  std::uint64_t lowest_recovered_tx_id{0};  /**< 0 when nothing was replayed */
  std::uint64_t highest_recovered_tx_id{0};
  wal::LogPosition start{};                  /**< where the scan began */
  wal::LogPosition tail{};                   /**< end of valid data after truncation */
  std::uint64_t truncated_bytes{0};
  bool forced{false};                        /**< logs were missing and recovery was forced */
  bool rebuilt_auxiliary{false};
  wal::CheckpointInfo checkpoint{};
  std::chrono::milliseconds elapsed{0};
};

class RecoveryEngine {
public:
  RecoveryEngine(RecoveryDependencies deps, RecoveryOptions opts, core::LogPtr log = nullptr);

  /** \brief Replay everything after the latest checkpoint and record a new one. */
  auto perform() -> std::expected<RecoveryOutcome, core::error>;

  [[nodiscard]] auto state() const noexcept -> RecoveryState { return state_; }

private:
  struct Group {
    std::uint64_t tx_id{0};
    wal::LogPosition start{};
    wal::LogPosition end{};
    bool committed{false};
  };

  struct ScanResult {
    std::vector<Group> groups;
    wal::LogPosition valid_end{};
  };

  auto check_auxiliary(RecoveryOutcome& out) -> std::expected<void, core::error>;
  auto recover_missing_logs(RecoveryOutcome& out) -> std::expected<void, core::error>;
  auto reverse_scan(wal::LogPosition start) -> std::expected<ScanResult, core::error>;
  auto forward_replay(wal::LogPosition from, wal::LogPosition until, RecoveryOutcome& out)
      -> std::expected<void, core::error>;
  auto truncate_after(wal::LogPosition tail, RecoveryOutcome& out) -> std::expected<wal::LogPosition, core::error>;
  auto finish(wal::LogPosition tail, RecoveryOutcome& out) -> std::expected<void, core::error>;
  auto abort(const char* phase) -> core::error;

  RecoveryDependencies deps_;
  RecoveryOptions opts_;
  core::LogPtr log_;
  RecoveryState state_{RecoveryState::not_started};
  std::chrono::steady_clock::time_point started_{};
};

} // namespace trellis::recovery

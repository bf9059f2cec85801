#pragma once

/** \file checkpoint.hpp
 *  \brief Checkpoint records and the two on-disk layouts behind one interface.
 *
 * Layouts (selected by configuration, never branched on elsewhere):
 * - interleaved: checkpoint entries live in the transaction log stream. With a writer
 *   attached they are appended through it; without one (during recovery) they are written
 *   directly at the given log tail. entry_position == log_position.
 * - dedicated: entries are appended to `wal.checkpoint` in the log directory, which carries
 *   its own header. entry_position addresses that file (version 0).
 *
 * Every write is fsynced before returning. Removing the latest checkpoint means truncating
 * its file at entry_position, in both layouts.
 *
 * Each object scans the files once and then remembers the latest checkpoint it found or
 * wrote. The remembered record is re-checked on disk before use, so truncating it away
 * forces a fresh scan. Only one object per log directory should write checkpoints.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "trellis/core/config.hpp"
#include "trellis/error.hpp"
#include "trellis/wal/log_entry.hpp"
#include "trellis/wal/log_files.hpp"
#include "trellis/wal/log_position.hpp"

namespace trellis::wal {

class TransactionLogFile;

struct CheckpointInfo {
  LogPosition log_position{};    /**< everything before this position is reflected in the store */
  LogPosition entry_position{};  /**< where the checkpoint record itself starts */
  std::uint64_t store_id{0};
  std::uint64_t transaction_id{0}; /**< last committed transaction at checkpoint time */
  std::uint64_t timestamp_ms{0};
  std::string reason;
};

class CheckpointFile {
public:
  virtual ~CheckpointFile() = default;

  /** \brief Most recent valid checkpoint; std::nullopt when none was ever recorded. */
  virtual auto find_latest() const -> std::expected<std::optional<CheckpointInfo>, core::error> = 0;

  /** \brief All checkpoints still on disk, oldest first. */
  virtual auto reachable() const -> std::expected<std::vector<CheckpointInfo>, core::error> = 0;

  /** \brief Append and fsync a checkpoint. Rejects a log_position below the latest one.
   *  Returns the record with entry_position filled in. */
  virtual auto write(const CheckpointInfo& info) -> std::expected<CheckpointInfo, core::error> = 0;

  /** \brief File that holds the latest checkpoint (for tools and tests). */
  virtual auto current_file() const -> std::filesystem::path = 0;

  virtual auto layout() const noexcept -> core::CheckpointLayout = 0;

  /** \brief Route writes through a live writer (interleaved layout); nullptr detaches. */
  void attach(TransactionLogFile* writer) noexcept { writer_ = writer; }

protected:
  auto check_monotonic(const CheckpointInfo& info) const -> std::expected<void, core::error>;

  TransactionLogFile* writer_{nullptr};
};

auto make_checkpoint_file(core::CheckpointLayout layout, LogFiles& files) -> std::unique_ptr<CheckpointFile>;

auto to_checkpoint_info(const CheckpointEntry& e, LogPosition entry_position) -> CheckpointInfo;

} // namespace trellis::wal

#pragma once

/** \file transaction_log_file.hpp
 *  \brief Transaction log writer: buffered append, flush, rotation and positioned readers.
 *
 * Notes
 * - One mutex serializes append, flush and rotate; rotation blocks appenders for its duration.
 * - Readers are bounded by flushed_position() and never see a half-written record.
 * - Entries appended but not flushed are lost when the object is destroyed without close(),
 *   exactly as on a crash.
 * - A failed write or fsync cuts the file back to the last flushed position and stops the
 *   writer: every later append, flush and rotate fails with io_failed carrying the cause.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "trellis/core/config.hpp"
#include "trellis/core/logging.hpp"
#include "trellis/error.hpp"
#include "trellis/wal/channel.hpp"
#include "trellis/wal/log_entry.hpp"
#include "trellis/wal/log_files.hpp"
#include "trellis/wal/log_version_repository.hpp"
#include "trellis/wal/reader.hpp"
#include "trellis/wal/transaction_id_store.hpp"

namespace trellis::wal {

constexpr std::size_t LOG_BUFFER_UNIT = 512 * 1024;
constexpr std::size_t LOG_BUFFER_MAX_UNITS = 8;
constexpr std::size_t LOG_BUFFER_MIN_OVERRIDE = 4 * 1024;

/** \brief Writer buffer size for a host: one 512 KiB unit per four cores plus one, at most eight units. */
auto default_buffer_size(std::size_t parallelism) -> std::size_t;

/** \brief 0 selects default_buffer_size(); other values are clamped to [4 KiB, 4 MiB]. */
auto resolve_buffer_size(std::size_t requested) -> std::size_t;

/** \brief Runs before each fsync of a log file; an error fails that flush. */
using SyncInterceptor = std::function<std::expected<void, core::error>(const std::filesystem::path&)>;

struct TransactionLogFileOptions {
  std::uint64_t rotation_threshold{core::DEFAULT_ROTATION_THRESHOLD};
  std::size_t buffer_size{0};
  SyncInterceptor sync_interceptor{};
};

struct TransactionLogStats {
  std::uint64_t entries{};
  std::uint64_t bytes{};
  std::uint64_t flushes{};
  std::uint64_t rotations{};
};

class TransactionLogFile {
public:
  /** \brief Open the current log version (creating it when missing) and seek to the end of
   *  valid data, first from the last closed transaction position, then from the file start. */
  static auto open(LogFiles& files, LogVersionRepository& versions, TransactionIdStore& tx_ids,
                   TransactionLogFileOptions opts, core::LogPtr log)
      -> std::expected<std::unique_ptr<TransactionLogFile>, core::error>;

  TransactionLogFile(const TransactionLogFile&) = delete;
  TransactionLogFile& operator=(const TransactionLogFile&) = delete;

  /** \brief Buffer one entry; returns the position the entry starts at. */
  auto append(const LogEntry& entry) -> std::expected<LogPosition, core::error>;

  /** \brief Write buffered bytes and fsync; establishes a durability boundary. */
  auto flush() -> std::expected<void, core::error>;

  [[nodiscard]] auto rotation_needed() const -> bool;

  /** \brief Switch to the next log version. Returns the data start of the new channel. */
  auto rotate() -> std::expected<LogPosition, core::error>;

  auto reader(LogPosition from) const -> std::expected<LogEntryReader, core::error>;
  auto read_bound() const -> ReadBound;

  auto current_position() const -> LogPosition;
  auto flushed_position() const -> LogPosition;
  auto stats() const -> TransactionLogStats;
  [[nodiscard]] auto files() const noexcept -> const LogFiles& { return *files_; }

  /** \brief Write or fsync failure that stopped the writer; nullopt while healthy. */
  auto failure() const -> std::optional<core::error>;

  /** \brief Flush and release the channel. */
  auto close() -> std::expected<void, core::error>;

private:
  TransactionLogFile(LogFiles& files, LogVersionRepository& versions, TransactionIdStore& tx_ids,
                     TransactionLogFileOptions opts, core::LogPtr log);

  auto seek_end_of_valid_data() -> std::expected<LogPosition, core::error>;
  auto scan_to_end(LogPosition from, std::uint64_t file_size) const -> std::expected<LogPosition, core::error>;
  auto spill_locked() -> std::expected<void, core::error>;
  auto flush_locked() -> std::expected<void, core::error>;
  auto usable_locked() const -> std::expected<void, core::error>;
  auto fail_locked(core::error cause) -> core::error;
  void publish_flushed(LogPosition p);

  LogFiles* files_;
  LogVersionRepository* versions_;
  TransactionIdStore* tx_ids_;
  TransactionLogFileOptions opts_;
  core::LogPtr log_;

  mutable std::mutex mutex_;          // append / flush / rotate
  VersionedChannel channel_;
  std::uint64_t write_offset_{0};     // bytes handed to the channel
  std::vector<std::uint8_t> buffer_;
  std::size_t buffered_{0};
  TransactionLogStats stats_{};
  bool closed_{false};
  std::optional<core::error> failure_;

  mutable std::mutex position_mutex_; // guards flushed_
  LogPosition flushed_{};
};

} // namespace trellis::wal

#pragma once

/** \file reader.hpp
 *  \brief Sequential log entry reader spanning log versions through the version bridge.
 *
 * Notes
 * - Each reader owns its channel; any number of readers may run next to the writer.
 * - When a bound is supplied the reader never reads past the writer's flushed position,
 *   so it never observes a half-written record.
 * - Undecodable bytes at the tail of the log end the stream (tail_damaged() turns true).
 *   Undecodable bytes followed by a later valid log version are a data_integrity error.
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <vector>

#include "trellis/error.hpp"
#include "trellis/wal/channel.hpp"
#include "trellis/wal/log_entry.hpp"
#include "trellis/wal/log_files.hpp"

namespace trellis::wal {

/** \brief Upper bound for readers; std::nullopt means unbounded. */
using ReadBound = std::function<std::optional<LogPosition>()>;

class LogEntryReader {
public:
  /** \brief Position a reader at `start` (clamped to the data start of its version). */
  static auto open(const LogFiles& files, LogPosition start, ReadBound bound = {})
      -> std::expected<LogEntryReader, core::error>;

  LogEntryReader(LogEntryReader&&) noexcept = default;
  LogEntryReader& operator=(LogEntryReader&&) noexcept = default;

  /** \brief Next entry in append order; std::nullopt at end of log. */
  auto next() -> std::expected<std::optional<LogEntry>, core::error>;

  /** Position right after the last entry returned (the next entry's start). */
  [[nodiscard]] auto position() const noexcept -> LogPosition { return pos_; }
  /** Start position of the last entry returned. */
  [[nodiscard]] auto entry_position() const noexcept -> LogPosition { return entry_pos_; }
  [[nodiscard]] auto tail_damaged() const noexcept -> bool { return tail_damaged_; }

private:
  LogEntryReader(const LogFiles& files, ReadBound bound) : files_(&files), bound_(std::move(bound)) {}

  auto advance_version() -> std::expected<bool, core::error>;
  auto damaged(const std::string& reason) -> std::expected<std::optional<LogEntry>, core::error>;

  const LogFiles* files_;
  ReadBound bound_;
  std::optional<VersionedChannel> channel_;
  LogPosition pos_{};
  LogPosition entry_pos_{};
  bool done_{false};
  bool tail_damaged_{false};
  std::vector<std::uint8_t> buf_;
};

} // namespace trellis::wal

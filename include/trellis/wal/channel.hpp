#pragma once

/** \file channel.hpp
 *  \brief One open log file (one log version) with positioned read/write/truncate.
 *
 * Ownership: the writer owns its channel exclusively; every reader opens its own
 * read-only channel and keeps an independent cursor. Channels are move-only.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>

#include "trellis/error.hpp"
#include "trellis/platform/filesystem.hpp"
#include "trellis/wal/log_position.hpp"

namespace trellis::wal {

class VersionedChannel {
public:
  VersionedChannel() = default;
  VersionedChannel(platform::FileHandle fd, std::filesystem::path path, std::uint64_t version, LogHeader header)
      : fd_(std::move(fd)), path_(std::move(path)), version_(version), header_(header) {}

  VersionedChannel(VersionedChannel&&) noexcept = default;
  VersionedChannel& operator=(VersionedChannel&&) noexcept = default;
  VersionedChannel(const VersionedChannel&) = delete;
  VersionedChannel& operator=(const VersionedChannel&) = delete;

  auto read(std::span<std::uint8_t> out, std::uint64_t offset) const -> std::expected<std::size_t, core::error>;
  auto write(std::span<const std::uint8_t> bytes, std::uint64_t offset) -> std::expected<void, core::error>;
  auto truncate(std::uint64_t size) -> std::expected<void, core::error>;
  auto size() const -> std::expected<std::uint64_t, core::error>;
  /** fsync file data and metadata. */
  auto force() -> std::expected<void, core::error>;
  auto close() noexcept -> void { fd_.close(); }

  [[nodiscard]] auto is_open() const noexcept -> bool { return fd_.is_valid(); }
  [[nodiscard]] auto version() const noexcept -> std::uint64_t { return version_; }
  [[nodiscard]] auto header() const noexcept -> const LogHeader& { return header_; }
  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return path_; }
  [[nodiscard]] auto data_start() const noexcept -> LogPosition { return header_.start_position(); }

private:
  platform::FileHandle fd_;
  std::filesystem::path path_;
  std::uint64_t version_{0};
  LogHeader header_{};
};

} // namespace trellis::wal

#pragma once

/** \file log_files.hpp
 *  \brief Directory view over versioned log files and the version bridge.
 *
 * Files are named `<prefix><8+ digit version>.log`; ordering is the numeric sort of the
 * captured digits. The view is recomputed from the directory on every call.
 *
 * Version bridge: next_channel() opens version v+1 for a reader that exhausted v. A missing
 * file, a short or invalid header, or a version beyond the reader's bound is end of log.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "trellis/error.hpp"
#include "trellis/wal/channel.hpp"
#include "trellis/wal/log_position.hpp"

namespace trellis::wal {

constexpr auto CHECKPOINT_FILE_NAME = "wal.checkpoint";

struct LogFilesOptions {
  std::filesystem::path dir;     /**< directory holding the log files */
  std::string prefix{"wal-"};    /**< file prefix */
  std::uint64_t store_id{0};     /**< written into every new header */
};

class LogFiles {
public:
  explicit LogFiles(LogFilesOptions opts);

  [[nodiscard]] auto directory() const noexcept -> const std::filesystem::path& { return opts_.dir; }
  [[nodiscard]] auto prefix() const noexcept -> const std::string& { return opts_.prefix; }
  [[nodiscard]] auto store_id() const noexcept -> std::uint64_t { return opts_.store_id; }
  void set_store_id(std::uint64_t id) noexcept { opts_.store_id = id; }

  auto path_for(std::uint64_t version) const -> std::filesystem::path;
  auto checkpoint_file_path() const -> std::filesystem::path;

  /** \brief Versions present on disk, ascending; empty when the directory is absent. */
  auto versions() const -> std::vector<std::uint64_t>;
  auto lowest_version() const -> std::optional<std::uint64_t>;
  auto highest_version() const -> std::optional<std::uint64_t>;
  auto has_version(std::uint64_t version) const -> bool;

  /** \brief Read the header of `version`; nullopt when short or invalid, not_found when absent. */
  auto extract_header(std::uint64_t version) const -> std::expected<std::optional<LogHeader>, core::error>;

  /** \brief Read-only channel for `version`; nullopt when the file has no valid header. */
  auto open_for_version(std::uint64_t version) const
      -> std::expected<std::optional<VersionedChannel>, core::error>;

  /** \brief Read-write channel for `version`, creating the file and writing its header when
   *  missing. Idempotent: an existing valid header is kept, a header-only file with a torn
   *  header is rewritten. */
  auto create_channel_for_version(std::uint64_t version, std::uint64_t reference_tx_id)
      -> std::expected<VersionedChannel, core::error>;

  /** \brief Version bridge. `bound` limits how far a reader may go (writer's flushed position). */
  auto next_channel(std::uint64_t exhausted_version, std::optional<LogPosition> bound = std::nullopt) const
      -> std::expected<std::optional<VersionedChannel>, core::error>;

private:
  LogFilesOptions opts_;
};

} // namespace trellis::wal

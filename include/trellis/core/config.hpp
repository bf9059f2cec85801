#pragma once

/** \file config.hpp
 *  \brief Database configuration: option struct, key=value file loader, TRELLIS_* env overrides.
 *
 * File format: one `key=value` per line; blank lines and lines starting with '#' are ignored.
 * Keys match the field names of DatabaseConfig.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "trellis/error.hpp"

namespace trellis::core {

/** Where checkpoint entries live. */
enum class CheckpointLayout : std::uint8_t { interleaved, dedicated };

constexpr std::uint64_t DEFAULT_ROTATION_THRESHOLD = 256ull * 1024 * 1024;
constexpr std::string_view DEFAULT_LOG_SUBDIR = "tx-logs";

struct DatabaseConfig {
  std::string name{"trellis"};                 /**< database name, key for the state service */
  std::filesystem::path store_dir;             /**< metadata, node store and id file */
  std::filesystem::path log_dir;               /**< empty: store_dir / "tx-logs" */
  std::string log_prefix{"wal-"};              /**< log file prefix */
  std::uint64_t rotation_threshold{DEFAULT_ROTATION_THRESHOLD};
  CheckpointLayout checkpoint_layout{CheckpointLayout::interleaved};
  bool fail_on_missing_files{true};            /**< false enables forced recovery */
  std::uint64_t checkpoint_interval_tx{0};     /**< 0 disables periodic checkpoints */
  std::size_t log_buffer_size{0};              /**< 0: derived from available parallelism */
  std::string log_level{"info"};
};

auto resolved_log_dir(const DatabaseConfig& cfg) -> std::filesystem::path;

auto parse_checkpoint_layout(std::string_view text) -> std::expected<CheckpointLayout, error>;
auto to_string(CheckpointLayout layout) -> std::string_view;

/** \brief Load a key=value file over the defaults. */
auto load_config(const std::filesystem::path& path) -> std::expected<DatabaseConfig, error>;

/** \brief Apply TRELLIS_ROTATION_THRESHOLD, TRELLIS_CHECKPOINT_LAYOUT, TRELLIS_FAIL_ON_MISSING_FILES,
 *  TRELLIS_CHECKPOINT_INTERVAL_TX and TRELLIS_LOG_LEVEL when set. */
auto apply_env_overrides(DatabaseConfig& cfg) -> std::expected<void, error>;

auto validate(const DatabaseConfig& cfg) -> std::expected<void, error>;

} // namespace trellis::core

#pragma once

/** \file logging.hpp
 *  \brief Component loggers on top of spdlog.
 *
 * One sink is shared by every logger of a database; each component
 * ("wal", "recovery", "database") gets its own named logger.
 */

#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "trellis/error.hpp"

namespace trellis::core {

using LogPtr = std::shared_ptr<spdlog::logger>;
using LogSink = spdlog::sink_ptr;

enum class LogTarget { stderr_color, file, null };

constexpr auto LOG_FILENAME = "trellis.log";

/** \brief Create a sink; `dir` is only used by LogTarget::file. */
auto create_sink(LogTarget target, const std::filesystem::path& dir = {}) -> LogSink;

/** \brief Create a named logger writing to `sink` (null sink when empty). */
auto create_logger(LogSink sink, std::string_view name) -> LogPtr;

/** \brief Parse "trace", "debug", "info", "warn", "error", "critical" or "off". */
auto parse_log_level(std::string_view text) -> std::expected<spdlog::level::level_enum, error>;

} // namespace trellis::core

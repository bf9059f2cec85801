#include "trellis/core/logging.hpp"

#include <string>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace trellis::core {

auto create_sink(LogTarget target, const std::filesystem::path& dir) -> LogSink {
  switch (target) {
    case LogTarget::file:
      return std::make_shared<spdlog::sinks::basic_file_sink_mt>((dir / LOG_FILENAME).string());
    case LogTarget::stderr_color:
      return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    case LogTarget::null:
      break;
  }
  return std::make_shared<spdlog::sinks::null_sink_mt>();
}

auto create_logger(LogSink sink, std::string_view name) -> LogPtr {
  if (!sink) sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  auto log = std::make_shared<spdlog::logger>(std::string(name), std::move(sink));
  log->set_level(spdlog::level::trace);
  return log;
}

auto parse_log_level(std::string_view text) -> std::expected<spdlog::level::level_enum, error> {
  if (text == "trace") return spdlog::level::trace;
  if (text == "debug") return spdlog::level::debug;
  if (text == "info") return spdlog::level::info;
  if (text == "warn") return spdlog::level::warn;
  if (text == "error") return spdlog::level::err;
  if (text == "critical") return spdlog::level::critical;
  if (text == "off") return spdlog::level::off;
  return std::unexpected(error{error_code::config_invalid,
                               "unrecognized log level '" + std::string(text) + "'", "core.logging"});
}

} // namespace trellis::core

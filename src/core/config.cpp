#include "trellis/core/config.hpp"
#include "trellis/core/logging.hpp"
#include "trellis/core/platform_utils.hpp"

#include <charconv>
#include <fstream>

namespace trellis::core {

namespace {

auto parse_u64(std::string_view s, std::uint64_t& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  unsigned long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end || beg == end) return false;
  out = static_cast<std::uint64_t>(tmp);
  return true;
}

auto parse_bool(std::string_view s, bool& out) -> bool {
  if (s == "true" || s == "1" || s == "yes") { out = true; return true; }
  if (s == "false" || s == "0" || s == "no") { out = false; return true; }
  return false;
}

auto trim(std::string_view s) -> std::string_view {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
  return s;
}

// Applies one key/value pair; returns a short reason on failure.
auto apply_setting(DatabaseConfig& cfg, std::string_view k, std::string_view v) -> std::expected<void, std::string> {
  if (k == "name") { cfg.name = std::string(v); return {}; }
  if (k == "store_dir") { cfg.store_dir = std::filesystem::path(std::string(v)); return {}; }
  if (k == "log_dir") { cfg.log_dir = std::filesystem::path(std::string(v)); return {}; }
  if (k == "log_prefix") { cfg.log_prefix = std::string(v); return {}; }
  if (k == "log_level") { cfg.log_level = std::string(v); return {}; }
  if (k == "rotation_threshold") {
    if (!parse_u64(v, cfg.rotation_threshold)) return std::unexpected("invalid rotation_threshold=\"" + std::string(v) + "\"");
    return {};
  }
  if (k == "checkpoint_interval_tx") {
    if (!parse_u64(v, cfg.checkpoint_interval_tx)) return std::unexpected("invalid checkpoint_interval_tx=\"" + std::string(v) + "\"");
    return {};
  }
  if (k == "log_buffer_size") {
    std::uint64_t n = 0;
    if (!parse_u64(v, n)) return std::unexpected("invalid log_buffer_size=\"" + std::string(v) + "\"");
    cfg.log_buffer_size = static_cast<std::size_t>(n);
    return {};
  }
  if (k == "fail_on_missing_files") {
    if (!parse_bool(v, cfg.fail_on_missing_files)) return std::unexpected("invalid fail_on_missing_files=\"" + std::string(v) + "\"");
    return {};
  }
  if (k == "checkpoint_layout") {
    auto layout = parse_checkpoint_layout(v);
    if (!layout) return std::unexpected(layout.error().message);
    cfg.checkpoint_layout = *layout;
    return {};
  }
  return std::unexpected("unknown key \"" + std::string(k) + "\"");
}

} // namespace

auto resolved_log_dir(const DatabaseConfig& cfg) -> std::filesystem::path {
  if (!cfg.log_dir.empty()) return cfg.log_dir;
  return cfg.store_dir / DEFAULT_LOG_SUBDIR;
}

auto parse_checkpoint_layout(std::string_view text) -> std::expected<CheckpointLayout, error> {
  if (text == "interleaved") return CheckpointLayout::interleaved;
  if (text == "dedicated") return CheckpointLayout::dedicated;
  return std::unexpected(error{error_code::config_invalid,
                               "invalid checkpoint_layout=\"" + std::string(text) + "\"", "core.config"});
}

auto to_string(CheckpointLayout layout) -> std::string_view {
  return layout == CheckpointLayout::dedicated ? "dedicated" : "interleaved";
}

auto load_config(const std::filesystem::path& path) -> std::expected<DatabaseConfig, error> {
  DatabaseConfig cfg{};
  std::ifstream in(path);
  if (!in.good()) {
    return std::unexpected(error{error_code::not_found, "config open failed: " + path.string(), "core.config"});
  }
  std::string line; std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    auto s = trim(line);
    if (s.empty() || s.front() == '#') continue;
    auto eq = s.find('=');
    if (eq == std::string_view::npos) {
      return std::unexpected(error{error_code::config_invalid,
                                   "config parse error at line " + std::to_string(line_no) + ": expected key=value",
                                   "core.config"});
    }
    auto applied = apply_setting(cfg, trim(s.substr(0, eq)), trim(s.substr(eq + 1)));
    if (!applied) {
      return std::unexpected(error{error_code::config_invalid,
                                   "config parse error at line " + std::to_string(line_no) + ": " + applied.error(),
                                   "core.config"});
    }
  }
  return cfg;
}

auto apply_env_overrides(DatabaseConfig& cfg) -> std::expected<void, error> {
  static constexpr std::pair<const char*, std::string_view> vars[] = {
    {"TRELLIS_ROTATION_THRESHOLD", "rotation_threshold"},
    {"TRELLIS_CHECKPOINT_LAYOUT", "checkpoint_layout"},
    {"TRELLIS_FAIL_ON_MISSING_FILES", "fail_on_missing_files"},
    {"TRELLIS_CHECKPOINT_INTERVAL_TX", "checkpoint_interval_tx"},
    {"TRELLIS_LOG_LEVEL", "log_level"},
  };
  for (const auto& [env, key] : vars) {
    auto v = safe_getenv(env);
    if (!v) continue;
    auto applied = apply_setting(cfg, key, trim(*v));
    if (!applied) {
      return std::unexpected(error{error_code::config_invalid,
                                   std::string(env) + ": " + applied.error(), "core.config"});
    }
  }
  return {};
}

auto validate(const DatabaseConfig& cfg) -> std::expected<void, error> {
  if (cfg.store_dir.empty()) {
    return std::unexpected(error{error_code::config_invalid, "store_dir is required", "core.config"});
  }
  if (cfg.log_prefix.empty() || cfg.log_prefix.find('/') != std::string::npos) {
    return std::unexpected(error{error_code::config_invalid, "invalid log_prefix", "core.config"});
  }
  if (cfg.rotation_threshold < 4096) {
    return std::unexpected(error{error_code::config_invalid, "rotation_threshold must be at least 4096", "core.config"});
  }
  if (auto lvl = parse_log_level(cfg.log_level); !lvl) return std::unexpected(lvl.error());
  return {};
}

} // namespace trellis::core

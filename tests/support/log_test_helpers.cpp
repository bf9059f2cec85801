#include "tests/support/log_test_helpers.hpp"

#include <fstream>

#include <trellis/wal/checkpoint.hpp>
#include <trellis/wal/log_files.hpp>
#include <trellis/wal/reader.hpp>

namespace test_support {

namespace fs = std::filesystem;
using namespace trellis;

namespace {
wal::LogFiles files_for(const core::DatabaseConfig& cfg) {
  return wal::LogFiles({.dir = core::resolved_log_dir(cfg), .prefix = cfg.log_prefix});
}
}

fs::path fresh_dir(const std::string& name) {
  auto dir = fs::temp_directory_path() / name;
  std::error_code ec; fs::remove_all(dir, ec); fs::create_directories(dir, ec);
  return dir;
}

core::DatabaseConfig make_config(const fs::path& store_dir, core::CheckpointLayout layout) {
  core::DatabaseConfig cfg{};
  cfg.store_dir = store_dir;
  cfg.checkpoint_layout = layout;
  cfg.log_level = "off";
  return cfg;
}

std::size_t checkpoint_count(const core::DatabaseConfig& cfg) {
  auto files = files_for(cfg);
  auto cps = wal::make_checkpoint_file(cfg.checkpoint_layout, files);
  auto all = cps->reachable();
  return all ? all->size() : 0;
}

bool remove_last_checkpoint(const core::DatabaseConfig& cfg) {
  auto files = files_for(cfg);
  auto cps = wal::make_checkpoint_file(cfg.checkpoint_layout, files);
  auto latest = cps->find_latest();
  if (!latest || !latest->has_value()) return false;
  const auto file = cps->current_file();
  std::error_code ec;
  fs::resize_file(file, (*latest)->entry_position.byte_offset, ec);
  return !ec;
}

std::vector<fs::path> log_file_paths(const core::DatabaseConfig& cfg) {
  auto files = files_for(cfg);
  std::vector<fs::path> out;
  for (auto v : files.versions()) out.push_back(files.path_for(v));
  return out;
}

void append_bytes(const fs::path& file, const std::vector<std::uint8_t>& bytes) {
  std::ofstream out(file, std::ios::binary | std::ios::app);
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

std::vector<wal::LogEntry> read_all(const wal::LogFiles& files, wal::LogPosition from) {
  std::vector<wal::LogEntry> out;
  auto r = wal::LogEntryReader::open(files, from);
  REQUIRE(r.has_value());
  for (;;) {
    auto e = r->next();
    REQUIRE(e.has_value());
    if (!e->has_value()) break;
    out.push_back(std::move(**e));
  }
  return out;
}

} // namespace test_support

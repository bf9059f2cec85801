#include <catch2/catch_all.hpp>
#include <trellis/core/config.hpp>
#include <trellis/core/logging.hpp>
#include <tests/support/log_test_helpers.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace trellis;
namespace fs = std::filesystem;

namespace {
auto write_config(const fs::path& dir, const std::string& text) -> fs::path {
  auto p = dir / "trellis.conf";
  std::ofstream(p) << text;
  return p;
}
}

TEST_CASE("config file overrides defaults", "[config]") {
  auto dir = test_support::fresh_dir("trellis_config_load");
  auto p = write_config(dir,
      "# comment\n"
      "\n"
      "name = graph\n"
      "store_dir=/var/lib/graph\n"
      "rotation_threshold=1048576\n"
      "checkpoint_layout=dedicated\n"
      "fail_on_missing_files=false\n"
      "checkpoint_interval_tx=100\n");
  auto cfg = core::load_config(p);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->name == "graph");
  REQUIRE(cfg->store_dir == fs::path("/var/lib/graph"));
  REQUIRE(cfg->rotation_threshold == 1048576);
  REQUIRE(cfg->checkpoint_layout == core::CheckpointLayout::dedicated);
  REQUIRE_FALSE(cfg->fail_on_missing_files);
  REQUIRE(cfg->checkpoint_interval_tx == 100);
  REQUIRE(cfg->log_prefix == "wal-");
  REQUIRE(core::resolved_log_dir(*cfg) == fs::path("/var/lib/graph") / "tx-logs");
}

TEST_CASE("config parse errors name the line", "[config]") {
  auto dir = test_support::fresh_dir("trellis_config_errors");
  SECTION("missing separator") {
    auto cfg = core::load_config(write_config(dir, "name=a\nstore_dir\n"));
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == core::error_code::config_invalid);
    REQUIRE(cfg.error().message.find("line 2") != std::string::npos);
  }
  SECTION("bad number") {
    auto cfg = core::load_config(write_config(dir, "rotation_threshold=lots\n"));
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().message.find("line 1") != std::string::npos);
  }
  SECTION("unknown key") {
    auto cfg = core::load_config(write_config(dir, "\nwal_mode=fast\n"));
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().message.find("wal_mode") != std::string::npos);
  }
  SECTION("missing file") {
    auto cfg = core::load_config(dir / "absent.conf");
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == core::error_code::not_found);
  }
}

TEST_CASE("environment overrides apply over loaded values", "[config][env]") {
  core::DatabaseConfig cfg{};
  setenv("TRELLIS_ROTATION_THRESHOLD", "65536", 1);
  setenv("TRELLIS_CHECKPOINT_LAYOUT", "dedicated", 1);
  setenv("TRELLIS_FAIL_ON_MISSING_FILES", "no", 1);
  auto ok = core::apply_env_overrides(cfg);
  unsetenv("TRELLIS_ROTATION_THRESHOLD");
  unsetenv("TRELLIS_CHECKPOINT_LAYOUT");
  unsetenv("TRELLIS_FAIL_ON_MISSING_FILES");
  REQUIRE(ok.has_value());
  REQUIRE(cfg.rotation_threshold == 65536);
  REQUIRE(cfg.checkpoint_layout == core::CheckpointLayout::dedicated);
  REQUIRE_FALSE(cfg.fail_on_missing_files);

  setenv("TRELLIS_CHECKPOINT_LAYOUT", "sideways", 1);
  auto bad = core::apply_env_overrides(cfg);
  unsetenv("TRELLIS_CHECKPOINT_LAYOUT");
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().message.find("TRELLIS_CHECKPOINT_LAYOUT") != std::string::npos);
}

TEST_CASE("validate rejects unusable configurations", "[config]") {
  core::DatabaseConfig cfg{};
  REQUIRE(core::validate(cfg).error().code == core::error_code::config_invalid);
  cfg.store_dir = "/tmp/x";
  REQUIRE(core::validate(cfg).has_value());

  auto tiny = cfg; tiny.rotation_threshold = 100;
  REQUIRE_FALSE(core::validate(tiny).has_value());
  auto slash = cfg; slash.log_prefix = "a/b";
  REQUIRE_FALSE(core::validate(slash).has_value());
  auto level = cfg; level.log_level = "loud";
  REQUIRE_FALSE(core::validate(level).has_value());
  REQUIRE(core::parse_log_level("warn").value() == spdlog::level::warn);
}

TEST_CASE("file sink writes component loggers to trellis.log", "[config][logging]") {
  auto dir = test_support::fresh_dir("trellis_logging_file");
  {
    auto sink = core::create_sink(core::LogTarget::file, dir);
    auto log = core::create_logger(sink, "wal");
    log->warn("rotated to version {}", 3);
    log->flush();
  }
  std::ifstream in(dir / core::LOG_FILENAME);
  std::stringstream text;
  text << in.rdbuf();
  REQUIRE_THAT(text.str(), Catch::Matchers::ContainsSubstring("rotated to version 3"));
  REQUIRE_THAT(text.str(), Catch::Matchers::ContainsSubstring("[wal]"));
}

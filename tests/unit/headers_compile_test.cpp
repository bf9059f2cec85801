#include <trellis/core/config.hpp>
#include <trellis/core/logging.hpp>
#include <trellis/error.hpp>
#include <trellis/kernel/database.hpp>
#include <trellis/recovery/recovery.hpp>
#include <trellis/wal.hpp>
#include <trellis/wal/channel.hpp>
#include <trellis/wal/log_version_repository.hpp>
#include <trellis/wal/reader.hpp>
#include <trellis/wal/transaction_id_store.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("headers compile and basic types exist", "[headers]") {
  trellis::core::DatabaseConfig cfg{};
  REQUIRE(cfg.rotation_threshold == trellis::core::DEFAULT_ROTATION_THRESHOLD);
  REQUIRE(cfg.checkpoint_layout == trellis::core::CheckpointLayout::interleaved);
  REQUIRE(cfg.fail_on_missing_files);
  trellis::wal::LogPosition p{};
  REQUIRE(p.log_version == 0);
}

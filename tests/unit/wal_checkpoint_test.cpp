#include <catch2/catch_all.hpp>
#include <trellis/wal/checkpoint.hpp>
#include <trellis/wal/transaction_log_file.hpp>
#include <tests/support/log_test_helpers.hpp>

#include <filesystem>

using namespace trellis;
namespace fs = std::filesystem;

namespace {
auto info_at(wal::LogPosition p, std::uint64_t store_id, std::uint64_t tx, std::string reason) -> wal::CheckpointInfo {
  return wal::CheckpointInfo{.log_position = p, .entry_position = {}, .store_id = store_id,
                             .transaction_id = tx, .timestamp_ms = 1000 + tx, .reason = std::move(reason)};
}
}

TEST_CASE("checkpoint positions are monotonic in both layouts", "[wal][checkpoint]") {
  const auto layout = GENERATE(core::CheckpointLayout::interleaved, core::CheckpointLayout::dedicated);
  test_support::LogFixture fx(std::string("trellis_cp_mono_") + std::string(core::to_string(layout)));
  auto w = fx.open_writer();
  REQUIRE(w.has_value());
  auto cps = wal::make_checkpoint_file(layout, *fx.files);
  cps->attach(w->get());
  REQUIRE(cps->layout() == layout);

  auto none = cps->find_latest();
  REQUIRE(none.has_value());
  REQUIRE_FALSE(none->has_value());

  auto first = cps->write(info_at((*w)->flushed_position(), fx.meta->store_id(), 0, "first"));
  REQUIRE(first.has_value());
  REQUIRE((*w)->append(wal::StartEntry{1, 1, 0}).has_value());
  REQUIRE((*w)->append(wal::CommitEntry{1, 2}).has_value());
  REQUIRE((*w)->flush().has_value());
  auto second = cps->write(info_at((*w)->flushed_position(), fx.meta->store_id(), 1, "second"));
  REQUIRE(second.has_value());
  REQUIRE(first->log_position < second->log_position);

  if (layout == core::CheckpointLayout::interleaved) {
    REQUIRE(second->entry_position == second->log_position);
    REQUIRE(cps->current_file() == fx.files->path_for(0));
  } else {
    REQUIRE(second->entry_position.log_version == 0);
    REQUIRE(cps->current_file() == fx.files->checkpoint_file_path());
  }

  auto stale = cps->write(info_at(first->log_position, fx.meta->store_id(), 0, "stale"));
  REQUIRE_FALSE(stale.has_value());
  REQUIRE(stale.error().code == core::error_code::precondition_failed);

  auto all = cps->reachable();
  REQUIRE(all.has_value());
  REQUIRE(all->size() == 2);
  REQUIRE(all->front().reason == "first");
  REQUIRE(all->back().reason == "second");
  auto latest = cps->find_latest();
  REQUIRE(latest.has_value());
  REQUIRE(latest->has_value());
  REQUIRE((*latest)->transaction_id == 1);
  REQUIRE((*latest)->store_id == fx.meta->store_id());
}

TEST_CASE("truncating at the entry position removes exactly one checkpoint", "[wal][checkpoint]") {
  const auto layout = GENERATE(core::CheckpointLayout::interleaved, core::CheckpointLayout::dedicated);
  test_support::LogFixture fx(std::string("trellis_cp_strip_") + std::string(core::to_string(layout)));
  auto w = fx.open_writer();
  REQUIRE(w.has_value());
  auto cps = wal::make_checkpoint_file(layout, *fx.files);
  cps->attach(w->get());
  for (std::uint64_t i = 1; i <= 3; ++i) {
    REQUIRE((*w)->append(wal::CommitEntry{i, i}).has_value());
    REQUIRE((*w)->flush().has_value());
    REQUIRE(cps->write(info_at((*w)->flushed_position(), fx.meta->store_id(), i, "cp")).has_value());
  }
  REQUIRE((*w)->close().has_value());
  cps->attach(nullptr);

  auto latest = cps->find_latest();
  REQUIRE(latest.has_value());
  REQUIRE(latest->has_value());
  fs::resize_file(cps->current_file(), (*latest)->entry_position.byte_offset);

  auto all = cps->reachable();
  REQUIRE(all.has_value());
  REQUIRE(all->size() == 2);
  REQUIRE(all->back().transaction_id == 2);
}

TEST_CASE("dedicated checkpoint file tolerates a torn last record", "[wal][checkpoint][crash]") {
  test_support::LogFixture fx("trellis_cp_torn");
  auto cps = wal::make_checkpoint_file(core::CheckpointLayout::dedicated, *fx.files);
  REQUIRE(cps->write(info_at({0, 64}, fx.meta->store_id(), 1, "a")).has_value());
  const auto good_size = fs::file_size(cps->current_file());
  test_support::append_bytes(cps->current_file(), std::vector<std::uint8_t>(11, 0x45));

  auto latest = cps->find_latest();
  REQUIRE(latest.has_value());
  REQUIRE(latest->has_value());
  REQUIRE((*latest)->reason == "a");

  auto next = cps->write(info_at({0, 128}, fx.meta->store_id(), 2, "b"));
  REQUIRE(next.has_value());
  REQUIRE(next->entry_position == wal::LogPosition{0, good_size});
  auto all = cps->reachable();
  REQUIRE(all.has_value());
  REQUIRE(all->size() == 2);
}

TEST_CASE("interleaved checkpoint without a writer lands exactly at the log tail", "[wal][checkpoint]") {
  test_support::LogFixture fx("trellis_cp_direct");
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    REQUIRE((*w)->append(wal::CommitEntry{1, 1}).has_value());
    REQUIRE((*w)->close().has_value());
  }
  const wal::LogPosition tail{0, wal::LOG_HEADER_SIZE + 32};
  auto cps = wal::make_checkpoint_file(core::CheckpointLayout::interleaved, *fx.files);
  auto cp = cps->write(info_at(tail, fx.meta->store_id(), 1, "Recovery completed."));
  REQUIRE(cp.has_value());
  REQUIRE(cp->entry_position == tail);

  auto entries = test_support::read_all(*fx.files);
  REQUIRE(entries.size() == 2);
  REQUIRE(std::holds_alternative<wal::CheckpointEntry>(entries.back()));

  SECTION("a writer opened afterwards appends after the checkpoint") {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    REQUIRE((*w)->current_position().byte_offset == fs::file_size(fx.files->path_for(0)));
  }
}

TEST_CASE("interleaved checkpoint without a writer refuses a log version sealed by rotation", "[wal][checkpoint][rotation]") {
  test_support::LogFixture fx("trellis_cp_sealed");
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    REQUIRE((*w)->append(wal::CommitEntry{1, 1}).has_value());
    REQUIRE((*w)->flush().has_value());
    REQUIRE((*w)->rotate().has_value());
    REQUIRE((*w)->close().has_value());
  }
  const auto sealed = fs::file_size(fx.files->path_for(0));
  auto cps = wal::make_checkpoint_file(core::CheckpointLayout::interleaved, *fx.files);

  auto into_sealed = cps->write(info_at({0, sealed}, fx.meta->store_id(), 1, "Recovery completed."));
  REQUIRE_FALSE(into_sealed.has_value());
  REQUIRE(into_sealed.error().code == core::error_code::precondition_failed);
  REQUIRE(fs::file_size(fx.files->path_for(0)) == sealed);

  auto at_tail = cps->write(info_at({1, wal::LOG_HEADER_SIZE}, fx.meta->store_id(), 1, "Recovery completed."));
  REQUIRE(at_tail.has_value());
  REQUIRE(at_tail->entry_position == wal::LogPosition{1, wal::LOG_HEADER_SIZE});
  REQUIRE(fs::file_size(fx.files->path_for(0)) == sealed);
}

TEST_CASE("latest checkpoint is remembered until it disappears from disk", "[wal][checkpoint]") {
  const auto layout = GENERATE(core::CheckpointLayout::interleaved, core::CheckpointLayout::dedicated);
  test_support::LogFixture fx(std::string("trellis_cp_remember_") + std::string(core::to_string(layout)));
  auto w = fx.open_writer();
  REQUIRE(w.has_value());
  auto cps = wal::make_checkpoint_file(layout, *fx.files);
  cps->attach(w->get());

  auto first = cps->write(info_at((*w)->flushed_position(), fx.meta->store_id(), 0, "first"));
  REQUIRE(first.has_value());
  REQUIRE((*w)->append(wal::CommitEntry{1, 1}).has_value());
  REQUIRE((*w)->flush().has_value());
  auto second = cps->write(info_at((*w)->flushed_position(), fx.meta->store_id(), 1, "second"));
  REQUIRE(second.has_value());

  // Transactions after the checkpoint do not change the answer.
  for (std::uint64_t tx = 2; tx <= 20; ++tx) REQUIRE((*w)->append(wal::CommitEntry{tx, tx}).has_value());
  REQUIRE((*w)->flush().has_value());
  auto latest = cps->find_latest();
  REQUIRE(latest.has_value());
  REQUIRE(latest->has_value());
  REQUIRE((*latest)->reason == "second");

  auto fresh = wal::make_checkpoint_file(layout, *fx.files);
  auto scanned = fresh->find_latest();
  REQUIRE(scanned.has_value());
  REQUIRE(scanned->has_value());
  REQUIRE((*scanned)->entry_position == (*latest)->entry_position);

  REQUIRE((*w)->close().has_value());
  cps->attach(nullptr);
  fs::resize_file(cps->current_file(), second->entry_position.byte_offset);

  latest = cps->find_latest();
  REQUIRE(latest.has_value());
  REQUIRE(latest->has_value());
  REQUIRE((*latest)->reason == "first");

  auto third = cps->write(info_at(second->log_position, fx.meta->store_id(), 1, "third"));
  REQUIRE(third.has_value());
  REQUIRE(third->entry_position == second->entry_position);
  auto all = cps->reachable();
  REQUIRE(all.has_value());
  REQUIRE(all->size() == 2);
  REQUIRE(all->back().reason == "third");
}

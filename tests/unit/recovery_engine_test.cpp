#include <catch2/catch_all.hpp>
#include <trellis/recovery/recovery.hpp>
#include <trellis/store/node_store.hpp>
#include <trellis/wal/checkpoint.hpp>
#include <tests/support/log_test_helpers.hpp>

#include <filesystem>
#include <map>
#include <utility>

using namespace trellis;
using store::NodeCommand;
namespace fs = std::filesystem;

namespace {

struct RecoveryFixture : test_support::LogFixture {
  core::CheckpointLayout layout;
  std::unique_ptr<wal::CheckpointFile> checkpoints;
  std::unique_ptr<store::NodeStore> nodes;
  recovery::AvailabilityGuard guard;
  recovery::RecoveryMonitor monitor;

  RecoveryFixture(const std::string& name, core::CheckpointLayout l = core::CheckpointLayout::interleaved)
      : LogFixture(name), layout(l) {
    checkpoints = wal::make_checkpoint_file(layout, *files);
    auto n = store::NodeStore::open(dir);
    REQUIRE(n.has_value());
    nodes = std::move(*n);
    // A created store always has its data and id files.
    REQUIRE(nodes->flush().has_value());
  }

  auto recovery_layout() const -> recovery::RecoveryLayout {
    return {.store_dir = dir, .log_dir = files->directory(), .log_prefix = "wal-",
            .checkpoint_layout = layout, .auxiliary_files = {}};
  }

  auto engine(bool fail_on_missing_files = true) -> recovery::RecoveryEngine {
    return recovery::RecoveryEngine({.files = files.get(), .checkpoints = checkpoints.get(), .metadata = meta.get(),
                                     .store = nodes.get(), .auxiliary = nodes.get(), .guard = &guard, .monitor = monitor},
                                    {.fail_on_missing_files = fail_on_missing_files});
  }

  // Reopen the node store from disk, dropping whatever was applied in memory.
  void reload_nodes() {
    nodes.reset();
    auto n = store::NodeStore::open(dir);
    REQUIRE(n.has_value());
    nodes = std::move(*n);
  }
};

// Start, create node `tx`, set its "tx" property, and optionally commit.
void write_tx(wal::TransactionLogFile& w, std::uint64_t tx, bool commit = true) {
  REQUIRE(w.append(wal::StartEntry{tx, 1000 + tx, tx - 1}).has_value());
  REQUIRE(w.append(wal::CommandEntry{tx, store::encode_command({NodeCommand::Op::create_node, tx, "", ""})}).has_value());
  REQUIRE(w.append(wal::CommandEntry{tx, store::encode_command(
                       {NodeCommand::Op::set_property, tx, "tx", std::to_string(tx)})}).has_value());
  if (commit) REQUIRE(w.append(wal::CommitEntry{tx, 2000 + tx}).has_value());
  REQUIRE(w.flush().has_value());
}

auto transaction_entries(const wal::LogFiles& files) -> std::size_t {
  std::size_t n = 0;
  for (const auto& e : test_support::read_all(files)) n += wal::is_transaction_entry(e) ? 1 : 0;
  return n;
}

} // namespace

TEST_CASE("committed groups are replayed and a trailing incomplete group is truncated", "[recovery][replay]") {
  const auto layout = GENERATE(core::CheckpointLayout::interleaved, core::CheckpointLayout::dedicated);
  RecoveryFixture fx(std::string("trellis_rec_trailing_") + std::string(core::to_string(layout)), layout);
  wal::LogPosition after_last_commit{};
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    for (std::uint64_t tx = 1; tx <= 3; ++tx) write_tx(**w, tx);
    after_last_commit = (*w)->flushed_position();
    write_tx(**w, 4, false);
    REQUIRE((*w)->close().has_value());
  }
  REQUIRE(recovery::is_recovery_required(fx.recovery_layout()).value());

  auto engine = fx.engine();
  auto out = engine.perform();
  REQUIRE(out.has_value());
  REQUIRE(engine.state() == recovery::RecoveryState::done);
  REQUIRE(out->recovered_transactions == 3);
  REQUIRE(out->lowest_recovered_tx_id == 1);
  REQUIRE(out->highest_recovered_tx_id == 3);
  REQUIRE(out->tail == after_last_commit);
  REQUIRE(out->truncated_bytes > 0);
  REQUIRE(out->checkpoint.log_position == after_last_commit);
  REQUIRE(out->checkpoint.reason == recovery::RECOVERY_CHECKPOINT_REASON);

  REQUIRE(fx.nodes->node_count() == 3);
  REQUIRE_FALSE(fx.nodes->has_node(4));
  REQUIRE(fx.nodes->property(2, "tx") == std::optional<std::string>("2"));
  REQUIRE(transaction_entries(*fx.files) == 12);
  REQUIRE(fx.meta->last_committed_transaction_id() == 3);

  // The replayed state was flushed before the checkpoint.
  fx.reload_nodes();
  REQUIRE(fx.nodes->node_count() == 3);
  REQUIRE_FALSE(recovery::is_recovery_required(fx.recovery_layout()).value());
}

TEST_CASE("recovery converges when run again", "[recovery][replay]") {
  RecoveryFixture fx("trellis_rec_converge");
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    for (std::uint64_t tx = 1; tx <= 5; ++tx) write_tx(**w, tx);
    REQUIRE((*w)->close().has_value());
  }
  auto first = fx.engine().perform();
  REQUIRE(first.has_value());
  REQUIRE(first->recovered_transactions == 5);

  auto again = fx.engine().perform();
  REQUIRE(again.has_value());
  REQUIRE(again->recovered_transactions == 0);
  REQUIRE(again->truncated_bytes == 0);
  REQUIRE(first->tail <= again->tail);
  REQUIRE(fx.nodes->node_count() == 5);
  REQUIRE(test_support::checkpoint_count(test_support::make_config(fx.dir)) == 2);
}

TEST_CASE("replay starts at the latest checkpoint", "[recovery][replay]") {
  RecoveryFixture fx("trellis_rec_from_checkpoint");
  std::vector<std::uint64_t> lowest_seen;
  std::uint64_t recovered_reported = 0;
  fx.monitor.reverse_store_recovery_completed = [&](std::uint64_t lowest) { lowest_seen.push_back(lowest); };
  fx.monitor.recovery_completed = [&](std::uint64_t n, std::uint64_t) { recovered_reported = n; };
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    fx.checkpoints->attach(w->get());
    write_tx(**w, 1);
    write_tx(**w, 2);
    REQUIRE(fx.checkpoints->write({.log_position = (*w)->flushed_position(), .store_id = fx.meta->store_id(),
                                   .transaction_id = 2, .reason = "periodic"}).has_value());
    write_tx(**w, 3);
    write_tx(**w, 4);
    REQUIRE((*w)->close().has_value());
    fx.checkpoints->attach(nullptr);
  }
  auto out = fx.engine().perform();
  REQUIRE(out.has_value());
  REQUIRE(out->recovered_transactions == 2);
  REQUIRE(lowest_seen == std::vector<std::uint64_t>{3});
  REQUIRE(recovered_reported == 2);
  // Transactions before the checkpoint belong to the store already; this store never saw them.
  REQUIRE_FALSE(fx.nodes->has_node(1));
  REQUIRE(fx.nodes->has_node(3));
  REQUIRE(fx.nodes->has_node(4));
}

TEST_CASE("nothing after the checkpoint reports lowest id 0", "[recovery]") {
  RecoveryFixture fx("trellis_rec_nothing");
  std::optional<std::uint64_t> lowest;
  fx.monitor.reverse_store_recovery_completed = [&](std::uint64_t l) { lowest = l; };
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    REQUIRE((*w)->close().has_value());
  }
  auto out = fx.engine().perform();
  REQUIRE(out.has_value());
  REQUIRE(lowest == std::optional<std::uint64_t>(0));
  REQUIRE(out->recovered_transactions == 0);
  REQUIRE(out->tail == wal::LogPosition{0, wal::LOG_HEADER_SIZE});
}

TEST_CASE("unknown entry types are skipped", "[recovery][compat]") {
  RecoveryFixture fx("trellis_rec_unknown");
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    write_tx(**w, 1);
    REQUIRE((*w)->append(wal::UnknownEntry{99, 0, {1, 2, 3, 4}}).has_value());
    write_tx(**w, 2);
    REQUIRE((*w)->close().has_value());
  }
  auto out = fx.engine().perform();
  REQUIRE(out.has_value());
  REQUIRE(out->recovered_transactions == 2);
  REQUIRE(out->truncated_bytes == 0);
  REQUIRE(fx.nodes->node_count() == 2);
}

TEST_CASE("torn tail is truncated", "[recovery][crash]") {
  RecoveryFixture fx("trellis_rec_torn");
  wal::LogPosition after_first{};
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    write_tx(**w, 1);
    after_first = (*w)->flushed_position();
    write_tx(**w, 2);
    REQUIRE((*w)->close().has_value());
  }
  const auto v0 = fx.files->path_for(0);
  fs::resize_file(v0, fs::file_size(v0) - 5);
  REQUIRE(recovery::is_recovery_required(fx.recovery_layout()).value());

  auto out = fx.engine(/*fail_on_missing_files=*/true).perform();
  REQUIRE(out.has_value());
  REQUIRE(out->recovered_transactions == 1);
  REQUIRE(out->tail == after_first);
  REQUIRE(fx.nodes->has_node(1));
  REQUIRE_FALSE(fx.nodes->has_node(2));
  REQUIRE(transaction_entries(*fx.files) == 4);
}

TEST_CASE("damage followed by a later log version is fatal", "[recovery][corruption]") {
  RecoveryFixture fx("trellis_rec_midstream");
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    write_tx(**w, 1);
    write_tx(**w, 2);
    REQUIRE((*w)->close().has_value());
  }
  const auto v0 = fx.files->path_for(0);
  const auto size_before = fs::file_size(v0) - 5;
  fs::resize_file(v0, size_before);
  REQUIRE(fx.files->create_channel_for_version(1, 2).has_value());

  auto engine = fx.engine();
  auto out = engine.perform();
  REQUIRE_FALSE(out.has_value());
  REQUIRE(out.error().code == core::error_code::data_integrity);
  REQUIRE_THAT(out.error().message, Catch::Matchers::ContainsSubstring("wal-00000000.log"));
  // Nothing was truncated or checkpointed.
  REQUIRE(fs::file_size(v0) == size_before);
  REQUIRE(test_support::checkpoint_count(test_support::make_config(fx.dir)) == 0);
}

TEST_CASE("a checkpoint from another store is rejected", "[recovery]") {
  RecoveryFixture fx("trellis_rec_mismatch", core::CheckpointLayout::dedicated);
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    write_tx(**w, 1);
    REQUIRE((*w)->close().has_value());
  }
  REQUIRE(fx.checkpoints->write({.log_position = {0, wal::LOG_HEADER_SIZE}, .store_id = fx.meta->store_id() + 1,
                                 .transaction_id = 0, .reason = "foreign"}).has_value());
  auto out = fx.engine().perform();
  REQUIRE_FALSE(out.has_value());
  REQUIRE(out.error().code == core::error_code::store_mismatch);
}

TEST_CASE("stopping the guard after the reverse scan aborts recovery without side effects", "[recovery][guard]") {
  RecoveryFixture fx("trellis_rec_abort_scan");
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    write_tx(**w, 1);
    write_tx(**w, 2, false);
    REQUIRE((*w)->close().has_value());
  }
  const auto size_before = fs::file_size(fx.files->path_for(0));
  fx.monitor.reverse_store_recovery_completed = [&](std::uint64_t) { fx.guard.stop(); };

  auto engine = fx.engine();
  auto out = engine.perform();
  REQUIRE_FALSE(out.has_value());
  REQUIRE(out.error().code == core::error_code::start_aborted);
  REQUIRE(engine.state() == recovery::RecoveryState::aborted);
  REQUIRE(fx.guard.is_start_aborted());
  REQUIRE(fx.nodes->node_count() == 0);
  REQUIRE(fs::file_size(fx.files->path_for(0)) == size_before);
  REQUIRE(test_support::checkpoint_count(test_support::make_config(fx.dir)) == 0);

  fx.guard.release();
  fx.monitor = {};
  auto retry = fx.engine().perform();
  REQUIRE(retry.has_value());
  REQUIRE(retry->recovered_transactions == 1);
  REQUIRE(fx.nodes->has_node(1));
}

namespace {
// Applier that stops the guard once the first command reached the store.
class StoppingApplier final : public recovery::StoreApplier {
public:
  StoppingApplier(store::NodeStore& inner, recovery::AvailabilityGuard& guard) : inner_(inner), guard_(guard) {}
  auto apply(const wal::CommandEntry& command) -> std::expected<void, core::error> override {
    guard_.stop();
    return inner_.apply(command);
  }
  auto flush() -> std::expected<void, core::error> override { return inner_.flush(); }

private:
  store::NodeStore& inner_;
  recovery::AvailabilityGuard& guard_;
};
} // namespace

TEST_CASE("stopping the guard during replay aborts after the current transaction", "[recovery][guard]") {
  RecoveryFixture fx("trellis_rec_abort_replay");
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    write_tx(**w, 1);
    write_tx(**w, 2);
    REQUIRE((*w)->close().has_value());
  }
  StoppingApplier stopping(*fx.nodes, fx.guard);
  recovery::RecoveryEngine engine({.files = fx.files.get(), .checkpoints = fx.checkpoints.get(), .metadata = fx.meta.get(),
                                   .store = &stopping, .auxiliary = nullptr, .guard = &fx.guard, .monitor = {}},
                                  {});
  auto out = engine.perform();
  REQUIRE_FALSE(out.has_value());
  REQUIRE(out.error().code == core::error_code::start_aborted);
  REQUIRE(fx.nodes->has_node(1));
  REQUIRE_FALSE(fx.nodes->has_node(2));
  REQUIRE(test_support::checkpoint_count(test_support::make_config(fx.dir)) == 0);

  // Rerunning against the partially applied store replays both transactions again.
  fx.guard.release();
  auto retry = fx.engine().perform();
  REQUIRE(retry.has_value());
  REQUIRE(retry->recovered_transactions == 2);
  REQUIRE(fx.nodes->node_count() == 2);
}

TEST_CASE("missing logs fail by default and are recreated when forced", "[recovery][missing]") {
  RecoveryFixture fx("trellis_rec_missing_logs");
  fs::create_directories(fx.files->directory());
  fx.meta->transaction_closed(3, {0, 400});
  REQUIRE(fx.meta->flush().has_value());
  REQUIRE(recovery::is_recovery_required(fx.recovery_layout()).value());

  auto strict = fx.engine().perform();
  REQUIRE_FALSE(strict.has_value());
  REQUIRE(strict.error().code == core::error_code::logs_missing);
  REQUIRE_THAT(strict.error().message, Catch::Matchers::ContainsSubstring(fx.files->directory().string()));

  REQUIRE(fx.meta->last_missing_logs_recovery_timestamp() == -1);
  auto forced = fx.engine(false).perform();
  REQUIRE(forced.has_value());
  REQUIRE(forced->forced);
  REQUIRE(fx.files->versions() == std::vector<std::uint64_t>{1});
  REQUIRE(fx.meta->last_missing_logs_recovery_timestamp() > 0);
  REQUIRE(forced->checkpoint.log_position == wal::LogPosition{1, wal::LOG_HEADER_SIZE});
  REQUIRE_FALSE(recovery::is_recovery_required(fx.recovery_layout()).value());
}

TEST_CASE("missing auxiliary files", "[recovery][missing]") {
  RecoveryFixture fx("trellis_rec_missing_aux");
  REQUIRE(fx.nodes->flush().has_value());
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    write_tx(**w, 1);
    REQUIRE((*w)->close().has_value());
  }
  fs::remove(fx.nodes->id_file());
  auto layout = fx.recovery_layout();
  layout.auxiliary_files = {fx.nodes->id_file()};
  REQUIRE(recovery::is_recovery_required(layout).value());

  auto strict = fx.engine().perform();
  REQUIRE_FALSE(strict.has_value());
  REQUIRE(strict.error().code == core::error_code::missing_files);

  auto forced = fx.engine(false).perform();
  REQUIRE(forced.has_value());
  REQUIRE(forced->rebuilt_auxiliary);
  REQUIRE(fs::exists(fx.nodes->id_file()));
  REQUIRE(fx.nodes->allocate_node_id() == 2);
}

TEST_CASE("a store that never committed starts without its first log file", "[recovery][missing]") {
  const auto layout = GENERATE(core::CheckpointLayout::interleaved, core::CheckpointLayout::dedicated);
  RecoveryFixture fx(std::string("trellis_rec_first_start_") + std::string(core::to_string(layout)), layout);
  REQUIRE(fx.meta->flush().has_value());
  REQUIRE(fx.files->versions().empty());
  REQUIRE(fx.meta->last_committed_transaction_id() == 0);
  REQUIRE_FALSE(recovery::is_recovery_required(fx.recovery_layout()).value());

  auto out = fx.engine(/*fail_on_missing_files=*/true).perform();
  REQUIRE(out.has_value());
  REQUIRE_FALSE(out->forced);
  REQUIRE(out->recovered_transactions == 0);
  REQUIRE(fx.files->versions() == std::vector<std::uint64_t>{0});
  REQUIRE(out->checkpoint.log_position == wal::LogPosition{0, wal::LOG_HEADER_SIZE});
  REQUIRE(fx.meta->last_missing_logs_recovery_timestamp() == -1);

  SECTION("a checkpoint on record still makes missing logs fatal") {
    fs::remove(fx.files->path_for(0));
    if (layout == core::CheckpointLayout::dedicated) {
      REQUIRE(recovery::is_recovery_required(fx.recovery_layout()).value());
      auto strict = fx.engine().perform();
      REQUIRE_FALSE(strict.has_value());
      REQUIRE(strict.error().code == core::error_code::logs_missing);
    } else {
      // The interleaved checkpoint went with the log file.
      REQUIRE_FALSE(recovery::is_recovery_required(fx.recovery_layout()).value());
    }
  }
}

TEST_CASE("recovery after a crash that follows rotation never touches the sealed file", "[recovery][rotation][crash]") {
  const auto layout = GENERATE(core::CheckpointLayout::interleaved, core::CheckpointLayout::dedicated);
  RecoveryFixture fx(std::string("trellis_rec_after_rotation_") + std::string(core::to_string(layout)), layout);
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    write_tx(**w, 1);
    auto next = (*w)->rotate();
    REQUIRE(next.has_value());
    REQUIRE(*next == wal::LogPosition{1, wal::LOG_HEADER_SIZE});
  }
  const auto sealed = fs::file_size(fx.files->path_for(0));
  REQUIRE(fs::file_size(fx.files->path_for(1)) == wal::LOG_HEADER_SIZE);
  REQUIRE(recovery::is_recovery_required(fx.recovery_layout()).value());

  auto out = fx.engine().perform();
  REQUIRE(out.has_value());
  REQUIRE(out->recovered_transactions == 1);
  REQUIRE(out->tail == wal::LogPosition{1, wal::LOG_HEADER_SIZE});
  REQUIRE(out->checkpoint.log_position == out->tail);
  REQUIRE(fs::file_size(fx.files->path_for(0)) == sealed);
  REQUIRE(fx.meta->last_closed_transaction().position == out->tail);
  REQUIRE_FALSE(recovery::is_recovery_required(fx.recovery_layout()).value());

  // The writer continues in the new file.
  auto w = fx.open_writer();
  REQUIRE(w.has_value());
  REQUIRE((*w)->current_position().log_version == 1);
  write_tx(**w, 2);
  REQUIRE((*w)->close().has_value());
  REQUIRE(fs::file_size(fx.files->path_for(0)) == sealed);
}

TEST_CASE("the recovery check gives the same answer twice and changes no file", "[recovery][check]") {
  RecoveryFixture fx("trellis_rec_check_twice");
  {
    auto w = fx.open_writer();
    REQUIRE(w.has_value());
    write_tx(**w, 1);
    write_tx(**w, 2, /*commit=*/false);
  }
  test_support::append_bytes(fx.files->path_for(0), std::vector<std::uint8_t>(7, 0x45));

  using Snapshot = std::map<std::string, std::pair<std::uintmax_t, fs::file_time_type>>;
  auto snapshot = [&] {
    Snapshot files;
    for (const auto& e : fs::recursive_directory_iterator(fx.dir)) {
      if (e.is_regular_file()) files[e.path().string()] = {e.file_size(), e.last_write_time()};
    }
    return files;
  };
  auto check_twice = [&](bool expected) {
    const auto before = snapshot();
    auto first = recovery::is_recovery_required(fx.recovery_layout());
    auto second = recovery::is_recovery_required(fx.recovery_layout());
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(*first == expected);
    REQUIRE(*second == expected);
    REQUIRE(snapshot() == before);
  };

  check_twice(true);
  REQUIRE(fx.engine().perform().has_value());
  check_twice(false);
}

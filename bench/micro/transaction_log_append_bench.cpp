#include <benchmark/benchmark.h>
#include <trellis/store/metadata_store.hpp>
#include <trellis/store/node_store.hpp>
#include <trellis/wal/transaction_log_file.hpp>
#include <filesystem>
#include <vector>

using namespace trellis;
namespace fs = std::filesystem;

static void BenchEncodeCommandEntry(benchmark::State& state){
  std::vector<std::uint8_t> payload(static_cast<std::size_t>(state.range(0)), 0x5A);
  wal::LogEntry e = wal::CommandEntry{42, payload};
  for (auto _ : state) {
    auto bytes = wal::encode_entry(e);
    benchmark::DoNotOptimize(bytes->data());
  }
  state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BenchEncodeCommandEntry)->Arg(64)->Arg(1024)->Arg(16384);

// Buffered appends; one fsync per 64 entries.
static void BenchAppendFlushEvery64(benchmark::State& state){
  auto dir = fs::temp_directory_path() / "trellis_bench_append";
  std::error_code ec; fs::remove_all(dir, ec); fs::create_directories(dir, ec);
  auto meta = store::MetaDataStore::open(dir, true);
  if (!meta) { state.SkipWithError(meta.error().message.c_str()); return; }
  wal::LogFiles files({.dir = dir / "tx-logs", .prefix = "wal-", .store_id = (*meta)->store_id()});
  auto w = wal::TransactionLogFile::open(files, **meta, **meta, {.rotation_threshold = 64ull << 20}, nullptr);
  if (!w) { state.SkipWithError(w.error().message.c_str()); return; }
  std::vector<std::uint8_t> payload(static_cast<std::size_t>(state.range(0)), 0xA5);
  std::uint64_t tx = 0, n = 0;
  for (auto _ : state) {
    auto at = (*w)->append(wal::CommandEntry{++tx, payload});
    benchmark::DoNotOptimize(at);
    if (++n % 64 == 0) { auto f = (*w)->flush(); benchmark::DoNotOptimize(f); }
    if ((*w)->rotation_needed()) { auto r = (*w)->rotate(); benchmark::DoNotOptimize(r); }
  }
  auto c = (*w)->close(); benchmark::DoNotOptimize(c);
  state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
  fs::remove_all(dir, ec);
}
BENCHMARK(BenchAppendFlushEvery64)->Arg(128)->Arg(4096);

static void BenchApplySetProperty(benchmark::State& state){
  auto dir = fs::temp_directory_path() / "trellis_bench_apply";
  std::error_code ec; fs::remove_all(dir, ec); fs::create_directories(dir, ec);
  auto nodes = store::NodeStore::open(dir);
  if (!nodes) { state.SkipWithError(nodes.error().message.c_str()); return; }
  auto created = (*nodes)->apply(store::NodeCommand{.op = store::NodeCommand::Op::create_node, .node_id = 1});
  benchmark::DoNotOptimize(created);
  wal::CommandEntry cmd{1, store::encode_command({.op = store::NodeCommand::Op::set_property, .node_id = 1,
                                                  .key = "name", .value = "trellis"})};
  for (auto _ : state) {
    auto r = (*nodes)->apply(cmd);
    benchmark::DoNotOptimize(r);
  }
  fs::remove_all(dir, ec);
}
BENCHMARK(BenchApplySetProperty);

BENCHMARK_MAIN();

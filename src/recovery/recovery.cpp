#include "trellis/recovery/recovery.hpp"
#include "trellis/platform/filesystem.hpp"
#include "trellis/wal/reader.hpp"

#include <algorithm>

namespace trellis::recovery {

namespace {

auto now_ms() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch()).count();
}

auto join_paths(const std::vector<std::filesystem::path>& paths) -> std::string {
  std::string out;
  for (const auto& p : paths) {
    if (!out.empty()) out += ", ";
    out += p.string();
  }
  return out;
}

} // namespace

auto to_string(RecoveryState s) -> std::string_view {
  switch (s) {
    case RecoveryState::not_started: return "not_started";
    case RecoveryState::reverse_scan: return "reverse_scan";
    case RecoveryState::forward_replay: return "forward_replay";
    case RecoveryState::checkpoint_written: return "checkpoint_written";
    case RecoveryState::done: return "done";
    case RecoveryState::aborted: return "aborted";
  }
  return "unknown";
}

auto is_recovery_required(const RecoveryLayout& layout) -> std::expected<bool, core::error> {
  std::error_code ec;
  if (!std::filesystem::exists(store::metadata_path(layout.store_dir), ec)) return false;
  for (const auto& f : layout.auxiliary_files) {
    if (!std::filesystem::exists(f, ec)) return true;
  }

  wal::LogFiles files({.dir = layout.log_dir, .prefix = layout.log_prefix});
  const auto versions = files.versions();
  auto checkpoints = wal::make_checkpoint_file(layout.checkpoint_layout, files);
  auto latest = checkpoints->find_latest();
  if (!latest) return std::unexpected(latest.error());

  if (versions.empty()) {
    // A store that never committed loses nothing without logs; the writer creates the first file.
    auto meta = store::load_metadata(layout.store_dir);
    if (!meta) return std::unexpected(meta.error());
    return meta->last_committed_tx_id != 0 || latest->has_value();
  }
  const wal::LogPosition start = *latest ? (*latest)->log_position : wal::LogPosition{versions.front(), 0};

  auto r = wal::LogEntryReader::open(files, start);
  if (!r) {
    // The checkpoint points into a log version that is gone; recovery reports it.
    if (r.error().code == core::error_code::not_found) return true;
    return std::unexpected(r.error());
  }
  for (;;) {
    auto e = r->next();
    if (!e) return std::unexpected(e.error());
    if (!e->has_value()) break;
    if (wal::is_transaction_entry(**e)) return true;
  }
  return r->tail_damaged();
}

RecoveryEngine::RecoveryEngine(RecoveryDependencies deps, RecoveryOptions opts, core::LogPtr log)
    : deps_(std::move(deps)), opts_(opts), log_(log ? std::move(log) : core::create_logger(nullptr, "recovery")) {}

auto RecoveryEngine::abort(const char* phase) -> core::error {
  state_ = RecoveryState::aborted;
  if (deps_.guard != nullptr) deps_.guard->mark_start_aborted();
  log_->warn("recovery aborted during {}: availability guard stopped", phase);
  return core::error{core::error_code::start_aborted,
                     std::string("recovery aborted during ") + phase + ": availability guard stopped", "recovery"};
}

auto RecoveryEngine::check_auxiliary(RecoveryOutcome& out) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (deps_.auxiliary == nullptr) return {};
  const auto missing = deps_.auxiliary->missing_files();
  if (missing.empty()) return {};
  if (opts_.fail_on_missing_files) {
    return std::unexpected(error{error_code::missing_files,
                                 "Auxiliary files are missing: " + join_paths(missing) +
                                 ". Start with fail_on_missing_files=false to regenerate them.",
                                 "recovery"});
  }
  log_->warn("auxiliary files missing, regenerating after recovery: {}", join_paths(missing));
  out.rebuilt_auxiliary = true;
  return {};
}

auto RecoveryEngine::recover_missing_logs(RecoveryOutcome& out) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  const auto& dir = deps_.files->directory();
  if (opts_.fail_on_missing_files) {
    return std::unexpected(error{error_code::logs_missing,
                                 "Transaction logs are missing and recovery is not possible. Expected log files in " +
                                 dir.string(), "recovery"});
  }
  log_->warn("no transaction logs in {}, forcing recovery", dir.string());

  // Start a fresh version so the new checkpoint sorts after anything recorded before.
  auto version = deps_.metadata->increment_and_get();
  if (!version) return std::unexpected(version.error());
  auto ch = deps_.files->create_channel_for_version(*version, deps_.metadata->committing_transaction_id());
  if (!ch) return std::unexpected(ch.error());
  out.forced = true;
  out.start = ch->data_start();
  out.tail = ch->data_start();
  ch->close();
  deps_.metadata->set_last_missing_logs_recovery_timestamp(now_ms());

  if (deps_.monitor.reverse_store_recovery_completed) deps_.monitor.reverse_store_recovery_completed(0);
  if (deps_.guard != nullptr && !deps_.guard->is_available()) return std::unexpected(abort("reverse scan"));
  state_ = RecoveryState::forward_replay;
  return finish(out.tail, out);
}

auto RecoveryEngine::reverse_scan(wal::LogPosition start) -> std::expected<ScanResult, core::error> {
  auto r = wal::LogEntryReader::open(*deps_.files, start);
  if (!r) return std::unexpected(r.error());

  ScanResult res;
  res.valid_end = r->position();
  std::optional<Group> open;
  for (;;) {
    auto e = r->next();
    if (!e) return std::unexpected(e.error());
    if (!e->has_value()) break;
    const auto& entry = **e;
    if (const auto* s = std::get_if<wal::StartEntry>(&entry)) {
      if (open) res.groups.push_back(*open);
      open = Group{s->tx_id, r->entry_position(), {}, false};
    } else if (const auto* c = std::get_if<wal::CommitEntry>(&entry)) {
      if (open && open->tx_id == c->tx_id) {
        open->end = r->position();
        open->committed = true;
        res.groups.push_back(*open);
        open.reset();
        res.valid_end = r->position();
      }
    } else if (!std::holds_alternative<wal::CommandEntry>(entry) && !open) {
      res.valid_end = r->position();
    }
  }
  if (open) res.groups.push_back(*open);
  if (r->tail_damaged()) log_->warn("damaged bytes at the end of the log after {}", wal::to_string(r->position()));
  return res;
}

auto RecoveryEngine::forward_replay(wal::LogPosition from, wal::LogPosition until, RecoveryOutcome& out)
    -> std::expected<void, core::error> {
  auto r = wal::LogEntryReader::open(*deps_.files, from,
                                     [until]() -> std::optional<wal::LogPosition> { return until; });
  if (!r) return std::unexpected(r.error());

  std::optional<std::uint64_t> open_tx;
  std::vector<wal::CommandEntry> pending;
  for (;;) {
    auto e = r->next();
    if (!e) return std::unexpected(e.error());
    if (!e->has_value()) break;
    auto& entry = **e;
    if (const auto* s = std::get_if<wal::StartEntry>(&entry)) {
      if (open_tx) log_->debug("transaction {} has no commit, skipped", *open_tx);
      open_tx = s->tx_id;
      pending.clear();
    } else if (auto* cmd = std::get_if<wal::CommandEntry>(&entry)) {
      if (open_tx && *open_tx == cmd->tx_id) pending.push_back(std::move(*cmd));
    } else if (const auto* c = std::get_if<wal::CommitEntry>(&entry)) {
      if (!open_tx || *open_tx != c->tx_id) continue;
      for (const auto& p : pending) {
        if (auto a = deps_.store->apply(p); !a) return std::unexpected(a.error());
      }
      out.recovered_transactions += 1;
      if (out.lowest_recovered_tx_id == 0) out.lowest_recovered_tx_id = c->tx_id;
      out.highest_recovered_tx_id = c->tx_id;
      open_tx.reset();
      pending.clear();
      if (deps_.guard != nullptr && !deps_.guard->is_available()) return std::unexpected(abort("forward replay"));
    }
  }
  if (open_tx) log_->info("discarding incomplete transaction {}", *open_tx);
  return {};
}

auto RecoveryEngine::truncate_after(wal::LogPosition tail, RecoveryOutcome& out)
    -> std::expected<wal::LogPosition, core::error> {
  using core::error; using core::error_code;
  auto& files = *deps_.files;
  const auto reference = deps_.metadata->committing_transaction_id();

  auto remove_file = [&](std::uint64_t version) -> std::expected<void, error> {
    std::error_code ec;
    std::filesystem::remove(files.path_for(version), ec);
    if (ec) return std::unexpected(error{error_code::io_failed, "remove failed: " + files.path_for(version).string(), "recovery"});
    platform::sync_directory(files.directory());
    log_->warn("removed log file without a valid header: {}", files.path_for(version).string());
    return {};
  };

  // Cut `version` down to `cut` bytes when it is longer.
  auto cut_file = [&](std::uint64_t version, std::uint64_t cut) -> std::expected<std::uint64_t, error> {
    auto ch = files.create_channel_for_version(version, reference);
    if (!ch) return std::unexpected(ch.error());
    cut = std::max(cut, ch->header().start_offset);
    auto size = ch->size();
    if (!size) return std::unexpected(size.error());
    if (*size > cut) {
      if (auto t = ch->truncate(cut); !t) return std::unexpected(t.error());
      if (auto f = ch->force(); !f) return std::unexpected(f.error());
      out.truncated_bytes += *size - cut;
      log_->warn("truncated {} bytes of {} at offset {}", *size - cut, ch->path().string(), cut);
    }
    return cut;
  };

  auto valid_header = [&](std::uint64_t version) -> std::expected<bool, error> {
    auto h = files.extract_header(version);
    if (!h) return std::unexpected(h.error());
    return h->has_value() && (*h)->log_version == version;
  };

  wal::LogPosition result = tail;
  auto tail_ok = valid_header(tail.log_version);
  if (!tail_ok) return std::unexpected(tail_ok.error());
  if (!*tail_ok) {
    if (auto rm = remove_file(tail.log_version); !rm) return std::unexpected(rm.error());
    tail.byte_offset = 0;
  }
  auto cut = cut_file(tail.log_version, tail.byte_offset);
  if (!cut) return std::unexpected(cut.error());
  result.byte_offset = *cut;

  // A later version with a durable header sealed every file before it; the tail moves there.
  for (auto v : files.versions()) {
    if (v <= tail.log_version) continue;
    auto ok = valid_header(v);
    if (!ok) return std::unexpected(ok.error());
    if (*ok) {
      auto c = cut_file(v, 0);
      if (!c) return std::unexpected(c.error());
      result = {v, *c};
    } else if (auto rm = remove_file(v); !rm) {
      return std::unexpected(rm.error());
    }
  }
  if (result.log_version != tail.log_version) log_->info("log tail moved to rotated file at {}", wal::to_string(result));
  return result;
}

auto RecoveryEngine::finish(wal::LogPosition tail, RecoveryOutcome& out) -> std::expected<void, core::error> {
  auto& meta = *deps_.metadata;
  const auto last_committed = std::max(meta.last_committed_transaction_id(), out.highest_recovered_tx_id);
  meta.transaction_closed(last_committed, tail);

  if (auto f = deps_.store->flush(); !f) return std::unexpected(f.error());
  if (out.rebuilt_auxiliary && deps_.auxiliary != nullptr) {
    if (auto r = deps_.auxiliary->rebuild(); !r) return std::unexpected(r.error());
  }

  wal::CheckpointInfo info{
      .log_position = tail,
      .entry_position = {},
      .store_id = meta.store_id(),
      .transaction_id = last_committed,
      .timestamp_ms = static_cast<std::uint64_t>(now_ms()),
      .reason = RECOVERY_CHECKPOINT_REASON,
  };
  auto written = deps_.checkpoints->write(info);
  if (!written) return std::unexpected(written.error());
  state_ = RecoveryState::checkpoint_written;
  out.checkpoint = std::move(*written);
  out.tail = tail;

  if (auto f = meta.flush(); !f) return std::unexpected(f.error());
  state_ = RecoveryState::done;
  out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_);
  log_->info("recovery completed: {} transactions replayed, tail {}, checkpoint at {}",
             out.recovered_transactions, wal::to_string(tail), wal::to_string(out.checkpoint.entry_position));
  if (deps_.monitor.recovery_completed) {
    deps_.monitor.recovery_completed(out.recovered_transactions, static_cast<std::uint64_t>(out.elapsed.count()));
  }
  return {};
}

auto RecoveryEngine::perform() -> std::expected<RecoveryOutcome, core::error> {
  using core::error; using core::error_code;
  started_ = std::chrono::steady_clock::now();
  state_ = RecoveryState::reverse_scan;
  RecoveryOutcome out{};

  if (auto a = check_auxiliary(out); !a) return std::unexpected(a.error());
  auto latest = deps_.checkpoints->find_latest();
  if (!latest) return std::unexpected(latest.error());
  if (deps_.files->versions().empty()) {
    if (deps_.metadata->last_committed_transaction_id() != 0 || *latest) {
      if (auto m = recover_missing_logs(out); !m) return std::unexpected(m.error());
      return out;
    }
    // Nothing was ever committed: the first log file was never created.
    auto ch = deps_.files->create_channel_for_version(deps_.metadata->current_log_version(),
                                                      deps_.metadata->committing_transaction_id());
    if (!ch) return std::unexpected(ch.error());
    log_->info("no transaction logs and no committed transactions, created {}", ch->path().string());
    ch->close();
  }
  const auto store_id = deps_.metadata->store_id();
  if (*latest && (*latest)->store_id != store_id) {
    return std::unexpected(error{error_code::store_mismatch,
                                 "checkpoint belongs to store " + std::to_string((*latest)->store_id) +
                                 ", expected store " + std::to_string(store_id), "recovery"});
  }
  const wal::LogPosition start = *latest ? (*latest)->log_position
                                         : wal::LogPosition{deps_.files->lowest_version().value_or(0), 0};
  out.start = start;
  log_->info("recovery starting at {} ({})", wal::to_string(start), *latest ? "latest checkpoint" : "no checkpoint");

  auto scan = reverse_scan(start);
  if (!scan) return std::unexpected(scan.error());

  // Walk the groups back to the oldest committed one; replay starts there.
  std::uint64_t lowest = 0;
  wal::LogPosition replay_from = scan->valid_end;
  for (auto it = scan->groups.rbegin(); it != scan->groups.rend(); ++it) {
    if (!it->committed) continue;
    lowest = it->tx_id;
    replay_from = it->start;
  }
  log_->debug("reverse scan found {} transaction groups, lowest committed {}", scan->groups.size(), lowest);
  if (deps_.monitor.reverse_store_recovery_completed) deps_.monitor.reverse_store_recovery_completed(lowest);

  if (deps_.guard != nullptr && !deps_.guard->is_available()) return std::unexpected(abort("reverse scan"));
  state_ = RecoveryState::forward_replay;
  if (lowest != 0) {
    if (auto f = forward_replay(replay_from, scan->valid_end, out); !f) return std::unexpected(f.error());
  }

  auto tail = truncate_after(scan->valid_end, out);
  if (!tail) return std::unexpected(tail.error());
  if (auto f = finish(*tail, out); !f) return std::unexpected(f.error());
  return out;
}

} // namespace trellis::recovery

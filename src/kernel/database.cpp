#include "trellis/kernel/database.hpp"

namespace trellis::kernel {

namespace {

auto now_ms() -> std::uint64_t {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

void DatabaseStateService::record_started(const std::string& name) {
  std::lock_guard<std::mutex> lk(mutex_);
  states_[name] = std::nullopt;
}

void DatabaseStateService::record_failure(const std::string& name, core::error cause) {
  std::lock_guard<std::mutex> lk(mutex_);
  states_[name] = std::move(cause);
}

auto DatabaseStateService::cause_of_failure(const std::string& name) const -> std::optional<core::error> {
  std::lock_guard<std::mutex> lk(mutex_);
  auto it = states_.find(name);
  if (it == states_.end()) return std::nullopt;
  return it->second;
}

auto DatabaseStateService::has_failed(const std::string& name) const -> bool {
  return cause_of_failure(name).has_value();
}

auto database_layout(const core::DatabaseConfig& config) -> recovery::RecoveryLayout {
  return recovery::RecoveryLayout{
      .store_dir = config.store_dir,
      .log_dir = core::resolved_log_dir(config),
      .log_prefix = config.log_prefix,
      .checkpoint_layout = config.checkpoint_layout,
      .auxiliary_files = {config.store_dir / store::NODE_ID_FILE_NAME},
  };
}

auto is_recovery_required(const core::DatabaseConfig& config) -> std::expected<bool, core::error> {
  return recovery::is_recovery_required(database_layout(config));
}

auto find_legacy_logs(const core::DatabaseConfig& config) -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> out;
  if (core::resolved_log_dir(config) != config.store_dir / core::DEFAULT_LOG_SUBDIR) return out;
  const wal::LogFiles legacy({.dir = config.store_dir, .prefix = config.log_prefix});
  for (auto v : legacy.versions()) out.push_back(legacy.path_for(v));
  return out;
}

// Transaction

auto Transaction::exists(std::uint64_t id) const -> bool {
  if (deleted_.contains(id)) return false;
  return created_.contains(id) || db_->nodes_->has_node(id);
}

auto Transaction::create_node() -> std::expected<std::uint64_t, core::error> {
  if (done_) return std::unexpected(core::error{core::error_code::precondition_failed, "transaction already finished", "kernel.transaction"});
  const auto id = db_->nodes_->allocate_node_id();
  commands_.push_back({.op = store::NodeCommand::Op::create_node, .node_id = id});
  created_.insert(id);
  return id;
}

auto Transaction::delete_node(std::uint64_t id) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (done_) return std::unexpected(error{error_code::precondition_failed, "transaction already finished", "kernel.transaction"});
  if (!exists(id)) return std::unexpected(error{error_code::not_found, "no node " + std::to_string(id), "kernel.transaction"});
  commands_.push_back({.op = store::NodeCommand::Op::delete_node, .node_id = id});
  created_.erase(id);
  deleted_.insert(id);
  return {};
}

auto Transaction::set_property(std::uint64_t id, std::string key, std::string value) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (done_) return std::unexpected(error{error_code::precondition_failed, "transaction already finished", "kernel.transaction"});
  if (!exists(id)) return std::unexpected(error{error_code::not_found, "no node " + std::to_string(id), "kernel.transaction"});
  commands_.push_back({.op = store::NodeCommand::Op::set_property, .node_id = id, .key = std::move(key), .value = std::move(value)});
  return {};
}

auto Transaction::commit() -> std::expected<std::uint64_t, core::error> {
  if (done_) return std::unexpected(core::error{core::error_code::precondition_failed, "transaction already finished", "kernel.transaction"});
  done_ = true;
  return db_->commit(std::move(commands_));
}

// Database

Database::Database(core::DatabaseConfig config, std::shared_ptr<recovery::AvailabilityGuard> guard, core::LogPtr log)
    : config_(std::move(config)), guard_(std::move(guard)), log_(std::move(log)) {}

Database::~Database() {
  if (check_pointer_) check_pointer_->stop();
  if (checkpoints_) checkpoints_->attach(nullptr);
}

auto Database::open(core::DatabaseConfig config, DatabaseStateService& states, DatabaseOptions options)
    -> std::expected<std::unique_ptr<Database>, core::error> {
  using core::error; using core::error_code;
  const std::string name = config.name;
  auto fail = [&](error e) {
    states.record_failure(name, e);
    return std::unexpected(std::move(e));
  };

  if (auto v = core::validate(config); !v) return fail(v.error());
  auto level = core::parse_log_level(config.log_level);
  if (!level) return fail(level.error());
  auto make_log = [&](std::string_view component) {
    auto l = core::create_logger(options.sink, component);
    l->set_level(*level);
    return l;
  };
  auto log = make_log("database");
  if (!options.guard) options.guard = std::make_shared<recovery::AvailabilityGuard>();

  if (auto legacy = find_legacy_logs(config); !legacy.empty()) {
    std::string names;
    for (const auto& p : legacy) {
      log->error("transaction log in legacy location: {}", p.string());
      if (!names.empty()) names += ", ";
      names += p.filename().string();
    }
    const auto msg = "Transaction logs found in legacy location " + config.store_dir.string() + ": " + names +
                     ". Move them to " + core::resolved_log_dir(config).string() + " before starting the database.";
    log->error("{}", msg);
    return fail(error{error_code::legacy_layout, msg, "kernel.database"});
  }

  auto required = recovery::is_recovery_required(database_layout(config));
  if (!required) return fail(required.error());

  std::error_code ec;
  const bool fresh = !std::filesystem::exists(store::metadata_path(config.store_dir), ec);
  std::unique_ptr<Database> db(new Database(std::move(config), options.guard, log));
  const auto& cfg = db->config_;

  auto meta = store::MetaDataStore::open(cfg.store_dir, true);
  if (!meta) return fail(meta.error());
  db->metadata_ = std::move(*meta);
  db->files_ = std::make_unique<wal::LogFiles>(wal::LogFilesOptions{
      .dir = core::resolved_log_dir(cfg), .prefix = cfg.log_prefix, .store_id = db->metadata_->store_id()});
  db->checkpoints_ = wal::make_checkpoint_file(cfg.checkpoint_layout, *db->files_);
  auto nodes = store::NodeStore::open(cfg.store_dir);
  if (!nodes) return fail(nodes.error());
  db->nodes_ = std::move(*nodes);
  if (fresh) {
    if (auto f = db->nodes_->flush(); !f) return fail(f.error());
    log->info("created database '{}' in {}", name, cfg.store_dir.string());
  }

  Database* raw = db.get();
  db->check_pointer_ = std::make_unique<CheckPointer>(
      [raw](const std::string& reason) { return raw->checkpoint(reason); }, make_log("checkpoint"));

  if (*required) {
    log->info("database '{}' needs recovery", name);
    recovery::RecoveryEngine engine(
        recovery::RecoveryDependencies{
            .files = db->files_.get(),
            .checkpoints = db->checkpoints_.get(),
            .metadata = db->metadata_.get(),
            .store = db->nodes_.get(),
            .auxiliary = db->nodes_.get(),
            .guard = db->guard_.get(),
            .monitor = options.monitor,
        },
        recovery::RecoveryOptions{.fail_on_missing_files = cfg.fail_on_missing_files}, make_log("recovery"));
    auto outcome = engine.perform();
    if (!outcome) {
      if (outcome.error().code == error_code::start_aborted) {
        log->warn("start of database '{}' aborted: {}", name, outcome.error().message);
        states.record_failure(name, outcome.error());
        db->aborted_ = true;
        return db;
      }
      log->error("recovery of database '{}' failed: {}", name, core::describe(outcome.error()));
      return fail(outcome.error());
    }
    db->recovery_ = std::move(*outcome);
  }

  auto writer = wal::TransactionLogFile::open(*db->files_, *db->metadata_, *db->metadata_,
                                              wal::TransactionLogFileOptions{.rotation_threshold = cfg.rotation_threshold,
                                                                             .buffer_size = cfg.log_buffer_size,
                                                                             .sync_interceptor = options.sync_interceptor},
                                              make_log("wal"));
  if (!writer) return fail(writer.error());
  db->writer_ = std::move(*writer);
  db->checkpoints_->attach(db->writer_.get());

  auto latest = db->checkpoints_->find_latest();
  if (!latest) return fail(latest.error());
  if (*latest) db->check_pointer_->checkpointed((*latest)->transaction_id);
  db->check_pointer_->start();

  states.record_started(name);
  log->info("database '{}' started, log at {}", name, wal::to_string(db->writer_->current_position()));
  return db;
}

auto Database::begin_transaction() -> std::expected<Transaction, core::error> {
  if (auto g = guard_->require("begin_transaction"); !g) return std::unexpected(g.error());
  std::lock_guard<std::mutex> lk(commit_mutex_);
  if (auto u = usable_locked("begin_transaction"); !u) return std::unexpected(u.error());
  return Transaction(*this);
}

auto Database::usable_locked(const char* op) const -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (closed_ || !writer_) return std::unexpected(error{error_code::precondition_failed, "database is closed", "kernel.database"});
  if (failure_) {
    return std::unexpected(error{error_code::unavailable, std::string(op) + " refused: database '" + config_.name +
                                 "' stopped after a failed commit", "kernel.database", {*failure_}});
  }
  return {};
}

// The log may hold a transaction the store never saw; nothing else may commit on top of it.
auto Database::stop_locked(core::error cause) -> core::error {
  log_->error("database '{}' stopped accepting transactions: {}", config_.name, core::describe(cause));
  failure_ = cause;
  return cause;
}

auto Database::failure() const -> std::optional<core::error> {
  std::lock_guard<std::mutex> lk(commit_mutex_);
  return failure_;
}

auto Database::commit(std::vector<store::NodeCommand> commands) -> std::expected<std::uint64_t, core::error> {
  std::lock_guard<std::mutex> lk(commit_mutex_);
  if (auto g = guard_->require("commit"); !g) return std::unexpected(g.error());
  if (auto u = usable_locked("commit"); !u) return std::unexpected(u.error());

  auto append = [&](const wal::LogEntry& e) -> std::expected<void, core::error> {
    auto a = writer_->append(e);
    if (a) return {};
    if (writer_->failure()) return std::unexpected(stop_locked(std::move(a.error())));
    return std::unexpected(a.error());
  };
  const auto tx = metadata_->next_committing_transaction_id();
  const auto ts = now_ms();
  if (auto a = append(wal::StartEntry{tx, ts, metadata_->last_committed_transaction_id()}); !a) return std::unexpected(a.error());
  for (const auto& c : commands) {
    if (auto a = append(wal::CommandEntry{tx, store::encode_command(c)}); !a) return std::unexpected(a.error());
  }
  if (auto a = append(wal::CommitEntry{tx, ts}); !a) return std::unexpected(a.error());
  if (auto f = writer_->flush(); !f) return std::unexpected(stop_locked(std::move(f.error())));

  for (const auto& c : commands) {
    if (auto a = nodes_->apply(c); !a) return std::unexpected(stop_locked(std::move(a.error())));
  }
  metadata_->transaction_closed(tx, writer_->flushed_position());

  if (writer_->rotation_needed()) {
    if (auto r = writer_->rotate(); !r) {
      if (writer_->failure()) return std::unexpected(stop_locked(std::move(r.error())));
      return std::unexpected(r.error());
    }
  }
  if (config_.checkpoint_interval_tx != 0 && ++since_checkpoint_ >= config_.checkpoint_interval_tx) {
    since_checkpoint_ = 0;
    check_pointer_->request("Scheduled checkpoint after " + std::to_string(config_.checkpoint_interval_tx) + " transactions.");
  }
  return tx;
}

auto Database::checkpoint(const std::string& reason) -> std::expected<wal::CheckpointInfo, core::error> {
  std::lock_guard<std::mutex> lk(commit_mutex_);
  return checkpoint_locked(reason);
}

auto Database::checkpoint_locked(const std::string& reason) -> std::expected<wal::CheckpointInfo, core::error> {
  using core::error; using core::error_code;
  if (aborted_) return std::unexpected(error{error_code::start_aborted, "database start was aborted", "kernel.database"});
  if (auto u = usable_locked("checkpoint"); !u) return std::unexpected(u.error());

  if (auto f = writer_->flush(); !f) return std::unexpected(stop_locked(std::move(f.error())));
  if (auto f = nodes_->flush(); !f) return std::unexpected(f.error());
  const wal::CheckpointInfo info{
      .log_position = writer_->flushed_position(),
      .entry_position = {},
      .store_id = metadata_->store_id(),
      .transaction_id = metadata_->last_committed_transaction_id(),
      .timestamp_ms = now_ms(),
      .reason = reason,
  };
  auto written = checkpoints_->write(info);
  if (!written) {
    if (writer_->failure()) return std::unexpected(stop_locked(std::move(written.error())));
    return std::unexpected(written.error());
  }
  if (auto f = metadata_->flush(); !f) return std::unexpected(f.error());
  since_checkpoint_ = 0;
  check_pointer_->checkpointed(info.transaction_id);
  log_->info("checkpoint at {} covering transaction {}: {}", wal::to_string(written->log_position),
             written->transaction_id, reason);
  return written;
}

auto Database::close() -> std::expected<void, core::error> {
  if (check_pointer_) check_pointer_->stop();
  std::lock_guard<std::mutex> lk(commit_mutex_);
  if (closed_) return {};
  if (aborted_ || !writer_) {
    closed_ = true;
    return {};
  }
  if (failure_) {
    auto refused = usable_locked("close");
    checkpoints_->attach(nullptr);
    auto c = writer_->close();
    closed_ = true;
    if (!c) return std::unexpected(core::with_suppressed(std::move(refused.error()), std::move(c.error())));
    return std::unexpected(refused.error());
  }
  auto cp = checkpoint_locked(SHUTDOWN_CHECKPOINT_REASON);
  checkpoints_->attach(nullptr);
  auto c = writer_->close();
  closed_ = true;
  if (!cp) {
    if (!c) return std::unexpected(core::with_suppressed(cp.error(), c.error()));
    return std::unexpected(cp.error());
  }
  if (!c) return std::unexpected(c.error());
  log_->info("database '{}' closed", config_.name);
  return {};
}

auto Database::is_available(std::chrono::milliseconds timeout) const -> bool {
  if (aborted_) return false;
  return guard_->await_available(timeout).has_value();
}

auto Database::node_count() const -> std::size_t { return nodes_->node_count(); }

auto Database::has_node(std::uint64_t id) const -> bool { return nodes_->has_node(id); }

auto Database::property(std::uint64_t id, const std::string& key) const -> std::optional<std::string> {
  return nodes_->property(id, key);
}

} // namespace trellis::kernel

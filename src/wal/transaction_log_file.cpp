#include "trellis/wal/transaction_log_file.hpp"
#include "trellis/core/platform_utils.hpp"

#include <algorithm>
#include <cstring>

namespace trellis::wal {

auto default_buffer_size(std::size_t parallelism) -> std::size_t {
  const std::size_t units = std::min<std::size_t>(parallelism / 4 + 1, LOG_BUFFER_MAX_UNITS);
  return units * LOG_BUFFER_UNIT;
}

auto resolve_buffer_size(std::size_t requested) -> std::size_t {
  if (requested == 0) return default_buffer_size(core::available_parallelism());
  return std::clamp(requested, LOG_BUFFER_MIN_OVERRIDE, LOG_BUFFER_UNIT * LOG_BUFFER_MAX_UNITS);
}

TransactionLogFile::TransactionLogFile(LogFiles& files, LogVersionRepository& versions, TransactionIdStore& tx_ids,
                                       TransactionLogFileOptions opts, core::LogPtr log)
    : files_(&files), versions_(&versions), tx_ids_(&tx_ids), opts_(opts), log_(std::move(log)),
      buffer_(resolve_buffer_size(opts.buffer_size)) {}

auto TransactionLogFile::open(LogFiles& files, LogVersionRepository& versions, TransactionIdStore& tx_ids,
                              TransactionLogFileOptions opts, core::LogPtr log)
    -> std::expected<std::unique_ptr<TransactionLogFile>, core::error> {
  if (!log) log = core::create_logger(nullptr, "wal");
  std::unique_ptr<TransactionLogFile> w(new TransactionLogFile(files, versions, tx_ids, opts, std::move(log)));

  std::uint64_t current = versions.current_log_version();
  if (auto highest = files.highest_version(); highest && *highest > current) {
    w->log_->warn("log version counter {} is behind log file version {}", current, *highest);
    if (auto s = versions.set_current_log_version(*highest); !s) return std::unexpected(s.error());
    current = *highest;
  }
  // A counter ahead of the files (crash inside rotation) is repaired here.
  auto ch = files.create_channel_for_version(current, tx_ids.committing_transaction_id());
  if (!ch) return std::unexpected(ch.error());
  w->channel_ = std::move(*ch);

  auto end = w->seek_end_of_valid_data();
  if (!end) return std::unexpected(end.error());
  w->write_offset_ = end->byte_offset;
  w->publish_flushed(*end);
  w->log_->info("transaction log opened at {}", to_string(*end));
  return w;
}

auto TransactionLogFile::scan_to_end(LogPosition from, std::uint64_t file_size) const
    -> std::expected<LogPosition, core::error> {
  using core::error; using core::error_code;
  const LogPosition limit{channel_.version(), file_size};
  auto r = LogEntryReader::open(*files_, from, [limit]() -> std::optional<LogPosition> { return limit; });
  if (!r) return std::unexpected(r.error());
  for (;;) {
    auto e = r->next();
    if (!e) return std::unexpected(e.error());
    if (!e->has_value()) break;
  }
  if (r->tail_damaged()) {
    return std::unexpected(error{error_code::data_integrity,
                                 "unreadable bytes at " + to_string(r->position()) + " in " +
                                 channel_.path().string(), "wal.io"});
  }
  return r->position();
}

auto TransactionLogFile::seek_end_of_valid_data() -> std::expected<LogPosition, core::error> {
  auto size = channel_.size();
  if (!size) return std::unexpected(size.error());
  const LogPosition data_start = channel_.data_start();
  const LogPosition closed = tx_ids_->last_closed_transaction().position;

  std::optional<core::error> first_failure;
  if (closed.log_version == channel_.version() && closed >= data_start && closed.byte_offset <= *size) {
    auto end = scan_to_end(closed, *size);
    if (end) return end;
    log_->warn("resume from last closed transaction at {} failed, rescanning {}: {}",
               to_string(closed), channel_.path().string(), end.error().message);
    first_failure = std::move(end.error());
  }
  auto end = scan_to_end(data_start, *size);
  if (!end) {
    if (first_failure) return std::unexpected(core::with_suppressed(std::move(end.error()), std::move(*first_failure)));
    return std::unexpected(end.error());
  }
  return end;
}

void TransactionLogFile::publish_flushed(LogPosition p) {
  std::lock_guard<std::mutex> lk(position_mutex_);
  flushed_ = p;
}

auto TransactionLogFile::append(const LogEntry& entry) -> std::expected<LogPosition, core::error> {
  std::lock_guard<std::mutex> lk(mutex_);
  if (auto u = usable_locked(); !u) return std::unexpected(u.error());
  auto bytes = encode_entry(entry);
  if (!bytes) return std::unexpected(bytes.error());

  const LogPosition at{channel_.version(), write_offset_ + buffered_};
  if (bytes->size() > buffer_.size() - buffered_) {
    if (auto s = spill_locked(); !s) return std::unexpected(fail_locked(std::move(s.error())));
  }
  if (bytes->size() > buffer_.size()) {
    if (auto w = channel_.write(*bytes, write_offset_); !w) return std::unexpected(fail_locked(std::move(w.error())));
    write_offset_ += bytes->size();
  } else {
    std::memcpy(buffer_.data() + buffered_, bytes->data(), bytes->size());
    buffered_ += bytes->size();
  }
  stats_.entries += 1;
  stats_.bytes += bytes->size();
  return at;
}

auto TransactionLogFile::spill_locked() -> std::expected<void, core::error> {
  if (buffered_ == 0) return {};
  if (auto w = channel_.write({buffer_.data(), buffered_}, write_offset_); !w) return std::unexpected(w.error());
  write_offset_ += buffered_;
  buffered_ = 0;
  return {};
}

auto TransactionLogFile::flush_locked() -> std::expected<void, core::error> {
  auto done = spill_locked();
  if (done && opts_.sync_interceptor) done = opts_.sync_interceptor(channel_.path());
  if (done) done = channel_.force();
  if (!done) return std::unexpected(fail_locked(std::move(done.error())));
  stats_.flushes += 1;
  publish_flushed({channel_.version(), write_offset_});
  return {};
}

auto TransactionLogFile::usable_locked() const -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (closed_) return std::unexpected(error{error_code::precondition_failed, "log file closed", "wal.io"});
  if (failure_) {
    return std::unexpected(error{error_code::io_failed, "log writer stopped after a failed write to " +
                                 channel_.path().string(), "wal.io", {*failure_}});
  }
  return {};
}

// Bytes past the flushed position were never acknowledged; they must not reach a later fsync.
auto TransactionLogFile::fail_locked(core::error cause) -> core::error {
  const LogPosition durable = flushed_position();
  buffered_ = 0;
  if (durable.log_version == channel_.version()) {
    if (auto t = channel_.truncate(durable.byte_offset); !t) {
      cause = core::with_suppressed(std::move(cause), std::move(t.error()));
    } else {
      write_offset_ = durable.byte_offset;
    }
  }
  log_->error("log writer stopped at {}: {}", to_string(durable), core::describe(cause));
  failure_ = cause;
  return cause;
}

auto TransactionLogFile::failure() const -> std::optional<core::error> {
  std::lock_guard<std::mutex> lk(mutex_);
  return failure_;
}

auto TransactionLogFile::flush() -> std::expected<void, core::error> {
  std::lock_guard<std::mutex> lk(mutex_);
  if (auto u = usable_locked(); !u) return u;
  return flush_locked();
}

auto TransactionLogFile::rotation_needed() const -> bool {
  std::lock_guard<std::mutex> lk(mutex_);
  return !closed_ && !failure_ && write_offset_ + buffered_ >= opts_.rotation_threshold;
}

auto TransactionLogFile::rotate() -> std::expected<LogPosition, core::error> {
  std::lock_guard<std::mutex> lk(mutex_);
  if (auto u = usable_locked(); !u) return std::unexpected(u.error());

  // 1) persist the new version number
  auto next = versions_->increment_and_get();
  if (!next) return std::unexpected(next.error());
  // 2) make the old file end exactly at the write position
  if (auto f = flush_locked(); !f) return std::unexpected(f.error());
  if (auto t = channel_.truncate(write_offset_); !t) return std::unexpected(t.error());
  // 3) new file with its header; reference id is the committing id, not the last committed one
  auto created = files_->create_channel_for_version(*next, tx_ids_->committing_transaction_id());
  if (!created) return std::unexpected(created.error());
  // 4) swap
  const auto old_path = channel_.path();
  channel_.close();
  channel_ = std::move(*created);
  write_offset_ = channel_.header().start_offset;
  stats_.rotations += 1;
  publish_flushed(channel_.data_start());
  log_->debug("rotated {} -> {}", old_path.filename().string(), channel_.path().filename().string());
  return channel_.data_start();
}

auto TransactionLogFile::read_bound() const -> ReadBound {
  return [this]() -> std::optional<LogPosition> { return flushed_position(); };
}

auto TransactionLogFile::reader(LogPosition from) const -> std::expected<LogEntryReader, core::error> {
  return LogEntryReader::open(*files_, from, read_bound());
}

auto TransactionLogFile::current_position() const -> LogPosition {
  std::lock_guard<std::mutex> lk(mutex_);
  return {channel_.version(), write_offset_ + buffered_};
}

auto TransactionLogFile::flushed_position() const -> LogPosition {
  std::lock_guard<std::mutex> lk(position_mutex_);
  return flushed_;
}

auto TransactionLogFile::stats() const -> TransactionLogStats {
  std::lock_guard<std::mutex> lk(mutex_);
  return stats_;
}

auto TransactionLogFile::close() -> std::expected<void, core::error> {
  std::lock_guard<std::mutex> lk(mutex_);
  if (closed_) return {};
  auto f = failure_ ? usable_locked() : flush_locked();
  channel_.close();
  closed_ = true;
  return f;
}

} // namespace trellis::wal

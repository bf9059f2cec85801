#include "trellis/wal/checkpoint.hpp"
#include "trellis/platform/filesystem.hpp"
#include "trellis/wal/reader.hpp"
#include "trellis/wal/transaction_log_file.hpp"

#include <functional>
#include <limits>

namespace trellis::wal {

auto to_checkpoint_info(const CheckpointEntry& e, LogPosition entry_position) -> CheckpointInfo {
  return CheckpointInfo{e.log_position, entry_position, e.store_id, e.last_committed_tx_id, e.timestamp_ms, e.reason};
}

auto CheckpointFile::check_monotonic(const CheckpointInfo& info) const -> std::expected<void, core::error> {
  auto latest = find_latest();
  if (!latest) return std::unexpected(latest.error());
  if (*latest && info.log_position < (*latest)->log_position) {
    return std::unexpected(core::error{core::error_code::precondition_failed,
                                       "checkpoint at " + to_string(info.log_position) +
                                       " precedes latest checkpoint at " + to_string((*latest)->log_position),
                                       "wal.checkpoint"});
  }
  return {};
}

namespace {

auto to_entry(const CheckpointInfo& info) -> CheckpointEntry {
  return CheckpointEntry{info.transaction_id, info.log_position, info.store_id, info.timestamp_ms, info.reason};
}

/** Checkpoints interleaved with transactions in the log files. */
class InterleavedCheckpointFile final : public CheckpointFile {
public:
  explicit InterleavedCheckpointFile(LogFiles& files) : files_(&files) {}

  auto find_latest() const -> std::expected<std::optional<CheckpointInfo>, core::error> override {
    if (latest_ && still_on_disk(*latest_)) return *latest_;
    latest_.reset();
    auto versions = files_->versions();
    std::optional<CheckpointInfo> found;
    for (auto it = versions.rbegin(); it != versions.rend() && !found; ++it) {
      auto s = scan(*it, *it, [&](const CheckpointInfo& c) { found = c; });
      if (!s) return std::unexpected(s.error());
    }
    latest_.emplace(found);
    return found;
  }

  auto reachable() const -> std::expected<std::vector<CheckpointInfo>, core::error> override {
    std::vector<CheckpointInfo> out;
    auto versions = files_->versions();
    for (auto v : versions) {
      auto s = scan(v, v, [&](const CheckpointInfo& c) { out.push_back(c); });
      if (!s) return std::unexpected(s.error());
    }
    return out;
  }

  auto write(const CheckpointInfo& info) -> std::expected<CheckpointInfo, core::error> override {
    if (auto m = check_monotonic(info); !m) return std::unexpected(m.error());
    latest_.reset();
    CheckpointInfo written = info;
    if (writer_ != nullptr) {
      auto at = writer_->append(to_entry(info));
      if (!at) return std::unexpected(at.error());
      if (auto f = writer_->flush(); !f) return std::unexpected(f.error());
      written.entry_position = *at;
      latest_.emplace(written);
      return written;
    }
    // No writer yet: the record goes exactly at the tail it describes, which must be in the
    // newest file. Files below it are sealed.
    if (auto highest = files_->highest_version(); highest && info.log_position.log_version < *highest) {
      return std::unexpected(core::error{core::error_code::precondition_failed,
                                         "checkpoint at " + to_string(info.log_position) +
                                         " is in a sealed log version, newest is " + std::to_string(*highest),
                                         "wal.checkpoint"});
    }
    auto bytes = encode_entry(to_entry(info));
    if (!bytes) return std::unexpected(bytes.error());
    auto ch = files_->create_channel_for_version(info.log_position.log_version, info.transaction_id);
    if (!ch) return std::unexpected(ch.error());
    const std::uint64_t at = info.log_position.byte_offset;
    if (at < ch->header().start_offset) {
      return std::unexpected(core::error{core::error_code::invalid_argument,
                                         "checkpoint position inside log header: " + to_string(info.log_position),
                                         "wal.checkpoint"});
    }
    if (auto w = ch->write(*bytes, at); !w) return std::unexpected(w.error());
    if (auto t = ch->truncate(at + bytes->size()); !t) return std::unexpected(t.error());
    if (auto f = ch->force(); !f) return std::unexpected(f.error());
    written.entry_position = info.log_position;
    latest_.emplace(written);
    return written;
  }

  auto current_file() const -> std::filesystem::path override {
    auto latest = find_latest();
    if (latest && *latest) return files_->path_for((*latest)->entry_position.log_version);
    auto highest = files_->highest_version();
    return files_->path_for(highest.value_or(0));
  }

  auto layout() const noexcept -> core::CheckpointLayout override { return core::CheckpointLayout::interleaved; }

private:
  // A remembered "none" holds until this object writes; a remembered record must still be
  // readable at its entry position.
  auto still_on_disk(const std::optional<CheckpointInfo>& cached) const -> bool {
    if (!cached) return true;
    auto r = LogEntryReader::open(*files_, cached->entry_position);
    if (!r) return false;
    auto e = r->next();
    if (!e || !e->has_value()) return false;
    const auto* c = std::get_if<CheckpointEntry>(&**e);
    return c != nullptr && c->log_position == cached->log_position &&
           c->last_committed_tx_id == cached->transaction_id && c->timestamp_ms == cached->timestamp_ms;
  }

  // Visit checkpoints stored in versions [from, to], honouring the writer's flushed bound.
  auto scan(std::uint64_t from, std::uint64_t to, const std::function<void(const CheckpointInfo&)>& visit) const
      -> std::expected<void, core::error> {
    ReadBound writer_bound = writer_ != nullptr ? writer_->read_bound() : ReadBound{};
    ReadBound bound = [to, writer_bound]() -> std::optional<LogPosition> {
      const LogPosition cap{to, std::numeric_limits<std::uint64_t>::max()};
      if (writer_bound) {
        if (auto b = writer_bound(); b && *b < cap) return b;
      }
      return cap;
    };
    auto r = LogEntryReader::open(*files_, {from, 0}, std::move(bound));
    if (!r) {
      if (r.error().code == core::error_code::not_found) return {};
      return std::unexpected(r.error());
    }
    for (;;) {
      auto e = r->next();
      if (!e) return std::unexpected(e.error());
      if (!e->has_value()) break;
      if (const auto* c = std::get_if<CheckpointEntry>(&**e)) visit(to_checkpoint_info(*c, r->entry_position()));
    }
    return {};
  }

  LogFiles* files_;
  mutable std::optional<std::optional<CheckpointInfo>> latest_; // set once scanned
};

/** Checkpoints in their own file next to the log files. */
class DedicatedCheckpointFile final : public CheckpointFile {
public:
  explicit DedicatedCheckpointFile(const LogFiles& files) : files_(&files) {}

  auto find_latest() const -> std::expected<std::optional<CheckpointInfo>, core::error> override {
    auto t = tail();
    if (!t) return std::unexpected(t.error());
    return t->latest;
  }

  auto reachable() const -> std::expected<std::vector<CheckpointInfo>, core::error> override {
    std::vector<CheckpointInfo> out;
    auto end = scan([&](const CheckpointInfo& c) { out.push_back(c); });
    if (!end) return std::unexpected(end.error());
    return out;
  }

  auto write(const CheckpointInfo& info) -> std::expected<CheckpointInfo, core::error> override {
    using core::error; using core::error_code;
    if (auto m = check_monotonic(info); !m) return std::unexpected(m.error());
    auto known = tail();
    if (!known) return std::unexpected(known.error());
    tail_.reset();

    std::error_code ec;
    std::filesystem::create_directories(files_->directory(), ec);
    if (ec) return std::unexpected(error{error_code::io_failed, "mkdir failed: " + files_->directory().string(), "wal.checkpoint"});
    const auto path = current_file();
    auto fd = platform::open_file(path, platform::OpenMode::create);
    if (!fd) return std::unexpected(fd.error());

    std::uint64_t at = known->end;
    if (at == 0) {
      // Missing or torn header: start the file over.
      LogHeader header{};
      header.magic = CHECKPOINT_HEADER_MAGIC;
      header.store_id = info.store_id;
      if (auto t = platform::truncate_file(*fd, 0); !t) return std::unexpected(t.error());
      const auto hb = encode_header(header);
      if (auto w = platform::write_at(*fd, hb, 0); !w) return std::unexpected(w.error());
      at = header.start_offset;
    }
    auto bytes = encode_entry(to_entry(info));
    if (!bytes) return std::unexpected(bytes.error());
    if (auto w = platform::write_at(*fd, *bytes, at); !w) return std::unexpected(w.error());
    if (auto t = platform::truncate_file(*fd, at + bytes->size()); !t) return std::unexpected(t.error());
    if (!platform::sync_file(*fd)) {
      return std::unexpected(error{error_code::io_failed, "fsync failed: " + path.string(), "wal.checkpoint"});
    }
    platform::sync_directory(files_->directory());
    CheckpointInfo written = info;
    written.entry_position = {0, at};
    tail_ = Tail{written, at + bytes->size()};
    return written;
  }

  auto current_file() const -> std::filesystem::path override { return files_->checkpoint_file_path(); }

  auto layout() const noexcept -> core::CheckpointLayout override { return core::CheckpointLayout::dedicated; }

private:
  struct Tail {
    std::optional<CheckpointInfo> latest;
    std::uint64_t end{0}; // 0: no valid header
  };

  // Latest record and end of valid data; rescans when the file shrank below what was seen.
  auto tail() const -> std::expected<Tail, core::error> {
    if (tail_) {
      std::error_code ec;
      const auto size = std::filesystem::file_size(current_file(), ec);
      const std::uint64_t have = ec ? 0 : size;
      if (tail_->end == 0 ? have == 0 : have >= tail_->end) return *tail_;
      tail_.reset();
    }
    Tail t;
    auto end = scan([&](const CheckpointInfo& c) { t.latest = c; });
    if (!end) return std::unexpected(end.error());
    t.end = *end;
    tail_ = t;
    return t;
  }

  // Visit every valid record; returns the end of valid data, 0 when there is no valid header.
  // A torn record ends the scan: it is the tail of an interrupted write.
  auto scan(const std::function<void(const CheckpointInfo&)>& visit) const -> std::expected<std::uint64_t, core::error> {
    auto fd = platform::open_file(current_file(), platform::OpenMode::read_only);
    if (!fd) {
      if (fd.error().code == core::error_code::not_found) return std::uint64_t{0};
      return std::unexpected(fd.error());
    }
    auto size = platform::get_file_size(*fd);
    if (!size) {
      return std::unexpected(core::error{core::error_code::io_failed, "fstat failed: " + current_file().string(), "wal.checkpoint"});
    }
    std::vector<std::uint8_t> buf(LOG_HEADER_SIZE);
    auto n = platform::read_at(*fd, buf, 0);
    if (!n) return std::unexpected(n.error());
    auto header = decode_header(std::span<const std::uint8_t>(buf.data(), *n), CHECKPOINT_HEADER_MAGIC);
    if (!header) return std::uint64_t{0};

    std::uint64_t pos = header->start_offset;
    while (pos + FRAME_HEADER_SIZE <= *size) {
      buf.resize(FRAME_HEADER_SIZE);
      n = platform::read_at(*fd, buf, pos);
      if (!n) return std::unexpected(n.error());
      const std::uint32_t len = peek_frame_length(buf);
      if (len == 0 || pos + len > *size) break;
      buf.resize(len);
      n = platform::read_at(*fd, buf, pos);
      if (!n) return std::unexpected(n.error());
      auto frame = decode_frame(buf);
      if (!frame) break;
      auto entry = decode_entry(*frame);
      if (!entry) break;
      if (const auto* c = std::get_if<CheckpointEntry>(&*entry)) visit(to_checkpoint_info(*c, {0, pos}));
      pos += len;
    }
    return pos;
  }

  const LogFiles* files_;
  mutable std::optional<Tail> tail_;
};

} // namespace

auto make_checkpoint_file(core::CheckpointLayout layout, LogFiles& files) -> std::unique_ptr<CheckpointFile> {
  if (layout == core::CheckpointLayout::dedicated) return std::make_unique<DedicatedCheckpointFile>(files);
  return std::make_unique<InterleavedCheckpointFile>(files);
}

} // namespace trellis::wal

#include "trellis/wal/reader.hpp"

#include <algorithm>

namespace trellis::wal {

auto LogEntryReader::open(const LogFiles& files, LogPosition start, ReadBound bound)
    -> std::expected<LogEntryReader, core::error> {
  using core::error; using core::error_code;
  LogEntryReader r(files, std::move(bound));
  auto ch = files.open_for_version(start.log_version);
  if (!ch) {
    if (ch.error().code == error_code::not_found) {
      return std::unexpected(error{error_code::not_found,
                                   "log version " + std::to_string(start.log_version) + " not found in " +
                                   files.directory().string(), "wal.reader"});
    }
    return std::unexpected(ch.error());
  }
  r.pos_ = start;
  if (ch->has_value()) {
    r.pos_.byte_offset = std::max(start.byte_offset, (*ch)->header().start_offset);
    r.channel_ = std::move(*ch);
  }
  r.entry_pos_ = r.pos_;
  return r;
}

auto LogEntryReader::advance_version() -> std::expected<bool, core::error> {
  std::optional<LogPosition> limit;
  if (bound_) limit = bound_();
  auto next = files_->next_channel(pos_.log_version, limit);
  if (!next) return std::unexpected(next.error());
  if (!next->has_value()) return false;
  channel_ = std::move(**next);
  pos_ = channel_->data_start();
  return true;
}

auto LogEntryReader::damaged(const std::string& reason)
    -> std::expected<std::optional<LogEntry>, core::error> {
  // Damage followed by a readable later version cannot be a torn tail.
  auto later = files_->open_for_version(pos_.log_version + 1);
  if (later && later->has_value()) {
    return std::unexpected(core::error{core::error_code::data_integrity,
                                       "corrupt log entry in " + files_->path_for(pos_.log_version).string() +
                                       " at offset " + std::to_string(pos_.byte_offset) + ": " + reason,
                                       "wal.reader"});
  }
  tail_damaged_ = true;
  done_ = true;
  return std::optional<LogEntry>{};
}

auto LogEntryReader::next() -> std::expected<std::optional<LogEntry>, core::error> {
  while (!done_) {
    if (!channel_) {
      auto moved = advance_version();
      if (!moved) return std::unexpected(moved.error());
      if (!*moved) { done_ = true; break; }
      continue;
    }

    auto size = channel_->size();
    if (!size) return std::unexpected(size.error());
    std::uint64_t limit = *size;
    if (bound_) {
      if (auto b = bound_()) {
        if (pos_.log_version > b->log_version) { done_ = true; break; }
        if (pos_.log_version == b->log_version) limit = std::min(limit, b->byte_offset);
      }
    }
    if (pos_.byte_offset >= limit) {
      channel_.reset();
      auto moved = advance_version();
      if (!moved) return std::unexpected(moved.error());
      if (!*moved) { done_ = true; break; }
      continue;
    }

    const std::uint64_t remaining = limit - pos_.byte_offset;
    if (remaining < FRAME_HEADER_SIZE) return damaged("truncated frame header");
    buf_.resize(FRAME_HEADER_SIZE);
    auto n = channel_->read(buf_, pos_.byte_offset);
    if (!n) return std::unexpected(n.error());
    if (*n < FRAME_HEADER_SIZE) return damaged("short read");
    const std::uint32_t len = peek_frame_length(buf_);
    if (len == 0) return damaged("invalid frame header");
    if (len > remaining) return damaged("truncated frame");
    buf_.resize(len);
    n = channel_->read(buf_, pos_.byte_offset);
    if (!n) return std::unexpected(n.error());
    if (*n < len) return damaged("short read");
    auto frame = decode_frame(buf_);
    if (!frame) return damaged(frame.error().message);
    auto entry = decode_entry(*frame);
    if (!entry) return damaged(entry.error().message);
    entry_pos_ = pos_;
    pos_.byte_offset += len;
    return std::optional<LogEntry>(std::move(*entry));
  }
  return std::optional<LogEntry>{};
}

} // namespace trellis::wal

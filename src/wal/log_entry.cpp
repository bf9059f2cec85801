#include "trellis/wal/log_entry.hpp"

#include <limits>

namespace trellis::wal {

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

constexpr std::size_t CHECKPOINT_FIXED = 8 + 8 + 8 + 8 + 2;
}

auto entry_tx_id(const LogEntry& e) -> std::uint64_t {
  return std::visit(overloaded{
    [](const CheckpointEntry& c) { return c.last_committed_tx_id; },
    [](const auto& x) { return x.tx_id; },
  }, e);
}

auto is_transaction_entry(const LogEntry& e) -> bool {
  return std::holds_alternative<StartEntry>(e) || std::holds_alternative<CommandEntry>(e) ||
         std::holds_alternative<CommitEntry>(e);
}

auto encode_entry(const LogEntry& e) -> std::expected<std::vector<std::uint8_t>, core::error> {
  using core::error; using core::error_code;
  return std::visit(overloaded{
    [](const StartEntry& s) {
      std::uint8_t buf[16];
      store_le64(buf, s.timestamp_ms);
      store_le64(buf + 8, s.previous_committed_tx_id);
      return encode_frame(s.tx_id, static_cast<std::uint16_t>(EntryType::start), buf);
    },
    [](const CommandEntry& c) {
      return encode_frame(c.tx_id, static_cast<std::uint16_t>(EntryType::command), c.payload);
    },
    [](const CommitEntry& c) {
      std::uint8_t buf[8];
      store_le64(buf, c.timestamp_ms);
      return encode_frame(c.tx_id, static_cast<std::uint16_t>(EntryType::commit), buf);
    },
    [](const CheckpointEntry& c) -> std::expected<std::vector<std::uint8_t>, error> {
      if (c.reason.size() > std::numeric_limits<std::uint16_t>::max()) {
        return std::unexpected(error{error_code::invalid_argument, "checkpoint reason too long", "wal.entry"});
      }
      std::vector<std::uint8_t> buf(CHECKPOINT_FIXED + c.reason.size());
      std::uint8_t* p = buf.data();
      store_le64(p, c.log_position.log_version); p += 8;
      store_le64(p, c.log_position.byte_offset); p += 8;
      store_le64(p, c.store_id); p += 8;
      store_le64(p, c.timestamp_ms); p += 8;
      store_le16(p, static_cast<std::uint16_t>(c.reason.size())); p += 2;
      if (!c.reason.empty()) std::memcpy(p, c.reason.data(), c.reason.size());
      return encode_frame(c.last_committed_tx_id, static_cast<std::uint16_t>(EntryType::checkpoint), buf);
    },
    [](const UnknownEntry& u) {
      return encode_frame(u.tx_id, u.type, u.payload);
    },
  }, e);
}

auto decode_entry(const Frame& f) -> std::expected<LogEntry, core::error> {
  using core::error; using core::error_code;
  const auto& pl = f.payload;
  switch (static_cast<EntryType>(f.type)) {
    case EntryType::start:
      if (pl.size() != 16) break;
      return StartEntry{f.tx_id, load_le64(pl.data()), load_le64(pl.data() + 8)};
    case EntryType::command:
      return CommandEntry{f.tx_id, std::vector<std::uint8_t>(pl.begin(), pl.end())};
    case EntryType::commit:
      if (pl.size() != 8) break;
      return CommitEntry{f.tx_id, load_le64(pl.data())};
    case EntryType::checkpoint: {
      if (pl.size() < CHECKPOINT_FIXED) break;
      const std::uint8_t* p = pl.data();
      CheckpointEntry c{};
      c.last_committed_tx_id = f.tx_id;
      c.log_position = {load_le64(p), load_le64(p + 8)};
      c.store_id = load_le64(p + 16);
      c.timestamp_ms = load_le64(p + 24);
      const std::uint16_t rlen = load_le16(p + 32);
      if (pl.size() != CHECKPOINT_FIXED + rlen) break;
      c.reason.assign(reinterpret_cast<const char*>(p + CHECKPOINT_FIXED), rlen);
      return c;
    }
    default:
      return UnknownEntry{f.type, f.tx_id, std::vector<std::uint8_t>(pl.begin(), pl.end())};
  }
  return std::unexpected(error{error_code::data_integrity,
                               "malformed payload for entry type " + std::to_string(f.type), "wal.entry"});
}

} // namespace trellis::wal

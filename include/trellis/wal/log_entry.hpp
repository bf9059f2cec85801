#pragma once

/** \file log_entry.hpp
 *  \brief Typed log records and their payload codec.
 *
 * Payload schemas (little-endian):
 *   Start:      u64 timestamp_ms, u64 previous_committed_tx_id
 *   Command:    opaque bytes owned by the store
 *   Commit:     u64 timestamp_ms
 *   Checkpoint: u64 log_version, u64 byte_offset, u64 store_id, u64 timestamp_ms,
 *               u16 reason_len, reason bytes
 * Any other frame type decodes as UnknownEntry and is skipped by consumers.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <variant>
#include <vector>

#include "trellis/error.hpp"
#include "trellis/wal/frame.hpp"
#include "trellis/wal/log_position.hpp"

namespace trellis::wal {

enum class EntryType : std::uint16_t { start = 1, command = 2, commit = 3, checkpoint = 4 };

struct StartEntry {
  std::uint64_t tx_id{};
  std::uint64_t timestamp_ms{};
  std::uint64_t previous_committed_tx_id{};
};

struct CommandEntry {
  std::uint64_t tx_id{};
  std::vector<std::uint8_t> payload;
};

struct CommitEntry {
  std::uint64_t tx_id{};
  std::uint64_t timestamp_ms{};
};

struct CheckpointEntry {
  std::uint64_t last_committed_tx_id{};
  LogPosition log_position{};
  std::uint64_t store_id{};
  std::uint64_t timestamp_ms{};
  std::string reason;
};

/** \brief Entry written by a newer format; carried verbatim so it can be skipped. */
struct UnknownEntry {
  std::uint16_t type{};
  std::uint64_t tx_id{};
  std::vector<std::uint8_t> payload;
};

using LogEntry = std::variant<StartEntry, CommandEntry, CommitEntry, CheckpointEntry, UnknownEntry>;

/** \brief Transaction id carried by the entry's frame. */
auto entry_tx_id(const LogEntry& e) -> std::uint64_t;

/** \brief True for Start, Command and Commit entries. */
auto is_transaction_entry(const LogEntry& e) -> bool;

/** \brief Serialize an entry into one frame. */
auto encode_entry(const LogEntry& e) -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief Decode the payload of an already verified frame. */
auto decode_entry(const Frame& f) -> std::expected<LogEntry, core::error>;

} // namespace trellis::wal

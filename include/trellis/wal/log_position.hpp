#pragma once

/** \file log_position.hpp
 *  \brief Log coordinates and the fixed-size per-file header.
 *
 * Endianness: little-endian on disk.
 * Header layout (64 bytes):
 *   magic u32 | format u16 | reserved u16 | log_version u64 | start_offset u64 |
 *   reference_tx_id u64 | store_id u64 | crc32c u32 (over bytes [0,40)) | zero padding
 */

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace trellis::wal {

constexpr std::uint32_t LOG_HEADER_MAGIC = 0x474C5254u;        // "TRLG"
constexpr std::uint32_t CHECKPOINT_HEADER_MAGIC = 0x50435254u; // "TRCP"
constexpr std::uint16_t LOG_FORMAT_VERSION = 1;
constexpr std::size_t LOG_HEADER_SIZE = 64;

/** \brief (log version, byte offset); ordered by version then offset. */
struct LogPosition {
  std::uint64_t log_version{0};
  std::uint64_t byte_offset{0};

  friend constexpr auto operator<=>(const LogPosition&, const LogPosition&) = default;
};

auto to_string(const LogPosition& p) -> std::string;

struct LogHeader {
  std::uint32_t magic{LOG_HEADER_MAGIC};
  std::uint16_t format_version{LOG_FORMAT_VERSION};
  std::uint64_t log_version{0};
  std::uint64_t start_offset{LOG_HEADER_SIZE};
  std::uint64_t reference_tx_id{0};  /**< committing transaction id when the file was created */
  std::uint64_t store_id{0};

  [[nodiscard]] auto start_position() const -> LogPosition { return {log_version, start_offset}; }
};

auto encode_header(const LogHeader& h) -> std::array<std::uint8_t, LOG_HEADER_SIZE>;

/** \brief Decode a header; std::nullopt when the bytes are short, torn or carry `expected_magic` mismatch.
 *  An absent header is an empty stream, not an error. */
auto decode_header(std::span<const std::uint8_t> bytes, std::uint32_t expected_magic = LOG_HEADER_MAGIC)
    -> std::optional<LogHeader>;

} // namespace trellis::wal

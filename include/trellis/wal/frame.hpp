#pragma once

/** \file frame.hpp
 *  \brief Log entry envelope encode/decode and CRC32C verification (pure, in-memory).
 *
 * Endianness: little-endian framing on all platforms.
 * Thread-safety: functions are stateless and thread-safe.
 * Errors: returned via std::expected with trellis::core::error.
 */

#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <vector>

#include "trellis/error.hpp"

namespace trellis::wal {

constexpr std::uint32_t FRAME_MAGIC = 0x454C5254u; // "TRLE"
constexpr std::size_t FRAME_HEADER_SIZE = 4 + 4 + 2 + 2 + 8; // 20 bytes
constexpr std::size_t FRAME_TRAILER_SIZE = 4;
constexpr std::size_t FRAME_MIN_SIZE = FRAME_HEADER_SIZE + FRAME_TRAILER_SIZE;

struct Frame {
  std::uint32_t magic;
  std::uint32_t len;       // total length including header+payload+CRC
  std::uint16_t type;      // see EntryType; unknown values are skippable
  std::uint16_t reserved;  // 0
  std::uint64_t tx_id;     // owning transaction (last committed for checkpoints)
  std::span<const std::uint8_t> payload; // does not own memory
  std::uint32_t crc32c;    // Castagnoli over [magic..payload]
};

inline auto load_le16(const std::uint8_t* p) -> std::uint16_t { std::uint16_t v; std::memcpy(&v, p, 2); return v; }
inline auto load_le32(const std::uint8_t* p) -> std::uint32_t { std::uint32_t v; std::memcpy(&v, p, 4); return v; }
inline auto load_le64(const std::uint8_t* p) -> std::uint64_t { std::uint64_t v; std::memcpy(&v, p, 8); return v; }
inline void store_le16(std::uint8_t* p, std::uint16_t v) { std::memcpy(p, &v, 2); }
inline void store_le32(std::uint8_t* p, std::uint32_t v) { std::memcpy(p, &v, 4); }
inline void store_le64(std::uint8_t* p, std::uint64_t v) { std::memcpy(p, &v, 8); }

// CRC32C (Castagnoli) over the given bytes
auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

// Verify CRC32C of a full frame buffer (includes CRC at the end)
auto verify_crc32c(std::span<const std::uint8_t> full_frame) -> bool;

// Encode a frame; guards against 32-bit length overflow
auto encode_frame(std::uint64_t tx_id, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief Peek the total length from a frame header; 0 when the header is not plausible
 *  (short, bad magic, reserved != 0, len below minimum). */
auto peek_frame_length(std::span<const std::uint8_t> header) -> std::uint32_t;

// Decode a frame from a contiguous buffer (no allocations for payload)
auto decode_frame(std::span<const std::uint8_t> bytes) -> std::expected<Frame, core::error>;

} // namespace trellis::wal

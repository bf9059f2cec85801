#include "trellis/wal/frame.hpp"

#include <array>
#include <limits>

namespace trellis::wal {

// Reflected CRC-32C (Castagnoli) table using reversed polynomial 0x82F63B78
static constexpr std::array<std::uint32_t, 256> CRC32C_TABLE = []{
  std::array<std::uint32_t, 256> t{};
  const std::uint32_t poly = 0x82F63B78u;
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
    }
    t[i] = c;
  }
  return t;
}();

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t {
  std::uint32_t c = ~0u;
  for (auto b : bytes) {
    c = CRC32C_TABLE[(c ^ b) & 0xFFu] ^ (c >> 8);
  }
  return ~c;
}

auto verify_crc32c(std::span<const std::uint8_t> full_frame) -> bool {
  if (full_frame.size() < FRAME_MIN_SIZE) return false;
  const std::size_t n = full_frame.size();
  const std::uint32_t expect = load_le32(full_frame.data() + n - 4);
  return expect == crc32c(full_frame.first(n - 4));
}

auto encode_frame(std::uint64_t tx_id, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  using core::error; using core::error_code;
  const std::size_t max_payload = std::numeric_limits<std::uint32_t>::max() - FRAME_MIN_SIZE;
  if (payload.size() > max_payload) {
    return std::unexpected(error{error_code::invalid_argument, "payload too large", "wal.frame"});
  }
  const std::uint32_t len = static_cast<std::uint32_t>(FRAME_MIN_SIZE + payload.size());
  std::vector<std::uint8_t> out(len);
  std::uint8_t* p = out.data();
  store_le32(p, FRAME_MAGIC); p += 4;
  store_le32(p, len); p += 4;
  store_le16(p, type); p += 2;
  store_le16(p, 0); p += 2;
  store_le64(p, tx_id); p += 8;
  if (!payload.empty()) { std::memcpy(p, payload.data(), payload.size()); p += payload.size(); }
  store_le32(p, crc32c({out.data(), out.size() - 4}));
  return out;
}

auto peek_frame_length(std::span<const std::uint8_t> header) -> std::uint32_t {
  if (header.size() < FRAME_HEADER_SIZE) return 0;
  const std::uint8_t* p = header.data();
  if (load_le32(p) != FRAME_MAGIC) return 0;
  if (load_le16(p + 10) != 0) return 0;
  const std::uint32_t len = load_le32(p + 4);
  if (len < FRAME_MIN_SIZE) return 0;
  return len;
}

auto decode_frame(std::span<const std::uint8_t> bytes) -> std::expected<Frame, core::error> {
  using core::error; using core::error_code;
  if (bytes.size() < FRAME_MIN_SIZE) {
    return std::unexpected(error{error_code::precondition_failed, "frame too short", "wal.frame"});
  }
  const std::uint8_t* p = bytes.data();
  const std::uint32_t magic = load_le32(p);
  const std::uint32_t len = load_le32(p + 4);
  const std::uint16_t type = load_le16(p + 8);
  const std::uint16_t reserved = load_le16(p + 10);
  const std::uint64_t tx_id = load_le64(p + 12);

  if (magic != FRAME_MAGIC) {
    return std::unexpected(error{error_code::data_integrity, "bad magic", "wal.frame"});
  }
  if (len != bytes.size()) {
    return std::unexpected(error{error_code::precondition_failed, "len mismatch", "wal.frame"});
  }
  if (reserved != 0) {
    return std::unexpected(error{error_code::precondition_failed, "reserved != 0", "wal.frame"});
  }
  if (!verify_crc32c(bytes)) {
    return std::unexpected(error{error_code::data_integrity, "crc mismatch", "wal.frame"});
  }
  std::span<const std::uint8_t> payload{bytes.data() + FRAME_HEADER_SIZE, len - FRAME_MIN_SIZE};
  return Frame{magic, len, type, reserved, tx_id, payload, load_le32(bytes.data() + len - 4)};
}

} // namespace trellis::wal

#include "trellis/wal/log_position.hpp"
#include "trellis/wal/frame.hpp"

#include <cstring>

namespace trellis::wal {

auto to_string(const LogPosition& p) -> std::string {
  return "v" + std::to_string(p.log_version) + "@" + std::to_string(p.byte_offset);
}

auto encode_header(const LogHeader& h) -> std::array<std::uint8_t, LOG_HEADER_SIZE> {
  std::array<std::uint8_t, LOG_HEADER_SIZE> out{};
  std::uint8_t* p = out.data();
  store_le32(p + 0, h.magic);
  store_le16(p + 4, h.format_version);
  store_le16(p + 6, 0);
  store_le64(p + 8, h.log_version);
  store_le64(p + 16, h.start_offset);
  store_le64(p + 24, h.reference_tx_id);
  store_le64(p + 32, h.store_id);
  store_le32(p + 40, crc32c({out.data(), 40}));
  return out;
}

auto decode_header(std::span<const std::uint8_t> bytes, std::uint32_t expected_magic)
    -> std::optional<LogHeader> {
  if (bytes.size() < LOG_HEADER_SIZE) return std::nullopt;
  const std::uint8_t* p = bytes.data();
  if (load_le32(p) != expected_magic) return std::nullopt;
  if (load_le32(p + 40) != crc32c(bytes.first(40))) return std::nullopt;
  LogHeader h{};
  h.magic = expected_magic;
  h.format_version = load_le16(p + 4);
  if (h.format_version != LOG_FORMAT_VERSION || load_le16(p + 6) != 0) return std::nullopt;
  h.log_version = load_le64(p + 8);
  h.start_offset = load_le64(p + 16);
  h.reference_tx_id = load_le64(p + 24);
  h.store_id = load_le64(p + 32);
  if (h.start_offset < LOG_HEADER_SIZE) return std::nullopt;
  return h;
}

} // namespace trellis::wal

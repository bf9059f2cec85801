#include "trellis/wal/channel.hpp"

namespace trellis::wal {

namespace {
auto closed_error() -> core::error {
  return core::error{core::error_code::precondition_failed, "channel is closed", "wal.channel"};
}
}

auto VersionedChannel::read(std::span<std::uint8_t> out, std::uint64_t offset) const
    -> std::expected<std::size_t, core::error> {
  if (!fd_.is_valid()) return std::unexpected(closed_error());
  return platform::read_at(fd_, out, offset);
}

auto VersionedChannel::write(std::span<const std::uint8_t> bytes, std::uint64_t offset)
    -> std::expected<void, core::error> {
  if (!fd_.is_valid()) return std::unexpected(closed_error());
  return platform::write_at(fd_, bytes, offset);
}

auto VersionedChannel::truncate(std::uint64_t size) -> std::expected<void, core::error> {
  if (!fd_.is_valid()) return std::unexpected(closed_error());
  return platform::truncate_file(fd_, size);
}

auto VersionedChannel::size() const -> std::expected<std::uint64_t, core::error> {
  if (!fd_.is_valid()) return std::unexpected(closed_error());
  auto sz = platform::get_file_size(fd_);
  if (!sz) {
    return std::unexpected(core::error{core::error_code::io_failed, "fstat failed: " + path_.string(), "wal.channel"});
  }
  return *sz;
}

auto VersionedChannel::force() -> std::expected<void, core::error> {
  if (!fd_.is_valid()) return std::unexpected(closed_error());
  if (!platform::sync_file(fd_)) {
    return std::unexpected(core::error{core::error_code::io_failed, "fsync failed: " + path_.string(), "wal.channel"});
  }
  return {};
}

} // namespace trellis::wal

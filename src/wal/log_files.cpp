#include "trellis/wal/log_files.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <regex>
#include <sstream>

namespace trellis::wal {

namespace {
auto regex_escape(const std::string& s) -> std::string {
  static const std::string special = R"(\^$.|?*+()[]{})";
  std::string out;
  for (char c : s) {
    if (special.find(c) != std::string::npos) out += '\\';
    out += c;
  }
  return out;
}
}

LogFiles::LogFiles(LogFilesOptions opts) : opts_(std::move(opts)) {}

auto LogFiles::path_for(std::uint64_t version) const -> std::filesystem::path {
  std::ostringstream name;
  name << opts_.prefix << std::setw(8) << std::setfill('0') << version << ".log";
  return opts_.dir / name.str();
}

auto LogFiles::checkpoint_file_path() const -> std::filesystem::path {
  return opts_.dir / CHECKPOINT_FILE_NAME;
}

auto LogFiles::versions() const -> std::vector<std::uint64_t> {
  std::vector<std::uint64_t> out;
  std::error_code ec;
  if (!std::filesystem::is_directory(opts_.dir, ec)) return out;
  const std::regex rx(regex_escape(opts_.prefix) + "([0-9]{8,})\\.log");
  for (auto it = std::filesystem::directory_iterator(opts_.dir, ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    auto name = it->path().filename().string();
    std::smatch m;
    if (std::regex_match(name, m, rx) && m.size() == 2) {
      out.push_back(static_cast<std::uint64_t>(std::stoull(m[1].str())));
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

auto LogFiles::lowest_version() const -> std::optional<std::uint64_t> {
  auto v = versions();
  if (v.empty()) return std::nullopt;
  return v.front();
}

auto LogFiles::highest_version() const -> std::optional<std::uint64_t> {
  auto v = versions();
  if (v.empty()) return std::nullopt;
  return v.back();
}

auto LogFiles::has_version(std::uint64_t version) const -> bool {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_for(version), ec);
}

auto LogFiles::extract_header(std::uint64_t version) const
    -> std::expected<std::optional<LogHeader>, core::error> {
  auto fd = platform::open_file(path_for(version), platform::OpenMode::read_only);
  if (!fd) return std::unexpected(fd.error());
  std::array<std::uint8_t, LOG_HEADER_SIZE> buf{};
  auto n = platform::read_at(*fd, buf, 0);
  if (!n) return std::unexpected(n.error());
  return decode_header(std::span<const std::uint8_t>(buf.data(), *n));
}

auto LogFiles::open_for_version(std::uint64_t version) const
    -> std::expected<std::optional<VersionedChannel>, core::error> {
  const auto path = path_for(version);
  auto fd = platform::open_file(path, platform::OpenMode::read_only);
  if (!fd) return std::unexpected(fd.error());
  std::array<std::uint8_t, LOG_HEADER_SIZE> buf{};
  auto n = platform::read_at(*fd, buf, 0);
  if (!n) return std::unexpected(n.error());
  auto header = decode_header(std::span<const std::uint8_t>(buf.data(), *n));
  if (!header || header->log_version != version) return std::optional<VersionedChannel>{};
  return std::optional<VersionedChannel>(VersionedChannel(std::move(*fd), path, version, *header));
}

auto LogFiles::create_channel_for_version(std::uint64_t version, std::uint64_t reference_tx_id)
    -> std::expected<VersionedChannel, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  std::filesystem::create_directories(opts_.dir, ec);
  if (ec) return std::unexpected(error{error_code::io_failed, "mkdir failed: " + opts_.dir.string(), "wal.files"});

  const auto path = path_for(version);
  auto fd = platform::open_file(path, platform::OpenMode::create);
  if (!fd) return std::unexpected(fd.error());

  std::array<std::uint8_t, LOG_HEADER_SIZE> buf{};
  auto n = platform::read_at(*fd, buf, 0);
  if (!n) return std::unexpected(n.error());
  if (auto h = decode_header(std::span<const std::uint8_t>(buf.data(), *n)); h && h->log_version == version) {
    return VersionedChannel(std::move(*fd), path, version, *h);
  }
  auto size = platform::get_file_size(*fd);
  if (!size) return std::unexpected(error{error_code::io_failed, "fstat failed: " + path.string(), "wal.files"});
  if (*size > LOG_HEADER_SIZE) {
    return std::unexpected(error{error_code::data_integrity,
                                 "log file has data but no valid header: " + path.string(), "wal.files"});
  }

  LogHeader header{};
  header.log_version = version;
  header.reference_tx_id = reference_tx_id;
  header.store_id = opts_.store_id;
  VersionedChannel ch(std::move(*fd), path, version, header);
  if (auto t = ch.truncate(0); !t) return std::unexpected(t.error());
  const auto bytes = encode_header(header);
  if (auto w = ch.write(bytes, 0); !w) return std::unexpected(w.error());
  if (auto f = ch.force(); !f) return std::unexpected(f.error());
  platform::sync_directory(opts_.dir);
  return ch;
}

auto LogFiles::next_channel(std::uint64_t exhausted_version, std::optional<LogPosition> bound) const
    -> std::expected<std::optional<VersionedChannel>, core::error> {
  const std::uint64_t next = exhausted_version + 1;
  if (bound && next > bound->log_version) return std::optional<VersionedChannel>{};
  auto ch = open_for_version(next);
  if (!ch) {
    if (ch.error().code == core::error_code::not_found) return std::optional<VersionedChannel>{};
    return std::unexpected(ch.error());
  }
  return ch;
}

} // namespace trellis::wal

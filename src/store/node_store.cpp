#include "trellis/store/node_store.hpp"
#include "trellis/platform/filesystem.hpp"
#include "trellis/wal/frame.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>

namespace trellis::store {

namespace {

constexpr std::uint16_t NODE_STORE_VERSION = 1;
constexpr auto ID_FILE_HEADER = "trellis-id v1";

void put_u32(std::vector<std::uint8_t>& out, std::uint32_t v) {
  const auto at = out.size(); out.resize(at + 4); wal::store_le32(out.data() + at, v);
}
void put_u64(std::vector<std::uint8_t>& out, std::uint64_t v) {
  const auto at = out.size(); out.resize(at + 8); wal::store_le64(out.data() + at, v);
}
void put_string(std::vector<std::uint8_t>& out, const std::string& s) {
  put_u32(out, static_cast<std::uint32_t>(s.size()));
  out.insert(out.end(), s.begin(), s.end());
}

/** Bounds-checked little-endian cursor. */
class Cursor {
public:
  explicit Cursor(std::span<const std::uint8_t> bytes) : bytes_(bytes) {}
  auto u8(std::uint8_t& v) -> bool { if (left() < 1) return false; v = bytes_[pos_]; pos_ += 1; return true; }
  auto u16(std::uint16_t& v) -> bool { if (left() < 2) return false; v = wal::load_le16(bytes_.data() + pos_); pos_ += 2; return true; }
  auto u32(std::uint32_t& v) -> bool { if (left() < 4) return false; v = wal::load_le32(bytes_.data() + pos_); pos_ += 4; return true; }
  auto u64(std::uint64_t& v) -> bool { if (left() < 8) return false; v = wal::load_le64(bytes_.data() + pos_); pos_ += 8; return true; }
  auto str(std::string& s) -> bool {
    std::uint32_t n = 0;
    if (!u32(n) || left() < n) return false;
    s.assign(reinterpret_cast<const char*>(bytes_.data() + pos_), n);
    pos_ += n;
    return true;
  }
  [[nodiscard]] auto left() const -> std::size_t { return bytes_.size() - pos_; }

private:
  std::span<const std::uint8_t> bytes_;
  std::size_t pos_{0};
};

} // namespace

auto encode_command(const NodeCommand& cmd) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out;
  out.reserve(1 + 8 + 8 + cmd.key.size() + cmd.value.size());
  out.push_back(static_cast<std::uint8_t>(cmd.op));
  put_u64(out, cmd.node_id);
  put_string(out, cmd.key);
  put_string(out, cmd.value);
  return out;
}

auto decode_command(std::span<const std::uint8_t> bytes) -> std::expected<NodeCommand, core::error> {
  using core::error; using core::error_code;
  Cursor c(bytes);
  NodeCommand cmd{};
  std::uint8_t op = 0;
  if (!c.u8(op) || !c.u64(cmd.node_id) || !c.str(cmd.key) || !c.str(cmd.value) || c.left() != 0) {
    return std::unexpected(error{error_code::data_integrity, "malformed node command", "store.nodes"});
  }
  if (op < 1 || op > 3) {
    return std::unexpected(error{error_code::data_integrity, "unknown node command " + std::to_string(op), "store.nodes"});
  }
  cmd.op = static_cast<NodeCommand::Op>(op);
  return cmd;
}

auto NodeStore::open(const std::filesystem::path& store_dir) -> std::expected<std::unique_ptr<NodeStore>, core::error> {
  std::unique_ptr<NodeStore> s(new NodeStore(store_dir));
  if (auto l = s->load(); !l) return std::unexpected(l.error());
  return s;
}

auto NodeStore::load() -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  auto fd = platform::open_file(data_file(), platform::OpenMode::read_only);
  if (!fd) {
    if (fd.error().code != error_code::not_found) return std::unexpected(fd.error());
  } else {
    auto size = platform::get_file_size(*fd);
    if (!size) return std::unexpected(error{error_code::io_failed, "fstat failed: " + data_file().string(), "store.nodes"});
    std::vector<std::uint8_t> buf(*size);
    auto n = platform::read_at(*fd, buf, 0);
    if (!n) return std::unexpected(n.error());
    if (*n != buf.size() || buf.size() < 20 ||
        wal::crc32c({buf.data(), buf.size() - 4}) != wal::load_le32(buf.data() + buf.size() - 4)) {
      return std::unexpected(error{error_code::data_integrity, "node store checksum mismatch: " + data_file().string(), "store.nodes"});
    }
    Cursor c({buf.data(), buf.size() - 4});
    std::uint32_t magic = 0; std::uint16_t version = 0, reserved = 0; std::uint64_t count = 0;
    if (!c.u32(magic) || !c.u16(version) || !c.u16(reserved) || !c.u64(count) ||
        magic != NODE_STORE_MAGIC || version != NODE_STORE_VERSION) {
      return std::unexpected(error{error_code::data_integrity, "bad node store header: " + data_file().string(), "store.nodes"});
    }
    for (std::uint64_t i = 0; i < count; ++i) {
      std::uint64_t id = 0; std::uint32_t props = 0;
      if (!c.u64(id) || !c.u32(props)) {
        return std::unexpected(error{error_code::data_integrity, "truncated node record", "store.nodes"});
      }
      auto& node = nodes_[id];
      for (std::uint32_t p = 0; p < props; ++p) {
        std::string k, v;
        if (!c.str(k) || !c.str(v)) {
          return std::unexpected(error{error_code::data_integrity, "truncated node property", "store.nodes"});
        }
        node.emplace(std::move(k), std::move(v));
      }
      high_id_ = std::max(high_id_, id + 1);
    }
  }
  auto stored = load_id_file();
  if (!stored) return std::unexpected(stored.error());
  if (*stored) high_id_ = std::max(high_id_, **stored);
  return {};
}

auto NodeStore::load_id_file() -> std::expected<std::optional<std::uint64_t>, core::error> {
  using core::error; using core::error_code;
  std::ifstream in(id_file());
  if (!in.good()) return std::optional<std::uint64_t>{};
  std::string header, line;
  std::getline(in, header);
  std::getline(in, line);
  constexpr std::string_view key = "high_id=";
  std::uint64_t v = 0;
  if (header != ID_FILE_HEADER || line.rfind(key, 0) != 0) {
    return std::unexpected(error{error_code::data_integrity, "bad id file: " + id_file().string(), "store.nodes"});
  }
  const char* beg = line.data() + key.size();
  const char* end = line.data() + line.size();
  auto [ptr, ec] = std::from_chars(beg, end, v);
  if (ec != std::errc() || ptr != end) {
    return std::unexpected(error{error_code::data_integrity, "bad id file: " + id_file().string(), "store.nodes"});
  }
  return std::optional<std::uint64_t>(v);
}

auto NodeStore::write_id_file_locked() -> std::expected<void, core::error> {
  std::ostringstream out;
  out << ID_FILE_HEADER << "\n" << "high_id=" << high_id_ << "\n";
  const auto text = out.str();
  return platform::atomic_write_file(id_file(), std::string_view(text));
}

auto NodeStore::apply(const wal::CommandEntry& command) -> std::expected<void, core::error> {
  auto cmd = decode_command(command.payload);
  if (!cmd) {
    return std::unexpected(core::error{cmd.error().code,
                                       cmd.error().message + " in transaction " + std::to_string(command.tx_id),
                                       cmd.error().component});
  }
  return apply(*cmd);
}

auto NodeStore::apply(const NodeCommand& command) -> std::expected<void, core::error> {
  std::lock_guard<std::mutex> lk(mutex_);
  return apply_locked(command);
}

auto NodeStore::apply_locked(const NodeCommand& command) -> std::expected<void, core::error> {
  switch (command.op) {
    case NodeCommand::Op::create_node:
      nodes_.try_emplace(command.node_id);
      high_id_ = std::max(high_id_, command.node_id + 1);
      return {};
    case NodeCommand::Op::delete_node:
      nodes_.erase(command.node_id);
      return {};
    case NodeCommand::Op::set_property:
      // A node deleted later in the log may already be gone from a store flushed ahead of it.
      if (auto it = nodes_.find(command.node_id); it != nodes_.end()) it->second[command.key] = command.value;
      return {};
  }
  return std::unexpected(core::error{core::error_code::invalid_argument, "unknown node command", "store.nodes"});
}

auto NodeStore::flush() -> std::expected<void, core::error> {
  std::lock_guard<std::mutex> lk(mutex_);
  std::vector<std::uint8_t> out;
  put_u32(out, NODE_STORE_MAGIC);
  out.resize(out.size() + 4);
  wal::store_le16(out.data() + 4, NODE_STORE_VERSION);
  wal::store_le16(out.data() + 6, 0);
  put_u64(out, nodes_.size());
  for (const auto& [id, props] : nodes_) {
    put_u64(out, id);
    put_u32(out, static_cast<std::uint32_t>(props.size()));
    for (const auto& [k, v] : props) {
      put_string(out, k);
      put_string(out, v);
    }
  }
  put_u32(out, wal::crc32c(out));
  if (auto w = platform::atomic_write_file(data_file(), std::span<const std::uint8_t>(out)); !w) return w;
  return write_id_file_locked();
}

auto NodeStore::missing_files() const -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> out;
  std::error_code ec;
  if (!std::filesystem::exists(id_file(), ec)) out.push_back(id_file());
  return out;
}

auto NodeStore::rebuild() -> std::expected<void, core::error> {
  std::lock_guard<std::mutex> lk(mutex_);
  std::uint64_t high = 1;
  for (const auto& [id, props] : nodes_) high = std::max(high, id + 1);
  high_id_ = std::max(high_id_, high);
  return write_id_file_locked();
}

auto NodeStore::allocate_node_id() -> std::uint64_t {
  std::lock_guard<std::mutex> lk(mutex_);
  return high_id_++;
}

auto NodeStore::node_count() const -> std::size_t {
  std::lock_guard<std::mutex> lk(mutex_);
  return nodes_.size();
}

auto NodeStore::has_node(std::uint64_t id) const -> bool {
  std::lock_guard<std::mutex> lk(mutex_);
  return nodes_.contains(id);
}

auto NodeStore::property(std::uint64_t id, const std::string& key) const -> std::optional<std::string> {
  std::lock_guard<std::mutex> lk(mutex_);
  auto it = nodes_.find(id);
  if (it == nodes_.end()) return std::nullopt;
  auto p = it->second.find(key);
  if (p == it->second.end()) return std::nullopt;
  return p->second;
}

auto NodeStore::high_id() const -> std::uint64_t {
  std::lock_guard<std::mutex> lk(mutex_);
  return high_id_;
}

} // namespace trellis::store

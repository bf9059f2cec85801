#include "trellis/store/metadata_store.hpp"
#include "trellis/platform/filesystem.hpp"

#include <chrono>
#include <charconv>
#include <fstream>
#include <random>
#include <sstream>

namespace trellis::store {

namespace {

constexpr auto HEADER_LINE = "trellis-metadata v1";

template <class Int>
auto parse_int(const std::string& s, Int& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  Int tmp{};
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end || beg == end) return false;
  out = tmp;
  return true;
}

auto new_store_id() -> std::uint64_t {
  std::random_device rd;
  std::mt19937_64 gen((static_cast<std::uint64_t>(rd()) << 32) ^ rd() ^
                      static_cast<std::uint64_t>(std::chrono::system_clock::now().time_since_epoch().count()));
  std::uint64_t id = 0;
  while (id == 0) id = gen();
  return id;
}

} // namespace

auto metadata_path(const std::filesystem::path& store_dir) -> std::filesystem::path {
  return store_dir / METADATA_FILE_NAME;
}

auto load_metadata(const std::filesystem::path& store_dir) -> std::expected<MetaDataRecord, core::error> {
  using core::error; using core::error_code;
  std::ifstream in(metadata_path(store_dir));
  if (!in.good()) return std::unexpected(error{error_code::not_found, "metadata open failed", "store.metadata"});
  std::string header; std::getline(in, header);
  if (header != HEADER_LINE) {
    return std::unexpected(error{error_code::data_integrity, "bad metadata header", "store.metadata"});
  }
  MetaDataRecord rec{};
  bool have_store_id = false;
  std::string line; std::size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;
    auto eq = line.find('=');
    if (eq == std::string::npos) {
      return std::unexpected(error{error_code::data_integrity, "metadata parse error at line " + std::to_string(line_no), "store.metadata"});
    }
    const auto k = line.substr(0, eq);
    const auto v = line.substr(eq + 1);
    bool ok = true;
    if (k == "store_id") { ok = parse_int(v, rec.store_id); have_store_id = ok; }
    else if (k == "log_version") ok = parse_int(v, rec.log_version);
    else if (k == "last_committed_tx_id") ok = parse_int(v, rec.last_committed_tx_id);
    else if (k == "last_closed_tx_id") ok = parse_int(v, rec.last_closed_tx_id);
    else if (k == "last_closed_log_version") ok = parse_int(v, rec.last_closed_position.log_version);
    else if (k == "last_closed_byte_offset") ok = parse_int(v, rec.last_closed_position.byte_offset);
    else if (k == "last_missing_logs_recovery_timestamp") ok = parse_int(v, rec.last_missing_logs_recovery_timestamp);
    if (!ok) {
      return std::unexpected(error{error_code::data_integrity,
                                   "metadata parse error at line " + std::to_string(line_no) + ": invalid " + k + "=\"" + v + "\"",
                                   "store.metadata"});
    }
  }
  if (!have_store_id) return std::unexpected(error{error_code::data_integrity, "metadata missing store_id", "store.metadata"});
  return rec;
}

auto save_metadata(const std::filesystem::path& store_dir, const MetaDataRecord& rec) -> std::expected<void, core::error> {
  std::ostringstream out;
  out << HEADER_LINE << "\n";
  out << "store_id=" << rec.store_id << "\n";
  out << "log_version=" << rec.log_version << "\n";
  out << "last_committed_tx_id=" << rec.last_committed_tx_id << "\n";
  out << "last_closed_tx_id=" << rec.last_closed_tx_id << "\n";
  out << "last_closed_log_version=" << rec.last_closed_position.log_version << "\n";
  out << "last_closed_byte_offset=" << rec.last_closed_position.byte_offset << "\n";
  out << "last_missing_logs_recovery_timestamp=" << rec.last_missing_logs_recovery_timestamp << "\n";
  auto r = platform::atomic_write_file(metadata_path(store_dir), std::string_view(out.str()));
  if (!r) return std::unexpected(core::error{r.error().code, "metadata save failed: " + r.error().message, "store.metadata"});
  return {};
}

MetaDataStore::MetaDataStore(std::filesystem::path dir, MetaDataRecord rec)
    : dir_(std::move(dir)), rec_(rec), log_version_(rec.log_version), committing_(rec.last_committed_tx_id) {}

auto MetaDataStore::open(const std::filesystem::path& store_dir, bool create_if_missing)
    -> std::expected<std::unique_ptr<MetaDataStore>, core::error> {
  auto rec = load_metadata(store_dir);
  if (!rec) {
    if (rec.error().code != core::error_code::not_found || !create_if_missing) return std::unexpected(rec.error());
    std::error_code ec;
    std::filesystem::create_directories(store_dir, ec);
    if (ec) {
      return std::unexpected(core::error{core::error_code::io_failed, "mkdir failed: " + store_dir.string(), "store.metadata"});
    }
    MetaDataRecord fresh{};
    fresh.store_id = new_store_id();
    if (auto s = save_metadata(store_dir, fresh); !s) return std::unexpected(s.error());
    rec = fresh;
  }
  return std::unique_ptr<MetaDataStore>(new MetaDataStore(store_dir, *rec));
}

auto MetaDataStore::current_log_version() const noexcept -> std::uint64_t {
  return log_version_.load(std::memory_order_acquire);
}

auto MetaDataStore::increment_and_get() -> std::expected<std::uint64_t, core::error> {
  std::lock_guard<std::mutex> lk(mutex_);
  MetaDataRecord next = rec_;
  next.log_version += 1;
  if (auto s = save_metadata(dir_, next); !s) return std::unexpected(s.error());
  rec_ = next;
  log_version_.store(next.log_version, std::memory_order_release);
  return next.log_version;
}

auto MetaDataStore::set_current_log_version(std::uint64_t version) -> std::expected<void, core::error> {
  std::lock_guard<std::mutex> lk(mutex_);
  MetaDataRecord next = rec_;
  next.log_version = version;
  if (auto s = save_metadata(dir_, next); !s) return s;
  rec_ = next;
  log_version_.store(version, std::memory_order_release);
  return {};
}

auto MetaDataStore::committing_transaction_id() const noexcept -> std::uint64_t {
  return committing_.load(std::memory_order_acquire);
}

auto MetaDataStore::next_committing_transaction_id() noexcept -> std::uint64_t {
  return committing_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

auto MetaDataStore::last_committed_transaction_id() const noexcept -> std::uint64_t {
  std::lock_guard<std::mutex> lk(mutex_);
  return rec_.last_committed_tx_id;
}

auto MetaDataStore::last_closed_transaction() const noexcept -> wal::ClosedTransaction {
  std::lock_guard<std::mutex> lk(mutex_);
  return {rec_.last_closed_tx_id, rec_.last_closed_position};
}

void MetaDataStore::transaction_closed(std::uint64_t tx_id, wal::LogPosition position) noexcept {
  std::lock_guard<std::mutex> lk(mutex_);
  if (tx_id > rec_.last_committed_tx_id) rec_.last_committed_tx_id = tx_id;
  rec_.last_closed_tx_id = tx_id;
  rec_.last_closed_position = position;
  std::uint64_t c = committing_.load(std::memory_order_acquire);
  while (c < tx_id && !committing_.compare_exchange_weak(c, tx_id, std::memory_order_acq_rel)) {}
}

auto MetaDataStore::store_id() const noexcept -> std::uint64_t {
  std::lock_guard<std::mutex> lk(mutex_);
  return rec_.store_id;
}

auto MetaDataStore::last_missing_logs_recovery_timestamp() const noexcept -> std::int64_t {
  std::lock_guard<std::mutex> lk(mutex_);
  return rec_.last_missing_logs_recovery_timestamp;
}

void MetaDataStore::set_last_missing_logs_recovery_timestamp(std::int64_t ts) noexcept {
  std::lock_guard<std::mutex> lk(mutex_);
  rec_.last_missing_logs_recovery_timestamp = ts;
}

auto MetaDataStore::snapshot() const -> MetaDataRecord {
  std::lock_guard<std::mutex> lk(mutex_);
  return rec_;
}

auto MetaDataStore::flush() -> std::expected<void, core::error> {
  std::lock_guard<std::mutex> lk(mutex_);
  return save_metadata(dir_, rec_);
}

} // namespace trellis::store

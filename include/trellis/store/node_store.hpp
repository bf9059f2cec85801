#pragma once

/** \file node_store.hpp
 *  \brief Node store: the state the transaction log is replayed into.
 *
 * On disk (store directory):
 * - `graph.store`: all nodes and their string properties, little-endian, CRC32C trailer,
 *   replaced atomically by flush().
 * - `graph.store.id`: auxiliary id file holding the next node id. It can always be
 *   regenerated from `graph.store`.
 *
 * Every command is idempotent so that replaying a command the store already reflects is
 * harmless. Thread-safe.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "trellis/error.hpp"
#include "trellis/recovery/collaborators.hpp"

namespace trellis::store {

constexpr auto NODE_STORE_FILE_NAME = "graph.store";
constexpr auto NODE_ID_FILE_NAME = "graph.store.id";
constexpr std::uint32_t NODE_STORE_MAGIC = 0x534E5254u; // "TRNS"

struct NodeCommand {
  enum class Op : std::uint8_t { create_node = 1, delete_node = 2, set_property = 3 };

  Op op{Op::create_node};
  std::uint64_t node_id{0};
  std::string key;
  std::string value;
};

/** \brief Command payload: u8 op, u64 node id, u32 key length, key, u32 value length, value. */
auto encode_command(const NodeCommand& cmd) -> std::vector<std::uint8_t>;
auto decode_command(std::span<const std::uint8_t> bytes) -> std::expected<NodeCommand, core::error>;

class NodeStore final : public recovery::StoreApplier, public recovery::AuxiliaryRebuilder {
public:
  /** \brief Load `graph.store` when present. A missing id file is not an error here. */
  static auto open(const std::filesystem::path& store_dir) -> std::expected<std::unique_ptr<NodeStore>, core::error>;

  // StoreApplier
  auto apply(const wal::CommandEntry& command) -> std::expected<void, core::error> override;
  auto flush() -> std::expected<void, core::error> override;

  // AuxiliaryRebuilder
  auto missing_files() const -> std::vector<std::filesystem::path> override;
  auto rebuild() -> std::expected<void, core::error> override;

  auto apply(const NodeCommand& command) -> std::expected<void, core::error>;

  /** \brief Reserve a node id; reserved ids are never handed out twice. */
  auto allocate_node_id() -> std::uint64_t;

  auto node_count() const -> std::size_t;
  auto has_node(std::uint64_t id) const -> bool;
  auto property(std::uint64_t id, const std::string& key) const -> std::optional<std::string>;
  auto high_id() const -> std::uint64_t;

  auto data_file() const -> std::filesystem::path { return dir_ / NODE_STORE_FILE_NAME; }
  auto id_file() const -> std::filesystem::path { return dir_ / NODE_ID_FILE_NAME; }

private:
  using Properties = std::map<std::string, std::string>;

  explicit NodeStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

  auto load() -> std::expected<void, core::error>;
  auto load_id_file() -> std::expected<std::optional<std::uint64_t>, core::error>;
  auto write_id_file_locked() -> std::expected<void, core::error>;
  auto apply_locked(const NodeCommand& command) -> std::expected<void, core::error>;

  std::filesystem::path dir_;
  mutable std::mutex mutex_;
  std::map<std::uint64_t, Properties> nodes_;
  std::uint64_t high_id_{1};
};

} // namespace trellis::store

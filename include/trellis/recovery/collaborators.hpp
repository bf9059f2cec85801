#pragma once

/** \file collaborators.hpp
 *  \brief Interfaces the recovery engine consumes from the store and from observers.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <vector>

#include "trellis/error.hpp"
#include "trellis/wal/log_entry.hpp"

namespace trellis::recovery {

/** \brief Target of forward replay. apply() must be idempotent. */
class StoreApplier {
public:
  virtual ~StoreApplier() = default;
  virtual auto apply(const wal::CommandEntry& command) -> std::expected<void, core::error> = 0;
  /** Make everything applied so far durable. */
  virtual auto flush() -> std::expected<void, core::error> = 0;
};

/** \brief Regenerable lookup structures (id files). */
class AuxiliaryRebuilder {
public:
  virtual ~AuxiliaryRebuilder() = default;
  virtual auto missing_files() const -> std::vector<std::filesystem::path> = 0;
  virtual auto rebuild() -> std::expected<void, core::error> = 0;
};

/** \brief Fire-and-forget recovery notifications, invoked synchronously. Empty members are skipped. */
struct RecoveryMonitor {
  std::function<void(std::uint64_t lowest_recovered_tx_id)> reverse_store_recovery_completed;
  std::function<void(std::uint64_t recovered_transactions, std::uint64_t elapsed_ms)> recovery_completed;
};

} // namespace trellis::recovery

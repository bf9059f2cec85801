#pragma once

/** \file log_version_repository.hpp
 *  \brief Owner of the process-wide "current log version" counter.
 *
 * increment_and_get() is only called under the writer's rotation lock and persists the new
 * value before returning. current_log_version() is a lock-free snapshot for readers.
 */

#include <cstdint>
#include <expected>

#include "trellis/error.hpp"

namespace trellis::wal {

class LogVersionRepository {
public:
  virtual ~LogVersionRepository() = default;
  virtual auto current_log_version() const noexcept -> std::uint64_t = 0;
  virtual auto increment_and_get() -> std::expected<std::uint64_t, core::error> = 0;
  virtual auto set_current_log_version(std::uint64_t version) -> std::expected<void, core::error> = 0;
};

} // namespace trellis::wal

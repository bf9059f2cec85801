#pragma once

/** \file check_pointer.hpp
 *  \brief Background thread serving checkpoint requests, with bounded waits.
 *
 * request() queues one checkpoint (requests coalesce); the worker runs the supplied
 * checkpoint function outside its own lock. await_checkpoint() waits until a checkpoint
 * covering the given transaction id was recorded, or times out without side effects.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "trellis/core/logging.hpp"
#include "trellis/error.hpp"
#include "trellis/wal/checkpoint.hpp"

namespace trellis::kernel {

class CheckPointer {
public:
  using CheckpointFn = std::function<std::expected<wal::CheckpointInfo, core::error>(const std::string& reason)>;

  CheckPointer(CheckpointFn fn, core::LogPtr log);
  ~CheckPointer();

  CheckPointer(const CheckPointer&) = delete;
  CheckPointer& operator=(const CheckPointer&) = delete;

  void start();
  /** \brief Join the worker; a request still queued is dropped. */
  void stop();

  void request(std::string reason);

  /** \brief Record that a checkpoint covering `tx_id` is durable. */
  void checkpointed(std::uint64_t tx_id);

  auto await_checkpoint(std::uint64_t tx_id, std::chrono::milliseconds timeout) const
      -> std::expected<void, core::error>;

  [[nodiscard]] auto last_checkpointed_transaction() const -> std::uint64_t;
  [[nodiscard]] auto last_error() const -> std::optional<core::error>;

private:
  void worker_thread();

  CheckpointFn fn_;
  core::LogPtr log_;
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::optional<std::string> pending_;
  std::uint64_t checkpointed_tx_{0};
  std::optional<core::error> last_error_;
};

} // namespace trellis::kernel

#pragma once

/** \file availability_guard.hpp
 *  \brief External switch that suspends a database's ability to serve transactions.
 *
 * stop() makes the database unavailable. mark_start_aborted() additionally records that
 * startup was cancelled; require() then reports start_aborted until release().
 * Thread-safe.
 */

#include <chrono>
#include <condition_variable>
#include <expected>
#include <mutex>
#include <string_view>

#include "trellis/error.hpp"

namespace trellis::recovery {

class AvailabilityGuard {
public:
  void stop();
  void release();
  void mark_start_aborted();

  [[nodiscard]] auto is_available() const -> bool;
  [[nodiscard]] auto is_start_aborted() const -> bool;

  /** \brief Ok when available; start_aborted or unavailable otherwise. */
  auto require(std::string_view operation) const -> std::expected<void, core::error>;

  /** \brief Wait up to `timeout` for availability; timed_out leaves the guard untouched. */
  auto await_available(std::chrono::milliseconds timeout) const -> std::expected<void, core::error>;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool available_{true};
  bool start_aborted_{false};
};

} // namespace trellis::recovery

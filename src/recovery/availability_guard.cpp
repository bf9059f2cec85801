#include "trellis/recovery/availability_guard.hpp"

#include <string>

namespace trellis::recovery {

void AvailabilityGuard::stop() {
  std::lock_guard<std::mutex> lk(mutex_);
  available_ = false;
}

void AvailabilityGuard::release() {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    available_ = true;
    start_aborted_ = false;
  }
  cv_.notify_all();
}

void AvailabilityGuard::mark_start_aborted() {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    available_ = false;
    start_aborted_ = true;
  }
  cv_.notify_all();
}

auto AvailabilityGuard::is_available() const -> bool {
  std::lock_guard<std::mutex> lk(mutex_);
  return available_;
}

auto AvailabilityGuard::is_start_aborted() const -> bool {
  std::lock_guard<std::mutex> lk(mutex_);
  return start_aborted_;
}

auto AvailabilityGuard::require(std::string_view operation) const -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  std::lock_guard<std::mutex> lk(mutex_);
  if (start_aborted_) {
    return std::unexpected(error{error_code::start_aborted,
                                 "database start was aborted; " + std::string(operation) + " refused", "recovery.guard"});
  }
  if (!available_) {
    return std::unexpected(error{error_code::unavailable,
                                 "database is unavailable; " + std::string(operation) + " refused", "recovery.guard"});
  }
  return {};
}

auto AvailabilityGuard::await_available(std::chrono::milliseconds timeout) const -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  std::unique_lock<std::mutex> lk(mutex_);
  if (!cv_.wait_for(lk, timeout, [this] { return available_ || start_aborted_; })) {
    return std::unexpected(error{error_code::timed_out,
                                 "database not available after " + std::to_string(timeout.count()) + " ms", "recovery.guard"});
  }
  if (start_aborted_) {
    return std::unexpected(error{error_code::start_aborted, "database start was aborted", "recovery.guard"});
  }
  return {};
}

} // namespace trellis::recovery

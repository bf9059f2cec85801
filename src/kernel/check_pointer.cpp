#include "trellis/kernel/check_pointer.hpp"

namespace trellis::kernel {

CheckPointer::CheckPointer(CheckpointFn fn, core::LogPtr log)
    : fn_(std::move(fn)), log_(log ? std::move(log) : core::create_logger(nullptr, "checkpoint")) {}

CheckPointer::~CheckPointer() {
  stop();
}

void CheckPointer::start() {
  if (running_.exchange(true)) return;
  worker_ = std::thread(&CheckPointer::worker_thread, this);
}

void CheckPointer::stop() {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!running_.exchange(false)) return;
    pending_.reset();
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void CheckPointer::request(std::string reason) {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!running_) return;
    if (!pending_) pending_ = std::move(reason);
  }
  cv_.notify_all();
}

void CheckPointer::checkpointed(std::uint64_t tx_id) {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (tx_id > checkpointed_tx_) checkpointed_tx_ = tx_id;
  }
  cv_.notify_all();
}

auto CheckPointer::await_checkpoint(std::uint64_t tx_id, std::chrono::milliseconds timeout) const
    -> std::expected<void, core::error> {
  std::unique_lock<std::mutex> lk(mutex_);
  if (!cv_.wait_for(lk, timeout, [&] { return checkpointed_tx_ >= tx_id; })) {
    return std::unexpected(core::error{core::error_code::timed_out,
                                       "no checkpoint covering transaction " + std::to_string(tx_id) + " after " +
                                       std::to_string(timeout.count()) + " ms", "kernel.checkpoint"});
  }
  return {};
}

auto CheckPointer::last_checkpointed_transaction() const -> std::uint64_t {
  std::lock_guard<std::mutex> lk(mutex_);
  return checkpointed_tx_;
}

auto CheckPointer::last_error() const -> std::optional<core::error> {
  std::lock_guard<std::mutex> lk(mutex_);
  return last_error_;
}

void CheckPointer::worker_thread() {
  while (running_) {
    std::string reason;
    {
      std::unique_lock<std::mutex> lk(mutex_);
      cv_.wait(lk, [this] { return pending_.has_value() || !running_; });
      if (!running_) break;
      reason = std::move(*pending_);
      pending_.reset();
    }
    auto r = fn_(reason);
    if (!r) {
      log_->error("checkpoint failed ({}): {}", reason, core::describe(r.error()));
      std::lock_guard<std::mutex> lk(mutex_);
      last_error_ = r.error();
    }
  }
}

} // namespace trellis::kernel

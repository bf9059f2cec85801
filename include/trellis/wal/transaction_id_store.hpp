#pragma once

/** \file transaction_id_store.hpp
 *  \brief Transaction id bookkeeping the log writer consults.
 */

#include <cstdint>

#include "trellis/wal/log_position.hpp"

namespace trellis::wal {

struct ClosedTransaction {
  std::uint64_t tx_id{0};
  LogPosition position{};   /**< log position right after the transaction's Commit entry */
};

class TransactionIdStore {
public:
  virtual ~TransactionIdStore() = default;
  /** Highest id handed to a transaction that started committing. */
  virtual auto committing_transaction_id() const noexcept -> std::uint64_t = 0;
  virtual auto next_committing_transaction_id() noexcept -> std::uint64_t = 0;
  virtual auto last_committed_transaction_id() const noexcept -> std::uint64_t = 0;
  virtual auto last_closed_transaction() const noexcept -> ClosedTransaction = 0;
  virtual void transaction_closed(std::uint64_t tx_id, LogPosition position) noexcept = 0;
};

} // namespace trellis::wal

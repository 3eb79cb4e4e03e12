#pragma once

#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace asqueue::db::memory {

/*
  Transaction = snapshot + write set
*/

class MemoryTransaction final : public db::Transaction {
 public:
  // Throws db::Error(Busy) when another transaction stays open past the lock timeout.
  MemoryTransaction(MemoryRepository& repo, const TransactionOptions& options);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsActive() const override {
    return active_;
  }

  // Err when the transaction ended or its deadline passed.
  Result Check() const;

  uint64_t NextSequenceId() {
    return repo_.next_sequence_id_.fetch_add(1);
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&                                    repo_;
  std::unique_lock<std::timed_mutex>                   lock_;
  MemoryRepository::State                              working_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  bool                                                 committed_ = false;
  bool                                                 active_    = true;
};

} // namespace asqueue::db::memory

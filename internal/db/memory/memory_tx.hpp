#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace avatarpool::db::memory {

/*
  Working copy of the committed state, swapped in on Commit().

  The repository's writer lock is held until destruction, so transactions
  are serialized and Commit() never conflicts.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return status_ == Status::kCommitted;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  enum class Status { kOpen, kCommitted, kRolledBack };

  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> writer_lock_;
  MemoryRepository::State      working_;
  Status                       status_ = Status::kOpen;
};

} // namespace avatarpool::db::memory

#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace avatarpool::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_lock_(repo.writer_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_;
}

MemoryTransaction::~MemoryTransaction() {
  // an open transaction simply drops its working copy
}

void MemoryTransaction::Commit() {
  if (status_ != Status::kOpen) {
    throw avatarpool::util::InvariantViolation("memory transaction already finished");
  }
  {
    std::scoped_lock lock(repo_.mutex_);
    repo_.committed_ = std::move(working_);
  }
  status_ = Status::kCommitted;
}

void MemoryTransaction::Rollback() {
  if (status_ == Status::kOpen) {
    status_ = Status::kRolledBack;
    working_ = {};
  }
}

} // namespace avatarpool::db::memory

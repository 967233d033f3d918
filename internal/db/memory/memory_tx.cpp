#include "memory_tx.hpp"

namespace calltrace::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo_.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  journal_.clear();
  committed_ = true;
  if (lock_.owns_lock()) lock_.unlock();
}

void MemoryTransaction::Rollback() {
  for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
    (*it)(repo_.committed_);
  }
  journal_.clear();
  rolled_back_ = true;
  if (lock_.owns_lock()) lock_.unlock();
}

void MemoryTransaction::OnRollback(std::function<void(MemoryRepository::State&)> undo) {
  journal_.push_back(std::move(undo));
}

} // namespace calltrace::db::memory

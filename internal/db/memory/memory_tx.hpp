#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace calltrace::db::memory {

/*
  Transaction = exclusive lock + undo journal.

  Writes go straight to the committed state; Rollback replays the
  journal backwards. Copying the whole state per transaction would
  make every traced call O(trace size).
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_ || rolled_back_;
  }

  MemoryRepository::State& Mutable() {
    return repo_.committed_;
  }
  const MemoryRepository::State& View() const {
    return repo_.committed_;
  }

  void OnRollback(std::function<void(MemoryRepository::State&)> undo);

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;

  std::vector<std::function<void(MemoryRepository::State&)>> journal_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace calltrace::db::memory

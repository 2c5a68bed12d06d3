#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace alarmsrv::db::memory {

/*
  Transaction = snapshot + write set

  A write transaction holds the repository writer lock until it commits
  or rolls back, so its snapshot cannot go stale. A read transaction
  only copies the last committed state.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool writable);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  bool Writable() const {
    return writer_lock_.owns_lock();
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> writer_lock_;
  MemoryRepository::State      working_;
  bool                         committed_ = false;
};

} // namespace alarmsrv::db::memory

#include "memory_tx.hpp"

namespace alarmsrv::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool writable) : repo_(repo) {
  if (writable) {
    writer_lock_ = std::unique_lock<std::mutex>(repo_.writer_mutex_);
  }
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_) Rollback();
}

void MemoryTransaction::Commit() {
  if (writer_lock_.owns_lock()) {
    {
      std::scoped_lock lock(repo_.mutex_);
      repo_.committed_ = std::move(working_);
    }
    writer_lock_.unlock();
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  if (writer_lock_.owns_lock()) {
    writer_lock_.unlock();
  }
  committed_ = true;
}

} // namespace alarmsrv::db::memory

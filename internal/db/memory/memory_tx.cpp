#include "memory_tx.hpp"

namespace meshdispatch::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.writer_mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() = default;

void MemoryTransaction::Commit() {
  repo_.committed_ = std::move(working_);
  committed_       = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace meshdispatch::db::memory

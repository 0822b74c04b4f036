#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace coord::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode) : repo_(repo), mode_(mode) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() = default;

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (mode_ == TxMode::kReadOnly) {
    throw std::logic_error("memory store: write inside a read-only transaction");
  }
  if (finished_) {
    throw std::logic_error("memory store: write after transaction finished");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("memory store: transaction already finished");
  }
  finished_ = true;

  if (mode_ == TxMode::kReadWrite) {
    std::scoped_lock lock(repo_.mutex_);
    if (repo_.committed_version_ != base_version_) {
      throw util::StoreError("memory store: concurrent commit since this transaction began", true);
    }
    repo_.committed_ = std::move(working_);
    ++repo_.committed_version_;
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  // the working copy is simply dropped
  finished_ = true;
}

} // namespace coord::db::memory

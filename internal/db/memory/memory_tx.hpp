#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace coord::db::memory {

/*
  Works on a private copy of the committed state. A read-write commit swaps
  the copy in only if nothing else committed since the copy was taken;
  otherwise it fails as a retryable store error. Read-only transactions
  never publish and never bump the version.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;

  bool IsCommitted() const override {
    return committed_;
  }
  TxMode Mode() const override {
    return mode_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  TxMode                  mode_;
  MemoryRepository::State working_;
  uint64_t                base_version_ = 0;
  bool                    committed_    = false;
  bool                    finished_     = false;
};

} // namespace coord::db::memory

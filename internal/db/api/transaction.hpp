#pragma once

namespace coord::db {

enum class TxMode {
  kReadWrite,
  // Log and inbox reads. Never blocks a writer and never invalidates a
  // concurrent read-write transaction.
  kReadOnly,
};

/*
  One coordination call = one transaction.

  Every backend guarantees:

  - nothing written is visible to others before Commit()
  - a read-write transaction holds the store's write lock from its first
    read, so a lock-table decision cannot interleave with another writer
    (sqlite: BEGIN IMMEDIATE, memory: version check at commit)
  - destroying an unfinished transaction rolls it back
  - writing through a read-only transaction is a logic error
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
  virtual TxMode Mode() const = 0;
};

}

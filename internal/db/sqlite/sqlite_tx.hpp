#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace coord::db::sqlite {

/*
  Read-write transactions open with BEGIN IMMEDIATE so the file's write lock
  is taken before the first SELECT; a second process contending for the
  same resource waits (busy_timeout) and then re-reads the committed row.
  Read-only transactions use a deferred BEGIN and see a WAL snapshot.

  The connection is shared by every thread of the process, so the
  transaction owns the connection's TxMutex() until it finishes.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

  bool IsCommitted() const override { return committed_; }
  TxMode Mode() const override { return mode_; }

private:
  std::shared_ptr<SqliteDB> db_;
  TxMode mode_;
  std::unique_lock<std::mutex> turn_;
  bool committed_ = false;
  bool finished_  = false;
};

}

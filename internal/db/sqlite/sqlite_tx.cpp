#include "sqlite_tx.hpp"

#include "internal/util/errors.hpp"

namespace coord::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode)
    : db_(std::move(db)), mode_(mode), turn_(db_->TxMutex()) {
  db_->Exec(mode_ == TxMode::kReadWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  // no throwing from here; a failed ROLLBACK leaves nothing to undo
  sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
}

void SqliteTransaction::Commit() {
  finished_ = true;
  try {
    db_->Exec("COMMIT;");
  } catch (const util::StoreError&) {
    // a failed COMMIT can leave the transaction open on this connection
    sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
    turn_.unlock();
    throw;
  }
  committed_ = true;
  turn_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const util::StoreError&) {
    turn_.unlock();
    throw;
  }
  turn_.unlock();
}

} // namespace coord::db::sqlite

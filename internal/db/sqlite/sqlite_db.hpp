#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace coord::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One handle per process per project. Cross-process exclusion comes from the
  sqlite file lock, so several coordinators may open the same file. Within
  the process, threads sharing the handle take turns: a transaction holds
  TxMutex() from BEGIN until COMMIT/ROLLBACK.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  int         busy_timeout_ms_;
  std::mutex  tx_mutex_;
};

} // namespace coord::db::sqlite

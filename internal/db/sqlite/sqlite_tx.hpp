#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace seawatch::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - a concurrent dedup pass waits on busy_timeout instead of
      failing mid-merge on lock upgrade
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      finished_  = false;
};

} // namespace seawatch::db::sqlite

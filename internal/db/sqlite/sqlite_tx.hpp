#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace healthd::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Holds the connection's write mutex for its whole lifetime, so statements
  issued through Exec()/Prepare() belong to this transaction only.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const { return db_->Handle(); }

  void      Exec(const std::string& sql) { db_->Exec(sql); }
  Statement Prepare(const std::string& sql, std::string_view what = "sqlite prepare") { return db_->Prepare(sql, what); }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool finished_ = false;
};

}

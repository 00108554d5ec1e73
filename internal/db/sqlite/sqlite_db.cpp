#include "sqlite_db.hpp"

#include "internal/db/sqlite/sqlite_util.hpp"

namespace healthd::db::sqlite {

SqliteDB::SqliteDB(std::string path, OpenMode mode) : path_(std::move(path)), mode_(mode) {
  const int flags = mode_ == OpenMode::kReadOnly ? SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX
                                                 : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw Error(TranslateCode(rc), "sqlite open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close_v2(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw Error(TranslateCode(rc), msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql, std::string_view what) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIfError(db_, rc, what);
  return Statement(stmt);
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately
  ThrowIfError(db_, sqlite3_busy_timeout(db_, 5000), "busy_timeout");

  if (mode_ == OpenMode::kReadOnly) {
    Exec("PRAGMA temp_store=MEMORY;");
    return;
  }

  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

} // namespace healthd::db::sqlite

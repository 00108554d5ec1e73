#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace healthd::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

enum class OpenMode {
  kReadWrite,
  kReadOnly,
};

/*
  Thin RAII wrapper around sqlite3*.

  The store opens the same file twice: one read-write handle that all
  writes go through, and one read-only handle for queries. In WAL mode the
  readers never wait on the writer.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, OpenMode mode = OpenMode::kReadWrite);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool ReadOnly() const {
    return mode_ == OpenMode::kReadOnly;
  }

  // Execute a SQL string (used for pragmas/DDL). Throws db::Error.
  void Exec(const std::string& sql);

  // Prepare a single statement. Throws db::Error prefixed with `what`.
  Statement Prepare(const std::string& sql, std::string_view what = "sqlite prepare");

  /*
    Serializes writers on this connection.

    SQLite keeps transaction state and sqlite3_changes() per connection, so
    every statement that writes, and every transaction, holds this lock.
  */
  std::unique_lock<std::mutex> LockWrites() {
    return std::unique_lock<std::mutex>(write_mutex_);
  }

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  OpenMode    mode_;
  std::mutex  write_mutex_;
};

} // namespace healthd::db::sqlite

#pragma once

#include <unistd.h>

#include <filesystem>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"

namespace healthd::testing {

/*
  Fresh state database under the temp dir, opened the way the agent opens
  it: read-write first, then read-only on the same file. The file and its
  WAL side files are removed on destruction.
*/
class TestDB {
 public:
  explicit TestDB(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "healthd_unit_tests";
    std::filesystem::create_directories(dir);
    path_ = (dir / (name + "-" + std::to_string(::getpid()) + ".db")).string();
    RemoveFiles();

    rw = std::make_shared<db::sqlite::SqliteDB>(path_, db::sqlite::OpenMode::kReadWrite);
    ro = std::make_shared<db::sqlite::SqliteDB>(path_, db::sqlite::OpenMode::kReadOnly);
  }

  ~TestDB() {
    ro.reset();
    rw.reset();
    RemoveFiles();
  }

  TestDB(const TestDB&)            = delete;
  TestDB& operator=(const TestDB&) = delete;

  const std::string& Path() const {
    return path_;
  }

  std::shared_ptr<db::sqlite::SqliteDB> rw;
  std::shared_ptr<db::sqlite::SqliteDB> ro;

 private:
  void RemoveFiles() {
    std::error_code ec;
    for (const char* suffix : {"", "-wal", "-shm"}) {
      std::filesystem::remove(path_ + suffix, ec);
    }
  }

  std::string path_;
};

} // namespace healthd::testing

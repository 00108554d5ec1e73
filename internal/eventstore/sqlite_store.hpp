#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/eventstore/sqlite_bucket.hpp"
#include "internal/eventstore/store.hpp"

namespace healthd::eventstore {

/*
  Store over one SQLite database, opened through a read-write and a
  read-only handle on the same file.

  The retention config is fixed at construction; every bucket resolves its
  own policy from it, so options passed for one bucket never leak into the
  next.
*/
class SqliteStore final : public Store {
 public:
  SqliteStore(std::shared_ptr<db::sqlite::SqliteDB> db_rw, std::shared_ptr<db::sqlite::SqliteDB> db_ro, RetentionConfig retention);

  std::shared_ptr<Bucket> OpenBucket(const std::string& name, const BucketOptions& options = {}) override;
  std::shared_ptr<Bucket> LoadBucketWithNoPurge(const std::string& name) override;

  // Explicit policy, bypassing the store default (short intervals in tests).
  std::shared_ptr<SqliteBucket> OpenBucketWithPolicy(const std::string& name, const RetentionPolicy& policy);

  const RetentionConfig& Retention() const {
    return retention_;
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_rw_;
  std::shared_ptr<db::sqlite::SqliteDB> db_ro_;
  const RetentionConfig                 retention_;
};

} // namespace healthd::eventstore

#include "sqlite_store.hpp"

#include "internal/eventstore/table_name.hpp"
#include "internal/util/errors.hpp"

namespace healthd::eventstore {

namespace {

// Bound on CREATE TABLE + indexes.
constexpr auto kCreateTableTimeout = std::chrono::seconds(10);

} // namespace

SqliteStore::SqliteStore(std::shared_ptr<db::sqlite::SqliteDB> db_rw, std::shared_ptr<db::sqlite::SqliteDB> db_ro,
                         RetentionConfig retention)
    : db_rw_(std::move(db_rw)), db_ro_(std::move(db_ro)), retention_(retention) {
  if (!db_rw_ || !db_ro_) {
    throw util::InvalidArgument("sqlite store requires both a read-write and a read-only handle");
  }
  if (db_rw_->ReadOnly()) {
    throw util::InvalidArgument("sqlite store: write handle for " + db_rw_->Path() + " is read-only");
  }
}

std::shared_ptr<Bucket> SqliteStore::OpenBucket(const std::string& name, const BucketOptions& options) {
  return OpenBucketWithPolicy(name, ResolveRetentionPolicy(retention_, options));
}

std::shared_ptr<Bucket> SqliteStore::LoadBucketWithNoPurge(const std::string& name) {
  return OpenBucketWithPolicy(name, RetentionPolicy{});
}

std::shared_ptr<SqliteBucket> SqliteStore::OpenBucketWithPolicy(const std::string& name, const RetentionPolicy& policy) {
  const auto table = DeriveTableName(name);

  CreateEventTable(db_rw_, util::Context::Background().WithTimeout(kCreateTableTimeout), table);
  return std::make_shared<SqliteBucket>(db_rw_, db_ro_, table, policy);
}

} // namespace healthd::eventstore

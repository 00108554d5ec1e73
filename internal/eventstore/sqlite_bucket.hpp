#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/eventstore/retention_purger.hpp"
#include "internal/eventstore/store.hpp"

namespace healthd::eventstore {

/*
  Bucket over one SQLite table:

    timestamp INTEGER NOT NULL   unix seconds, any int64
    name TEXT NOT NULL
    type TEXT NOT NULL
    message TEXT                 NULL when empty
    extra_info TEXT              JSON object or NULL
    suggested_actions TEXT       JSON object or NULL

  Insert/Purge use the read-write handle, Find/Get/Latest the read-only one.
*/
class SqliteBucket final : public Bucket {
 public:
  SqliteBucket(std::shared_ptr<db::sqlite::SqliteDB> db_rw, std::shared_ptr<db::sqlite::SqliteDB> db_ro, std::string table,
               RetentionPolicy policy);
  ~SqliteBucket() override;

  const std::string& Name() const override {
    return table_;
  }

  void                         Insert(const util::Context& ctx, const model::Event& event) override;
  std::optional<model::Event>  Find(const util::Context& ctx, const model::Event& event) override;
  std::optional<model::Events> Get(const util::Context& ctx, std::chrono::sys_seconds since) override;
  std::optional<model::Event>  Latest(const util::Context& ctx) override;
  int                          Purge(const util::Context& ctx, int64_t before_unix_seconds) override;
  void                         Close() override;

  const RetentionPolicy& Policy() const {
    return policy_;
  }

  bool Purging() const;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_rw_;
  std::shared_ptr<db::sqlite::SqliteDB> db_ro_;
  std::string                           table_;
  RetentionPolicy                       policy_;

  mutable std::mutex               close_mutex_;
  std::unique_ptr<RetentionPurger> purger_;
};

// CREATE TABLE + three indexes in one transaction, all IF NOT EXISTS.
void CreateEventTable(const std::shared_ptr<db::sqlite::SqliteDB>& db_rw, const util::Context& ctx, const std::string& table);

} // namespace healthd::eventstore

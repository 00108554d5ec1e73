#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/metrics/metrics_store.hpp"

namespace healthd::metrics {

inline constexpr std::string_view kDefaultMetricsTable = "metrics_v0_5_0";

/*
  MetricsStore over one SQLite table:

    unix_milliseconds INTEGER NOT NULL
    component TEXT NOT NULL
    name TEXT NOT NULL
    label TEXT                   NULL when empty
    value REAL NOT NULL

  Writes go through the read-write handle, reads through the read-only one.
*/
class SqliteMetricsStore final : public MetricsStore {
 public:
  SqliteMetricsStore(std::shared_ptr<db::sqlite::SqliteDB> db_rw, std::shared_ptr<db::sqlite::SqliteDB> db_ro,
                     std::string table = std::string(kDefaultMetricsTable));

  const std::string& Table() const {
    return table_;
  }

  void           Record(const util::Context& ctx, const model::Metrics& metrics) override;
  model::Metrics Read(const util::Context& ctx, const ReadOptions& options = {}) override;
  int            Purge(const util::Context& ctx, util::TimePoint before) override;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_rw_;
  std::shared_ptr<db::sqlite::SqliteDB> db_ro_;
  std::string                           table_;
};

} // namespace healthd::metrics

#include "sqlite_metrics_store.hpp"

#include <chrono>

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/db/sqlite/sqlite_util.hpp"
#include "internal/eventstore/table_name.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace healthd::metrics {

namespace sqlite = db::sqlite;

namespace {

double SecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

SqliteMetricsStore::SqliteMetricsStore(std::shared_ptr<sqlite::SqliteDB> db_rw, std::shared_ptr<sqlite::SqliteDB> db_ro,
                                       std::string table)
    : db_rw_(std::move(db_rw)), db_ro_(std::move(db_ro)), table_(std::move(table)) {
  if (!eventstore::IsSafeTableName(table_)) {
    throw util::InvalidArgument("invalid metrics table name \"" + table_ + "\"");
  }

  sqlite::SqliteTransaction tx(db_rw_);
  tx.Exec("CREATE TABLE IF NOT EXISTS " + table_ +
          " (unix_milliseconds INTEGER NOT NULL, component TEXT NOT NULL, name TEXT NOT NULL, label TEXT, value REAL NOT NULL);");
  tx.Exec("CREATE INDEX IF NOT EXISTS idx_" + table_ + "_unix_milliseconds ON " + table_ + "(unix_milliseconds);");
  tx.Exec("CREATE INDEX IF NOT EXISTS idx_" + table_ + "_component ON " + table_ + "(component);");
  tx.Commit();
}

void SqliteMetricsStore::Record(const util::Context& ctx, const model::Metrics& metrics) {
  const std::string what = "record " + table_;
  ctx.ThrowIfDone(what);
  if (metrics.empty()) return;

  const auto start = std::chrono::steady_clock::now();
  {
    sqlite::SqliteTransaction tx(db_rw_);
    auto st = tx.Prepare("INSERT INTO " + table_ + " (unix_milliseconds, component, name, label, value) VALUES (?, ?, ?, NULLIF(?, ''), ?);", what);

    for (const auto& m : metrics) {
      ctx.ThrowIfDone(what);

      sqlite3_reset(st.get());
      sqlite3_clear_bindings(st.get());
      sqlite::BindInt64(st.get(), 1, m.unix_milliseconds);
      sqlite::BindText(st.get(), 2, m.component);
      sqlite::BindText(st.get(), 3, m.name);
      sqlite::BindText(st.get(), 4, m.label);
      sqlite::BindDouble(st.get(), 5, m.value);
      sqlite::StepDone(tx.Handle(), st.get(), what);
    }
    st.reset();
    tx.Commit();
  }
  observability::Metrics::Instance().ObserveInsertUpdateSeconds(table_, SecondsSince(start));
}

model::Metrics SqliteMetricsStore::Read(const util::Context& ctx, const ReadOptions& options) {
  const std::string what = "read " + table_;
  ctx.ThrowIfDone(what);

  std::string sql = "SELECT unix_milliseconds, component, name, label, value FROM " + table_ + " WHERE unix_milliseconds >= ?";
  if (!options.components.empty()) {
    sql += " AND component IN (";
    for (std::size_t i = 0; i < options.components.size(); ++i) {
      sql += i == 0 ? "?" : ", ?";
    }
    sql += ")";
  }
  sql += " ORDER BY unix_milliseconds ASC;";

  const auto start = std::chrono::steady_clock::now();
  auto       st    = db_ro_->Prepare(sql, what);

  int idx = 1;
  sqlite::BindInt64(st.get(), idx++, util::ToUnixMillis(options.since));
  for (const auto& component : options.components) {
    sqlite::BindText(st.get(), idx++, component);
  }

  model::Metrics out;
  while (sqlite::StepRow(db_ro_->Handle(), st.get(), ctx, what)) {
    model::Metric m;
    m.unix_milliseconds = sqlite::ColInt64(st.get(), 0);
    m.component         = sqlite::ColText(st.get(), 1);
    m.name              = sqlite::ColText(st.get(), 2);
    m.label             = sqlite::ColText(st.get(), 3);
    m.value             = sqlite::ColDouble(st.get(), 4);
    out.push_back(std::move(m));
  }
  observability::Metrics::Instance().ObserveSelectSeconds(table_, SecondsSince(start));
  return out;
}

int SqliteMetricsStore::Purge(const util::Context& ctx, util::TimePoint before) {
  const std::string what = "purge " + table_;
  ctx.ThrowIfDone(what);

  const auto start  = std::chrono::steady_clock::now();
  int        purged = 0;
  {
    auto lock = db_rw_->LockWrites();
    ctx.ThrowIfDone(what);

    auto st = db_rw_->Prepare("DELETE FROM " + table_ + " WHERE unix_milliseconds < ?;", what);
    sqlite::BindInt64(st.get(), 1, util::ToUnixMillis(before));
    sqlite::StepDone(db_rw_->Handle(), st.get(), what);
    purged = sqlite3_changes(db_rw_->Handle());
  }
  observability::Metrics::Instance().ObserveDeleteSeconds(table_, SecondsSince(start));
  return purged;
}

} // namespace healthd::metrics

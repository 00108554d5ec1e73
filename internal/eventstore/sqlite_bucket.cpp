#include "sqlite_bucket.hpp"

#include <chrono>
#include <vector>

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/db/sqlite/sqlite_util.hpp"
#include "internal/eventstore/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/time.hpp"

namespace healthd::eventstore {

namespace sqlite = db::sqlite;

using observability::StringField;

namespace {

constexpr const char* kColumnTimestamp        = "timestamp";
constexpr const char* kColumnName             = "name";
constexpr const char* kColumnType             = "type";
constexpr const char* kColumnMessage          = "message";
constexpr const char* kColumnExtraInfo        = "extra_info";
constexpr const char* kColumnSuggestedActions = "suggested_actions";

std::string SelectColumns() {
  return std::string(kColumnTimestamp) + ", " + kColumnName + ", " + kColumnType + ", " + kColumnMessage + ", " + kColumnExtraInfo +
         ", " + kColumnSuggestedActions;
}

double SecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

model::Event ScanEvent(sqlite3_stmt* st, const std::string& what) {
  model::Event event;
  event.time = util::FromUnixSeconds(sqlite::ColInt64(st, 0));
  event.name = sqlite::ColText(st, 1);
  event.type = model::ParseEventType(sqlite::ColText(st, 2));
  if (auto message = sqlite::ColOptionalText(st, 3)) {
    event.message = std::move(*message);
  }

  try {
    event.extra_info = codec::UnmarshalIfValid<model::ExtraInfo>(sqlite::ColOptionalText(st, 4));
  } catch (const util::CodecError& e) {
    throw util::CodecError(what + ": failed to unmarshal extra info: " + e.what());
  }

  try {
    event.suggested_actions = codec::UnmarshalIfValid<healthd::v1::SuggestedActions>(sqlite::ColOptionalText(st, 5));
  } catch (const util::CodecError& e) {
    throw util::CodecError(what + ": failed to unmarshal suggested actions: " + e.what());
  }

  return event;
}

} // namespace

void CreateEventTable(const std::shared_ptr<sqlite::SqliteDB>& db_rw, const util::Context& ctx, const std::string& table) {
  ctx.ThrowIfDone("create table " + table);

  sqlite::SqliteTransaction tx(db_rw);

  tx.Exec("CREATE TABLE IF NOT EXISTS " + table + " (" + kColumnTimestamp + " INTEGER NOT NULL, " + kColumnName + " TEXT NOT NULL, " +
          kColumnType + " TEXT NOT NULL, " + kColumnMessage + " TEXT, " + kColumnExtraInfo + " TEXT, " + kColumnSuggestedActions +
          " TEXT);");

  for (const char* column : {kColumnTimestamp, kColumnName, kColumnType}) {
    tx.Exec("CREATE INDEX IF NOT EXISTS idx_" + table + "_" + column + " ON " + table + "(" + column + ");");
  }

  tx.Commit();
}

SqliteBucket::SqliteBucket(std::shared_ptr<sqlite::SqliteDB> db_rw, std::shared_ptr<sqlite::SqliteDB> db_ro, std::string table,
                           RetentionPolicy policy)
    : db_rw_(std::move(db_rw)), db_ro_(std::move(db_ro)), table_(std::move(table)), policy_(policy) {
  purger_ = std::make_unique<RetentionPurger>(*this, policy_);
}

SqliteBucket::~SqliteBucket() {
  Close();
}

bool SqliteBucket::Purging() const {
  std::lock_guard lock(close_mutex_);
  return purger_ != nullptr && purger_->Running();
}

void SqliteBucket::Close() {
  std::lock_guard lock(close_mutex_);
  if (!purger_) return;

  if (purger_->Running()) {
    HEALTHD_LOG_INFO("closing the store", {StringField("table", table_)});
  }
  purger_->Stop();
  purger_.reset();
}

void SqliteBucket::Insert(const util::Context& ctx, const model::Event& event) {
  const std::string what = "insert " + table_;
  ctx.ThrowIfDone(what);

  const auto extra_info        = codec::MarshalOptional(event.extra_info);
  const auto suggested_actions = codec::MarshalOptional(event.suggested_actions);

  const auto start = std::chrono::steady_clock::now();
  {
    auto lock = db_rw_->LockWrites();
    ctx.ThrowIfDone(what);

    auto st = db_rw_->Prepare("INSERT INTO " + table_ + " (" + SelectColumns() +
                              ") VALUES (?, ?, ?, NULLIF(?, ''), NULLIF(?, ''), NULLIF(?, ''));",
                              what);
    sqlite::BindInt64(st.get(), 1, event.time.time_since_epoch().count());
    sqlite::BindText(st.get(), 2, event.name);
    sqlite::BindText(st.get(), 3, model::EventTypeName(event.type));
    sqlite::BindText(st.get(), 4, event.message);
    sqlite::BindText(st.get(), 5, extra_info);
    sqlite::BindText(st.get(), 6, suggested_actions);

    sqlite::StepDone(db_rw_->Handle(), st.get(), what);
  }
  observability::Metrics::Instance().ObserveInsertUpdateSeconds(table_, SecondsSince(start));
}

std::optional<model::Event> SqliteBucket::Find(const util::Context& ctx, const model::Event& event) {
  const std::string what = "find " + table_;
  ctx.ThrowIfDone(what);

  std::string sql = "SELECT " + SelectColumns() + " FROM " + table_ + " WHERE " + kColumnTimestamp + " = ? AND " + kColumnName +
                    " = ? AND " + kColumnType + " = ?";
  if (!event.message.empty()) {
    sql += std::string(" AND ") + kColumnMessage + " = ?";
  }
  std::string suggested_actions;
  if (event.suggested_actions) {
    suggested_actions = codec::Marshal(*event.suggested_actions);
    sql += std::string(" AND ") + kColumnSuggestedActions + " = ?";
  }
  sql += ";";

  const auto start = std::chrono::steady_clock::now();
  auto       st    = db_ro_->Prepare(sql, what);

  int idx = 1;
  sqlite::BindInt64(st.get(), idx++, event.time.time_since_epoch().count());
  sqlite::BindText(st.get(), idx++, event.name);
  sqlite::BindText(st.get(), idx++, model::EventTypeName(event.type));
  if (!event.message.empty()) {
    sqlite::BindText(st.get(), idx++, event.message);
  }
  if (event.suggested_actions) {
    sqlite::BindText(st.get(), idx++, suggested_actions);
  }

  std::optional<model::Event> found;
  while (sqlite::StepRow(db_ro_->Handle(), st.get(), ctx, what)) {
    auto candidate = ScanEvent(st.get(), what);
    if (model::SameExtraInfo(candidate.extra_info, event.extra_info)) {
      found = std::move(candidate);
      break;
    }
  }
  observability::Metrics::Instance().ObserveSelectSeconds(table_, SecondsSince(start));
  return found;
}

std::optional<model::Events> SqliteBucket::Get(const util::Context& ctx, std::chrono::sys_seconds since) {
  const std::string what = "get " + table_;
  ctx.ThrowIfDone(what);

  const auto start = std::chrono::steady_clock::now();
  auto       st    = db_ro_->Prepare("SELECT " + SelectColumns() + " FROM " + table_ + " WHERE " + kColumnTimestamp + " > ? ORDER BY " +
                                    kColumnTimestamp + " DESC;",
                                    what);
  sqlite::BindInt64(st.get(), 1, since.time_since_epoch().count());

  model::Events events;
  while (sqlite::StepRow(db_ro_->Handle(), st.get(), ctx, what)) {
    events.push_back(ScanEvent(st.get(), what));
  }
  observability::Metrics::Instance().ObserveSelectSeconds(table_, SecondsSince(start));

  if (events.empty()) {
    return std::nullopt;
  }
  return events;
}

std::optional<model::Event> SqliteBucket::Latest(const util::Context& ctx) {
  const std::string what = "latest " + table_;
  ctx.ThrowIfDone(what);

  const auto start = std::chrono::steady_clock::now();
  auto st = db_ro_->Prepare("SELECT " + SelectColumns() + " FROM " + table_ + " ORDER BY " + kColumnTimestamp + " DESC LIMIT 1;", what);

  std::optional<model::Event> latest;
  if (sqlite::StepRow(db_ro_->Handle(), st.get(), ctx, what)) {
    latest = ScanEvent(st.get(), what);
  }
  observability::Metrics::Instance().ObserveSelectSeconds(table_, SecondsSince(start));
  return latest;
}

int SqliteBucket::Purge(const util::Context& ctx, int64_t before_unix_seconds) {
  const std::string what = "purge " + table_;
  ctx.ThrowIfDone(what);

  const auto start = std::chrono::steady_clock::now();
  int        purged = 0;
  {
    auto lock = db_rw_->LockWrites();
    ctx.ThrowIfDone(what);

    auto st = db_rw_->Prepare("DELETE FROM " + table_ + " WHERE " + kColumnTimestamp + " < ?;", what);
    sqlite::BindInt64(st.get(), 1, before_unix_seconds);
    sqlite::StepDone(db_rw_->Handle(), st.get(), what);
    purged = sqlite3_changes(db_rw_->Handle());
  }
  observability::Metrics::Instance().ObserveDeleteSeconds(table_, SecondsSince(start));
  return purged;
}

} // namespace healthd::eventstore

#include "compactor.hpp"

#include <filesystem>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace healthd::state {

using observability::DurationField;
using observability::IntField;
using observability::StringField;

namespace {

std::uintmax_t FileSize(const std::string& path) {
  std::error_code ec;
  auto            size = std::filesystem::file_size(path, ec);
  return ec ? 0 : size;
}

// Main file plus write-ahead log.
std::uintmax_t DatabaseSize(const std::string& path) {
  return FileSize(path) + FileSize(path + "-wal");
}

} // namespace

CompactResult Compact(db::sqlite::SqliteDB& db_rw, const util::Context& ctx) {
  ctx.ThrowIfDone("compact " + db_rw.Path());

  CompactResult result;
  result.size_before_bytes = DatabaseSize(db_rw.Path());
  {
    auto lock = db_rw.LockWrites();
    ctx.ThrowIfDone("compact " + db_rw.Path());
    db_rw.Exec("VACUUM;");
    // VACUUM output lands in the WAL; fold it back into the main file
    db_rw.Exec("PRAGMA wal_checkpoint(TRUNCATE);");
  }
  result.size_after_bytes = DatabaseSize(db_rw.Path());
  return result;
}

Compactor::Compactor(std::shared_ptr<db::sqlite::SqliteDB> db_rw, std::chrono::nanoseconds period)
    : db_rw_(std::move(db_rw)), period_(period), ctx_(util::Context::WithCancel()) {
}

Compactor::~Compactor() {
  Stop();
}

void Compactor::Start() {
  if (!Enabled() || task_) {
    return;
  }

  HEALTHD_LOG_INFO("start compacting", {StringField("db", db_rw_->Path()), DurationField("period", period_)});
  task_ = std::make_unique<runtime::PeriodicTask>("compact:" + db_rw_->Path(), period_, [this] {
    try {
      auto result = Compact(*db_rw_, ctx_);
      HEALTHD_LOG_INFO("compacted state database", {StringField("db", db_rw_->Path()),
                                                    IntField("size_before_bytes", static_cast<std::int64_t>(result.size_before_bytes)),
                                                    IntField("size_after_bytes", static_cast<std::int64_t>(result.size_after_bytes))});
    } catch (const std::exception& e) {
      HEALTHD_LOG_ERROR("failed to compact state database", {StringField("db", db_rw_->Path()), StringField("error", e.what())});
    }
  });
  task_->Start();
}

void Compactor::Stop() {
  ctx_.Cancel();
  if (task_) {
    task_->Stop();
    task_->Wait();
  }
}

} // namespace healthd::state

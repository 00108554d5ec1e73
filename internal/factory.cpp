#include "factory.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace healthd::factory {

using observability::DurationField;
using observability::StringField;

RuntimeDependencies BuildRuntime(const healthd::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Database handles
  // ------------------------------------------------------------------
  const auto& path = config.state().path();
  deps.db_rw       = std::make_shared<db::sqlite::SqliteDB>(path, db::sqlite::OpenMode::kReadWrite);
  deps.db_ro       = std::make_shared<db::sqlite::SqliteDB>(path, db::sqlite::OpenMode::kReadOnly);

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  eventstore::RetentionConfig retention;
  retention.retention = util::FromProto(config.events().retention_period());

  deps.event_store   = std::make_shared<eventstore::SqliteStore>(deps.db_rw, deps.db_ro, retention);
  deps.metrics_store = std::make_shared<metrics::SqliteMetricsStore>(deps.db_rw, deps.db_ro);

  // ------------------------------------------------------------------
  // Compaction
  // ------------------------------------------------------------------
  deps.compactor = std::make_shared<state::Compactor>(deps.db_rw, util::FromProto(config.state().compact_period()));
  deps.compactor->Start();

  HEALTHD_LOG_INFO("state store ready", {StringField("path", path), DurationField("retention", retention.retention)});
  return deps;
}

std::unique_ptr<metrics::Syncer> BuildSyncer(const healthd::runtime::config::RuntimeConfig& config,
                                             std::shared_ptr<metrics::Scraper>              scraper,
                                             std::shared_ptr<metrics::MetricsStore>         store) {
  metrics::SyncerOptions options;
  options.scrape_interval = util::FromProto(config.metrics().scrape_interval());
  options.purge_interval  = util::FromProto(config.metrics().purge_interval());
  options.retain_duration = util::FromProto(config.metrics().retain_duration());
  return std::make_unique<metrics::Syncer>(std::move(scraper), std::move(store), options);
}

} // namespace healthd::factory

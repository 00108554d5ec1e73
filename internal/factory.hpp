#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/eventstore/sqlite_store.hpp"
#include "internal/metrics/scraper.hpp"
#include "internal/metrics/sqlite_metrics_store.hpp"
#include "internal/metrics/syncer.hpp"
#include "internal/state/compactor.hpp"

namespace healthd::factory {

/*
  RuntimeDependencies

  Owns all long-lived storage objects used by the agent.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::sqlite::SqliteDB> db_rw;
  std::shared_ptr<db::sqlite::SqliteDB> db_ro;

  std::shared_ptr<eventstore::SqliteStore>       event_store;
  std::shared_ptr<metrics::SqliteMetricsStore>   metrics_store;
  std::shared_ptr<state::Compactor>              compactor;
};

/*
  BuildRuntime

  Opens the state database (read-write first, then read-only on the same
  file), creates the event store and metrics store, and starts compaction
  when state.compact_period is set.

  NOTE:
  This is the composition root. It is the ONLY place allowed to know
  concrete storage types.
*/
RuntimeDependencies BuildRuntime(const healthd::runtime::config::RuntimeConfig& config);

// Syncer wired with the configured intervals. Not started.
std::unique_ptr<metrics::Syncer> BuildSyncer(const healthd::runtime::config::RuntimeConfig& config,
                                             std::shared_ptr<metrics::Scraper>              scraper,
                                             std::shared_ptr<metrics::MetricsStore>         store);

} // namespace healthd::factory

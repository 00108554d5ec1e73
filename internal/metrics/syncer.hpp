#pragma once

#include <chrono>
#include <memory>
#include <mutex>

#include "internal/metrics/metrics_store.hpp"
#include "internal/metrics/scraper.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/util/context.hpp"

namespace healthd::metrics {

struct SyncerOptions {
  std::chrono::nanoseconds scrape_interval{std::chrono::minutes(1)};
  std::chrono::nanoseconds purge_interval{std::chrono::minutes(5)};
  std::chrono::nanoseconds retain_duration{std::chrono::hours(72)};
};

/*
  Drives a Scraper into a MetricsStore on two independent schedules:

    every scrape_interval:  Sync()
    every purge_interval:   store.Purge(now - retain_duration)

  Failures in either loop are logged and never stop it.
*/
class Syncer {
 public:
  Syncer(std::shared_ptr<Scraper> scraper, std::shared_ptr<MetricsStore> store, SyncerOptions options);
  ~Syncer();

  Syncer(const Syncer&)            = delete;
  Syncer& operator=(const Syncer&) = delete;

  /*
    Scrapes once and records the batch in one call. Scrape and store errors
    propagate unchanged; a failed scrape leaves the store untouched.
  */
  void Sync();

  void Start();

  // Cancels in-flight calls, stops both loops and waits for them. Idempotent.
  void Stop();

  const SyncerOptions& Options() const {
    return options_;
  }

 private:
  void PurgeOnce();

  std::shared_ptr<Scraper>      scraper_;
  std::shared_ptr<MetricsStore> store_;
  SyncerOptions                 options_;
  util::Context                 ctx_;

  std::mutex                             lifecycle_mutex_;
  std::unique_ptr<runtime::PeriodicTask> scrape_task_;
  std::unique_ptr<runtime::PeriodicTask> purge_task_;
};

} // namespace healthd::metrics

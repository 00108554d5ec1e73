#include "syncer.hpp"

#include <chrono>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace healthd::metrics {

using observability::DurationField;
using observability::IntField;
using observability::StringField;

Syncer::Syncer(std::shared_ptr<Scraper> scraper, std::shared_ptr<MetricsStore> store, SyncerOptions options)
    : scraper_(std::move(scraper)), store_(std::move(store)), options_(options), ctx_(util::Context::WithCancel()) {
  if (!scraper_ || !store_) {
    throw util::InvalidArgument("syncer requires a scraper and a metrics store");
  }
}

Syncer::~Syncer() {
  Stop();
}

void Syncer::Sync() {
  auto metrics = scraper_->Scrape(ctx_);
  store_->Record(ctx_, metrics);
}

void Syncer::Start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (scrape_task_) {
    throw util::InvalidState("syncer already started");
  }

  HEALTHD_LOG_INFO("starting metrics syncer", {DurationField("scrape_interval", options_.scrape_interval),
                                               DurationField("purge_interval", options_.purge_interval),
                                               DurationField("retain_duration", options_.retain_duration)});

  scrape_task_ = std::make_unique<runtime::PeriodicTask>("metrics-scrape", options_.scrape_interval, [this] {
    try {
      Sync();
    } catch (const std::exception& e) {
      HEALTHD_LOG_ERROR("failed to sync metrics", {StringField("error", e.what())});
    }
  });
  purge_task_ = std::make_unique<runtime::PeriodicTask>("metrics-purge", options_.purge_interval, [this] { PurgeOnce(); });

  scrape_task_->Start();
  purge_task_->Start();
}

void Syncer::Stop() {
  std::lock_guard lock(lifecycle_mutex_);
  ctx_.Cancel();
  for (auto* task : {scrape_task_.get(), purge_task_.get()}) {
    if (task) task->Stop();
  }
  for (auto* task : {scrape_task_.get(), purge_task_.get()}) {
    if (task) task->Wait();
  }
}

void Syncer::PurgeOnce() {
  const auto before = std::chrono::time_point_cast<util::Clock::duration>(util::Now() - options_.retain_duration);
  try {
    const int purged = store_->Purge(ctx_, before);
    HEALTHD_LOG_DEBUG("purged metrics", {IntField("purged", purged)});
  } catch (const std::exception& e) {
    HEALTHD_LOG_ERROR("failed to purge metrics", {StringField("error", e.what())});
  }
}

} // namespace healthd::metrics

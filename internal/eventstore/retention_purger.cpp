#include "retention_purger.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace healthd::eventstore {

using observability::DurationField;
using observability::IntField;
using observability::StringField;

RetentionPolicy ResolveRetentionPolicy(const RetentionConfig& config, const BucketOptions& options) {
  if (options.disable_purge) {
    return {};
  }

  RetentionPolicy policy;
  policy.retention      = config.retention;
  policy.purge_interval = std::max<std::chrono::nanoseconds>(config.retention / 5, std::chrono::seconds(1));
  return policy;
}

bool RetentionPurger::Enabled(const RetentionPolicy& policy) {
  return policy.retention > std::chrono::seconds(1) && policy.purge_interval > std::chrono::nanoseconds::zero();
}

RetentionPurger::RetentionPurger(Bucket& bucket, RetentionPolicy policy)
    : bucket_(bucket), policy_(policy), ctx_(util::Context::WithCancel()) {
  if (!Enabled(policy_)) {
    return;
  }

  HEALTHD_LOG_INFO("start purging", {StringField("table", bucket_.Name()), DurationField("retention", policy_.retention),
                                     DurationField("check_interval", policy_.purge_interval)});

  task_ = std::make_unique<runtime::PeriodicTask>("purge:" + bucket_.Name(), policy_.purge_interval, [this] { PurgeOnce(); });
  task_->Start();
}

RetentionPurger::~RetentionPurger() {
  Stop();
}

void RetentionPurger::Stop() {
  ctx_.Cancel();
  if (task_) {
    task_->Stop();
    task_->Wait();
  }
}

void RetentionPurger::PurgeOnce() {
  const auto cutoff = util::ToUnixSeconds(std::chrono::time_point_cast<util::Clock::duration>(util::Now() - policy_.retention));
  try {
    const int purged = bucket_.Purge(ctx_, cutoff);
    HEALTHD_LOG_INFO("purged data", {StringField("table", bucket_.Name()), DurationField("retention", policy_.retention),
                                     IntField("purged", purged)});
  } catch (const std::exception& e) {
    HEALTHD_LOG_ERROR("failed to purge data", {StringField("table", bucket_.Name()), DurationField("retention", policy_.retention),
                                               StringField("error", e.what())});
  }
}

} // namespace healthd::eventstore

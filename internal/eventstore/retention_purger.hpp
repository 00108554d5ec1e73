#pragma once

#include <memory>

#include "internal/eventstore/store.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/util/context.hpp"

namespace healthd::eventstore {

/*
  Background retention loop for one bucket.

  idle-waiting --(purge_interval)--> purging --> idle-waiting ...

  Each tick deletes everything older than now - retention. A failed purge is
  logged and retried on the next tick. Retention of one second or less
  disables the loop entirely.
*/
class RetentionPurger {
 public:
  RetentionPurger(Bucket& bucket, RetentionPolicy policy);
  ~RetentionPurger();

  RetentionPurger(const RetentionPurger&)            = delete;
  RetentionPurger& operator=(const RetentionPurger&) = delete;

  static bool Enabled(const RetentionPolicy& policy);

  bool Running() const {
    return task_ != nullptr;
  }

  const RetentionPolicy& Policy() const {
    return policy_;
  }

  // Cancels an in-flight purge, stops the loop and waits for it. Idempotent.
  void Stop();

 private:
  void PurgeOnce();

  Bucket&                                bucket_;
  RetentionPolicy                        policy_;
  util::Context                          ctx_;
  std::unique_ptr<runtime::PeriodicTask> task_;
};

} // namespace healthd::eventstore

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/event.hpp"
#include "internal/util/context.hpp"

namespace healthd::eventstore {

/*
  One retention-scoped collection of events, backed by one table.

  Every operation takes a request context; a canceled or expired context
  fails the call with util::ContextError before anything is written.
  Engine failures surface as db::Error, payload decode failures as
  util::CodecError.
*/
class Bucket {
 public:
  virtual ~Bucket() = default;

  // Physical table name.
  virtual const std::string& Name() const = 0;

  // Appends one row. Never deduplicates; call Find() first for at-most-once.
  virtual void Insert(const util::Context& ctx, const model::Event& event) = 0;

  /*
    Matches time, name and type exactly, plus message when the query has
    one and serialized suggested actions when the query has them. Extra
    info is compared after the query (see model::SameExtraInfo). The first
    match in scan order wins; nullopt when nothing matches.
  */
  virtual std::optional<model::Event> Find(const util::Context& ctx, const model::Event& event) = 0;

  // Events with time > since, newest first. nullopt when nothing qualifies.
  virtual std::optional<model::Events> Get(const util::Context& ctx, std::chrono::sys_seconds since) = 0;

  // Newest event, or nullopt when the bucket is empty.
  virtual std::optional<model::Event> Latest(const util::Context& ctx) = 0;

  // Deletes events with time < before_unix_seconds, returns the count.
  virtual int Purge(const util::Context& ctx, int64_t before_unix_seconds) = 0;

  // Stops the background purge loop. Data stays. Idempotent.
  virtual void Close() = 0;
};

struct BucketOptions {
  // Suppresses the retention loop only; the table is created the same way.
  bool disable_purge = false;
};

// Immutable store-wide default, copied into each bucket at creation.
struct RetentionConfig {
  std::chrono::nanoseconds retention{0};
};

// Resolved per bucket; zero retention means no purge loop.
struct RetentionPolicy {
  std::chrono::nanoseconds retention{0};
  std::chrono::nanoseconds purge_interval{0};
};

/*
  retention / 5, floored at one second, so expired rows are caught soon
  after a restart without polling too often.
*/
RetentionPolicy ResolveRetentionPolicy(const RetentionConfig& config, const BucketOptions& options);

class Store {
 public:
  virtual ~Store() = default;

  /*
    Derives the table name, creates the table and its indexes if missing,
    and returns a live bucket. Safe to call repeatedly and concurrently for
    the same name. Throws util::InvalidArgument for names that cannot be
    turned into a safe table name.
  */
  virtual std::shared_ptr<Bucket> OpenBucket(const std::string& name, const BucketOptions& options = {}) = 0;

  // Same as OpenBucket() with the purge loop disabled.
  virtual std::shared_ptr<Bucket> LoadBucketWithNoPurge(const std::string& name) = 0;
};

} // namespace healthd::eventstore

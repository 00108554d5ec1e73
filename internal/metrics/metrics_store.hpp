#pragma once

#include <string>
#include <vector>

#include "internal/model/metric.hpp"
#include "internal/util/context.hpp"
#include "internal/util/time.hpp"

namespace healthd::metrics {

struct ReadOptions {
  // Samples collected at or after this point.
  util::TimePoint since{};

  // Empty = all components.
  std::vector<std::string> components;
};

/*
  Append-only sample store. Implementations must tolerate Record, Read and
  Purge running concurrently from different threads.
*/
class MetricsStore {
 public:
  virtual ~MetricsStore() = default;

  virtual void           Record(const util::Context& ctx, const model::Metrics& metrics) = 0;
  virtual model::Metrics Read(const util::Context& ctx, const ReadOptions& options = {}) = 0;

  // Deletes samples collected before `before`; returns the count.
  virtual int Purge(const util::Context& ctx, util::TimePoint before) = 0;
};

} // namespace healthd::metrics

#pragma once

#include "internal/model/metric.hpp"
#include "internal/util/context.hpp"

namespace healthd::metrics {

// Produces a fresh batch of samples on demand. Throws on failure.
class Scraper {
 public:
  virtual ~Scraper() = default;

  virtual model::Metrics Scrape(const util::Context& ctx) = 0;
};

} // namespace healthd::metrics

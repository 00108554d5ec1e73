#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace healthd::model {

/*
  One scraped metric sample. Pure append, no dedup.
*/
struct Metric {
  int64_t     unix_milliseconds = 0;
  std::string component;
  std::string name;
  std::string label;  // optional, empty = none
  double      value = 0.0;
};

using Metrics = std::vector<Metric>;

} // namespace healthd::model

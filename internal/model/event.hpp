#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "healthd/v1.hpp"

namespace healthd::model {

enum class EventType {
  kUnknown,
  kInfo,
  kWarning,
  kCritical,
  kFatal,
};

// Text form stored in the type column ("Unknown", "Info", ...).
std::string_view EventTypeName(EventType type);

// Unrecognised text maps to kUnknown.
EventType ParseEventType(std::string_view name);

using ExtraInfo = std::map<std::string, std::string>;

/*
  One health event row.

  extra_info and suggested_actions are optional: absent, present-but-empty
  and populated values all round-trip distinctly through the store.
*/
struct Event {
  std::chrono::sys_seconds time{};
  std::string              name;
  EventType                type = EventType::kUnknown;
  std::string              message;

  std::optional<ExtraInfo>                    extra_info;
  std::optional<healthd::v1::SuggestedActions> suggested_actions;
};

using Events = std::vector<Event>;

/*
  Dedup equality on extra info: same key count and every key of a present in
  b with the same value. Absent compares as zero keys.
*/
bool SameExtraInfo(const std::optional<ExtraInfo>& a, const std::optional<ExtraInfo>& b);

} // namespace healthd::model

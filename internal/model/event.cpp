#include "internal/model/event.hpp"

#include <array>
#include <utility>

namespace healthd::model {

namespace {

constexpr std::array<std::pair<EventType, std::string_view>, 5> kEventTypeNames = {{
    {EventType::kUnknown, "Unknown"},
    {EventType::kInfo, "Info"},
    {EventType::kWarning, "Warning"},
    {EventType::kCritical, "Critical"},
    {EventType::kFatal, "Fatal"},
}};

} // namespace

std::string_view EventTypeName(EventType type) {
  for (const auto& [value, name] : kEventTypeNames) {
    if (value == type) return name;
  }
  return "Unknown";
}

EventType ParseEventType(std::string_view name) {
  for (const auto& [value, text] : kEventTypeNames) {
    if (text == name) return value;
  }
  return EventType::kUnknown;
}

bool SameExtraInfo(const std::optional<ExtraInfo>& a, const std::optional<ExtraInfo>& b) {
  const std::size_t a_size = a ? a->size() : 0;
  const std::size_t b_size = b ? b->size() : 0;
  if (a_size != b_size) return false;
  if (a_size == 0) return true;

  for (const auto& [key, value] : *a) {
    auto it = b->find(key);
    if (it == b->end() || it->second != value) return false;
  }
  return true;
}

} // namespace healthd::model

#pragma once

#include <string>
#include <string_view>

namespace healthd::eventstore {

// Bumped whenever the bucket table layout changes; old tables are orphaned.
inline constexpr std::string_view kSchemaVersion = "v0_4_0";

/*
  "Test Component-Name" -> "components_test_component_name_events_v0_4_0"

  Spaces and hyphens become underscores, one pass collapses "__" to "_",
  then the result is lowercased.
*/
std::string DefaultTableName(std::string_view logical_name);

// True when every character is an ASCII letter, digit or underscore.
bool IsSafeTableName(std::string_view table_name);

// DefaultTableName() plus validation. Throws util::InvalidArgument.
std::string DeriveTableName(std::string_view logical_name);

} // namespace healthd::eventstore

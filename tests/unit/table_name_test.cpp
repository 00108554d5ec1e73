#include "internal/eventstore/table_name.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using healthd::eventstore::DefaultTableName;
using healthd::eventstore::DeriveTableName;
using healthd::eventstore::IsSafeTableName;

void TestDerivationRules() {
  assert(DefaultTableName("test") == "components_test_events_v0_4_0");
  assert(DefaultTableName("Test Component") == "components_test_component_events_v0_4_0");
  assert(DefaultTableName("test-component") == "components_test_component_events_v0_4_0");
  assert(DefaultTableName("test  component--name") == "components_test_component_name_events_v0_4_0");
  assert(DefaultTableName("accelerator-nvidia-error-xid") == "components_accelerator_nvidia_error_xid_events_v0_4_0");
}

void TestDoubleUnderscoreCollapsesOnce() {
  // four underscores collapse to two in a single non-overlapping pass
  assert(DefaultTableName("a____b") == "components_a__b_events_v0_4_0");
  assert(DefaultTableName("a   b") == "components_a__b_events_v0_4_0");
}

void TestEmptyNameIsAccepted() {
  assert(DefaultTableName("") == "components__events_v0_4_0");
  assert(DeriveTableName("") == "components__events_v0_4_0");
}

void TestUnsafeNamesAreRejected() {
  const std::vector<std::string> names = {"invalid;table;name", "drop table x", "quote\"d", "semi;colon", "dot.name", "snow\xe2\x98\x83"};
  for (const auto& name : names) {
    bool threw = false;
    try {
      (void)DeriveTableName(name);
    } catch (const healthd::util::InvalidArgument&) {
      threw = true;
    }
    if (name == "drop table x") {
      // spaces are rewritten, so this one is safe
      assert(!threw);
    } else {
      assert(threw);
    }
  }
}

void TestIsSafeTableName() {
  assert(IsSafeTableName("components_abc_events_v0_4_0"));
  assert(IsSafeTableName("metrics_v0_5_0"));
  assert(!IsSafeTableName(""));
  assert(!IsSafeTableName("a b"));
  assert(!IsSafeTableName("a-b"));
  assert(!IsSafeTableName("a;b"));
}

} // namespace

int main() {
  TestDerivationRules();
  TestDoubleUnderscoreCollapsesOnce();
  TestEmptyNameIsAccepted();
  TestUnsafeNamesAreRejected();
  TestIsSafeTableName();

  std::cout << "healthd_unit_table_name: pass" << std::endl;
  return 0;
}

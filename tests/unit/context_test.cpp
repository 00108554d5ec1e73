#include "internal/util/context.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using healthd::util::Context;
using healthd::util::ContextError;

void TestBackgroundIsNeverDone() {
  auto ctx = Context::Background();
  assert(!ctx.Done());
  assert(!ctx.Deadline().has_value());
  ctx.ThrowIfDone("noop");
}

void TestCancelIsSharedBetweenCopies() {
  auto ctx  = Context::WithCancel();
  auto copy = ctx;

  copy.Cancel();
  assert(ctx.Canceled());
  assert(ctx.Done());

  bool threw = false;
  try {
    ctx.ThrowIfDone("insert t");
  } catch (const ContextError& e) {
    threw = true;
    assert(e.reason() == ContextError::Reason::kCanceled);
    assert(std::string(e.what()) == "insert t: context canceled");
  }
  assert(threw);
}

void TestParentCancelReachesChildren() {
  auto parent = Context::WithCancel();
  auto child  = parent.WithTimeout(std::chrono::hours(1));
  assert(!child.Done());

  parent.Cancel();
  assert(child.Canceled());

  // canceling a child never reaches the parent
  auto other       = Context::WithCancel();
  auto other_child = other.WithTimeout(std::chrono::hours(1));
  other_child.Cancel();
  assert(!other.Done());
}

void TestDeadline() {
  auto ctx = Context::Background().WithTimeout(std::chrono::milliseconds(20));
  assert(ctx.Deadline().has_value());
  assert(!ctx.Done());

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(ctx.DeadlineExceeded());
  assert(!ctx.Canceled());

  bool threw = false;
  try {
    ctx.ThrowIfDone("get t");
  } catch (const ContextError& e) {
    threw = true;
    assert(e.reason() == ContextError::Reason::kDeadlineExceeded);
  }
  assert(threw);
}

void TestChildDeadlineNeverExtendsParent() {
  auto parent = Context::Background().WithTimeout(std::chrono::seconds(1));
  auto child  = parent.WithTimeout(std::chrono::hours(1));
  assert(*child.Deadline() == *parent.Deadline());
}

} // namespace

int main() {
  TestBackgroundIsNeverDone();
  TestCancelIsSharedBetweenCopies();
  TestParentCancelReachesChildren();
  TestDeadline();
  TestChildDeadlineNeverExtendsParent();

  std::cout << "healthd_unit_context: pass" << std::endl;
  return 0;
}

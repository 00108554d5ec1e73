#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace healthd::util {

/*
  Request scope for store operations: cancellation plus optional deadline.

  Copies share state, so canceling any copy cancels all of them. Children
  created with WithTimeout() are done when their parent is done.
*/
class Context {
 public:
  using Clock     = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  // Never canceled, no deadline.
  static Context Background();

  // Cancelable root.
  static Context WithCancel();

  Context WithTimeout(std::chrono::nanoseconds timeout) const;
  Context WithDeadline(TimePoint deadline) const;

  void Cancel() const;

  bool Done() const;
  bool Canceled() const;
  bool DeadlineExceeded() const;

  std::optional<TimePoint> Deadline() const;

  // Throws ContextError("<op>: context canceled" / "... deadline exceeded").
  void ThrowIfDone(std::string_view op) const;

 private:
  struct State {
    std::atomic<bool>        canceled{false};
    std::optional<TimePoint> deadline;
    std::shared_ptr<State>   parent;
  };

  explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {
  }

  std::shared_ptr<State> state_;
};

} // namespace healthd::util

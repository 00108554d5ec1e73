#include "context.hpp"

#include <string>

#include "errors.hpp"

namespace healthd::util {

Context Context::Background() {
  return Context(std::make_shared<State>());
}

Context Context::WithCancel() {
  return Context(std::make_shared<State>());
}

Context Context::WithTimeout(std::chrono::nanoseconds timeout) const {
  return WithDeadline(Clock::now() + timeout);
}

Context Context::WithDeadline(TimePoint deadline) const {
  auto child    = std::make_shared<State>();
  child->parent = state_;

  auto inherited = Deadline();
  child->deadline = inherited && *inherited < deadline ? *inherited : deadline;
  return Context(std::move(child));
}

void Context::Cancel() const {
  state_->canceled.store(true);
}

bool Context::Canceled() const {
  for (auto* s = state_.get(); s != nullptr; s = s->parent.get()) {
    if (s->canceled.load()) return true;
  }
  return false;
}

bool Context::DeadlineExceeded() const {
  auto deadline = Deadline();
  return deadline && Clock::now() >= *deadline;
}

bool Context::Done() const {
  return Canceled() || DeadlineExceeded();
}

std::optional<Context::TimePoint> Context::Deadline() const {
  std::optional<TimePoint> result;
  for (auto* s = state_.get(); s != nullptr; s = s->parent.get()) {
    if (s->deadline && (!result || *s->deadline < *result)) result = s->deadline;
  }
  return result;
}

void Context::ThrowIfDone(std::string_view op) const {
  if (Canceled()) {
    throw ContextError(ContextError::Reason::kCanceled, std::string(op) + ": context canceled");
  }
  if (DeadlineExceeded()) {
    throw ContextError(ContextError::Reason::kDeadlineExceeded, std::string(op) + ": context deadline exceeded");
  }
}

} // namespace healthd::util

#include "periodic_task.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace healthd::runtime {

using observability::StringField;

PeriodicTask::PeriodicTask(std::string name, std::chrono::nanoseconds interval, Body body)
    : name_(std::move(name)), interval_(interval), body_(std::move(body)) {
  if (interval_ <= std::chrono::nanoseconds::zero()) {
    throw util::InvalidArgument("periodic task " + name_ + ": interval must be positive");
  }
}

PeriodicTask::~PeriodicTask() {
  Stop();
  Wait();
}

void PeriodicTask::Start() {
  std::lock_guard join_lock(join_mutex_);
  {
    std::lock_guard lock(mutex_);
    if (started_) {
      throw util::InvalidState("periodic task " + name_ + " already started");
    }
    started_ = true;
  }
  thread_ = std::thread(&PeriodicTask::Run, this);
}

void PeriodicTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
}

void PeriodicTask::Wait() {
  std::lock_guard join_lock(join_mutex_);
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool PeriodicTask::StopRequested() const {
  std::lock_guard lock(mutex_);
  return stop_requested_;
}

void PeriodicTask::Run() {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [&] { return stop_requested_; })) {
        return;
      }
    }

    try {
      body_();
    } catch (const std::exception& e) {
      HEALTHD_LOG_ERROR("periodic task iteration failed", {StringField("task", name_), StringField("error", e.what())});
    }
  }
}

} // namespace healthd::runtime

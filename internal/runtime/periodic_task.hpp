#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace healthd::runtime {

/*
  Owned background loop: wait one interval, run the body, repeat.

  - Stop() is idempotent and wakes the loop immediately
  - Wait() joins the thread; safe to call more than once
  - An exception thrown by the body is logged and the next tick runs anyway
*/
class PeriodicTask {
 public:
  using Body = std::function<void()>;

  PeriodicTask(std::string name, std::chrono::nanoseconds interval, Body body);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();
  void Wait();

  bool StopRequested() const;

  const std::string& Name() const {
    return name_;
  }

  std::chrono::nanoseconds Interval() const {
    return interval_;
  }

 private:
  void Run();

  std::string              name_;
  std::chrono::nanoseconds interval_;
  Body                     body_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    stop_requested_ = false;
  bool                    started_        = false;

  std::mutex  join_mutex_;
  std::thread thread_;
};

} // namespace healthd::runtime

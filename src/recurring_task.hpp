#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// Runs `fn` on a dedicated thread every `interval` until stopped. A run is
// never started while the previous one is still executing; stop() waits for
// the current run to return.
class RecurringTask {
public:
  RecurringTask() = default;
  ~RecurringTask();

  RecurringTask(const RecurringTask&) = delete;
  RecurringTask& operator=(const RecurringTask&) = delete;

  void start(std::chrono::milliseconds interval, std::function<void()> fn, bool run_immediately = false);
  void stop();
  // Wakes the thread so the next run starts without waiting out the interval.
  void trigger();
  bool running() const;

private:
  void loop(bool run_immediately);

  mutable std::mutex m_;
  std::condition_variable cv_;
  std::thread thread_;
  std::function<void()> fn_;
  std::chrono::milliseconds interval_{0};
  bool stop_ = false;
  bool triggered_ = false;
};

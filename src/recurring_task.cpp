#include "recurring_task.hpp"

RecurringTask::~RecurringTask() {
  stop();
}

void RecurringTask::start(std::chrono::milliseconds interval, std::function<void()> fn, bool run_immediately) {
  stop();
  std::lock_guard lg(m_);
  interval_ = interval.count() > 0 ? interval : std::chrono::milliseconds(1);
  fn_ = std::move(fn);
  stop_ = false;
  triggered_ = false;
  thread_ = std::thread([this, run_immediately](){ loop(run_immediately); });
}

void RecurringTask::stop() {
  {
    std::lock_guard lg(m_);
    stop_ = true;
  }
  cv_.notify_all();
  if(thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

void RecurringTask::trigger() {
  {
    std::lock_guard lg(m_);
    triggered_ = true;
  }
  cv_.notify_all();
}

bool RecurringTask::running() const {
  std::lock_guard lg(m_);
  return thread_.joinable() && !stop_;
}

void RecurringTask::loop(bool run_immediately) {
  std::unique_lock lk(m_);
  bool run_now = run_immediately;
  while(true) {
    if(!run_now) {
      cv_.wait_for(lk, interval_, [this]{ return stop_ || triggered_; });
    }
    if(stop_) return;
    triggered_ = false;
    run_now = false;

    auto fn = fn_;
    lk.unlock();
    fn();
    lk.lock();
  }
}

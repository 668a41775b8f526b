#include "wake/tick_scheduler.hpp"

#include "debug_log.hpp"
#include "wake/errors.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

namespace wake {

TickScheduler::TickScheduler(std::chrono::milliseconds interval, TickFn on_tick)
    : interval_(interval),
      coalesce_window_(std::min(interval, std::chrono::milliseconds(60000))),
      on_tick_(std::move(on_tick)) {
  if (interval_.count() <= 0) {
    throw ValidationError("TickScheduler interval must be positive");
  }
  if (!on_tick_) {
    throw ValidationError("TickScheduler requires a tick callback");
  }
}

TickScheduler::~TickScheduler() {
  stop();
}

void TickScheduler::start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread([this]() { run_loop(); });
  debug_log("scheduler", "started");
}

void TickScheduler::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  wakeup_.notify_all();
  if (thread_.joinable()) {
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
    } else {
      thread_.join();
    }
  }
  debug_log("scheduler", "stopped");
}

void TickScheduler::schedule(const std::string& alarm_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    due_[alarm_id] = SteadyClock::now() + interval_;
  }
  wakeup_.notify_all();
}

void TickScheduler::cancel(const std::string& alarm_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    due_.erase(alarm_id);
  }
  wakeup_.notify_all();
}

bool TickScheduler::scheduled(const std::string& alarm_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return due_.count(alarm_id) > 0;
}

std::size_t TickScheduler::scheduled_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return due_.size();
}

void TickScheduler::run_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_requested_) {
    if (due_.empty()) {
      wakeup_.wait(lock, [this]() { return stop_requested_ || !due_.empty(); });
      continue;
    }

    auto earliest = due_.begin()->second;
    for (const auto& entry : due_) {
      earliest = std::min(earliest, entry.second);
    }
    const auto now = SteadyClock::now();
    if (now < earliest) {
      wakeup_.wait_until(lock, earliest);
      continue;
    }

    // Everything due within the coalescing window fires in this pass.
    std::vector<std::string> batch;
    for (auto& entry : due_) {
      if (entry.second <= now + coalesce_window_) {
        batch.push_back(entry.first);
        entry.second = now + interval_;
      }
    }

    lock.unlock();
    debug_log("scheduler", "tick batch of " + std::to_string(batch.size()));
    for (const auto& alarm_id : batch) {
      if (!scheduled(alarm_id)) {
        continue;
      }
      try {
        on_tick_(alarm_id);
      } catch (const std::exception& ex) {
        debug_log("scheduler", "tick for " + alarm_id + " threw: " + ex.what());
      }
    }
    lock.lock();
  }
}

} // namespace wake

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace wake {

// Shared periodic driver for all alarms with real-time adaptation. One
// worker thread wakes at the earliest due time, collects every alarm due
// within the same minute and invokes the tick callback for each.
class TickScheduler {
public:
  using TickFn = std::function<void(const std::string& alarm_id)>;

  TickScheduler(std::chrono::milliseconds interval, TickFn on_tick);
  ~TickScheduler();

  TickScheduler(const TickScheduler&) = delete;
  TickScheduler& operator=(const TickScheduler&) = delete;

  void start();
  void stop();
  bool running() const { return running_; }

  // Arms an alarm; its first tick is one interval from now.
  void schedule(const std::string& alarm_id);
  // Safe from any thread, including from inside the tick callback.
  void cancel(const std::string& alarm_id);
  bool scheduled(const std::string& alarm_id) const;
  std::size_t scheduled_count() const;

private:
  using SteadyClock = std::chrono::steady_clock;

  void run_loop();

  std::chrono::milliseconds interval_;
  std::chrono::milliseconds coalesce_window_;
  TickFn on_tick_;

  mutable std::mutex mutex_;
  std::condition_variable wakeup_;
  std::map<std::string, SteadyClock::time_point> due_;
  std::atomic<bool> running_{false};
  bool stop_requested_ = false;
  std::thread thread_;
};

} // namespace wake

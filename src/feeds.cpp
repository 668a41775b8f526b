#include "wake/feeds.hpp"

#include <utility>

namespace wake {

void PushedConditionSource::push(const ConditionReading& readings) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [type, value] : readings) {
    readings_[type] = value;
  }
}

void PushedConditionSource::set(ConditionType type, ConditionValue value) {
  std::lock_guard<std::mutex> lock(mutex_);
  readings_[type] = std::move(value);
}

void PushedConditionSource::clear(ConditionType type) {
  std::lock_guard<std::mutex> lock(mutex_);
  readings_.erase(type);
}

ConditionReading PushedConditionSource::current_readings() {
  std::lock_guard<std::mutex> lock(mutex_);
  return readings_;
}

void PushedSleepPredictor::set_pattern(std::optional<SleepPattern> pattern) {
  std::lock_guard<std::mutex> lock(mutex_);
  pattern_ = std::move(pattern);
}

void PushedSleepPredictor::set_stages(std::vector<StagePoint> stages) {
  std::lock_guard<std::mutex> lock(mutex_);
  stages_ = std::move(stages);
}

void PushedSleepPredictor::set_recommendation(std::optional<WakeRecommendation> recommendation) {
  std::lock_guard<std::mutex> lock(mutex_);
  recommendation_ = std::move(recommendation);
}

std::optional<SleepPattern> PushedSleepPredictor::current_pattern() {
  std::lock_guard<std::mutex> lock(mutex_);
  return pattern_;
}

std::vector<StagePoint> PushedSleepPredictor::predict(const Alarm&, const SleepPattern&) {
  std::lock_guard<std::mutex> lock(mutex_);
  return stages_;
}

std::optional<WakeRecommendation> PushedSleepPredictor::recommend(const Alarm&) {
  std::lock_guard<std::mutex> lock(mutex_);
  return recommendation_;
}

void QueuedNotifier::on_schedule_changed(const std::string& alarm_id,
                                         int new_time,
                                         double confidence,
                                         const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.push_back({alarm_id, new_time, confidence, reason});
}

std::vector<ScheduleChange> QueuedNotifier::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ScheduleChange> out(queue_.begin(), queue_.end());
  queue_.clear();
  return out;
}

std::size_t QueuedNotifier::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

} // namespace wake

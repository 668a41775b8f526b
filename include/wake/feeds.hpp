#pragma once

#include "collaborators.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wake {

// Latest condition snapshot pushed by the host (weather/calendar services,
// sleep-debt tracker). Each push replaces the values for the given keys.
class PushedConditionSource : public ConditionReadingSource {
public:
  void push(const ConditionReading& readings);
  void set(ConditionType type, ConditionValue value);
  void clear(ConditionType type);

  ConditionReading current_readings() override;

private:
  std::mutex mutex_;
  ConditionReading readings_;
};

// Holds the most recent output of the host-side sleep stage classifier.
class PushedSleepPredictor : public SleepStagePredictor {
public:
  void set_pattern(std::optional<SleepPattern> pattern);
  void set_stages(std::vector<StagePoint> stages);
  void set_recommendation(std::optional<WakeRecommendation> recommendation);

  std::optional<SleepPattern> current_pattern() override;
  std::vector<StagePoint> predict(const Alarm& alarm, const SleepPattern& pattern) override;
  std::optional<WakeRecommendation> recommend(const Alarm& alarm) override;

private:
  std::mutex mutex_;
  std::optional<SleepPattern> pattern_;
  std::vector<StagePoint> stages_;
  std::optional<WakeRecommendation> recommendation_;
};

struct ScheduleChange {
  std::string alarm_id;
  int new_time = 0;
  double confidence = 0.0;
  std::string reason;
};

// Notifier for hosts that poll instead of receiving callbacks.
class QueuedNotifier : public Notifier {
public:
  void on_schedule_changed(const std::string& alarm_id,
                           int new_time,
                           double confidence,
                           const std::string& reason) override;

  std::vector<ScheduleChange> drain();
  std::size_t pending() const;

private:
  mutable std::mutex mutex_;
  std::deque<ScheduleChange> queue_;
};

} // namespace wake

#include "wake/sleep_pattern.hpp"

#include "../scoring/feedback_scoring.hpp"
#include "wake/time_of_day.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace wake::sleep {

namespace {

std::vector<std::string> optimality_factors(SleepStage stage, int distance, double confidence) {
  std::vector<std::string> factors;
  switch (stage) {
    case SleepStage::Light:
      factors.emplace_back("Optimal sleep stage (light)");
      break;
    case SleepStage::Rem:
      factors.emplace_back("Good sleep stage (REM)");
      break;
    case SleepStage::Deep:
      factors.emplace_back("Suboptimal sleep stage (deep)");
      break;
  }
  if (distance < 10) {
    factors.emplace_back("Close to preferred time");
  }
  if (confidence > 0.8) {
    factors.emplace_back("High confidence based on patterns");
  }
  return factors;
}

double stage_bonus(SleepStage stage) {
  switch (stage) {
    case SleepStage::Light: return 0.3;
    case SleepStage::Rem: return 0.1;
    case SleepStage::Deep: return -0.2;
  }
  return 0.0;
}

double proximity_bonus(int distance, int wake_window) {
  if (wake_window <= 0) {
    return distance == 0 ? 0.2 : 0.0;
  }
  return std::max(0.0, 0.2 - (static_cast<double>(distance) / wake_window) * 0.2);
}

} // namespace

SleepStage stage_at(const std::vector<StagePoint>& stages, int minute_of_day) {
  if (stages.empty()) {
    return SleepStage::Light;
  }
  const StagePoint* closest = &stages.front();
  int best = time::circular_distance(closest->minute_of_day, minute_of_day);
  for (const auto& point : stages) {
    const int distance = time::circular_distance(point.minute_of_day, minute_of_day);
    if (distance < best) {
      best = distance;
      closest = &point;
    }
  }
  return closest->stage;
}

double time_preference_factor(const std::vector<WakeUpFeedback>& feedback, int minute_of_day) {
  double factor = 1.0;
  const std::size_t count = std::min(kPreferenceFeedbackWindow, feedback.size());
  for (auto it = feedback.end() - static_cast<std::ptrdiff_t>(count); it != feedback.end(); ++it) {
    if (time::circular_distance(it->actual_wake_time, minute_of_day) < kPreferenceRadiusMinutes) {
      factor *= 0.7 + scoring::feeling_score(it->feeling) * 0.3;
    }
  }
  return factor;
}

std::vector<OptimalTimeSlot> optimal_time_slots(const Alarm& alarm,
                                                const std::vector<StagePoint>& stages,
                                                const std::vector<WakeUpFeedback>& feedback) {
  std::vector<OptimalTimeSlot> slots;
  for (int offset = -alarm.wake_window; offset <= kSlotLateBufferMinutes;
       offset += kSlotStepMinutes) {
    const int candidate = time::wrap(alarm.baseline_time + offset);
    const int distance = std::abs(offset);
    const SleepStage stage = stage_at(stages, candidate);

    double confidence = 0.5 + stage_bonus(stage);
    confidence += proximity_bonus(distance, alarm.wake_window);
    confidence *= time_preference_factor(feedback, candidate);
    confidence = detail::clip01(confidence);

    OptimalTimeSlot slot;
    slot.minute_of_day = candidate;
    slot.confidence = confidence;
    slot.stage = stage;
    slot.factors = optimality_factors(stage, distance, confidence);
    slot.adjustment = offset;
    slots.push_back(std::move(slot));
  }

  std::stable_sort(slots.begin(), slots.end(),
                   [](const OptimalTimeSlot& a, const OptimalTimeSlot& b) {
                     return a.confidence > b.confidence;
                   });
  if (slots.size() > kMaxSlots) {
    slots.resize(kMaxSlots);
  }
  return slots;
}

int dynamic_wake_window(const Alarm& alarm,
                        const SleepPattern& pattern,
                        const std::vector<WakeUpFeedback>& feedback) {
  const double efficiency = detail::clip01(pattern.sleep_efficiency / 100.0);
  const double consistency_factor = 0.5 + efficiency * 0.5;
  const double feedback_factor = scoring::feedback_consistency_factor(feedback);
  return std::max(0, detail::round_half_up(alarm.wake_window * consistency_factor * feedback_factor));
}

int sleep_pattern_adjustment(const Alarm& alarm,
                             const SleepPattern& pattern,
                             const std::optional<WakeRecommendation>& recommendation,
                             const std::vector<WakeUpFeedback>& feedback) {
  if (!recommendation.has_value()) {
    return 0;
  }
  const int window = alarm.dynamic_wake_window ? dynamic_wake_window(alarm, pattern, feedback)
                                               : alarm.wake_window;
  const int adjustment = time::signed_delta(alarm.baseline_time, recommendation->minute_of_day);
  return std::clamp(adjustment, -window, window);
}

} // namespace wake::sleep

#include "wake/types.hpp"

#include "wake/time_of_day.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace wake {

void ConditionDefinition::validate() const {
  if (id.empty()) {
    throw ValidationError("Condition id must not be empty");
  }
  if (priority < 1 || priority > 5) {
    throw ValidationError("Condition '" + id + "' priority must be within [1, 5]");
  }
  const auto magnitude = std::abs(static_cast<std::int64_t>(adjustment.minutes));
  if (magnitude > static_cast<std::int64_t>(adjustment.max_adjustment)) {
    throw ValidationError("Condition '" + id + "' maxAdjustment must be >= |minutes|");
  }
  if (!std::isfinite(effectiveness_score) || effectiveness_score < 0.0 ||
      effectiveness_score > 1.0) {
    throw ValidationError("Condition '" + id + "' effectivenessScore must be within [0, 1]");
  }
  if (predicate.threshold.has_value() && !std::isfinite(*predicate.threshold)) {
    throw ValidationError("Condition '" + id + "' threshold must be finite");
  }
}

void WakeUpFeedback::validate() const {
  if (sleep_quality < 1 || sleep_quality > 10) {
    throw ValidationError("sleepQuality must be within [1, 10]");
  }
  if (time_to_fully_awake < 0) {
    throw ValidationError("timeToFullyAwake must not be negative");
  }
  if (original_time < 0 || original_time >= time::kMinutesPerDay ||
      actual_wake_time < 0 || actual_wake_time >= time::kMinutesPerDay) {
    throw ValidationError("Feedback times must be minutes of day");
  }
}

void Alarm::validate() const {
  if (id.empty()) {
    throw ValidationError("Alarm id must not be empty");
  }
  if (baseline_time < 0 || baseline_time >= time::kMinutesPerDay ||
      current_time < 0 || current_time >= time::kMinutesPerDay) {
    throw ValidationError("Alarm '" + id + "' times must be minutes of day");
  }
  if (wake_window < 0 || wake_window > 180) {
    throw ValidationError("Alarm '" + id + "' wake window must be within [0, 180]");
  }
  if (!(sleep_pattern_weight >= 0.0 && sleep_pattern_weight <= 1.0)) {
    throw ValidationError("Alarm '" + id + "' sleepPatternWeight must be within [0, 1]");
  }
  if (!(learning_factor >= 0.0 && learning_factor <= 1.0)) {
    throw ValidationError("Alarm '" + id + "' learningFactor must be within [0, 1]");
  }
}

} // namespace wake

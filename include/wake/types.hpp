#pragma once

#include "errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wake {

using Timestamp = std::chrono::system_clock::time_point;
using Clock = std::function<Timestamp()>;

namespace detail {

inline double clip01(double value) {
  return std::clamp(value, 0.0, 1.0);
}

// Halves round toward +infinity: -2.5 -> -2, 2.5 -> 3.
inline int round_half_up(double value) {
  return static_cast<int>(std::floor(value + 0.5));
}

} // namespace detail

enum class ConditionType {
  Weather,
  Calendar,
  SleepDebt,
  StressLevel,
  Exercise,
  ScreenTime
};

inline std::string to_string(ConditionType type) {
  switch (type) {
    case ConditionType::Weather: return "weather";
    case ConditionType::Calendar: return "calendar";
    case ConditionType::SleepDebt: return "sleep_debt";
    case ConditionType::StressLevel: return "stress_level";
    case ConditionType::Exercise: return "exercise";
    case ConditionType::ScreenTime: return "screen_time";
  }
  return "weather";
}

inline ConditionType condition_type_from_string(const std::string& value) {
  if (value == "weather") return ConditionType::Weather;
  if (value == "calendar") return ConditionType::Calendar;
  if (value == "sleep_debt") return ConditionType::SleepDebt;
  if (value == "stress_level") return ConditionType::StressLevel;
  if (value == "exercise") return ConditionType::Exercise;
  if (value == "screen_time") return ConditionType::ScreenTime;
  throw ValidationError("Unknown condition type: " + value);
}

enum class PredicateOperator {
  Equals,
  GreaterThan,
  LessThan,
  Contains
};

inline std::string to_string(PredicateOperator op) {
  switch (op) {
    case PredicateOperator::Equals: return "equals";
    case PredicateOperator::GreaterThan: return "greater_than";
    case PredicateOperator::LessThan: return "less_than";
    case PredicateOperator::Contains: return "contains";
  }
  return "equals";
}

inline PredicateOperator predicate_operator_from_string(const std::string& value) {
  if (value == "equals") return PredicateOperator::Equals;
  if (value == "greater_than") return PredicateOperator::GreaterThan;
  if (value == "less_than") return PredicateOperator::LessThan;
  if (value == "contains") return PredicateOperator::Contains;
  throw ValidationError("Unknown predicate operator: " + value);
}

enum class SleepStage {
  Light,
  Deep,
  Rem
};

inline std::string to_string(SleepStage stage) {
  switch (stage) {
    case SleepStage::Light: return "light";
    case SleepStage::Deep: return "deep";
    case SleepStage::Rem: return "rem";
  }
  return "light";
}

inline SleepStage sleep_stage_from_string(const std::string& value) {
  if (value == "light") return SleepStage::Light;
  if (value == "deep") return SleepStage::Deep;
  if (value == "rem") return SleepStage::Rem;
  throw ValidationError("Unknown sleep stage: " + value);
}

enum class AdaptationSource {
  SleepPattern,
  Condition,
  UserFeedback,
  Learning
};

inline std::string to_string(AdaptationSource source) {
  switch (source) {
    case AdaptationSource::SleepPattern: return "sleep_pattern";
    case AdaptationSource::Condition: return "condition";
    case AdaptationSource::UserFeedback: return "user_feedback";
    case AdaptationSource::Learning: return "learning";
  }
  return "condition";
}

inline AdaptationSource adaptation_source_from_string(const std::string& value) {
  if (value == "sleep_pattern") return AdaptationSource::SleepPattern;
  if (value == "condition") return AdaptationSource::Condition;
  if (value == "user_feedback") return AdaptationSource::UserFeedback;
  if (value == "learning") return AdaptationSource::Learning;
  throw ValidationError("Unknown adaptation source: " + value);
}

// Ordinals follow declaration order: very_easy = 0 .. very_hard = 4.
enum class WakeDifficulty {
  VeryEasy,
  Easy,
  Normal,
  Hard,
  VeryHard
};

inline std::string to_string(WakeDifficulty difficulty) {
  switch (difficulty) {
    case WakeDifficulty::VeryEasy: return "very_easy";
    case WakeDifficulty::Easy: return "easy";
    case WakeDifficulty::Normal: return "normal";
    case WakeDifficulty::Hard: return "hard";
    case WakeDifficulty::VeryHard: return "very_hard";
  }
  return "normal";
}

inline WakeDifficulty wake_difficulty_from_string(const std::string& value) {
  if (value == "very_easy") return WakeDifficulty::VeryEasy;
  if (value == "easy") return WakeDifficulty::Easy;
  if (value == "normal") return WakeDifficulty::Normal;
  if (value == "hard") return WakeDifficulty::Hard;
  if (value == "very_hard") return WakeDifficulty::VeryHard;
  throw ValidationError("Unknown wake difficulty: " + value);
}

// Ordinals follow declaration order: terrible = 0 .. excellent = 4.
enum class WakeFeeling {
  Terrible,
  Tired,
  Okay,
  Good,
  Excellent
};

inline std::string to_string(WakeFeeling feeling) {
  switch (feeling) {
    case WakeFeeling::Terrible: return "terrible";
    case WakeFeeling::Tired: return "tired";
    case WakeFeeling::Okay: return "okay";
    case WakeFeeling::Good: return "good";
    case WakeFeeling::Excellent: return "excellent";
  }
  return "okay";
}

inline WakeFeeling wake_feeling_from_string(const std::string& value) {
  if (value == "terrible") return WakeFeeling::Terrible;
  if (value == "tired") return WakeFeeling::Tired;
  if (value == "okay") return WakeFeeling::Okay;
  if (value == "good") return WakeFeeling::Good;
  if (value == "excellent") return WakeFeeling::Excellent;
  throw ValidationError("Unknown wake feeling: " + value);
}

// A single observed signal value: number | string | string list | bool.
using ConditionValue = std::variant<double, std::string, std::vector<std::string>, bool>;

// Snapshot of the current signals. Missing keys mean "no data this cycle".
using ConditionReading = std::map<ConditionType, ConditionValue>;

struct ConditionPredicate {
  PredicateOperator op = PredicateOperator::Equals;
  ConditionValue value;
  std::optional<double> threshold;
};

struct ConditionAdjustment {
  int minutes = 0; // negative = earlier
  unsigned int max_adjustment = 0;
  std::string reason;
};

struct ConditionDefinition {
  std::string id;
  ConditionType type = ConditionType::Weather;
  bool enabled = true;
  int priority = 3;
  ConditionPredicate predicate;
  ConditionAdjustment adjustment;
  double effectiveness_score = 0.5;
  std::optional<Timestamp> last_triggered;

  void validate() const;
};

struct OptimalTimeSlot {
  int minute_of_day = 0;
  double confidence = 0.0;
  SleepStage stage = SleepStage::Light;
  std::vector<std::string> factors;
  int adjustment = 0; // minutes from baseline
};

struct AdaptationRecord {
  std::uint64_t sequence = 0;
  Timestamp date;
  int original_time = 0;
  int adjusted_time = 0;
  int adjustment_minutes = 0;
  std::string reason;
  AdaptationSource source = AdaptationSource::Condition;
  std::vector<std::string> condition_ids;
  double confidence = 0.0;
  std::optional<double> effectiveness;
};

struct WakeUpFeedback {
  Timestamp date;
  int original_time = 0;
  int actual_wake_time = 0;
  WakeDifficulty difficulty = WakeDifficulty::Normal;
  WakeFeeling feeling = WakeFeeling::Okay;
  int sleep_quality = 5;        // 1-10
  int time_to_fully_awake = 0;  // minutes
  bool would_prefer_earlier = false;
  bool would_prefer_later = false;
  std::optional<std::string> notes;

  void validate() const;
};

struct Alarm {
  std::string id;
  std::string label;
  int baseline_time = 7 * 60; // minute of day
  int current_time = 7 * 60;  // target the notifier currently holds
  int wake_window = 30;
  bool enabled = true;
  bool real_time_adaptation = true;
  bool dynamic_wake_window = true;
  double sleep_pattern_weight = 0.7;
  double learning_factor = 0.3;
  Timestamp created_at;

  void validate() const;
};

enum class RecommendationType {
  TimeAdjustment,
  ConditionChange,
  SleepGoalUpdate
};

inline std::string to_string(RecommendationType type) {
  switch (type) {
    case RecommendationType::TimeAdjustment: return "time_adjustment";
    case RecommendationType::ConditionChange: return "condition_change";
    case RecommendationType::SleepGoalUpdate: return "sleep_goal_update";
  }
  return "time_adjustment";
}

enum class RecommendationImpact {
  Low,
  Medium,
  High
};

inline std::string to_string(RecommendationImpact impact) {
  switch (impact) {
    case RecommendationImpact::Low: return "low";
    case RecommendationImpact::Medium: return "medium";
    case RecommendationImpact::High: return "high";
  }
  return "low";
}

struct SmartRecommendation {
  RecommendationType type = RecommendationType::TimeAdjustment;
  std::string description;
  RecommendationImpact impact = RecommendationImpact::Low;
  double confidence = 0.0;
  struct Action {
    std::string type;
    std::string target;
    double value = 0.0;
  } action;
};

struct SmartAlarmMetrics {
  std::string alarm_id;
  std::size_t feedback_count = 0;
  double average_wake_up_difficulty = 0.0; // 1-5, 0 without feedback
  std::vector<int> sleep_quality_trend;
  double adaptation_success = 0.5;
  double user_satisfaction = 0.0;
  std::vector<ConditionType> most_effective_conditions;
  std::vector<SmartRecommendation> recommendations;
};

} // namespace wake

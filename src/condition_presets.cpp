#include "resources/condition_presets.hpp"

#include <utility>

namespace wake::resources {

namespace {

ConditionDefinition make_condition(std::string id,
                                   ConditionType type,
                                   int priority,
                                   PredicateOperator op,
                                   ConditionValue value,
                                   std::optional<double> threshold,
                                   int minutes,
                                   unsigned int max_adjustment,
                                   std::string reason,
                                   double effectiveness) {
  ConditionDefinition def;
  def.id = std::move(id);
  def.type = type;
  def.enabled = true;
  def.priority = priority;
  def.predicate.op = op;
  def.predicate.value = std::move(value);
  def.predicate.threshold = threshold;
  def.adjustment.minutes = minutes;
  def.adjustment.max_adjustment = max_adjustment;
  def.adjustment.reason = std::move(reason);
  def.effectiveness_score = effectiveness;
  return def;
}

using List = std::vector<std::string>;

std::vector<ConditionDefinition> build_library() {
  using T = ConditionType;
  using Op = PredicateOperator;
  std::vector<ConditionDefinition> library;

  // Weather: readings are a condition string ("light rain") or a list of tags.
  library.push_back(make_condition("weather_rain_light", T::Weather, 3, Op::Contains,
                                   std::string("rain"), std::nullopt, -10, 20,
                                   "Light rain may slow commute - extra preparation time", 0.8));
  library.push_back(make_condition("weather_snow", T::Weather, 5, Op::Contains,
                                   std::string("snow"), std::nullopt, -30, 60,
                                   "Snow conditions require extra safety preparation", 0.9));
  library.push_back(make_condition("weather_ice", T::Weather, 5, Op::Contains,
                                   List{"ice", "freezing", "sleet"}, std::nullopt, -35, 70,
                                   "Icy conditions pose significant safety risks", 0.95));
  library.push_back(make_condition("weather_fog", T::Weather, 4, Op::Contains,
                                   List{"fog", "mist"}, std::nullopt, -20, 35,
                                   "Fog reduces visibility and slows travel", 0.85));

  // Calendar: event keywords, a day type, or the day's meeting count.
  library.push_back(make_condition(
      "calendar_critical", T::Calendar, 5, Op::Contains,
      List{"critical", "urgent", "emergency", "CEO", "board meeting"}, std::nullopt, -60, 120,
      "Critical events require extensive preparation", 0.95));
  library.push_back(make_condition(
      "calendar_important", T::Calendar, 4, Op::Contains,
      List{"important", "presentation", "interview", "client meeting"}, std::nullopt, -30, 60,
      "Important meetings need thorough preparation", 0.9));
  library.push_back(make_condition("calendar_weekend", T::Calendar, 2, Op::Equals,
                                   std::string("weekend"), std::nullopt, 45, 120,
                                   "Weekend relaxation and recovery time", 0.9));
  library.push_back(make_condition("calendar_holiday", T::Calendar, 2, Op::Equals,
                                   std::string("holiday"), std::nullopt, 60, 150,
                                   "Holiday relaxation time", 0.95));
  library.push_back(make_condition("calendar_busy_day", T::Calendar, 3, Op::GreaterThan,
                                   std::string("meeting_count"), 5.0, -20, 35,
                                   "Busy day requires extra mental preparation", 0.7));
  library.push_back(make_condition(
      "calendar_deadline", T::Calendar, 4, Op::Contains,
      List{"deadline", "due", "submission", "final"}, std::nullopt, -35, 60,
      "Deadline pressure requires extra preparation and focus time", 0.85));

  // Sleep debt: accumulated minutes.
  library.push_back(make_condition("sleep_debt_minor", T::SleepDebt, 2, Op::GreaterThan,
                                   std::string("sleep_debt_minutes"), 15.0, -5, 10,
                                   "Minor sleep debt adjustment", 0.65));
  library.push_back(make_condition("sleep_debt_moderate", T::SleepDebt, 3, Op::GreaterThan,
                                   std::string("sleep_debt_minutes"), 30.0, -15, 25,
                                   "Moderate sleep debt requires schedule adjustment", 0.75));
  library.push_back(make_condition(
      "sleep_debt_high", T::SleepDebt, 4, Op::GreaterThan, std::string("sleep_debt_minutes"),
      60.0, -25, 45, "High sleep debt requires significant recovery adjustment", 0.85));
  library.push_back(make_condition(
      "sleep_debt_severe", T::SleepDebt, 5, Op::GreaterThan, std::string("sleep_debt_minutes"),
      120.0, -40, 75, "Severe sleep debt requires immediate schedule correction", 0.9));

  // Stress on a 0-10 scale.
  library.push_back(make_condition("stress_high_day", T::StressLevel, 3, Op::GreaterThan,
                                   std::string("predicted_stress_level"), 7.0, -20, 35,
                                   "High stress days need extra mental preparation time", 0.75));
  library.push_back(make_condition("stress_low_day", T::StressLevel, 2, Op::LessThan,
                                   std::string("predicted_stress_level"), 3.0, 10, 20,
                                   "Low stress day allows relaxed morning routine", 0.7));

  // Previous day's exercise minutes.
  library.push_back(make_condition("exercise_intense_recovery", T::Exercise, 3, Op::GreaterThan,
                                   std::string("previous_day_exercise_minutes"), 90.0, 20, 40,
                                   "Intense exercise requires additional recovery sleep", 0.8));

  // Evening screen minutes before bed.
  library.push_back(make_condition("screen_time_high", T::ScreenTime, 2, Op::GreaterThan,
                                   std::string("evening_screen_minutes"), 120.0, 10, 20,
                                   "High screen time delays natural sleep hormones", 0.65));
  return library;
}

std::vector<std::string> essential_ids() {
  return {"weather_rain_light", "weather_snow", "calendar_important", "calendar_weekend",
          "sleep_debt_high"};
}

std::vector<std::string> comprehensive_ids() {
  auto ids = essential_ids();
  for (const char* id : {"weather_fog", "calendar_busy_day", "calendar_deadline",
                         "exercise_intense_recovery", "stress_high_day", "screen_time_high"}) {
    ids.emplace_back(id);
  }
  return ids;
}

} // namespace

std::vector<ConditionDefinition> default_conditions() {
  using T = ConditionType;
  using Op = PredicateOperator;
  return {
      make_condition("weather_rain", T::Weather, 3, Op::Contains, std::string("rain"),
                     std::nullopt, -10, 20, "Allow extra time for rainy weather commute", 0.8),
      make_condition("sleep_debt_high", T::SleepDebt, 4, Op::GreaterThan,
                     std::string("sleep_debt_minutes"), 60.0, -15, 30,
                     "Extra sleep to recover from sleep debt", 0.7),
      make_condition("weekend_relaxed", T::Calendar, 2, Op::Equals, std::string("weekend"),
                     std::nullopt, 30, 60, "Weekend lie-in", 0.9),
  };
}

const std::vector<ConditionDefinition>& condition_library() {
  static const std::vector<ConditionDefinition> library = build_library();
  return library;
}

ConditionDefinition library_condition(std::string_view id) {
  for (const auto& def : condition_library()) {
    if (def.id == id) {
      return def;
    }
  }
  throw NotFoundError("Unknown library condition: " + std::string(id));
}

const std::vector<ConfigurationPreset>& configuration_presets() {
  static const std::vector<ConfigurationPreset> presets = {
      {"QUICK_START", "Basic conditions for immediate use", 0.3, 0.7, essential_ids()},
      {"COMPREHENSIVE", "Full condition set for maximum personalization", 0.3, 0.6,
       comprehensive_ids()},
      {"CONSERVATIVE", "Minimal adjustments, high consistency", 0.2, 0.8,
       {"calendar_critical", "weather_snow", "sleep_debt_severe"}},
      {"AGGRESSIVE", "Maximum adaptation and learning speed", 0.5, 0.5, comprehensive_ids()},
  };
  return presets;
}

const ConfigurationPreset& configuration_preset(std::string_view name) {
  for (const auto& preset : configuration_presets()) {
    if (preset.name == name) {
      return preset;
    }
  }
  throw NotFoundError("Unknown configuration preset: " + std::string(name));
}

std::vector<ConditionDefinition> preset_conditions(const ConfigurationPreset& preset) {
  std::vector<ConditionDefinition> out;
  out.reserve(preset.condition_ids.size());
  for (const auto& id : preset.condition_ids) {
    out.push_back(library_condition(id));
  }
  return out;
}

} // namespace wake::resources

#include "json_bridge.hpp"

#include "wake/time_of_day.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace wake::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj.at(key);
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

const nlohmann::json& require_field(const nlohmann::json& obj, const char* key) {
  if (!obj.is_object() || !obj.contains(key) || obj.at(key).is_null()) {
    throw ValidationError("Missing required field '" + std::string(key) + "'");
  }
  return obj.at(key);
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<int>();
  }
  if (value.is_number_float()) {
    return static_cast<int>(std::lround(value.get<double>()));
  }
  throw ValidationError("Expected integer for field '" + std::string(key) + "'");
}

std::int64_t json_to_int64(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  throw ValidationError("Expected integer for field '" + std::string(key) + "'");
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw ValidationError("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

bool json_to_bool(const nlohmann::json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number_integer()) {
    const int v = value.get<int>();
    if (v == 0 || v == 1) {
      return v != 0;
    }
  }
  throw ValidationError("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw ValidationError("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

std::vector<std::string> json_to_string_vector(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw ValidationError("Expected array<string> for field '" + std::string(key) + "'");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& item : value) {
    out.push_back(json_to_string(item, key));
  }
  return out;
}

int json_to_time(const nlohmann::json& value, std::string_view key) {
  if (value.is_string()) {
    return time::parse_hhmm(value.get<std::string>());
  }
  const int minutes = json_to_int(value, key);
  if (minutes < 0 || minutes >= time::kMinutesPerDay) {
    throw ValidationError("Minute of day out of range for field '" + std::string(key) + "'");
  }
  return minutes;
}

Timestamp json_to_timestamp(const nlohmann::json& value, std::string_view key) {
  return time::from_epoch_ms(json_to_int64(value, key));
}

nlohmann::json strings_to_json_array(const std::vector<std::string>& values) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& v : values) {
    arr.push_back(v);
  }
  return arr;
}

} // namespace

nlohmann::json to_json(const ConditionValue& value) {
  return std::visit(
      [](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
          return strings_to_json_array(v);
        } else {
          return nlohmann::json(v);
        }
      },
      value);
}

ConditionValue condition_value_from_json(const nlohmann::json& json_value) {
  if (json_value.is_boolean()) {
    return json_value.get<bool>();
  }
  if (json_value.is_number()) {
    return json_value.get<double>();
  }
  if (json_value.is_string()) {
    return json_value.get<std::string>();
  }
  if (json_value.is_array()) {
    return json_to_string_vector(json_value, "value");
  }
  throw ValidationError("Condition value must be a number, string, string list or bool");
}

nlohmann::json to_json(const ConditionReading& reading) {
  nlohmann::json json_reading = nlohmann::json::object();
  for (const auto& [type, value] : reading) {
    json_reading[to_string(type)] = to_json(value);
  }
  return json_reading;
}

ConditionReading condition_reading_from_json(const nlohmann::json& json_reading) {
  if (!json_reading.is_object()) {
    throw ValidationError("Condition reading must be an object");
  }
  ConditionReading reading;
  for (const auto& item : json_reading.items()) {
    if (item.value().is_null()) {
      continue;
    }
    reading[condition_type_from_string(item.key())] = condition_value_from_json(item.value());
  }
  return reading;
}

nlohmann::json to_json(const ConditionDefinition& def) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = def.id;
  json["type"] = to_string(def.type);
  json["enabled"] = def.enabled;
  json["priority"] = def.priority;

  nlohmann::json condition = nlohmann::json::object();
  condition["operator"] = to_string(def.predicate.op);
  condition["value"] = to_json(def.predicate.value);
  if (def.predicate.threshold.has_value()) {
    condition["threshold"] = def.predicate.threshold.value();
  } else {
    condition["threshold"] = nullptr;
  }
  json["condition"] = std::move(condition);

  nlohmann::json adjustment = nlohmann::json::object();
  adjustment["minutes"] = def.adjustment.minutes;
  adjustment["maxAdjustment"] = def.adjustment.max_adjustment;
  adjustment["reason"] = def.adjustment.reason;
  json["adjustment"] = std::move(adjustment);

  json["effectivenessScore"] = def.effectiveness_score;
  if (def.last_triggered.has_value()) {
    json["lastTriggered"] = time::to_epoch_ms(def.last_triggered.value());
  } else {
    json["lastTriggered"] = nullptr;
  }
  return json;
}

ConditionDefinition condition_definition_from_json(const nlohmann::json& json_def) {
  ConditionDefinition def;
  def.id = json_to_string(require_field(json_def, "id"), "id");
  def.type = condition_type_from_string(json_to_string(require_field(json_def, "type"), "type"));
  assign_if_present(json_def, "enabled",
                    [&](const nlohmann::json& v) { def.enabled = json_to_bool(v, "enabled"); });
  assign_if_present(json_def, "priority",
                    [&](const nlohmann::json& v) { def.priority = json_to_int(v, "priority"); });

  const auto& condition = require_field(json_def, "condition");
  def.predicate.op =
      predicate_operator_from_string(json_to_string(require_field(condition, "operator"), "operator"));
  def.predicate.value = condition_value_from_json(require_field(condition, "value"));
  assign_if_present(condition, "threshold", [&](const nlohmann::json& v) {
    def.predicate.threshold = json_to_double(v, "threshold");
  });

  const auto& adjustment = require_field(json_def, "adjustment");
  def.adjustment.minutes = json_to_int(require_field(adjustment, "minutes"), "minutes");
  const int max_adjustment = json_to_int(require_field(adjustment, "maxAdjustment"), "maxAdjustment");
  if (max_adjustment < 0) {
    throw ValidationError("maxAdjustment must not be negative");
  }
  def.adjustment.max_adjustment = static_cast<unsigned int>(max_adjustment);
  assign_if_present(adjustment, "reason", [&](const nlohmann::json& v) {
    def.adjustment.reason = json_to_string(v, "reason");
  });

  assign_if_present(json_def, "effectivenessScore", [&](const nlohmann::json& v) {
    def.effectiveness_score = json_to_double(v, "effectivenessScore");
  });
  assign_if_present(json_def, "lastTriggered", [&](const nlohmann::json& v) {
    def.last_triggered = json_to_timestamp(v, "lastTriggered");
  });
  return def;
}

nlohmann::json to_json(const AdaptationRecord& record) {
  nlohmann::json json = nlohmann::json::object();
  json["sequence"] = record.sequence;
  json["date"] = time::to_epoch_ms(record.date);
  json["originalTime"] = time::format_hhmm(record.original_time);
  json["adjustedTime"] = time::format_hhmm(record.adjusted_time);
  json["adjustmentMinutes"] = record.adjustment_minutes;
  json["reason"] = record.reason;
  json["source"] = to_string(record.source);
  json["conditionIds"] = strings_to_json_array(record.condition_ids);
  json["confidence"] = record.confidence;
  if (record.effectiveness.has_value()) {
    json["effectiveness"] = record.effectiveness.value();
  } else {
    json["effectiveness"] = nullptr;
  }
  return json;
}

AdaptationRecord adaptation_record_from_json(const nlohmann::json& json_record) {
  AdaptationRecord record;
  assign_if_present(json_record, "sequence", [&](const nlohmann::json& v) {
    record.sequence = static_cast<std::uint64_t>(json_to_int64(v, "sequence"));
  });
  record.date = json_to_timestamp(require_field(json_record, "date"), "date");
  record.original_time = json_to_time(require_field(json_record, "originalTime"), "originalTime");
  record.adjusted_time = json_to_time(require_field(json_record, "adjustedTime"), "adjustedTime");
  if (!assign_if_present(json_record, "adjustmentMinutes", [&](const nlohmann::json& v) {
        record.adjustment_minutes = json_to_int(v, "adjustmentMinutes");
      })) {
    record.adjustment_minutes = time::signed_delta(record.original_time, record.adjusted_time);
  }
  assign_if_present(json_record, "reason",
                    [&](const nlohmann::json& v) { record.reason = json_to_string(v, "reason"); });
  assign_if_present(json_record, "source", [&](const nlohmann::json& v) {
    record.source = adaptation_source_from_string(json_to_string(v, "source"));
  });
  assign_if_present(json_record, "conditionIds", [&](const nlohmann::json& v) {
    record.condition_ids = json_to_string_vector(v, "conditionIds");
  });
  assign_if_present(json_record, "confidence", [&](const nlohmann::json& v) {
    record.confidence = json_to_double(v, "confidence");
  });
  assign_if_present(json_record, "effectiveness", [&](const nlohmann::json& v) {
    record.effectiveness = json_to_double(v, "effectiveness");
  });
  return record;
}

nlohmann::json to_json(const WakeUpFeedback& feedback) {
  nlohmann::json json = nlohmann::json::object();
  json["date"] = time::to_epoch_ms(feedback.date);
  json["originalTime"] = time::format_hhmm(feedback.original_time);
  json["actualWakeTime"] = time::format_hhmm(feedback.actual_wake_time);
  json["difficulty"] = to_string(feedback.difficulty);
  json["feeling"] = to_string(feedback.feeling);
  json["sleepQuality"] = feedback.sleep_quality;
  json["timeToFullyAwake"] = feedback.time_to_fully_awake;
  json["wouldPreferEarlier"] = feedback.would_prefer_earlier;
  json["wouldPreferLater"] = feedback.would_prefer_later;
  if (feedback.notes.has_value()) {
    json["notes"] = feedback.notes.value();
  } else {
    json["notes"] = nullptr;
  }
  return json;
}

WakeUpFeedback wake_up_feedback_from_json(const nlohmann::json& json_feedback) {
  WakeUpFeedback feedback;
  feedback.date = json_to_timestamp(require_field(json_feedback, "date"), "date");
  feedback.original_time =
      json_to_time(require_field(json_feedback, "originalTime"), "originalTime");
  feedback.actual_wake_time =
      json_to_time(require_field(json_feedback, "actualWakeTime"), "actualWakeTime");
  feedback.difficulty = wake_difficulty_from_string(
      json_to_string(require_field(json_feedback, "difficulty"), "difficulty"));
  feedback.feeling =
      wake_feeling_from_string(json_to_string(require_field(json_feedback, "feeling"), "feeling"));
  feedback.sleep_quality = json_to_int(require_field(json_feedback, "sleepQuality"), "sleepQuality");
  assign_if_present(json_feedback, "timeToFullyAwake", [&](const nlohmann::json& v) {
    feedback.time_to_fully_awake = json_to_int(v, "timeToFullyAwake");
  });
  assign_if_present(json_feedback, "wouldPreferEarlier", [&](const nlohmann::json& v) {
    feedback.would_prefer_earlier = json_to_bool(v, "wouldPreferEarlier");
  });
  assign_if_present(json_feedback, "wouldPreferLater", [&](const nlohmann::json& v) {
    feedback.would_prefer_later = json_to_bool(v, "wouldPreferLater");
  });
  assign_if_present(json_feedback, "notes",
                    [&](const nlohmann::json& v) { feedback.notes = json_to_string(v, "notes"); });
  return feedback;
}

nlohmann::json to_json(const Alarm& alarm) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = alarm.id;
  json["label"] = alarm.label;
  json["baselineTime"] = time::format_hhmm(alarm.baseline_time);
  json["time"] = time::format_hhmm(alarm.current_time);
  json["wakeWindow"] = alarm.wake_window;
  json["enabled"] = alarm.enabled;
  json["realTimeAdaptation"] = alarm.real_time_adaptation;
  json["dynamicWakeWindow"] = alarm.dynamic_wake_window;
  json["sleepPatternWeight"] = alarm.sleep_pattern_weight;
  json["learningFactor"] = alarm.learning_factor;
  json["createdAt"] = time::to_epoch_ms(alarm.created_at);
  return json;
}

Alarm alarm_from_json(const nlohmann::json& json_alarm) {
  Alarm alarm;
  alarm.id = json_to_string(require_field(json_alarm, "id"), "id");
  assign_if_present(json_alarm, "label",
                    [&](const nlohmann::json& v) { alarm.label = json_to_string(v, "label"); });
  alarm.baseline_time = json_to_time(require_field(json_alarm, "baselineTime"), "baselineTime");
  alarm.current_time = alarm.baseline_time;
  assign_if_present(json_alarm, "time",
                    [&](const nlohmann::json& v) { alarm.current_time = json_to_time(v, "time"); });
  assign_if_present(json_alarm, "wakeWindow",
                    [&](const nlohmann::json& v) { alarm.wake_window = json_to_int(v, "wakeWindow"); });
  assign_if_present(json_alarm, "enabled",
                    [&](const nlohmann::json& v) { alarm.enabled = json_to_bool(v, "enabled"); });
  assign_if_present(json_alarm, "realTimeAdaptation", [&](const nlohmann::json& v) {
    alarm.real_time_adaptation = json_to_bool(v, "realTimeAdaptation");
  });
  assign_if_present(json_alarm, "dynamicWakeWindow", [&](const nlohmann::json& v) {
    alarm.dynamic_wake_window = json_to_bool(v, "dynamicWakeWindow");
  });
  assign_if_present(json_alarm, "sleepPatternWeight", [&](const nlohmann::json& v) {
    alarm.sleep_pattern_weight = json_to_double(v, "sleepPatternWeight");
  });
  assign_if_present(json_alarm, "learningFactor", [&](const nlohmann::json& v) {
    alarm.learning_factor = json_to_double(v, "learningFactor");
  });
  assign_if_present(json_alarm, "createdAt", [&](const nlohmann::json& v) {
    alarm.created_at = json_to_timestamp(v, "createdAt");
  });
  return alarm;
}

nlohmann::json to_json(const AlarmConfig& config) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = config.id;
  json["label"] = config.label;
  json["time"] = config.time;
  json["wakeWindow"] = config.wake_window;
  json["enabled"] = config.enabled;
  json["realTimeAdaptation"] = config.real_time_adaptation;
  json["dynamicWakeWindow"] = config.dynamic_wake_window;
  json["sleepPatternWeight"] = config.sleep_pattern_weight;
  json["learningFactor"] = config.learning_factor;
  if (config.conditions.has_value()) {
    nlohmann::json conditions = nlohmann::json::array();
    for (const auto& def : config.conditions.value()) {
      conditions.push_back(to_json(def));
    }
    json["conditions"] = std::move(conditions);
  } else {
    json["conditions"] = nullptr;
  }
  if (config.preset.has_value()) {
    json["preset"] = config.preset.value();
  } else {
    json["preset"] = nullptr;
  }
  return json;
}

AlarmConfig alarm_config_from_json(const nlohmann::json& json_config) {
  AlarmConfig config;
  config.id = json_to_string(require_field(json_config, "id"), "id");
  assign_if_present(json_config, "label",
                    [&](const nlohmann::json& v) { config.label = json_to_string(v, "label"); });
  assign_if_present(json_config, "time",
                    [&](const nlohmann::json& v) { config.time = json_to_string(v, "time"); });
  assign_if_present(json_config, "wakeWindow", [&](const nlohmann::json& v) {
    config.wake_window = json_to_int(v, "wakeWindow");
  });
  assign_if_present(json_config, "enabled",
                    [&](const nlohmann::json& v) { config.enabled = json_to_bool(v, "enabled"); });
  assign_if_present(json_config, "realTimeAdaptation", [&](const nlohmann::json& v) {
    config.real_time_adaptation = json_to_bool(v, "realTimeAdaptation");
  });
  assign_if_present(json_config, "dynamicWakeWindow", [&](const nlohmann::json& v) {
    config.dynamic_wake_window = json_to_bool(v, "dynamicWakeWindow");
  });
  assign_if_present(json_config, "sleepPatternWeight", [&](const nlohmann::json& v) {
    config.sleep_pattern_weight = json_to_double(v, "sleepPatternWeight");
  });
  assign_if_present(json_config, "learningFactor", [&](const nlohmann::json& v) {
    config.learning_factor = json_to_double(v, "learningFactor");
  });
  assign_if_present(json_config, "conditions", [&](const nlohmann::json& v) {
    if (!v.is_array()) {
      throw ValidationError("Expected array for field 'conditions'");
    }
    std::vector<ConditionDefinition> conditions;
    for (const auto& item : v) {
      conditions.push_back(condition_definition_from_json(item));
    }
    config.conditions = std::move(conditions);
  });
  assign_if_present(json_config, "preset",
                    [&](const nlohmann::json& v) { config.preset = json_to_string(v, "preset"); });
  return config;
}

nlohmann::json to_json(const EngineConfig& config) {
  nlohmann::json json = nlohmann::json::object();
  json["tickIntervalMs"] = config.tick_interval_ms;
  json["collaboratorTimeoutMs"] = config.collaborator_timeout_ms;
  json["utcOffsetMinutes"] = config.utc_offset_minutes;
  json["metricsWindowDays"] = config.metrics_window_days;
  json["staleAdaptationDays"] = config.stale_adaptation_days;
  json["failureAdvisoryThreshold"] = config.failure_advisory_threshold;
  return json;
}

EngineConfig engine_config_from_json(const nlohmann::json& json_config) {
  if (!json_config.is_object()) {
    throw ValidationError("Engine config must be a JSON object");
  }
  EngineConfig config;
  assign_if_present(json_config, "tickIntervalMs", [&](const nlohmann::json& v) {
    config.tick_interval_ms = json_to_int64(v, "tickIntervalMs");
  });
  assign_if_present(json_config, "collaboratorTimeoutMs", [&](const nlohmann::json& v) {
    config.collaborator_timeout_ms = json_to_int64(v, "collaboratorTimeoutMs");
  });
  assign_if_present(json_config, "utcOffsetMinutes", [&](const nlohmann::json& v) {
    config.utc_offset_minutes = json_to_int(v, "utcOffsetMinutes");
  });
  assign_if_present(json_config, "metricsWindowDays", [&](const nlohmann::json& v) {
    config.metrics_window_days = json_to_int(v, "metricsWindowDays");
  });
  assign_if_present(json_config, "staleAdaptationDays", [&](const nlohmann::json& v) {
    config.stale_adaptation_days = json_to_int(v, "staleAdaptationDays");
  });
  assign_if_present(json_config, "failureAdvisoryThreshold", [&](const nlohmann::json& v) {
    config.failure_advisory_threshold = json_to_int(v, "failureAdvisoryThreshold");
  });
  config.validate();
  return config;
}

nlohmann::json to_json(const OptimalTimeSlot& slot) {
  nlohmann::json json = nlohmann::json::object();
  json["time"] = time::format_hhmm(slot.minute_of_day);
  json["confidence"] = slot.confidence;
  json["sleepStage"] = to_string(slot.stage);
  json["factors"] = strings_to_json_array(slot.factors);
  json["adjustment"] = slot.adjustment;
  return json;
}

nlohmann::json to_json(const SmartAlarmMetrics& metrics) {
  nlohmann::json json = nlohmann::json::object();
  json["alarmId"] = metrics.alarm_id;
  json["feedbackCount"] = static_cast<std::int64_t>(metrics.feedback_count);
  json["averageWakeUpDifficulty"] = metrics.average_wake_up_difficulty;
  nlohmann::json trend = nlohmann::json::array();
  for (int quality : metrics.sleep_quality_trend) {
    trend.push_back(quality);
  }
  json["sleepQualityTrend"] = std::move(trend);
  json["adaptationSuccess"] = metrics.adaptation_success;
  json["userSatisfaction"] = metrics.user_satisfaction;
  nlohmann::json effective = nlohmann::json::array();
  for (auto type : metrics.most_effective_conditions) {
    effective.push_back(to_string(type));
  }
  json["mostEffectiveConditions"] = std::move(effective);
  nlohmann::json recommendations = nlohmann::json::array();
  for (const auto& rec : metrics.recommendations) {
    nlohmann::json item = nlohmann::json::object();
    item["type"] = to_string(rec.type);
    item["description"] = rec.description;
    item["impact"] = to_string(rec.impact);
    item["confidence"] = rec.confidence;
    nlohmann::json action = nlohmann::json::object();
    action["type"] = rec.action.type;
    action["target"] = rec.action.target;
    action["value"] = rec.action.value;
    item["action"] = std::move(action);
    recommendations.push_back(std::move(item));
  }
  json["recommendedAdjustments"] = std::move(recommendations);
  return json;
}

nlohmann::json to_json(const metrics::ConditionAudit& audit) {
  nlohmann::json json = nlohmann::json::object();
  json["isValid"] = audit.valid;
  json["score"] = audit.score;
  json["grade"] = audit.grade;
  json["issues"] = strings_to_json_array(audit.issues);
  json["recommendations"] = strings_to_json_array(audit.recommendations);
  json["enabledConditions"] = static_cast<std::int64_t>(audit.enabled_conditions);
  json["totalConditions"] = static_cast<std::int64_t>(audit.total_conditions);
  return json;
}

nlohmann::json to_json(const TickOutcome& outcome) {
  nlohmann::json json = nlohmann::json::object();
  json["alarmId"] = outcome.alarm_id;
  json["state"] = to_string(outcome.state);
  json["detail"] = outcome.detail;
  json["sleepAdjustment"] = outcome.sleep_adjustment;
  json["conditionAdjustment"] = outcome.conditions.total_adjustment;
  nlohmann::json fired = nlohmann::json::array();
  for (const auto& item : outcome.conditions.fired) {
    nlohmann::json entry = nlohmann::json::object();
    entry["conditionId"] = item.condition_id;
    entry["type"] = to_string(item.type);
    entry["appliedMinutes"] = item.applied_minutes;
    entry["reason"] = item.reason;
    fired.push_back(std::move(entry));
  }
  json["fired"] = std::move(fired);
  if (outcome.blend.has_value()) {
    nlohmann::json blend = nlohmann::json::object();
    blend["adjustment"] = outcome.blend->adjustment;
    blend["significant"] = outcome.blend->significant;
    blend["confidence"] = outcome.blend->confidence;
    blend["dominant"] = to_string(outcome.blend->dominant);
    json["blend"] = std::move(blend);
  } else {
    json["blend"] = nullptr;
  }
  if (outcome.record.has_value()) {
    json["record"] = to_json(outcome.record.value());
  } else {
    json["record"] = nullptr;
  }
  return json;
}

} // namespace wake::bridge

#pragma once

#include "wake/adaptation_loop.hpp"
#include "wake/config.hpp"
#include "wake/metrics.hpp"
#include "wake/types.hpp"

#include <nlohmann/json.hpp>

namespace wake::bridge {

nlohmann::json to_json(const ConditionValue& value);
ConditionValue condition_value_from_json(const nlohmann::json& json_value);

nlohmann::json to_json(const ConditionReading& reading);
ConditionReading condition_reading_from_json(const nlohmann::json& json_reading);

nlohmann::json to_json(const ConditionDefinition& def);
ConditionDefinition condition_definition_from_json(const nlohmann::json& json_def);

nlohmann::json to_json(const AdaptationRecord& record);
AdaptationRecord adaptation_record_from_json(const nlohmann::json& json_record);

nlohmann::json to_json(const WakeUpFeedback& feedback);
WakeUpFeedback wake_up_feedback_from_json(const nlohmann::json& json_feedback);

nlohmann::json to_json(const Alarm& alarm);
Alarm alarm_from_json(const nlohmann::json& json_alarm);

nlohmann::json to_json(const AlarmConfig& config);
AlarmConfig alarm_config_from_json(const nlohmann::json& json_config);

nlohmann::json to_json(const EngineConfig& config);
EngineConfig engine_config_from_json(const nlohmann::json& json_config);

nlohmann::json to_json(const OptimalTimeSlot& slot);
nlohmann::json to_json(const SmartAlarmMetrics& metrics);
nlohmann::json to_json(const metrics::ConditionAudit& audit);
nlohmann::json to_json(const TickOutcome& outcome);

} // namespace wake::bridge

#pragma once

#include "config.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace wake::metrics {

struct MetricsInput {
  Alarm alarm;
  std::vector<ConditionDefinition> conditions;
  std::vector<WakeUpFeedback> feedback;
  std::vector<AdaptationRecord> history;
  int consecutive_failures = 0;
  Timestamp now;
};

SmartAlarmMetrics compute_metrics(const MetricsInput& input, const EngineConfig& config);

std::vector<SmartRecommendation> recommendations(const MetricsInput& input,
                                                 const std::vector<WakeUpFeedback>& recent_feedback,
                                                 const EngineConfig& config);

struct ConditionAudit {
  bool valid = true;
  int score = 100;
  std::string grade;
  std::vector<std::string> issues;
  std::vector<std::string> recommendations;
  std::size_t enabled_conditions = 0;
  std::size_t total_conditions = 0;
};

ConditionAudit audit_conditions(const Alarm& alarm,
                                const std::vector<ConditionDefinition>& conditions);

} // namespace wake::metrics

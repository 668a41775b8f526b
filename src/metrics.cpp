#include "wake/metrics.hpp"

#include "../scoring/feedback_scoring.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

namespace wake::metrics {

namespace {

Timestamp days_before(Timestamp now, int days) {
  return now - std::chrono::hours(24) * days;
}

std::vector<WakeUpFeedback> recent_feedback(const MetricsInput& input, const EngineConfig& config) {
  const Timestamp cutoff = days_before(input.now, config.metrics_window_days);
  std::vector<WakeUpFeedback> recent;
  for (const auto& entry : input.feedback) {
    if (entry.date > cutoff) {
      recent.push_back(entry);
    }
  }
  return recent;
}

double adaptation_success(const MetricsInput& input, const EngineConfig& config) {
  const Timestamp cutoff = days_before(input.now, config.metrics_window_days);
  double sum = 0.0;
  std::size_t count = 0;
  for (const auto& record : input.history) {
    if (record.date > cutoff && record.effectiveness.has_value()) {
      sum += record.effectiveness.value();
      ++count;
    }
  }
  return count == 0 ? 0.5 : sum / static_cast<double>(count);
}

std::vector<ConditionType> most_effective_types(const std::vector<ConditionDefinition>& conditions) {
  std::vector<ConditionDefinition> ranked = conditions;
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const ConditionDefinition& a, const ConditionDefinition& b) {
                     return a.effectiveness_score > b.effectiveness_score;
                   });
  std::vector<ConditionType> types;
  for (const auto& def : ranked) {
    if (types.size() == 3) {
      break;
    }
    if (std::find(types.begin(), types.end(), def.type) == types.end()) {
      types.push_back(def.type);
    }
  }
  return types;
}

} // namespace

std::vector<SmartRecommendation> recommendations(const MetricsInput& input,
                                                 const std::vector<WakeUpFeedback>& recent,
                                                 const EngineConfig& config) {
  std::vector<SmartRecommendation> out;

  if (!recent.empty()) {
    if (scoring::average_difficulty(recent) > 3.5) {
      SmartRecommendation rec;
      rec.type = RecommendationType::TimeAdjustment;
      rec.description =
          "Consider moving your alarm 15-20 minutes earlier to align with lighter sleep phases";
      rec.impact = RecommendationImpact::Medium;
      rec.confidence = 0.7;
      rec.action = {"adjust_wake_window", "wake_window", input.alarm.wake_window + 10.0};
      out.push_back(std::move(rec));
    }
    if (scoring::average_satisfaction(recent) < 0.4) {
      SmartRecommendation rec;
      rec.type = RecommendationType::SleepGoalUpdate;
      rec.description =
          "Your sleep goals may need adjustment. Consider going to bed 30 minutes earlier";
      rec.impact = RecommendationImpact::High;
      rec.confidence = 0.8;
      rec.action = {"adjust_bedtime", "bedtime", -30.0};
      out.push_back(std::move(rec));
    }
  }

  for (const auto& def : input.conditions) {
    if (def.enabled && def.effectiveness_score < 0.4) {
      SmartRecommendation rec;
      rec.type = RecommendationType::ConditionChange;
      rec.description = "Condition '" + def.id +
                        "' has not been helping your wake-ups. Consider disabling it";
      rec.impact = RecommendationImpact::Low;
      rec.confidence = 0.6;
      rec.action = {"disable_condition", def.id, def.effectiveness_score};
      out.push_back(std::move(rec));
    }
  }

  if (input.alarm.real_time_adaptation) {
    const Timestamp stale_cutoff = days_before(input.now, config.stale_adaptation_days);
    const bool old_enough = input.alarm.created_at <= stale_cutoff;
    const bool adapted_recently =
        std::any_of(input.history.begin(), input.history.end(),
                    [&](const AdaptationRecord& record) { return record.date > stale_cutoff; });
    if (old_enough && !adapted_recently) {
      SmartRecommendation rec;
      rec.type = RecommendationType::ConditionChange;
      rec.description =
          "No recent adaptations despite being enabled. Check that condition and sleep data "
          "are reaching the alarm";
      rec.impact = RecommendationImpact::Medium;
      rec.confidence = 0.6;
      rec.action = {"review_conditions", input.alarm.id,
                    static_cast<double>(config.stale_adaptation_days)};
      out.push_back(std::move(rec));
    }
  }

  if (input.consecutive_failures >= config.failure_advisory_threshold) {
    SmartRecommendation rec;
    rec.type = RecommendationType::ConditionChange;
    rec.description = "Smart adjustments have failed " +
                      std::to_string(input.consecutive_failures) +
                      " times in a row. Check the sleep tracker and condition sources";
    rec.impact = RecommendationImpact::High;
    rec.confidence = 0.9;
    rec.action = {"check_sources", input.alarm.id,
                  static_cast<double>(input.consecutive_failures)};
    out.push_back(std::move(rec));
  }
  return out;
}

SmartAlarmMetrics compute_metrics(const MetricsInput& input, const EngineConfig& config) {
  const auto recent = recent_feedback(input, config);

  SmartAlarmMetrics metrics;
  metrics.alarm_id = input.alarm.id;
  metrics.feedback_count = recent.size();
  metrics.average_wake_up_difficulty = scoring::average_difficulty(recent);
  const std::size_t trend = std::min<std::size_t>(7, recent.size());
  for (auto it = recent.end() - static_cast<std::ptrdiff_t>(trend); it != recent.end(); ++it) {
    metrics.sleep_quality_trend.push_back(it->sleep_quality);
  }
  metrics.adaptation_success = adaptation_success(input, config);
  metrics.user_satisfaction = scoring::average_satisfaction(recent);
  metrics.most_effective_conditions = most_effective_types(input.conditions);
  metrics.recommendations = recommendations(input, recent, config);
  return metrics;
}

ConditionAudit audit_conditions(const Alarm& alarm,
                                const std::vector<ConditionDefinition>& conditions) {
  ConditionAudit audit;
  audit.total_conditions = conditions.size();

  if (conditions.empty()) {
    audit.issues.emplace_back("No conditions configured");
    audit.recommendations.emplace_back("Enable basic conditions (weather, calendar, sleep debt)");
    audit.score -= 40;
  }

  std::size_t critical = 0;
  std::size_t poor = 0;
  bool has_weather = false;
  bool has_calendar = false;
  bool has_sleep_debt = false;
  for (const auto& def : conditions) {
    if (!def.enabled) {
      continue;
    }
    ++audit.enabled_conditions;
    has_weather = has_weather || def.type == ConditionType::Weather;
    has_calendar = has_calendar || def.type == ConditionType::Calendar;
    has_sleep_debt = has_sleep_debt || def.type == ConditionType::SleepDebt;
    if (def.priority == 5) {
      ++critical;
    }
    if (def.effectiveness_score < 0.6) {
      ++poor;
    }
  }

  if (audit.enabled_conditions < audit.total_conditions) {
    audit.issues.push_back(std::to_string(audit.total_conditions - audit.enabled_conditions) +
                           " conditions are disabled");
    audit.recommendations.emplace_back("Review and enable useful conditions");
    audit.score -= 10;
  }
  if (!has_weather) {
    audit.recommendations.emplace_back("Add weather conditions for commute optimization");
    audit.score -= 15;
  }
  if (!has_calendar) {
    audit.recommendations.emplace_back("Add calendar integration for event preparation");
    audit.score -= 15;
  }
  if (!has_sleep_debt) {
    audit.recommendations.emplace_back("Add sleep debt tracking for energy management");
    audit.score -= 20;
  }
  if (critical > 3) {
    audit.issues.emplace_back("Too many critical priority conditions may cause conflicts");
    audit.recommendations.emplace_back("Review priority levels and reduce critical conditions");
    audit.score -= 10;
  }
  if (poor > 0) {
    audit.issues.push_back(std::to_string(poor) + " conditions have low effectiveness");
    audit.recommendations.emplace_back("Disable or adjust poorly performing conditions");
    audit.score -= static_cast<int>(poor) * 5;
  }
  if (alarm.learning_factor < 0.1) {
    audit.issues.emplace_back("Learning factor too low for effective adaptation");
    audit.recommendations.emplace_back("Increase learning factor to 0.2-0.3");
    audit.score -= 10;
  } else if (alarm.learning_factor > 0.6) {
    audit.issues.emplace_back("Learning factor too high may cause instability");
    audit.recommendations.emplace_back("Reduce learning factor to 0.3-0.4");
    audit.score -= 5;
  }

  audit.valid = audit.issues.empty();
  if (audit.score >= 90) {
    audit.grade = "Excellent";
  } else if (audit.score >= 75) {
    audit.grade = "Good";
  } else if (audit.score >= 60) {
    audit.grade = "Fair";
  } else {
    audit.grade = "Poor";
  }
  return audit;
}

} // namespace wake::metrics

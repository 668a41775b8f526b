#pragma once

#include "adaptation_loop.hpp"
#include "collaborators.hpp"
#include "config.hpp"
#include "metrics.hpp"
#include "types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace wake {

class SmartAlarmEngine {
public:
  virtual ~SmartAlarmEngine() = default;

  virtual Alarm create_enhanced_alarm(const AlarmConfig& config) = 0;

  // Rebuilds an alarm's in-memory state from Storage.
  virtual Alarm restore_alarm(const std::string& alarm_id) = 0;

  virtual Alarm get_alarm(const std::string& alarm_id) const = 0;

  // Forces an immediate evaluation, e.g. after a manual calendar refresh.
  virtual TickOutcome tick_now(const std::string& alarm_id) = 0;

  virtual std::vector<OptimalTimeSlot> calculate_optimal_time_slots(const std::string& alarm_id) = 0;

  virtual void record_wake_up_feedback(const std::string& alarm_id,
                                       const WakeUpFeedback& feedback) = 0;

  virtual SmartAlarmMetrics get_metrics(const std::string& alarm_id) const = 0;

  virtual metrics::ConditionAudit audit_conditions(const std::string& alarm_id) const = 0;

  // Disabling cancels the scheduled tick; an in-flight tick stops before it
  // mutates anything.
  virtual void set_real_time_adaptation(const std::string& alarm_id, bool enabled) = 0;

  virtual std::vector<ConditionDefinition> list_conditions(const std::string& alarm_id,
                                                           bool enabled_only) const = 0;
  virtual void upsert_condition(const std::string& alarm_id, const ConditionDefinition& def) = 0;
  virtual void remove_condition(const std::string& alarm_id, const std::string& condition_id) = 0;
  virtual void apply_preset(const std::string& alarm_id, const std::string& preset_name) = 0;

  virtual std::vector<AdaptationRecord> adaptation_history(const std::string& alarm_id) const = 0;
  virtual std::vector<WakeUpFeedback> wake_up_feedback(const std::string& alarm_id) const = 0;

  virtual void start() = 0;
  virtual void stop() = 0;
};

std::unique_ptr<SmartAlarmEngine> make_engine(Collaborators collaborators,
                                              EngineConfig config = {});

} // namespace wake

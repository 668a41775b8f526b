#pragma once

#include "adaptation_blender.hpp"
#include "alarm_state.hpp"
#include "collaborators.hpp"
#include "condition_evaluator.hpp"

#include <optional>
#include <string>

namespace wake {

struct TickOutcome {
  std::string alarm_id;
  TickState state = TickState::Idle;
  ConditionEvaluation conditions;
  int sleep_adjustment = 0;
  std::optional<BlendResult> blend;
  std::optional<AdaptationRecord> record;
  std::string detail;
};

// One evaluate -> blend -> (apply | skip) cycle per call. Collaborator
// failures are reported and turned into a Failed outcome; the alarm keeps
// its previous time.
class AdaptationLoop {
public:
  explicit AdaptationLoop(Collaborators collaborators);

  TickOutcome tick(AlarmState& state);

private:
  TickOutcome run_tick(AlarmState& state, TickOutcome outcome);
  // New time first, then the record; a failed append restores the stored time.
  void persist_adaptation(const Alarm& previous, const Alarm& updated, const AdaptationRecord& record);
  TickOutcome finish(AlarmState& state, TickOutcome outcome, TickState result);
  std::string build_reason(const ConditionEvaluation& evaluation, int sleep_adjustment) const;

  Collaborators collaborators_;
};

} // namespace wake

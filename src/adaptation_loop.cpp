#include "wake/adaptation_loop.hpp"

#include "debug_log.hpp"
#include "wake/sleep_pattern.hpp"
#include "wake/time_of_day.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace wake {

namespace {

std::string format_minutes(double minutes) {
  const double rounded = std::round(minutes * 10.0) / 10.0;
  std::ostringstream oss;
  if (rounded == std::floor(rounded)) {
    oss << static_cast<long long>(rounded);
  } else {
    oss << rounded;
  }
  oss << "min";
  return oss.str();
}

} // namespace

AdaptationLoop::AdaptationLoop(Collaborators collaborators)
    : collaborators_(std::move(collaborators)) {
  if (!collaborators_.storage) {
    throw ValidationError("AdaptationLoop requires a storage collaborator");
  }
  if (!collaborators_.clock) {
    collaborators_.clock = [] { return std::chrono::system_clock::now(); };
  }
  if (!collaborators_.error_reporter) {
    collaborators_.error_reporter = std::make_shared<StderrErrorReporter>();
  }
}

TickOutcome AdaptationLoop::tick(AlarmState& state) {
  std::lock_guard<std::mutex> serial(state.tick_mutex);

  TickOutcome outcome;
  bool enabled = true;
  {
    std::lock_guard<std::mutex> lock(state.mutex);
    outcome.alarm_id = state.alarm.id;
    enabled = state.alarm.enabled;
    state.state = TickState::Evaluating;
  }

  if (!state.adaptation_active.load()) {
    outcome.detail = "real-time adaptation disabled";
    return finish(state, std::move(outcome), TickState::Cancelled);
  }
  if (!enabled) {
    outcome.detail = "alarm disabled";
    return finish(state, std::move(outcome), TickState::Skipped);
  }

  const std::string alarm_id = outcome.alarm_id;
  try {
    return run_tick(state, std::move(outcome));
  } catch (const std::exception& ex) {
    collaborators_.error_reporter->report(ex, "adaptation tick for alarm '" + alarm_id + "'");
    TickOutcome failed;
    failed.alarm_id = alarm_id;
    failed.detail = ex.what();
    return finish(state, std::move(failed), TickState::Failed);
  }
}

TickOutcome AdaptationLoop::run_tick(AlarmState& state, TickOutcome outcome) {
  Alarm alarm;
  std::vector<WakeUpFeedback> feedback;
  {
    std::lock_guard<std::mutex> lock(state.mutex);
    alarm = state.alarm;
    feedback = state.feedback;
  }

  if (!collaborators_.readings) {
    throw CollaboratorUnavailableError("no condition reading source configured");
  }
  if (!collaborators_.sleep_predictor) {
    throw CollaboratorUnavailableError("no sleep stage predictor configured");
  }

  const ConditionReading readings = collaborators_.readings->current_readings();
  const auto pattern = collaborators_.sleep_predictor->current_pattern();
  if (!pattern.has_value()) {
    outcome.detail = "no sleep pattern available";
    return finish(state, std::move(outcome), TickState::Skipped);
  }
  const auto recommendation = collaborators_.sleep_predictor->recommend(alarm);

  outcome.conditions = evaluate_conditions(state.catalog->list(true), readings);
  for (const auto& id : outcome.conditions.rejected) {
    debug_log("wake", alarm.id + ": reading shape rejected for condition " + id);
  }
  outcome.sleep_adjustment =
      sleep::sleep_pattern_adjustment(alarm, pattern.value(), recommendation, feedback);
  const BlendResult blend = blend_adjustments(outcome.conditions.total_adjustment,
                                              outcome.sleep_adjustment,
                                              alarm.sleep_pattern_weight);
  outcome.blend = blend;

  if (!state.adaptation_active.load()) {
    outcome.detail = "cancelled during evaluation";
    return finish(state, std::move(outcome), TickState::Cancelled);
  }

  // Fired conditions are stamped whether or not the alarm moves; same-day
  // feedback learns from them either way.
  const Timestamp now = collaborators_.clock();
  std::vector<std::string> fired_ids;
  for (const auto& fired : outcome.conditions.fired) {
    fired_ids.push_back(fired.condition_id);
  }
  if (!fired_ids.empty()) {
    try {
      state.catalog->mark_triggered(fired_ids, now);
    } catch (const std::exception& ex) {
      collaborators_.error_reporter->report(ex, "marking triggered conditions for '" + alarm.id + "'");
    }
  }

  if (!blend.significant) {
    outcome.detail = "adjustment below significance threshold";
    return finish(state, std::move(outcome), TickState::Skipped);
  }

  const int target = clamp_to_window(alarm.baseline_time, blend.adjustment, alarm.wake_window);
  if (target == alarm.current_time) {
    outcome.detail = "alarm already at " + time::format_hhmm(target);
    return finish(state, std::move(outcome), TickState::Skipped);
  }

  if (!state.adaptation_active.load()) {
    outcome.detail = "cancelled before apply";
    return finish(state, std::move(outcome), TickState::Cancelled);
  }

  AdaptationRecord record;
  Alarm previous;
  {
    // A sequence is never handed out twice, even if the writes below fail.
    std::lock_guard<std::mutex> lock(state.mutex);
    record.sequence = state.next_sequence++;
    previous = state.alarm;
  }
  record.date = now;
  record.original_time = alarm.baseline_time;
  record.adjusted_time = target;
  record.adjustment_minutes = time::signed_delta(alarm.baseline_time, target);
  record.reason = build_reason(outcome.conditions, outcome.sleep_adjustment);
  record.source = blend.dominant;
  record.condition_ids = fired_ids;
  record.confidence = blend.confidence;

  Alarm updated = previous;
  updated.current_time = target;
  persist_adaptation(previous, updated, record);

  {
    std::lock_guard<std::mutex> lock(state.mutex);
    state.alarm.current_time = target;
    state.history.push_back(record);
  }

  if (collaborators_.notifier) {
    try {
      collaborators_.notifier->on_schedule_changed(alarm.id, target, record.confidence,
                                                   record.reason);
    } catch (const std::exception& ex) {
      collaborators_.error_reporter->report(ex, "schedule notification for '" + alarm.id + "'");
    }
  }

  outcome.record = record;
  outcome.detail = "alarm moved to " + time::format_hhmm(target);
  return finish(state, std::move(outcome), TickState::Applied);
}

void AdaptationLoop::persist_adaptation(const Alarm& previous,
                                        const Alarm& updated,
                                        const AdaptationRecord& record) {
  collaborators_.storage->save_alarm(updated);
  try {
    collaborators_.storage->append_adaptation(updated.id, record);
  } catch (const std::exception&) {
    try {
      collaborators_.storage->save_alarm(previous);
    } catch (const std::exception& rollback) {
      collaborators_.error_reporter->report(
          rollback, "restoring stored time for alarm '" + updated.id + "'");
    }
    throw;
  }
}

TickOutcome AdaptationLoop::finish(AlarmState& state, TickOutcome outcome, TickState result) {
  const Timestamp now = collaborators_.clock();
  {
    std::lock_guard<std::mutex> lock(state.mutex);
    state.state = TickState::Idle;
    state.last_tick = now;
    if (result == TickState::Failed) {
      ++state.consecutive_failures;
    } else if (result == TickState::Applied || result == TickState::Skipped) {
      state.consecutive_failures = 0;
    }
  }
  outcome.state = result;
  debug_log("wake", outcome.alarm_id + " tick " + to_string(result) + ": " + outcome.detail);
  return outcome;
}

std::string AdaptationLoop::build_reason(const ConditionEvaluation& evaluation,
                                         int sleep_adjustment) const {
  std::string reason = "Conditions: ";
  if (evaluation.fired.empty()) {
    reason += "none";
  }
  for (std::size_t i = 0; i < evaluation.fired.size(); ++i) {
    if (i > 0) {
      reason += ", ";
    }
    reason += to_string(evaluation.fired[i].type) + ": " +
              format_minutes(evaluation.fired[i].applied_minutes);
  }
  reason += ". Sleep pattern: " + format_minutes(sleep_adjustment);
  return reason;
}

} // namespace wake

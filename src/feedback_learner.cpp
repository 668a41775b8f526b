#include "wake/feedback_learner.hpp"

#include "../scoring/feedback_scoring.hpp"
#include "debug_log.hpp"
#include "wake/time_of_day.hpp"

#include <sstream>
#include <utility>

namespace wake {

LearningResult learn_from_feedback(const WakeUpFeedback& feedback,
                                   const std::vector<ConditionDefinition>& conditions,
                                   const std::vector<AdaptationRecord>& history,
                                   double learning_factor,
                                   int utc_offset_minutes) {
  LearningResult result;
  result.effectiveness = scoring::feedback_effectiveness(feedback);

  for (const auto& def : conditions) {
    if (!def.last_triggered.has_value() ||
        !time::same_local_day(def.last_triggered.value(), feedback.date, utc_offset_minutes)) {
      continue;
    }
    EffectivenessUpdate update;
    update.condition_id = def.id;
    update.previous = def.effectiveness_score;
    update.updated = scoring::ema_update(def.effectiveness_score, result.effectiveness,
                                         learning_factor);
    result.condition_updates.push_back(std::move(update));
  }

  for (std::size_t i = 0; i < history.size(); ++i) {
    const auto& record = history[i];
    if (record.effectiveness.has_value()) {
      continue;
    }
    if (time::same_local_day(record.date, feedback.date, utc_offset_minutes)) {
      result.backfilled_records.push_back(i);
    }
  }
  return result;
}

FeedbackLearner::FeedbackLearner(std::shared_ptr<Storage> storage, int utc_offset_minutes)
    : storage_(std::move(storage)), utc_offset_minutes_(utc_offset_minutes) {}

LearningResult FeedbackLearner::record_feedback(AlarmState& state, const WakeUpFeedback& feedback) {
  feedback.validate();
  std::lock_guard<std::mutex> serial(state.feedback_mutex);

  std::string alarm_id;
  double learning_factor = 0.0;
  std::vector<AdaptationRecord> history;
  {
    std::lock_guard<std::mutex> lock(state.mutex);
    alarm_id = state.alarm.id;
    learning_factor = state.alarm.learning_factor;
    history = state.history;
  }

  storage_->append_feedback(alarm_id, feedback);
  {
    std::lock_guard<std::mutex> lock(state.mutex);
    state.feedback.push_back(feedback);
  }

  const auto conditions = state.catalog->list();
  LearningResult result =
      learn_from_feedback(feedback, conditions, history, learning_factor, utc_offset_minutes_);

  for (const auto& update : result.condition_updates) {
    state.catalog->update_effectiveness(update.condition_id, update.updated);
  }

  for (std::size_t index : result.backfilled_records) {
    const auto sequence = history[index].sequence;
    storage_->set_adaptation_effectiveness(alarm_id, sequence, result.effectiveness);
    std::lock_guard<std::mutex> lock(state.mutex);
    if (index < state.history.size() && state.history[index].sequence == sequence) {
      state.history[index].effectiveness = result.effectiveness;
    }
  }

  if (debug_enabled()) {
    std::ostringstream oss;
    oss << alarm_id << " feedback effectiveness=" << result.effectiveness
        << " conditions=" << result.condition_updates.size()
        << " backfilled=" << result.backfilled_records.size();
    debug_log("wake", oss.str());
  }
  return result;
}

} // namespace wake

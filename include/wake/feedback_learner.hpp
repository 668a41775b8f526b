#pragma once

#include "alarm_state.hpp"
#include "collaborators.hpp"
#include "types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace wake {

struct EffectivenessUpdate {
  std::string condition_id;
  double previous = 0.0;
  double updated = 0.0;
};

struct LearningResult {
  double effectiveness = 0.0;
  std::vector<EffectivenessUpdate> condition_updates;
  std::vector<std::size_t> backfilled_records; // indices into history
};

// Pure scoring step: which conditions and records a piece of feedback
// touches, and their new values. Nothing is mutated.
LearningResult learn_from_feedback(const WakeUpFeedback& feedback,
                                   const std::vector<ConditionDefinition>& conditions,
                                   const std::vector<AdaptationRecord>& history,
                                   double learning_factor,
                                   int utc_offset_minutes);

class FeedbackLearner {
public:
  FeedbackLearner(std::shared_ptr<Storage> storage, int utc_offset_minutes);

  // Appends the feedback, then applies learn_from_feedback to the catalog
  // and history. Storage failures propagate to the caller.
  LearningResult record_feedback(AlarmState& state, const WakeUpFeedback& feedback);

private:
  std::shared_ptr<Storage> storage_;
  int utc_offset_minutes_ = 0;
};

} // namespace wake

#pragma once

#include "types.hpp"

#include <string>
#include <vector>

namespace wake {

struct FiredCondition {
  std::string condition_id;
  ConditionType type = ConditionType::Weather;
  double applied_minutes = 0.0;
  std::string reason;
};

struct ConditionEvaluation {
  std::vector<FiredCondition> fired;
  double total_adjustment = 0.0;
  // Conditions whose reading had the wrong shape for their type or operator.
  std::vector<std::string> rejected;
};

// Pure: no clock, no catalog writes. The caller stamps lastTriggered.
ConditionEvaluation evaluate_conditions(const std::vector<ConditionDefinition>& definitions,
                                        const ConditionReading& reading);

bool reading_shape_valid(ConditionType type, const ConditionValue& value);

// nullopt when the reading cannot be compared with the predicate.
std::optional<bool> predicate_matches(const ConditionPredicate& predicate,
                                      const ConditionValue& reading);

// minutes * effectiveness, clamped to +/- maxAdjustment.
double applied_adjustment(const ConditionDefinition& def);

std::string stringify(const ConditionValue& value);

} // namespace wake

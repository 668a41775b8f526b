#include "wake/condition_evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace wake {

namespace {

bool is_number(const ConditionValue& value) {
  return std::holds_alternative<double>(value);
}

bool is_text(const ConditionValue& value) {
  return std::holds_alternative<std::string>(value) ||
         std::holds_alternative<std::vector<std::string>>(value);
}

std::optional<double> comparand(const ConditionPredicate& predicate) {
  if (predicate.threshold.has_value()) {
    return predicate.threshold;
  }
  if (const auto* number = std::get_if<double>(&predicate.value)) {
    return *number;
  }
  return std::nullopt;
}

bool contains_one(const ConditionValue& reading, const std::string& needle) {
  if (const auto* list = std::get_if<std::vector<std::string>>(&reading)) {
    return std::find(list->begin(), list->end(), needle) != list->end();
  }
  return stringify(reading).find(needle) != std::string::npos;
}

} // namespace

std::string stringify(const ConditionValue& value) {
  if (const auto* number = std::get_if<double>(&value)) {
    if (std::isfinite(*number) && std::floor(*number) == *number && std::fabs(*number) < 1e15) {
      return std::to_string(static_cast<long long>(*number));
    }
    std::ostringstream out;
    out << std::setprecision(15) << *number;
    return out.str();
  }
  if (const auto* text = std::get_if<std::string>(&value)) {
    return *text;
  }
  if (const auto* flag = std::get_if<bool>(&value)) {
    return *flag ? "true" : "false";
  }
  const auto& list = std::get<std::vector<std::string>>(value);
  std::string joined;
  for (std::size_t i = 0; i < list.size(); ++i) {
    if (i > 0) {
      joined += ",";
    }
    joined += list[i];
  }
  return joined;
}

bool reading_shape_valid(ConditionType type, const ConditionValue& value) {
  switch (type) {
    case ConditionType::Weather:
      return is_text(value);
    case ConditionType::Calendar:
      return is_text(value) || is_number(value);
    case ConditionType::SleepDebt:
    case ConditionType::StressLevel:
    case ConditionType::ScreenTime:
      return is_number(value);
    case ConditionType::Exercise:
      return is_number(value) || std::holds_alternative<bool>(value);
  }
  return false;
}

std::optional<bool> predicate_matches(const ConditionPredicate& predicate,
                                      const ConditionValue& reading) {
  switch (predicate.op) {
    case PredicateOperator::Equals:
      return reading == predicate.value;
    case PredicateOperator::GreaterThan:
    case PredicateOperator::LessThan: {
      const auto* observed = std::get_if<double>(&reading);
      const auto bound = comparand(predicate);
      if (observed == nullptr || !bound.has_value()) {
        return std::nullopt;
      }
      return predicate.op == PredicateOperator::GreaterThan ? *observed > *bound
                                                            : *observed < *bound;
    }
    case PredicateOperator::Contains: {
      if (const auto* needles = std::get_if<std::vector<std::string>>(&predicate.value)) {
        return std::any_of(needles->begin(), needles->end(),
                           [&](const std::string& needle) { return contains_one(reading, needle); });
      }
      return contains_one(reading, stringify(predicate.value));
    }
  }
  return std::nullopt;
}

double applied_adjustment(const ConditionDefinition& def) {
  const double limit = static_cast<double>(def.adjustment.max_adjustment);
  const double raw = static_cast<double>(def.adjustment.minutes) * def.effectiveness_score;
  return std::clamp(raw, -limit, limit);
}

ConditionEvaluation evaluate_conditions(const std::vector<ConditionDefinition>& definitions,
                                        const ConditionReading& reading) {
  ConditionEvaluation evaluation;
  for (const auto& def : definitions) {
    if (!def.enabled) {
      continue;
    }
    auto it = reading.find(def.type);
    if (it == reading.end()) {
      continue;
    }
    if (!reading_shape_valid(def.type, it->second)) {
      evaluation.rejected.push_back(def.id);
      continue;
    }
    const auto matched = predicate_matches(def.predicate, it->second);
    if (!matched.has_value()) {
      evaluation.rejected.push_back(def.id);
      continue;
    }
    if (!matched.value()) {
      continue;
    }
    FiredCondition fired;
    fired.condition_id = def.id;
    fired.type = def.type;
    fired.applied_minutes = applied_adjustment(def);
    fired.reason = def.adjustment.reason;
    evaluation.total_adjustment += fired.applied_minutes;
    evaluation.fired.push_back(std::move(fired));
  }
  return evaluation;
}

} // namespace wake

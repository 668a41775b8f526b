#include "feedback_scoring.hpp"

#include <algorithm>

namespace wake::scoring {

int difficulty_ordinal(WakeDifficulty difficulty) {
  return static_cast<int>(difficulty) + 1;
}

double difficulty_score(WakeDifficulty difficulty) {
  return static_cast<double>(5 - static_cast<int>(difficulty)) / 5.0;
}

double feeling_score(WakeFeeling feeling) {
  return static_cast<double>(static_cast<int>(feeling)) / 4.0;
}

double quality_score(int sleep_quality) {
  return detail::clip01(static_cast<double>(sleep_quality) / 10.0);
}

double feedback_effectiveness(const WakeUpFeedback& feedback) {
  return (difficulty_score(feedback.difficulty) + feeling_score(feedback.feeling) +
          quality_score(feedback.sleep_quality)) /
         3.0;
}

double ema_update(double current, double observed, double learning_factor) {
  const double factor = detail::clip01(learning_factor);
  return detail::clip01(current * (1.0 - factor) + observed * factor);
}

double feedback_consistency_factor(const std::vector<WakeUpFeedback>& feedback,
                                   std::size_t window) {
  if (feedback.empty() || window == 0) {
    return 1.0;
  }
  const std::size_t count = std::min(window, feedback.size());
  const std::vector<WakeUpFeedback> recent(feedback.end() - static_cast<std::ptrdiff_t>(count),
                                           feedback.end());
  return 0.6 + (5.0 - average_difficulty(recent)) * 0.1;
}

double average_difficulty(const std::vector<WakeUpFeedback>& feedback) {
  if (feedback.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const auto& entry : feedback) {
    sum += difficulty_ordinal(entry.difficulty);
  }
  return sum / static_cast<double>(feedback.size());
}

double average_satisfaction(const std::vector<WakeUpFeedback>& feedback) {
  if (feedback.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const auto& entry : feedback) {
    sum += feeling_score(entry.feeling);
  }
  return sum / static_cast<double>(feedback.size());
}

} // namespace wake::scoring

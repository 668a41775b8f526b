#include "wake/adaptation_blender.hpp"

#include "wake/time_of_day.hpp"

#include <algorithm>
#include <cmath>

namespace wake {

double adjustment_confidence(double condition_adjustment, double sleep_adjustment) {
  const double agreement =
      std::fabs(condition_adjustment - sleep_adjustment) < kAgreementWindowMinutes ? 0.3 : 0.0;
  const double magnitude = std::min(0.3, std::fabs(condition_adjustment + sleep_adjustment) / 30.0);
  return std::min(1.0, 0.5 + agreement + magnitude);
}

BlendResult blend_adjustments(double condition_adjustment,
                              double sleep_adjustment,
                              double sleep_pattern_weight) {
  const double weight = detail::clip01(sleep_pattern_weight);

  BlendResult result;
  result.condition_contribution = condition_adjustment * (1.0 - weight);
  result.sleep_contribution = sleep_adjustment * weight;
  result.adjustment =
      detail::round_half_up(result.condition_contribution + result.sleep_contribution);
  result.significant = std::abs(result.adjustment) >= kSignificanceThresholdMinutes;
  result.confidence = adjustment_confidence(condition_adjustment, sleep_adjustment);
  // Ties go to the condition side.
  result.dominant = std::fabs(result.sleep_contribution) > std::fabs(result.condition_contribution)
                        ? AdaptationSource::SleepPattern
                        : AdaptationSource::Condition;
  return result;
}

int clamp_to_window(int baseline, int adjustment, int wake_window) {
  const int bound = std::max(0, wake_window);
  return time::wrap(baseline + std::clamp(adjustment, -bound, bound));
}

} // namespace wake

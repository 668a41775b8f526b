#pragma once

#include "types.hpp"

namespace wake {

constexpr int kSignificanceThresholdMinutes = 5;
constexpr double kAgreementWindowMinutes = 10.0;

struct BlendResult {
  int adjustment = 0;
  bool significant = false;
  double confidence = 0.5;
  double condition_contribution = 0.0;
  double sleep_contribution = 0.0;
  AdaptationSource dominant = AdaptationSource::Condition;
};

BlendResult blend_adjustments(double condition_adjustment,
                              double sleep_adjustment,
                              double sleep_pattern_weight);

double adjustment_confidence(double condition_adjustment, double sleep_adjustment);

// Absolute minute of day for baseline + adjustment with the offset held to
// +/- wake_window.
int clamp_to_window(int baseline, int adjustment, int wake_window);

} // namespace wake

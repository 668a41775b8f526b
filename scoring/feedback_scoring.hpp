#pragma once

#include "wake/types.hpp"

#include <vector>

namespace wake::scoring {

// 1 (very_easy) .. 5 (very_hard)
int difficulty_ordinal(WakeDifficulty difficulty);

// Easier wake-ups score higher: very_easy = 1.0 .. very_hard = 0.2.
double difficulty_score(WakeDifficulty difficulty);

// terrible = 0.0 .. excellent = 1.0
double feeling_score(WakeFeeling feeling);

double quality_score(int sleep_quality);

// Mean of the difficulty, feeling and quality scores.
double feedback_effectiveness(const WakeUpFeedback& feedback);

double ema_update(double current, double observed, double learning_factor);

// 0.6 + (5 - mean difficulty ordinal) * 0.1 over the last `window` entries,
// 1.0 without feedback.
double feedback_consistency_factor(const std::vector<WakeUpFeedback>& feedback,
                                   std::size_t window = 10);

double average_difficulty(const std::vector<WakeUpFeedback>& feedback);
double average_satisfaction(const std::vector<WakeUpFeedback>& feedback);

} // namespace wake::scoring

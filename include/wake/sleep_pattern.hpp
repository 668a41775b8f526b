#pragma once

#include "collaborators.hpp"
#include "types.hpp"

#include <optional>
#include <vector>

namespace wake::sleep {

constexpr int kSlotStepMinutes = 5;
constexpr int kSlotLateBufferMinutes = 10;
constexpr std::size_t kMaxSlots = 5;
constexpr std::size_t kPreferenceFeedbackWindow = 5;
constexpr int kPreferenceRadiusMinutes = 15;

// Stage of the prediction point closest to `minute_of_day` on the 24h
// circle. An empty prediction reads as light sleep.
SleepStage stage_at(const std::vector<StagePoint>& stages, int minute_of_day);

// Multiplicative factor from the last five feedback entries whose actual
// wake time lies within 15 minutes of `minute_of_day`.
double time_preference_factor(const std::vector<WakeUpFeedback>& feedback, int minute_of_day);

// Top five candidates in [baseline - window, baseline + 10] by confidence.
std::vector<OptimalTimeSlot> optimal_time_slots(const Alarm& alarm,
                                                const std::vector<StagePoint>& stages,
                                                const std::vector<WakeUpFeedback>& feedback);

int dynamic_wake_window(const Alarm& alarm,
                        const SleepPattern& pattern,
                        const std::vector<WakeUpFeedback>& feedback);

// Signed minutes from baseline to the predictor's recommendation, clamped to
// the dynamic (or static) wake window. Zero without a recommendation.
int sleep_pattern_adjustment(const Alarm& alarm,
                             const SleepPattern& pattern,
                             const std::optional<WakeRecommendation>& recommendation,
                             const std::vector<WakeUpFeedback>& feedback);

} // namespace wake::sleep

#include "../include/wake/adaptation_blender.hpp"
#include "../include/wake/feedback_learner.hpp"
#include "../include/wake/metrics.hpp"
#include "../include/wake/sleep_pattern.hpp"
#include "../include/wake/time_of_day.hpp"
#include "../include/resources/condition_presets.hpp"
#include "scoring/feedback_scoring.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

bool near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

// Noon UTC on a fixed day.
const wake::Timestamp kNoon = wake::time::from_epoch_ms(1697803200000LL);

wake::Alarm make_alarm(int baseline, int window) {
  wake::Alarm alarm;
  alarm.id = "alarm";
  alarm.baseline_time = baseline;
  alarm.current_time = baseline;
  alarm.wake_window = window;
  return alarm;
}

wake::WakeUpFeedback make_feedback(wake::WakeDifficulty difficulty,
                                   wake::WakeFeeling feeling,
                                   int quality,
                                   int actual_wake_time,
                                   wake::Timestamp date) {
  wake::WakeUpFeedback feedback;
  feedback.date = date;
  feedback.original_time = actual_wake_time;
  feedback.actual_wake_time = actual_wake_time;
  feedback.difficulty = difficulty;
  feedback.feeling = feeling;
  feedback.sleep_quality = quality;
  return feedback;
}

std::vector<wake::StagePoint> morning_stages() {
  return {{400, wake::SleepStage::Deep},
          {410, wake::SleepStage::Light},
          {420, wake::SleepStage::Rem}};
}

void test_scoring(TestSuite& suite) {
  using wake::WakeDifficulty;
  using wake::WakeFeeling;

  auto best = make_feedback(WakeDifficulty::VeryEasy, WakeFeeling::Excellent, 10, 420, kNoon);
  suite.require(near(wake::scoring::feedback_effectiveness(best), 1.0),
                "best feedback should score 1.0");
  auto rough = make_feedback(WakeDifficulty::VeryHard, WakeFeeling::Okay, 5, 420, kNoon);
  suite.require(near(wake::scoring::feedback_effectiveness(rough), 0.4),
                "very hard, okay, quality 5 should score 0.4");
  suite.require(near(wake::scoring::ema_update(0.8, 0.4, 0.5), 0.6), "ema 0.8 -> 0.6");
  suite.require(near(wake::scoring::ema_update(0.8, 0.2, 0.3), 0.62), "ema with factor 0.3");
  suite.require(near(wake::scoring::feedback_consistency_factor({}), 1.0),
                "no feedback keeps the window");
  suite.require(near(wake::scoring::feedback_consistency_factor({rough, rough}), 0.6),
                "very hard mornings shrink the window factor to 0.6");
}

void test_stage_lookup(TestSuite& suite) {
  const auto stages = morning_stages();
  suite.require(wake::sleep::stage_at({}, 420) == wake::SleepStage::Light,
                "empty prediction reads as light sleep");
  suite.require(wake::sleep::stage_at(stages, 405) == wake::SleepStage::Deep,
                "ties resolve to the earlier prediction point");
  suite.require(wake::sleep::stage_at(stages, 416) == wake::SleepStage::Rem,
                "416 is closest to the REM point");
  suite.require(wake::sleep::stage_at({{1435, wake::SleepStage::Deep}, {60, wake::SleepStage::Rem}},
                                      5) == wake::SleepStage::Deep,
                "stage lookup wraps around midnight");
}

void test_optimal_slots(TestSuite& suite) {
  auto alarm = make_alarm(420, 30);
  auto slots = wake::sleep::optimal_time_slots(alarm, morning_stages(), {});
  suite.require(slots.size() == 5, "at most five slots are returned");
  if (slots.size() == 5) {
    suite.require(slots[0].minute_of_day == 415, "best slot is 06:55 in light sleep");
    suite.require(slots[0].adjustment == -5, "best slot is five minutes early");
    suite.require(slots[0].stage == wake::SleepStage::Light, "best slot stage");
    suite.require(near(slots[0].confidence, 0.8 + 0.2 - (5.0 / 30.0) * 0.2),
                  "best slot confidence");
    suite.require(slots[0].factors.size() == 3, "best slot lists three factors");
    suite.require(slots[1].minute_of_day == 410, "second slot is 06:50");
    suite.require(slots[2].minute_of_day == 420, "third slot is the REM baseline");
    for (std::size_t i = 1; i < slots.size(); ++i) {
      suite.require(slots[i - 1].confidence >= slots[i].confidence,
                    "slots are ordered by confidence");
    }
  }

  std::vector<wake::WakeUpFeedback> feedback{
      make_feedback(wake::WakeDifficulty::Hard, wake::WakeFeeling::Terrible, 4, 415, kNoon)};
  slots = wake::sleep::optimal_time_slots(alarm, morning_stages(), feedback);
  suite.require(!slots.empty() && slots[0].minute_of_day == 430,
                "a terrible morning near 06:55 pushes the best slot to 07:10");

  auto flat = wake::sleep::optimal_time_slots(alarm, {}, {});
  suite.require(!flat.empty() && flat[0].minute_of_day == 420 && near(flat[0].confidence, 1.0),
                "without stages the baseline wins at full confidence");

  auto fixed = wake::sleep::optimal_time_slots(make_alarm(420, 0), {}, {});
  suite.require(fixed.size() == 3, "zero window yields baseline and the late buffer");
  if (fixed.size() == 3) {
    suite.require(near(fixed[0].confidence, 1.0) && near(fixed[1].confidence, 0.8),
                  "zero window proximity bonus only at the baseline");
  }

  auto midnight = wake::sleep::optimal_time_slots(make_alarm(5, 30), {}, {});
  bool wrapped = false;
  for (const auto& slot : midnight) {
    wrapped = wrapped || slot.minute_of_day >= 1400;
  }
  suite.require(wrapped, "slots before midnight wrap to the previous evening");
}

void test_dynamic_window(TestSuite& suite) {
  auto alarm = make_alarm(420, 30);
  wake::SleepPattern pattern;
  pattern.sleep_efficiency = 85.0;
  suite.require(wake::sleep::dynamic_wake_window(alarm, pattern, {}) == 28,
                "85% efficiency gives a 28 minute window");

  std::vector<wake::WakeUpFeedback> hard(
      3, make_feedback(wake::WakeDifficulty::VeryHard, wake::WakeFeeling::Tired, 3, 420, kNoon));
  suite.require(wake::sleep::dynamic_wake_window(alarm, pattern, hard) == 17,
                "hard mornings shrink the window to 17");

  pattern.sleep_efficiency = 140.0;
  suite.require(wake::sleep::dynamic_wake_window(alarm, pattern, {}) == 30,
                "efficiency is clipped to 100%");

  pattern.sleep_efficiency = 85.0;
  wake::WakeRecommendation rec{400, 0.9};
  suite.require(wake::sleep::sleep_pattern_adjustment(alarm, pattern, rec, {}) == -20,
                "recommendation inside the window is used as is");
  rec.minute_of_day = 360;
  suite.require(wake::sleep::sleep_pattern_adjustment(alarm, pattern, rec, {}) == -28,
                "recommendation is clamped to the dynamic window");
  alarm.dynamic_wake_window = false;
  suite.require(wake::sleep::sleep_pattern_adjustment(alarm, pattern, rec, {}) == -30,
                "static window clamps to wake_window");
  suite.require(wake::sleep::sleep_pattern_adjustment(alarm, pattern, std::nullopt, {}) == 0,
                "no recommendation means no sleep adjustment");

  auto late = make_alarm(5, 30);
  rec.minute_of_day = 1430;
  suite.require(wake::sleep::sleep_pattern_adjustment(late, pattern, rec, {}) == -15,
                "recommendation across midnight is fifteen minutes early");
}

void test_blending(TestSuite& suite) {
  auto blend = wake::blend_adjustments(-8.0, -12.0, 0.7);
  suite.require(blend.adjustment == -11, "-8 and -12 at weight 0.7 blend to -11");
  suite.require(blend.significant, "-11 is significant");
  suite.require(near(blend.confidence, 1.0), "agreeing signals give full confidence");
  suite.require(blend.dominant == wake::AdaptationSource::SleepPattern,
                "sleep pattern dominates the -11 blend");
  suite.require(wake::time::format_hhmm(wake::clamp_to_window(420, blend.adjustment, 30)) ==
                    "06:49",
                "07:00 moves to 06:49");

  blend = wake::blend_adjustments(-8.0, 0.0, 0.7);
  suite.require(blend.adjustment == -2 && !blend.significant, "-2 stays below the threshold");
  suite.require(blend.dominant == wake::AdaptationSource::Condition, "conditions dominate -2");

  suite.require(wake::blend_adjustments(-5.0, 0.0, 0.5).adjustment == -2,
                "-2.5 rounds toward +infinity");
  suite.require(wake::blend_adjustments(5.0, 0.0, 0.5).adjustment == 3, "2.5 rounds up");

  blend = wake::blend_adjustments(10.0, 10.0, 0.5);
  suite.require(blend.dominant == wake::AdaptationSource::Condition, "ties go to conditions");

  blend = wake::blend_adjustments(30.0, -20.0, 1.5);
  suite.require(blend.adjustment == -20, "weight above 1 is clipped");
  suite.require(near(blend.confidence, 0.8), "disagreeing signals lose the agreement bonus");

  suite.require(wake::clamp_to_window(420, 45, 30) == 450, "adjustment clamps to the window");
  suite.require(wake::clamp_to_window(420, -15, 0) == 420, "zero window pins the baseline");
  suite.require(wake::clamp_to_window(10, -20, 30) == 1430, "clamped time wraps midnight");
}

void test_learning(TestSuite& suite) {
  auto conditions = wake::resources::default_conditions();
  conditions[0].last_triggered = kNoon - std::chrono::hours(5);
  conditions[1].last_triggered = kNoon - std::chrono::hours(24);
  conditions[2].last_triggered = kNoon - std::chrono::hours(13);

  std::vector<wake::AdaptationRecord> history(3);
  history[0].sequence = 1;
  history[0].date = kNoon - std::chrono::hours(30);
  history[1].sequence = 2;
  history[1].date = kNoon - std::chrono::hours(6);
  history[2].sequence = 3;
  history[2].date = kNoon - std::chrono::hours(4);
  history[2].effectiveness = 0.9;

  auto feedback =
      make_feedback(wake::WakeDifficulty::VeryHard, wake::WakeFeeling::Okay, 5, 430, kNoon);
  auto result = wake::learn_from_feedback(feedback, conditions, history, 0.5, 0);
  suite.require(near(result.effectiveness, 0.4), "feedback effectiveness is 0.4");
  suite.require(result.condition_updates.size() == 1, "only today's trigger is updated");
  if (result.condition_updates.size() == 1) {
    suite.require(result.condition_updates[0].condition_id == "weather_rain",
                  "rain triggered today");
    suite.require(near(result.condition_updates[0].updated, 0.6), "0.8 blends down to 0.6");
  }
  suite.require(result.backfilled_records.size() == 1 && result.backfilled_records[0] == 1,
                "only today's unscored record is backfilled");

  // 23:00 UTC the previous day is 01:00 local at UTC+2.
  result = wake::learn_from_feedback(feedback, conditions, history, 0.5, 120);
  suite.require(result.condition_updates.size() == 2, "local day uses the configured offset");

  double score = 0.5;
  const auto good =
      make_feedback(wake::WakeDifficulty::VeryEasy, wake::WakeFeeling::Excellent, 10, 420, kNoon);
  for (int i = 0; i < 30; ++i) {
    score = wake::scoring::ema_update(score, wake::scoring::feedback_effectiveness(good), 0.3);
  }
  suite.require(score > 0.99 && score <= 1.0, "repeated good mornings converge toward 1");

  score = 0.8;
  bool falling = true;
  for (int i = 0; i < 30; ++i) {
    const double next = wake::scoring::ema_update(score, 0.0, 0.3);
    falling = falling && next < score && next >= 0.0;
    score = next;
  }
  suite.require(falling, "repeated useless mornings lower the score at every step");
  suite.require(score < 0.01, "repeated useless mornings converge toward 0");

  score = 0.5;
  bool rising = true;
  for (int i = 0; i < 30; ++i) {
    const double next = wake::scoring::ema_update(score, 1.0, 0.3);
    rising = rising && next > score && next <= 1.0;
    score = next;
  }
  suite.require(rising, "repeated perfect mornings raise the score at every step");
}

void test_metrics(TestSuite& suite) {
  wake::EngineConfig config;
  wake::metrics::MetricsInput input;
  input.alarm = make_alarm(420, 30);
  input.alarm.created_at = kNoon - std::chrono::hours(24 * 10);
  input.conditions = wake::resources::default_conditions();
  input.now = kNoon;
  input.consecutive_failures = 3;
  input.feedback.push_back(make_feedback(wake::WakeDifficulty::Easy, wake::WakeFeeling::Good, 8,
                                         420, kNoon - std::chrono::hours(24 * 40)));
  input.feedback.push_back(make_feedback(wake::WakeDifficulty::VeryHard,
                                         wake::WakeFeeling::Terrible, 3, 420,
                                         kNoon - std::chrono::hours(48)));
  input.feedback.push_back(make_feedback(wake::WakeDifficulty::VeryHard,
                                         wake::WakeFeeling::Terrible, 4, 420,
                                         kNoon - std::chrono::hours(24)));

  auto metrics = wake::metrics::compute_metrics(input, config);
  suite.require(metrics.feedback_count == 2, "feedback older than the window is ignored");
  suite.require(near(metrics.average_wake_up_difficulty, 5.0), "average difficulty is 5");
  suite.require(metrics.sleep_quality_trend == std::vector<int>({3, 4}), "quality trend");
  suite.require(near(metrics.adaptation_success, 0.5), "no scored history means 0.5");
  suite.require(near(metrics.user_satisfaction, 0.0), "terrible mornings mean 0 satisfaction");
  suite.require(metrics.most_effective_conditions ==
                    std::vector<wake::ConditionType>({wake::ConditionType::Calendar,
                                                      wake::ConditionType::Weather,
                                                      wake::ConditionType::SleepDebt}),
                "condition types ranked by effectiveness");

  const auto& recs = metrics.recommendations;
  suite.require(recs.size() == 4, "four recommendations expected");
  if (recs.size() == 4) {
    suite.require(recs[0].type == wake::RecommendationType::TimeAdjustment &&
                      near(recs[0].action.value, 40.0),
                  "hard mornings widen the wake window by ten minutes");
    suite.require(recs[1].type == wake::RecommendationType::SleepGoalUpdate,
                  "low satisfaction suggests an earlier bedtime");
    suite.require(recs[2].action.type == "review_conditions",
                  "no adaptations for a week raises the stale advisory");
    suite.require(recs[3].action.type == "check_sources" &&
                      recs[3].impact == wake::RecommendationImpact::High,
                  "three failed ticks raise the failure advisory");
  }

  wake::AdaptationRecord record;
  record.date = kNoon - std::chrono::hours(24);
  record.effectiveness = 0.8;
  input.history.push_back(record);
  input.consecutive_failures = 0;
  input.conditions[0].effectiveness_score = 0.3;
  metrics = wake::metrics::compute_metrics(input, config);
  suite.require(near(metrics.adaptation_success, 0.8), "scored history drives success");
  bool stale = false;
  bool disable = false;
  for (const auto& rec : metrics.recommendations) {
    stale = stale || rec.action.type == "review_conditions";
    disable = disable || (rec.action.type == "disable_condition" &&
                          rec.action.target == "weather_rain");
  }
  suite.require(!stale, "a recent adaptation clears the stale advisory");
  suite.require(disable, "an ineffective condition is suggested for disabling");
}

} // namespace

int main() {
  TestSuite suite;

  test_scoring(suite);
  test_stage_lookup(suite);
  test_optimal_slots(suite);
  test_dynamic_window(suite);
  test_blending(suite);
  test_learning(suite);
  test_metrics(suite);

  if (!suite.ok) {
    std::cerr << "Adaptation tests failed" << std::endl;
    return 1;
  }
  std::cout << "Adaptation tests passed" << std::endl;
  return 0;
}

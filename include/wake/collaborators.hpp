#pragma once

#include "types.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wake {

// Summary of the recent nights as classified by the host-side sleep tracker.
struct SleepPattern {
  double sleep_efficiency = 85.0; // percent, 0-100
  int average_sleep_minutes = 0;
  int average_bedtime = 0;        // minute of day
};

struct StagePoint {
  int minute_of_day = 0;
  SleepStage stage = SleepStage::Light;
};

struct WakeRecommendation {
  int minute_of_day = 0;
  double confidence = 0.0;
};

class SleepStagePredictor {
public:
  virtual ~SleepStagePredictor() = default;

  // Latest sleep pattern, or nullopt when too little data has been collected.
  virtual std::optional<SleepPattern> current_pattern() = 0;

  virtual std::vector<StagePoint> predict(const Alarm& alarm, const SleepPattern& pattern) = 0;

  virtual std::optional<WakeRecommendation> recommend(const Alarm& alarm) = 0;
};

class ConditionReadingSource {
public:
  virtual ~ConditionReadingSource() = default;

  virtual ConditionReading current_readings() = 0;
};

class Storage {
public:
  virtual ~Storage() = default;

  virtual void save_alarm(const Alarm& alarm) = 0;
  virtual std::optional<Alarm> load_alarm(const std::string& alarm_id) = 0;

  virtual void save_condition(const std::string& alarm_id, const ConditionDefinition& def) = 0;
  virtual void remove_condition(const std::string& alarm_id, const std::string& condition_id) = 0;
  virtual std::vector<ConditionDefinition> load_conditions(const std::string& alarm_id) = 0;

  virtual void append_adaptation(const std::string& alarm_id, const AdaptationRecord& record) = 0;
  virtual void set_adaptation_effectiveness(const std::string& alarm_id,
                                            std::uint64_t sequence,
                                            double effectiveness) = 0;
  virtual std::vector<AdaptationRecord> load_adaptations(const std::string& alarm_id) = 0;

  virtual void append_feedback(const std::string& alarm_id, const WakeUpFeedback& feedback) = 0;
  virtual std::vector<WakeUpFeedback> load_feedback(const std::string& alarm_id) = 0;
};

class Notifier {
public:
  virtual ~Notifier() = default;

  // Fire-and-forget; the engine never waits for an acknowledgement.
  virtual void on_schedule_changed(const std::string& alarm_id,
                                   int new_time,
                                   double confidence,
                                   const std::string& reason) = 0;
};

class ErrorReporter {
public:
  virtual ~ErrorReporter() = default;

  virtual void report(const std::exception& error, const std::string& context) = 0;
};

class StderrErrorReporter : public ErrorReporter {
public:
  void report(const std::exception& error, const std::string& context) override;
};

struct Collaborators {
  std::shared_ptr<Storage> storage;
  std::shared_ptr<SleepStagePredictor> sleep_predictor;
  std::shared_ptr<ConditionReadingSource> readings;
  std::shared_ptr<Notifier> notifier;
  std::shared_ptr<ErrorReporter> error_reporter;
  Clock clock;
};

// Decorators that bound every call to the sleep predictor and the reading
// source by a timeout. A call that exceeds the limit raises
// CollaboratorTimeoutError; any other failure surfaces as
// CollaboratorUnavailableError. Storage is never bounded: an abandoned write
// could still land after its tick was reported Failed.
std::shared_ptr<SleepStagePredictor> make_bounded_predictor(
    std::shared_ptr<SleepStagePredictor> inner, std::chrono::milliseconds timeout);
std::shared_ptr<ConditionReadingSource> make_bounded_readings(
    std::shared_ptr<ConditionReadingSource> inner, std::chrono::milliseconds timeout);

} // namespace wake

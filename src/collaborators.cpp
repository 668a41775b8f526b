#include "wake/collaborators.hpp"

#include "bounded_call.hpp"

#include <iostream>
#include <utility>

namespace wake {

void StderrErrorReporter::report(const std::exception& error, const std::string& context) {
  std::cerr << "[wake:error] " << context << ": " << error.what() << std::endl;
}

namespace {

class BoundedPredictor : public SleepStagePredictor {
public:
  BoundedPredictor(std::shared_ptr<SleepStagePredictor> inner, std::chrono::milliseconds timeout)
      : inner_(std::move(inner)), timeout_(timeout) {}

  std::optional<SleepPattern> current_pattern() override {
    auto inner = inner_;
    return call_with_timeout([inner]() { return inner->current_pattern(); }, timeout_,
                             "sleep_predictor.current_pattern", outstanding_);
  }

  std::vector<StagePoint> predict(const Alarm& alarm, const SleepPattern& pattern) override {
    auto inner = inner_;
    return call_with_timeout([inner, alarm, pattern]() { return inner->predict(alarm, pattern); },
                             timeout_, "sleep_predictor.predict", outstanding_);
  }

  std::optional<WakeRecommendation> recommend(const Alarm& alarm) override {
    auto inner = inner_;
    return call_with_timeout([inner, alarm]() { return inner->recommend(alarm); }, timeout_,
                             "sleep_predictor.recommend", outstanding_);
  }

private:
  std::shared_ptr<SleepStagePredictor> inner_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<std::atomic<int>> outstanding_ = std::make_shared<std::atomic<int>>(0);
};

class BoundedReadings : public ConditionReadingSource {
public:
  BoundedReadings(std::shared_ptr<ConditionReadingSource> inner,
                  std::chrono::milliseconds timeout)
      : inner_(std::move(inner)), timeout_(timeout) {}

  ConditionReading current_readings() override {
    auto inner = inner_;
    return call_with_timeout([inner]() { return inner->current_readings(); }, timeout_,
                             "condition_readings.current_readings", outstanding_);
  }

private:
  std::shared_ptr<ConditionReadingSource> inner_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<std::atomic<int>> outstanding_ = std::make_shared<std::atomic<int>>(0);
};

} // namespace

std::shared_ptr<SleepStagePredictor> make_bounded_predictor(
    std::shared_ptr<SleepStagePredictor> inner, std::chrono::milliseconds timeout) {
  if (!inner) {
    return nullptr;
  }
  return std::make_shared<BoundedPredictor>(std::move(inner), timeout);
}

std::shared_ptr<ConditionReadingSource> make_bounded_readings(
    std::shared_ptr<ConditionReadingSource> inner, std::chrono::milliseconds timeout) {
  if (!inner) {
    return nullptr;
  }
  return std::make_shared<BoundedReadings>(std::move(inner), timeout);
}

} // namespace wake

#include "wake/smart_alarm_engine.hpp"

#include "debug_log.hpp"
#include "resources/condition_presets.hpp"
#include "wake/feedback_learner.hpp"
#include "wake/sleep_pattern.hpp"
#include "wake/tick_scheduler.hpp"
#include "wake/time_of_day.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <utility>

namespace wake {
namespace {

Collaborators bound_collaborators(Collaborators raw, const EngineConfig& config) {
  const std::chrono::milliseconds timeout(config.collaborator_timeout_ms);
  Collaborators bounded;
  if (!raw.storage) {
    throw ValidationError("Storage collaborator is required");
  }
  bounded.storage = std::move(raw.storage);
  bounded.sleep_predictor = make_bounded_predictor(std::move(raw.sleep_predictor), timeout);
  bounded.readings = make_bounded_readings(std::move(raw.readings), timeout);
  bounded.notifier = std::move(raw.notifier);
  bounded.error_reporter = raw.error_reporter ? std::move(raw.error_reporter)
                                              : std::make_shared<StderrErrorReporter>();
  bounded.clock = raw.clock ? std::move(raw.clock)
                            : Clock([] { return std::chrono::system_clock::now(); });
  return bounded;
}

const EngineConfig& validated(const EngineConfig& config) {
  config.validate();
  return config;
}

class SmartAlarmEngineImpl : public SmartAlarmEngine {
public:
  SmartAlarmEngineImpl(Collaborators collaborators, EngineConfig config)
      : config_(validated(config)),
        collaborators_(bound_collaborators(std::move(collaborators), config_)),
        loop_(collaborators_),
        learner_(collaborators_.storage, config_.utc_offset_minutes),
        scheduler_(std::chrono::milliseconds(config_.tick_interval_ms),
                   [this](const std::string& alarm_id) { on_scheduled_tick(alarm_id); }) {}

  Alarm create_enhanced_alarm(const AlarmConfig& config) override {
    config.validate();
    IdReservation reservation(*this, config.id);

    Alarm alarm;
    alarm.id = config.id;
    alarm.label = config.label;
    alarm.baseline_time = time::parse_hhmm(config.time);
    alarm.current_time = alarm.baseline_time;
    alarm.wake_window = config.wake_window;
    alarm.enabled = config.enabled;
    alarm.real_time_adaptation = config.real_time_adaptation;
    alarm.dynamic_wake_window = config.dynamic_wake_window;
    alarm.sleep_pattern_weight = config.sleep_pattern_weight;
    alarm.learning_factor = config.learning_factor;
    alarm.created_at = collaborators_.clock();

    std::vector<ConditionDefinition> conditions;
    if (config.preset.has_value()) {
      const auto& preset = resources::configuration_preset(config.preset.value());
      alarm.learning_factor = preset.learning_factor;
      alarm.sleep_pattern_weight = preset.sleep_pattern_weight;
      conditions = resources::preset_conditions(preset);
    } else if (config.conditions.has_value()) {
      conditions = config.conditions.value();
    } else {
      conditions = resources::default_conditions();
    }
    alarm.validate();

    collaborators_.storage->save_alarm(alarm);
    for (const auto& def : conditions) {
      collaborators_.storage->save_condition(alarm.id, def);
    }

    auto catalog = std::make_shared<ConditionCatalog>(alarm.id, collaborators_.storage);
    catalog->load(std::move(conditions));
    auto state = std::make_shared<AlarmState>(alarm, catalog);
    state->adaptation_active = alarm.real_time_adaptation;

    {
      std::lock_guard<std::mutex> lock(alarms_mutex_);
      if (!alarms_.emplace(alarm.id, state).second) {
        throw ValidationError("Alarm '" + alarm.id + "' already exists");
      }
      reserved_ids_.erase(alarm.id);
      reservation.release();
    }
    if (alarm.real_time_adaptation) {
      scheduler_.schedule(alarm.id);
    }
    debug_log("wake", "created alarm " + alarm.id + " at " + time::format_hhmm(alarm.baseline_time) +
                          " with " + std::to_string(catalog->size()) + " conditions");
    return alarm;
  }

  Alarm restore_alarm(const std::string& alarm_id) override {
    auto stored = collaborators_.storage->load_alarm(alarm_id);
    if (!stored.has_value()) {
      throw NotFoundError("Unknown alarm: " + alarm_id);
    }
    Alarm alarm = stored.value();
    alarm.validate();

    auto catalog = std::make_shared<ConditionCatalog>(alarm.id, collaborators_.storage);
    catalog->load(collaborators_.storage->load_conditions(alarm_id));
    auto state = std::make_shared<AlarmState>(alarm, catalog);
    state->history = collaborators_.storage->load_adaptations(alarm_id);
    std::stable_sort(state->history.begin(), state->history.end(),
                     [](const AdaptationRecord& a, const AdaptationRecord& b) {
                       return a.sequence < b.sequence;
                     });
    state->feedback = collaborators_.storage->load_feedback(alarm_id);
    state->next_sequence = state->history.empty() ? 1 : state->history.back().sequence + 1;
    state->adaptation_active = alarm.real_time_adaptation;

    std::shared_ptr<AlarmState> previous;
    {
      std::lock_guard<std::mutex> lock(alarms_mutex_);
      if (reserved_ids_.count(alarm_id) > 0) {
        throw ValidationError("Alarm '" + alarm_id + "' is being created");
      }
      auto it = alarms_.find(alarm_id);
      if (it != alarms_.end()) {
        previous = it->second;
        it->second = state;
      } else {
        alarms_.emplace(alarm_id, state);
      }
    }
    if (previous) {
      previous->adaptation_active = false;
    }
    if (alarm.real_time_adaptation) {
      scheduler_.schedule(alarm_id);
    } else {
      scheduler_.cancel(alarm_id);
    }
    return alarm;
  }

  Alarm get_alarm(const std::string& alarm_id) const override {
    auto state = find_state(alarm_id);
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->alarm;
  }

  TickOutcome tick_now(const std::string& alarm_id) override {
    auto state = find_state(alarm_id);
    return loop_.tick(*state);
  }

  std::vector<OptimalTimeSlot> calculate_optimal_time_slots(const std::string& alarm_id) override {
    auto state = find_state(alarm_id);
    Alarm alarm;
    std::vector<WakeUpFeedback> feedback;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      alarm = state->alarm;
      feedback = state->feedback;
    }
    try {
      if (!collaborators_.sleep_predictor) {
        throw CollaboratorUnavailableError("no sleep stage predictor configured");
      }
      const auto pattern = collaborators_.sleep_predictor->current_pattern();
      if (!pattern.has_value()) {
        return {};
      }
      const auto stages = collaborators_.sleep_predictor->predict(alarm, pattern.value());
      return sleep::optimal_time_slots(alarm, stages, feedback);
    } catch (const std::exception& ex) {
      collaborators_.error_reporter->report(ex, "optimal time slots for alarm '" + alarm_id + "'");
      return {};
    }
  }

  void record_wake_up_feedback(const std::string& alarm_id,
                               const WakeUpFeedback& feedback) override {
    auto state = find_state(alarm_id);
    learner_.record_feedback(*state, feedback);
  }

  SmartAlarmMetrics get_metrics(const std::string& alarm_id) const override {
    return metrics::compute_metrics(metrics_input(alarm_id), config_);
  }

  metrics::ConditionAudit audit_conditions(const std::string& alarm_id) const override {
    auto state = find_state(alarm_id);
    Alarm alarm;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      alarm = state->alarm;
    }
    return metrics::audit_conditions(alarm, state->catalog->list());
  }

  void set_real_time_adaptation(const std::string& alarm_id, bool enabled) override {
    auto state = find_state(alarm_id);
    Alarm updated;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      updated = state->alarm;
    }
    const bool previous = updated.real_time_adaptation;
    updated.real_time_adaptation = enabled;

    if (!enabled) {
      state->adaptation_active = false;
      scheduler_.cancel(alarm_id);
    }
    try {
      collaborators_.storage->save_alarm(updated);
    } catch (const std::exception&) {
      if (!enabled && previous) {
        state->adaptation_active = true;
        scheduler_.schedule(alarm_id);
      }
      throw;
    }
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->alarm.real_time_adaptation = enabled;
    }
    if (enabled) {
      state->adaptation_active = true;
      if (!scheduler_.scheduled(alarm_id)) {
        scheduler_.schedule(alarm_id);
      }
    }
    debug_log("wake", alarm_id + std::string(" real-time adaptation ") + (enabled ? "on" : "off"));
  }

  std::vector<ConditionDefinition> list_conditions(const std::string& alarm_id,
                                                   bool enabled_only) const override {
    return find_state(alarm_id)->catalog->list(enabled_only);
  }

  void upsert_condition(const std::string& alarm_id, const ConditionDefinition& def) override {
    find_state(alarm_id)->catalog->upsert(def);
  }

  void remove_condition(const std::string& alarm_id, const std::string& condition_id) override {
    auto state = find_state(alarm_id);
    if (referenced_by_history(*state, condition_id)) {
      throw ValidationError("Condition '" + condition_id +
                            "' is referenced by adaptation history and cannot be removed");
    }
    state->catalog->remove(condition_id);
  }

  void apply_preset(const std::string& alarm_id, const std::string& preset_name) override {
    auto state = find_state(alarm_id);
    const auto& preset = resources::configuration_preset(preset_name);
    const auto incoming = resources::preset_conditions(preset);

    for (const auto& existing : state->catalog->list()) {
      const bool kept = std::any_of(incoming.begin(), incoming.end(),
                                    [&](const ConditionDefinition& def) {
                                      return def.id == existing.id;
                                    });
      if (kept) {
        continue;
      }
      if (referenced_by_history(*state, existing.id)) {
        ConditionDefinition disabled = existing;
        disabled.enabled = false;
        state->catalog->upsert(disabled);
      } else {
        state->catalog->remove(existing.id);
      }
    }
    for (const auto& def : incoming) {
      state->catalog->upsert(def);
    }

    Alarm updated;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      updated = state->alarm;
    }
    updated.learning_factor = preset.learning_factor;
    updated.sleep_pattern_weight = preset.sleep_pattern_weight;
    updated.real_time_adaptation = true;
    collaborators_.storage->save_alarm(updated);
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->alarm.learning_factor = updated.learning_factor;
      state->alarm.sleep_pattern_weight = updated.sleep_pattern_weight;
      state->alarm.real_time_adaptation = true;
    }
    state->adaptation_active = true;
    if (!scheduler_.scheduled(alarm_id)) {
      scheduler_.schedule(alarm_id);
    }
    debug_log("wake", "applied preset " + preset.name + " to " + alarm_id);
  }

  std::vector<AdaptationRecord> adaptation_history(const std::string& alarm_id) const override {
    auto state = find_state(alarm_id);
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->history;
  }

  std::vector<WakeUpFeedback> wake_up_feedback(const std::string& alarm_id) const override {
    auto state = find_state(alarm_id);
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->feedback;
  }

  void start() override { scheduler_.start(); }

  void stop() override { scheduler_.stop(); }

private:
  // Holds an alarm id from the duplicate check until the alarm is published,
  // so a concurrent create with the same id fails before touching storage.
  class IdReservation {
  public:
    IdReservation(SmartAlarmEngineImpl& engine, const std::string& alarm_id)
        : engine_(engine), alarm_id_(alarm_id) {
      std::lock_guard<std::mutex> lock(engine_.alarms_mutex_);
      if (engine_.alarms_.count(alarm_id_) > 0 || engine_.reserved_ids_.count(alarm_id_) > 0) {
        throw ValidationError("Alarm '" + alarm_id_ + "' already exists");
      }
      engine_.reserved_ids_.insert(alarm_id_);
    }

    ~IdReservation() {
      if (!held_) {
        return;
      }
      std::lock_guard<std::mutex> lock(engine_.alarms_mutex_);
      engine_.reserved_ids_.erase(alarm_id_);
    }

    IdReservation(const IdReservation&) = delete;
    IdReservation& operator=(const IdReservation&) = delete;

    // Called with alarms_mutex_ held once the alarm is in the map.
    void release() { held_ = false; }

  private:
    SmartAlarmEngineImpl& engine_;
    std::string alarm_id_;
    bool held_ = true;
  };

  std::shared_ptr<AlarmState> find_state(const std::string& alarm_id) const {
    std::lock_guard<std::mutex> lock(alarms_mutex_);
    auto it = alarms_.find(alarm_id);
    if (it == alarms_.end()) {
      throw NotFoundError("Unknown alarm: " + alarm_id);
    }
    return it->second;
  }

  static bool referenced_by_history(AlarmState& state, const std::string& condition_id) {
    std::lock_guard<std::mutex> lock(state.mutex);
    return std::any_of(state.history.begin(), state.history.end(),
                       [&](const AdaptationRecord& record) {
                         return std::find(record.condition_ids.begin(),
                                          record.condition_ids.end(),
                                          condition_id) != record.condition_ids.end();
                       });
  }

  metrics::MetricsInput metrics_input(const std::string& alarm_id) const {
    auto state = find_state(alarm_id);
    metrics::MetricsInput input;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      input.alarm = state->alarm;
      input.feedback = state->feedback;
      input.history = state->history;
      input.consecutive_failures = state->consecutive_failures;
    }
    input.conditions = state->catalog->list();
    input.now = collaborators_.clock();
    return input;
  }

  void on_scheduled_tick(const std::string& alarm_id) {
    std::shared_ptr<AlarmState> state;
    {
      std::lock_guard<std::mutex> lock(alarms_mutex_);
      auto it = alarms_.find(alarm_id);
      if (it != alarms_.end()) {
        state = it->second;
      }
    }
    if (!state) {
      scheduler_.cancel(alarm_id);
      return;
    }
    const auto outcome = loop_.tick(*state);
    if (debug_enabled()) {
      std::ostringstream oss;
      oss << "scheduled tick " << alarm_id << " -> " << to_string(outcome.state);
      debug_log("wake", oss.str());
    }
  }

  EngineConfig config_;
  Collaborators collaborators_;
  AdaptationLoop loop_;
  FeedbackLearner learner_;

  mutable std::mutex alarms_mutex_;
  std::map<std::string, std::shared_ptr<AlarmState>> alarms_;
  std::set<std::string> reserved_ids_;

  // Last member: its worker is joined before the state above is destroyed.
  TickScheduler scheduler_;
};

} // namespace

std::unique_ptr<SmartAlarmEngine> make_engine(Collaborators collaborators, EngineConfig config) {
  return std::make_unique<SmartAlarmEngineImpl>(std::move(collaborators), std::move(config));
}

} // namespace wake

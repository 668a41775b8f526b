#include "wake/config.hpp"
#include "wake/feeds.hpp"
#include "wake/smart_alarm_engine.hpp"
#include "wake/storage.hpp"
#include "wake/time_of_day.hpp"

#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {

nlohmann::json py_to_json(py::handle handle) {
  if (handle.is_none()) {
    return nullptr;
  }
  if (py::isinstance<py::bool_>(handle)) {
    return handle.cast<bool>();
  }
  if (py::isinstance<py::int_>(handle)) {
    return static_cast<long long>(handle.cast<long long>());
  }
  if (py::isinstance<py::float_>(handle)) {
    return handle.cast<double>();
  }
  if (py::isinstance<py::str>(handle)) {
    return handle.cast<std::string>();
  }
  if (py::isinstance<py::dict>(handle)) {
    nlohmann::json json_obj = nlohmann::json::object();
    for (auto item : handle.cast<py::dict>()) {
      auto key = py::cast<std::string>(item.first);
      json_obj[key] = py_to_json(item.second);
    }
    return json_obj;
  }
  if (py::isinstance<py::list>(handle) || py::isinstance<py::tuple>(handle)) {
    nlohmann::json json_array = nlohmann::json::array();
    for (auto item : handle.cast<py::sequence>()) {
      json_array.push_back(py_to_json(item));
    }
    return json_array;
  }
  throw std::runtime_error("Unsupported Python type for JSON conversion");
}

py::object json_to_py(const nlohmann::json& json_value) {
  if (json_value.is_null()) {
    return py::none();
  }
  if (json_value.is_boolean()) {
    return py::bool_(json_value.get<bool>());
  }
  if (json_value.is_number_integer()) {
    return py::int_(json_value.get<long long>());
  }
  if (json_value.is_number_float()) {
    return py::float_(json_value.get<double>());
  }
  if (json_value.is_string()) {
    return py::str(json_value.get<std::string>());
  }
  if (json_value.is_array()) {
    py::list list;
    for (const auto& element : json_value) {
      list.append(json_to_py(element));
    }
    return list;
  }
  if (json_value.is_object()) {
    py::dict dict;
    for (const auto& entry : json_value.items()) {
      dict[py::str(entry.key())] = json_to_py(entry.value());
    }
    return dict;
  }
  throw std::runtime_error("Unhandled JSON type");
}

int minute_from_json(const nlohmann::json& value) {
  if (value.is_string()) {
    return wake::time::parse_hhmm(value.get<std::string>());
  }
  return wake::time::wrap(value.get<int>());
}

template <typename T>
nlohmann::json list_to_json(const std::vector<T>& items) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& item : items) {
    out.push_back(wake::bridge::to_json(item));
  }
  return out;
}

// Engine wired to host-pushed feeds. Python never receives callbacks; the host
// pushes readings and drains schedule changes instead.
class PySmartAlarmEngine {
public:
  explicit PySmartAlarmEngine(py::object config_obj, std::string storage_root)
      : readings_(std::make_shared<wake::PushedConditionSource>()),
        predictor_(std::make_shared<wake::PushedSleepPredictor>()),
        notifier_(std::make_shared<wake::QueuedNotifier>()) {
    wake::EngineConfig config;
    if (!config_obj.is_none()) {
      config = wake::bridge::engine_config_from_json(py_to_json(config_obj));
    }
    wake::Collaborators collaborators;
    if (storage_root.empty()) {
      collaborators.storage = std::make_shared<wake::MemoryStorage>();
    } else {
      collaborators.storage = std::make_shared<wake::JsonFileStorage>(storage_root);
    }
    collaborators.sleep_predictor = predictor_;
    collaborators.readings = readings_;
    collaborators.notifier = notifier_;
    engine_ = wake::make_engine(std::move(collaborators), config);
  }

  py::object create_enhanced_alarm(py::object config_obj) {
    auto config = wake::bridge::alarm_config_from_json(py_to_json(config_obj));
    return json_to_py(wake::bridge::to_json(engine_->create_enhanced_alarm(config)));
  }

  py::object restore_alarm(const std::string& alarm_id) {
    return json_to_py(wake::bridge::to_json(engine_->restore_alarm(alarm_id)));
  }

  py::object get_alarm(const std::string& alarm_id) const {
    return json_to_py(wake::bridge::to_json(engine_->get_alarm(alarm_id)));
  }

  py::object tick_now(const std::string& alarm_id) {
    wake::TickOutcome outcome;
    {
      py::gil_scoped_release release;
      outcome = engine_->tick_now(alarm_id);
    }
    return json_to_py(wake::bridge::to_json(outcome));
  }

  py::object calculate_optimal_time_slots(const std::string& alarm_id) {
    return json_to_py(list_to_json(engine_->calculate_optimal_time_slots(alarm_id)));
  }

  void record_wake_up_feedback(const std::string& alarm_id, py::object feedback_obj) {
    auto feedback = wake::bridge::wake_up_feedback_from_json(py_to_json(feedback_obj));
    engine_->record_wake_up_feedback(alarm_id, feedback);
  }

  py::object get_metrics(const std::string& alarm_id) const {
    return json_to_py(wake::bridge::to_json(engine_->get_metrics(alarm_id)));
  }

  py::object audit_conditions(const std::string& alarm_id) const {
    return json_to_py(wake::bridge::to_json(engine_->audit_conditions(alarm_id)));
  }

  void set_real_time_adaptation(const std::string& alarm_id, bool enabled) {
    engine_->set_real_time_adaptation(alarm_id, enabled);
  }

  py::object list_conditions(const std::string& alarm_id, bool enabled_only) const {
    return json_to_py(list_to_json(engine_->list_conditions(alarm_id, enabled_only)));
  }

  void upsert_condition(const std::string& alarm_id, py::object def_obj) {
    engine_->upsert_condition(alarm_id,
                              wake::bridge::condition_definition_from_json(py_to_json(def_obj)));
  }

  void remove_condition(const std::string& alarm_id, const std::string& condition_id) {
    engine_->remove_condition(alarm_id, condition_id);
  }

  void apply_preset(const std::string& alarm_id, const std::string& preset_name) {
    engine_->apply_preset(alarm_id, preset_name);
  }

  py::object adaptation_history(const std::string& alarm_id) const {
    return json_to_py(list_to_json(engine_->adaptation_history(alarm_id)));
  }

  py::object wake_up_feedback(const std::string& alarm_id) const {
    return json_to_py(list_to_json(engine_->wake_up_feedback(alarm_id)));
  }

  void push_readings(py::object readings_obj) {
    readings_->push(wake::bridge::condition_reading_from_json(py_to_json(readings_obj)));
  }

  void clear_reading(const std::string& type) {
    readings_->clear(wake::condition_type_from_string(type));
  }

  void set_sleep_pattern(py::object pattern_obj) {
    if (pattern_obj.is_none()) {
      predictor_->set_pattern(std::nullopt);
      return;
    }
    auto json_pattern = py_to_json(pattern_obj);
    wake::SleepPattern pattern;
    pattern.sleep_efficiency = json_pattern.value("sleepEfficiency", pattern.sleep_efficiency);
    pattern.average_sleep_minutes =
        json_pattern.value("averageSleepMinutes", pattern.average_sleep_minutes);
    if (json_pattern.contains("averageBedtime")) {
      pattern.average_bedtime = minute_from_json(json_pattern.at("averageBedtime"));
    }
    predictor_->set_pattern(pattern);
  }

  void set_stage_prediction(py::object stages_obj) {
    std::vector<wake::StagePoint> stages;
    for (const auto& item : py_to_json(stages_obj)) {
      wake::StagePoint point;
      point.minute_of_day = minute_from_json(item.at("time"));
      point.stage = wake::sleep_stage_from_string(item.at("stage").get<std::string>());
      stages.push_back(point);
    }
    predictor_->set_stages(std::move(stages));
  }

  void set_recommendation(py::object recommendation_obj) {
    if (recommendation_obj.is_none()) {
      predictor_->set_recommendation(std::nullopt);
      return;
    }
    auto json_rec = py_to_json(recommendation_obj);
    wake::WakeRecommendation recommendation;
    recommendation.minute_of_day = minute_from_json(json_rec.at("time"));
    recommendation.confidence = json_rec.value("confidence", 0.0);
    predictor_->set_recommendation(recommendation);
  }

  py::object drain_schedule_changes() {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& change : notifier_->drain()) {
      out.push_back({{"alarmId", change.alarm_id},
                     {"newTime", wake::time::format_hhmm(change.new_time)},
                     {"confidence", change.confidence},
                     {"reason", change.reason}});
    }
    return json_to_py(out);
  }

  void start() { engine_->start(); }

  void stop() {
    py::gil_scoped_release release;
    engine_->stop();
  }

private:
  std::shared_ptr<wake::PushedConditionSource> readings_;
  std::shared_ptr<wake::PushedSleepPredictor> predictor_;
  std::shared_ptr<wake::QueuedNotifier> notifier_;
  std::unique_ptr<wake::SmartAlarmEngine> engine_;
};

} // namespace

PYBIND11_MODULE(_wakecore, m) {
  py::class_<PySmartAlarmEngine>(m, "SmartAlarmEngine")
      .def(py::init<py::object, std::string>(),
           py::arg("config") = py::none(),
           py::arg("storage_root") = std::string())
      .def("create_enhanced_alarm", &PySmartAlarmEngine::create_enhanced_alarm)
      .def("restore_alarm", &PySmartAlarmEngine::restore_alarm)
      .def("get_alarm", &PySmartAlarmEngine::get_alarm)
      .def("tick_now", &PySmartAlarmEngine::tick_now)
      .def("calculate_optimal_time_slots", &PySmartAlarmEngine::calculate_optimal_time_slots)
      .def("record_wake_up_feedback", &PySmartAlarmEngine::record_wake_up_feedback)
      .def("get_metrics", &PySmartAlarmEngine::get_metrics)
      .def("audit_conditions", &PySmartAlarmEngine::audit_conditions)
      .def("set_real_time_adaptation", &PySmartAlarmEngine::set_real_time_adaptation)
      .def("list_conditions", &PySmartAlarmEngine::list_conditions,
           py::arg("alarm_id"), py::arg("enabled_only") = false)
      .def("upsert_condition", &PySmartAlarmEngine::upsert_condition)
      .def("remove_condition", &PySmartAlarmEngine::remove_condition)
      .def("apply_preset", &PySmartAlarmEngine::apply_preset)
      .def("adaptation_history", &PySmartAlarmEngine::adaptation_history)
      .def("wake_up_feedback", &PySmartAlarmEngine::wake_up_feedback)
      .def("push_readings", &PySmartAlarmEngine::push_readings)
      .def("clear_reading", &PySmartAlarmEngine::clear_reading)
      .def("set_sleep_pattern", &PySmartAlarmEngine::set_sleep_pattern)
      .def("set_stage_prediction", &PySmartAlarmEngine::set_stage_prediction)
      .def("set_recommendation", &PySmartAlarmEngine::set_recommendation)
      .def("drain_schedule_changes", &PySmartAlarmEngine::drain_schedule_changes)
      .def("start", &PySmartAlarmEngine::start)
      .def("stop", &PySmartAlarmEngine::stop);
}

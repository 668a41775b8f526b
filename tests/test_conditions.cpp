#include "../include/wake/condition_catalog.hpp"
#include "../include/wake/condition_evaluator.hpp"
#include "../include/wake/config.hpp"
#include "../include/wake/metrics.hpp"
#include "../include/wake/storage.hpp"
#include "../include/wake/time_of_day.hpp"
#include "../include/resources/condition_presets.hpp"

#include "../src/json_bridge.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <set>
#include <stdexcept>
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

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

wake::ConditionDefinition make_def(const std::string& id,
                                   wake::ConditionType type,
                                   wake::PredicateOperator op,
                                   wake::ConditionValue value,
                                   int minutes,
                                   unsigned int max_adjustment,
                                   double effectiveness) {
  wake::ConditionDefinition def;
  def.id = id;
  def.type = type;
  def.predicate.op = op;
  def.predicate.value = std::move(value);
  def.adjustment.minutes = minutes;
  def.adjustment.max_adjustment = max_adjustment;
  def.adjustment.reason = id;
  def.effectiveness_score = effectiveness;
  return def;
}

// Storage whose condition writes always fail.
class BrokenConditionStorage : public wake::MemoryStorage {
public:
  void save_condition(const std::string&, const wake::ConditionDefinition&) override {
    throw std::runtime_error("disk full");
  }
  void remove_condition(const std::string&, const std::string&) override {
    throw std::runtime_error("disk full");
  }
};

void test_time_of_day(TestSuite& suite) {
  suite.require(wake::time::parse_hhmm("07:30") == 450, "07:30 should parse to 450");
  suite.require(wake::time::parse_hhmm("0:05") == 5, "single digit hour should parse");
  suite.require(throws<wake::ValidationError>([] { wake::time::parse_hhmm("24:00"); }),
                "24:00 should be rejected");
  suite.require(throws<wake::ValidationError>([] { wake::time::parse_hhmm("7:5"); }),
                "7:5 should be rejected");
  suite.require(wake::time::format_hhmm(-11) == "23:49", "negative minutes should wrap");
  suite.require(wake::time::wrap(1445) == 5, "1445 should wrap to 5");
  suite.require(wake::time::signed_delta(1430, 10) == 20, "delta across midnight is forward");
  suite.require(wake::time::signed_delta(10, 1430) == -20, "delta across midnight is backward");
  suite.require(wake::time::circular_distance(5, 1435) == 10, "circular distance wraps");
}

void test_evaluation(TestSuite& suite) {
  using wake::ConditionType;
  using wake::PredicateOperator;

  auto defaults = wake::resources::default_conditions();
  wake::ConditionReading reading;
  reading[ConditionType::Weather] = std::string("light rain");
  reading[ConditionType::SleepDebt] = 90.0;
  reading[ConditionType::Calendar] = std::string("weekday");

  auto evaluation = wake::evaluate_conditions(defaults, reading);
  suite.require(evaluation.fired.size() == 2, "rain and sleep debt should fire");
  suite.require(evaluation.rejected.empty(), "no reading should be rejected");
  suite.require(near(evaluation.total_adjustment, -8.0 - 10.5),
                "total should be -8 (rain) plus -10.5 (sleep debt)");
  if (evaluation.fired.size() == 2) {
    suite.require(evaluation.fired[0].condition_id == "weather_rain", "rain fires first");
    suite.require(near(evaluation.fired[0].applied_minutes, -8.0), "rain applies -8");
    suite.require(evaluation.fired[1].condition_id == "sleep_debt_high", "sleep debt fires second");
  }

  auto again = wake::evaluate_conditions(defaults, reading);
  suite.require(near(again.total_adjustment, evaluation.total_adjustment) &&
                    again.fired.size() == evaluation.fired.size(),
                "evaluation should be repeatable for the same input");

  reading[ConditionType::Calendar] = std::string("weekend");
  evaluation = wake::evaluate_conditions(defaults, reading);
  suite.require(evaluation.fired.size() == 3, "weekend condition should fire on weekend");
  suite.require(near(evaluation.total_adjustment, -8.0 - 10.5 + 27.0),
                "weekend adds 30 * 0.9 minutes");

  suite.require(wake::evaluate_conditions(defaults, {}).fired.empty(),
                "missing readings fire nothing");

  auto disabled = defaults;
  for (auto& def : disabled) {
    def.enabled = false;
  }
  suite.require(wake::evaluate_conditions(disabled, reading).fired.empty(),
                "disabled conditions never fire");
}

void test_clamping_and_shapes(TestSuite& suite) {
  using wake::ConditionType;
  using wake::PredicateOperator;

  auto storm = make_def("storm", ConditionType::Weather, PredicateOperator::Contains,
                        std::string("storm"), -30, 20, 1.0);
  suite.require(throws<wake::ValidationError>([&] { storm.validate(); }),
                "maxAdjustment below |minutes| should be invalid");
  auto extreme = storm;
  extreme.adjustment.minutes = std::numeric_limits<int>::min();
  extreme.adjustment.max_adjustment = static_cast<unsigned int>(std::numeric_limits<int>::max());
  suite.require(throws<wake::ValidationError>([&] { extreme.validate(); }),
                "the most negative minutes exceed INT_MAX maxAdjustment");
  extreme.adjustment.max_adjustment = 2147483648u;
  extreme.effectiveness_score = 1.0;
  suite.require(!throws<wake::ValidationError>([&] { extreme.validate(); }),
                "the most negative minutes fit a maxAdjustment of 2^31");
  storm.adjustment.max_adjustment = 30;
  storm.effectiveness_score = 1.0;
  suite.require(near(wake::applied_adjustment(storm), -30.0), "full effectiveness applies all");

  auto capped = make_def("capped", ConditionType::StressLevel, PredicateOperator::GreaterThan,
                         7.0, 40, 40, 0.5);
  suite.require(near(wake::applied_adjustment(capped), 20.0), "half effectiveness halves minutes");

  wake::ConditionReading reading;
  reading[ConditionType::Weather] = 42.0;
  auto evaluation = wake::evaluate_conditions({storm}, reading);
  suite.require(evaluation.fired.empty(), "numeric weather reading should not fire");
  suite.require(evaluation.rejected.size() == 1 && evaluation.rejected[0] == "storm",
                "numeric weather reading should be rejected");

  wake::ConditionReading stress;
  stress[ConditionType::StressLevel] = std::string("high");
  evaluation = wake::evaluate_conditions({capped}, stress);
  suite.require(evaluation.fired.empty() && evaluation.rejected.size() == 1,
                "text stress reading should be rejected");

  stress[ConditionType::StressLevel] = 8.0;
  evaluation = wake::evaluate_conditions({capped}, stress);
  suite.require(evaluation.fired.size() == 1, "stress 8 > 7 should fire");

  auto ice = wake::resources::library_condition("weather_ice");
  wake::ConditionReading tags;
  tags[ConditionType::Weather] = std::vector<std::string>{"cloudy", "freezing"};
  suite.require(wake::evaluate_conditions({ice}, tags).fired.size() == 1,
                "list predicate should match a list reading element");
  tags[ConditionType::Weather] = std::string("freezing drizzle");
  suite.require(wake::evaluate_conditions({ice}, tags).fired.size() == 1,
                "list predicate should match a substring of a text reading");
  tags[ConditionType::Weather] = std::string("sunny");
  suite.require(wake::evaluate_conditions({ice}, tags).fired.empty(),
                "list predicate should not match unrelated text");

  auto busy = wake::resources::library_condition("calendar_busy_day");
  wake::ConditionReading meetings;
  meetings[ConditionType::Calendar] = 7.0;
  suite.require(wake::evaluate_conditions({busy}, meetings).fired.size() == 1,
                "seven meetings should count as a busy day");

  wake::ConditionPredicate equals;
  equals.op = PredicateOperator::Equals;
  equals.value = 3.0;
  suite.require(wake::predicate_matches(equals, wake::ConditionValue(3.0)).value_or(false),
                "numeric equality should match");
  suite.require(!wake::predicate_matches(equals, wake::ConditionValue(std::string("3")))
                     .value_or(true),
                "equality does not coerce strings");

  suite.require(wake::stringify(wake::ConditionValue(2.0)) == "2", "integral doubles print bare");
  suite.require(wake::stringify(wake::ConditionValue(std::vector<std::string>{"a", "b"})) == "a,b",
                "lists join with commas");
}

void test_catalog(TestSuite& suite) {
  auto storage = std::make_shared<wake::MemoryStorage>();
  wake::ConditionCatalog catalog("alarm-1", storage);
  catalog.load(wake::resources::default_conditions());
  suite.require(catalog.size() == 3, "catalog should hold the default conditions");

  auto invalid = wake::resources::default_conditions().front();
  invalid.id = "bad";
  invalid.priority = 9;
  suite.require(throws<wake::ValidationError>([&] { catalog.upsert(invalid); }),
                "priority 9 should be rejected");
  suite.require(!catalog.contains("bad"), "rejected condition must not be stored in memory");
  suite.require(storage->load_conditions("alarm-1").empty(),
                "rejected condition must not reach storage");

  auto fog = wake::resources::library_condition("weather_fog");
  catalog.upsert(fog);
  suite.require(catalog.contains("weather_fog"), "upsert should add new conditions");
  suite.require(storage->load_conditions("alarm-1").size() == 1, "upsert should persist");

  fog.enabled = false;
  catalog.upsert(fog);
  suite.require(catalog.size() == 4, "upsert with an existing id should replace");
  suite.require(catalog.list(true).size() == 3, "enabled-only listing skips disabled entries");

  suite.require(throws<wake::NotFoundError>([&] { catalog.get("missing"); }),
                "get on unknown id throws NotFoundError");
  suite.require(throws<wake::NotFoundError>([&] { catalog.remove("missing"); }),
                "remove on unknown id throws NotFoundError");
  suite.require(throws<wake::ValidationError>([&] { catalog.update_effectiveness("weather_rain", 1.5); }),
                "effectiveness above 1 is rejected");

  catalog.update_effectiveness("weather_rain", 0.25);
  suite.require(near(catalog.get("weather_rain").effectiveness_score, 0.25),
                "effectiveness update should be visible");

  const auto when = wake::time::from_epoch_ms(1700000000000LL);
  catalog.mark_triggered({"weather_rain", "unknown"}, when);
  const auto rain = catalog.get("weather_rain");
  suite.require(rain.last_triggered.has_value() && rain.last_triggered.value() == when,
                "mark_triggered should stamp lastTriggered");

  catalog.remove("weather_fog");
  suite.require(!catalog.contains("weather_fog"), "remove should drop the condition");

  auto broken = std::make_shared<BrokenConditionStorage>();
  wake::ConditionCatalog fragile("alarm-2", broken);
  fragile.load(wake::resources::default_conditions());
  suite.require(throws<std::runtime_error>([&] {
                  fragile.update_effectiveness("weather_rain", 0.1);
                }),
                "storage failure should propagate");
  suite.require(near(fragile.get("weather_rain").effectiveness_score, 0.8),
                "failed write must leave the catalog unchanged");
  suite.require(throws<std::runtime_error>([&] { fragile.remove("weather_rain"); }) &&
                    fragile.contains("weather_rain"),
                "failed remove must keep the condition");
}

void test_presets(TestSuite& suite) {
  std::set<std::string> ids;
  for (const auto& def : wake::resources::condition_library()) {
    def.validate();
    suite.require(ids.insert(def.id).second, "library ids must be unique: " + def.id);
  }
  for (const auto& preset : wake::resources::configuration_presets()) {
    const auto conditions = wake::resources::preset_conditions(preset);
    suite.require(conditions.size() == preset.condition_ids.size(),
                  "preset " + preset.name + " should resolve every id");
  }
  const auto& quick = wake::resources::configuration_preset("QUICK_START");
  suite.require(near(quick.learning_factor, 0.3) && near(quick.sleep_pattern_weight, 0.7),
                "QUICK_START factors");
  const auto& conservative = wake::resources::configuration_preset("CONSERVATIVE");
  suite.require(conservative.condition_ids.size() == 3, "CONSERVATIVE has three conditions");
  suite.require(throws<wake::NotFoundError>([] { wake::resources::configuration_preset("NOPE"); }),
                "unknown preset throws NotFoundError");
}

void test_audit(TestSuite& suite) {
  wake::Alarm alarm;
  alarm.id = "audit";

  auto healthy = wake::metrics::audit_conditions(alarm, wake::resources::default_conditions());
  suite.require(healthy.valid, "default setup should be valid");
  suite.require(healthy.score == 100 && healthy.grade == "Excellent",
                "default setup should score 100");
  suite.require(healthy.enabled_conditions == 3 && healthy.total_conditions == 3,
                "default setup counts");

  auto empty = wake::metrics::audit_conditions(alarm, {});
  suite.require(!empty.valid, "empty setup is not valid");
  suite.require(empty.score == 10 && empty.grade == "Poor", "empty setup should score 10");

  auto weak = wake::resources::default_conditions();
  weak[0].effectiveness_score = 0.3;
  weak[1].enabled = false;
  alarm.learning_factor = 0.7;
  auto audit = wake::metrics::audit_conditions(alarm, weak);
  // disabled -10, no sleep debt -20, one poor -5, high learning factor -5
  suite.require(audit.score == 60 && audit.grade == "Fair", "weak setup should score 60");
  suite.require(audit.issues.size() == 3, "weak setup should report three issues");
}

void test_config(TestSuite& suite) {
  wake::AlarmConfig config;
  config.id = "cfg";
  config.time = "06:45";
  config.validate();

  config.preset = std::string("QUICK_START");
  config.conditions = wake::resources::default_conditions();
  suite.require(throws<wake::ValidationError>([&] { config.validate(); }),
                "preset plus explicit conditions is rejected");

  config.conditions.reset();
  config.preset = std::string("UNKNOWN");
  suite.require(throws<wake::NotFoundError>([&] { config.validate(); }),
                "unknown preset name is rejected");

  config.preset.reset();
  auto duplicated = wake::resources::default_conditions();
  duplicated.push_back(duplicated.front());
  config.conditions = duplicated;
  suite.require(throws<wake::ValidationError>([&] { config.validate(); }),
                "duplicate condition ids are rejected");

  config.conditions.reset();
  config.wake_window = 200;
  suite.require(throws<wake::ValidationError>([&] { config.validate(); }),
                "wake window above 180 is rejected");

  wake::EngineConfig engine;
  engine.collaborator_timeout_ms = 0;
  suite.require(throws<wake::ValidationError>([&] { engine.validate(); }),
                "zero collaborator timeout is rejected");

  auto json_config = nlohmann::json::parse(R"({
    "id": "json-alarm",
    "time": "06:30",
    "wakeWindow": 20,
    "conditions": [{
      "id": "storm",
      "type": "weather",
      "condition": {"operator": "contains", "value": ["storm", "thunder"]},
      "adjustment": {"minutes": -15, "maxAdjustment": 25, "reason": "Storm commute"}
    }]
  })");
  auto parsed = wake::bridge::alarm_config_from_json(json_config);
  suite.require(parsed.id == "json-alarm" && parsed.wake_window == 20, "alarm config fields");
  suite.require(parsed.conditions.has_value() && parsed.conditions->size() == 1,
                "alarm config conditions");
  if (parsed.conditions.has_value() && !parsed.conditions->empty()) {
    const auto& storm = parsed.conditions->front();
    suite.require(storm.type == wake::ConditionType::Weather, "storm type");
    suite.require(std::holds_alternative<std::vector<std::string>>(storm.predicate.value),
                  "storm predicate is a list");
    suite.require(near(storm.effectiveness_score, 0.5), "effectiveness defaults to 0.5");
  }
  parsed.validate();

  const auto path = std::filesystem::temp_directory_path() / "wake_engine_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"tickIntervalMs": 60000, "utcOffsetMinutes": 120, "staleAdaptationDays": 5})";
  }
  auto loaded = wake::load_engine_config(path);
  suite.require(loaded.tick_interval_ms == 60000 && loaded.utc_offset_minutes == 120,
                "engine config fields load from file");
  suite.require(loaded.stale_adaptation_days == 5 && loaded.metrics_window_days == 30,
                "missing engine config fields keep their defaults");
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  suite.require(throws<wake::ValidationError>([&] { wake::load_engine_config(path); }),
                "malformed engine config is a validation error");
  std::filesystem::remove(path);
  suite.require(throws<std::runtime_error>([&] { wake::load_engine_config(path); }),
                "missing engine config file throws");
}

} // namespace

int main() {
  TestSuite suite;

  test_time_of_day(suite);
  test_evaluation(suite);
  test_clamping_and_shapes(suite);
  test_catalog(suite);
  test_presets(suite);
  test_audit(suite);
  test_config(suite);

  if (!suite.ok) {
    std::cerr << "Condition tests failed" << std::endl;
    return 1;
  }
  std::cout << "Condition tests passed" << std::endl;
  return 0;
}

#include "wake/config.hpp"

#include "json_bridge.hpp"
#include "resources/condition_presets.hpp"
#include "wake/time_of_day.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace wake {

void EngineConfig::validate() const {
  if (tick_interval_ms <= 0) {
    throw ValidationError("tick_interval_ms must be positive");
  }
  if (collaborator_timeout_ms < 1 || collaborator_timeout_ms > 60000) {
    throw ValidationError("collaborator_timeout_ms must be within 1..60000");
  }
  if (utc_offset_minutes < -14 * 60 || utc_offset_minutes > 14 * 60) {
    throw ValidationError("utc_offset_minutes must be within -840..840");
  }
  if (metrics_window_days <= 0) {
    throw ValidationError("metrics_window_days must be positive");
  }
  if (stale_adaptation_days <= 0) {
    throw ValidationError("stale_adaptation_days must be positive");
  }
  if (failure_advisory_threshold <= 0) {
    throw ValidationError("failure_advisory_threshold must be positive");
  }
}

EngineConfig load_engine_config(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Engine config not found at: " + path.string());
  }
  std::ifstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open engine config: " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error& ex) {
    throw ValidationError("Engine config is not valid JSON (" + path.string() + "): " + ex.what());
  }
  return bridge::engine_config_from_json(document);
}

void AlarmConfig::validate() const {
  if (id.empty()) {
    throw ValidationError("Alarm id must not be empty");
  }
  time::parse_hhmm(time);
  if (wake_window < 0 || wake_window > 180) {
    throw ValidationError("wake_window must be within 0..180 minutes");
  }
  if (!(sleep_pattern_weight >= 0.0 && sleep_pattern_weight <= 1.0)) {
    throw ValidationError("sleep_pattern_weight must be within [0, 1]");
  }
  if (!(learning_factor >= 0.0 && learning_factor <= 1.0)) {
    throw ValidationError("learning_factor must be within [0, 1]");
  }
  if (conditions.has_value() && preset.has_value()) {
    throw ValidationError("Alarm config may name a preset or list conditions, not both");
  }
  if (preset.has_value()) {
    resources::configuration_preset(preset.value());
  }
  if (conditions.has_value()) {
    for (std::size_t i = 0; i < conditions->size(); ++i) {
      const auto& def = (*conditions)[i];
      def.validate();
      for (std::size_t j = 0; j < i; ++j) {
        if ((*conditions)[j].id == def.id) {
          throw ValidationError("Duplicate condition id: " + def.id);
        }
      }
    }
  }
}

} // namespace wake

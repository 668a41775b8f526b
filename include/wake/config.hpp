#pragma once

#include "types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wake {

struct EngineConfig {
  std::int64_t tick_interval_ms = 15 * 60 * 1000;
  std::int64_t collaborator_timeout_ms = 4000;
  int utc_offset_minutes = 0;
  int metrics_window_days = 30;
  int stale_adaptation_days = 7;
  int failure_advisory_threshold = 3;

  void validate() const;
};

EngineConfig load_engine_config(const std::filesystem::path& path);

struct AlarmConfig {
  std::string id;
  std::string label;
  std::string time = "07:00";
  int wake_window = 30;
  bool enabled = true;
  bool real_time_adaptation = true;
  bool dynamic_wake_window = true;
  double sleep_pattern_weight = 0.7;
  double learning_factor = 0.3;
  std::optional<std::vector<ConditionDefinition>> conditions;
  std::optional<std::string> preset;

  void validate() const;
};

} // namespace wake

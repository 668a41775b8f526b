#pragma once

#include "../wake/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace wake::resources {

// Installed when an alarm is created without conditions or a preset.
std::vector<ConditionDefinition> default_conditions();

// Every built-in condition, keyed by its stable id.
const std::vector<ConditionDefinition>& condition_library();
ConditionDefinition library_condition(std::string_view id);

struct ConfigurationPreset {
  std::string name;
  std::string description;
  double learning_factor = 0.3;
  double sleep_pattern_weight = 0.7;
  std::vector<std::string> condition_ids;
};

const std::vector<ConfigurationPreset>& configuration_presets();
const ConfigurationPreset& configuration_preset(std::string_view name);
std::vector<ConditionDefinition> preset_conditions(const ConfigurationPreset& preset);

} // namespace wake::resources

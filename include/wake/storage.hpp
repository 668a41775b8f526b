#pragma once

#include "collaborators.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wake {

// Keeps one JSON document per alarm; every read and write goes through the
// JSON bridge, exactly as a persistent backend would.
class MemoryStorage : public Storage {
public:
  void save_alarm(const Alarm& alarm) override;
  std::optional<Alarm> load_alarm(const std::string& alarm_id) override;

  void save_condition(const std::string& alarm_id, const ConditionDefinition& def) override;
  void remove_condition(const std::string& alarm_id, const std::string& condition_id) override;
  std::vector<ConditionDefinition> load_conditions(const std::string& alarm_id) override;

  void append_adaptation(const std::string& alarm_id, const AdaptationRecord& record) override;
  void set_adaptation_effectiveness(const std::string& alarm_id,
                                    std::uint64_t sequence,
                                    double effectiveness) override;
  std::vector<AdaptationRecord> load_adaptations(const std::string& alarm_id) override;

  void append_feedback(const std::string& alarm_id, const WakeUpFeedback& feedback) override;
  std::vector<WakeUpFeedback> load_feedback(const std::string& alarm_id) override;

  nlohmann::json document(const std::string& alarm_id);

protected:
  // Hooks for file-backed storage.
  virtual nlohmann::json read_document(const std::string& alarm_id);
  virtual void write_document(const std::string& alarm_id, const nlohmann::json& document);

  mutable std::mutex mutex_;

private:
  std::map<std::string, nlohmann::json> documents_;
};

// One <alarm-id>.json file per alarm under `root`.
class JsonFileStorage : public MemoryStorage {
public:
  explicit JsonFileStorage(std::filesystem::path root);

  const std::filesystem::path& root() const { return root_; }

protected:
  nlohmann::json read_document(const std::string& alarm_id) override;
  void write_document(const std::string& alarm_id, const nlohmann::json& document) override;

private:
  std::filesystem::path path_for(const std::string& alarm_id) const;

  std::filesystem::path root_;
};

} // namespace wake

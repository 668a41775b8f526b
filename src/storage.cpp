#include "wake/storage.hpp"

#include "json_bridge.hpp"

#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace wake {

namespace {

nlohmann::json empty_document() {
  nlohmann::json doc = nlohmann::json::object();
  doc["alarm"] = nullptr;
  doc["conditions"] = nlohmann::json::array();
  doc["adaptations"] = nlohmann::json::array();
  doc["feedback"] = nlohmann::json::array();
  return doc;
}

nlohmann::json& section(nlohmann::json& doc, const char* key) {
  if (!doc.contains(key) || !doc[key].is_array()) {
    doc[key] = nlohmann::json::array();
  }
  return doc[key];
}

} // namespace

void MemoryStorage::save_alarm(const Alarm& alarm) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto doc = read_document(alarm.id);
  doc["alarm"] = bridge::to_json(alarm);
  write_document(alarm.id, doc);
}

std::optional<Alarm> MemoryStorage::load_alarm(const std::string& alarm_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto doc = read_document(alarm_id);
  if (!doc.contains("alarm") || doc.at("alarm").is_null()) {
    return std::nullopt;
  }
  return bridge::alarm_from_json(doc.at("alarm"));
}

void MemoryStorage::save_condition(const std::string& alarm_id, const ConditionDefinition& def) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto doc = read_document(alarm_id);
  auto& conditions = section(doc, "conditions");
  auto encoded = bridge::to_json(def);
  bool replaced = false;
  for (auto& item : conditions) {
    if (item.contains("id") && item["id"] == def.id) {
      item = encoded;
      replaced = true;
      break;
    }
  }
  if (!replaced) {
    conditions.push_back(std::move(encoded));
  }
  write_document(alarm_id, doc);
}

void MemoryStorage::remove_condition(const std::string& alarm_id, const std::string& condition_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto doc = read_document(alarm_id);
  auto& conditions = section(doc, "conditions");
  nlohmann::json kept = nlohmann::json::array();
  for (const auto& item : conditions) {
    if (!(item.contains("id") && item["id"] == condition_id)) {
      kept.push_back(item);
    }
  }
  conditions = std::move(kept);
  write_document(alarm_id, doc);
}

std::vector<ConditionDefinition> MemoryStorage::load_conditions(const std::string& alarm_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto doc = read_document(alarm_id);
  std::vector<ConditionDefinition> out;
  for (const auto& item : section(doc, "conditions")) {
    out.push_back(bridge::condition_definition_from_json(item));
  }
  return out;
}

void MemoryStorage::append_adaptation(const std::string& alarm_id, const AdaptationRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto doc = read_document(alarm_id);
  section(doc, "adaptations").push_back(bridge::to_json(record));
  write_document(alarm_id, doc);
}

void MemoryStorage::set_adaptation_effectiveness(const std::string& alarm_id,
                                                 std::uint64_t sequence,
                                                 double effectiveness) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto doc = read_document(alarm_id);
  for (auto& item : section(doc, "adaptations")) {
    if (item.contains("sequence") && item["sequence"].get<std::uint64_t>() == sequence) {
      item["effectiveness"] = effectiveness;
      write_document(alarm_id, doc);
      return;
    }
  }
  throw NotFoundError("No adaptation #" + std::to_string(sequence) + " for alarm '" + alarm_id +
                      "'");
}

std::vector<AdaptationRecord> MemoryStorage::load_adaptations(const std::string& alarm_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto doc = read_document(alarm_id);
  std::vector<AdaptationRecord> out;
  for (const auto& item : section(doc, "adaptations")) {
    out.push_back(bridge::adaptation_record_from_json(item));
  }
  return out;
}

void MemoryStorage::append_feedback(const std::string& alarm_id, const WakeUpFeedback& feedback) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto doc = read_document(alarm_id);
  section(doc, "feedback").push_back(bridge::to_json(feedback));
  write_document(alarm_id, doc);
}

std::vector<WakeUpFeedback> MemoryStorage::load_feedback(const std::string& alarm_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto doc = read_document(alarm_id);
  std::vector<WakeUpFeedback> out;
  for (const auto& item : section(doc, "feedback")) {
    out.push_back(bridge::wake_up_feedback_from_json(item));
  }
  return out;
}

nlohmann::json MemoryStorage::document(const std::string& alarm_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return read_document(alarm_id);
}

nlohmann::json MemoryStorage::read_document(const std::string& alarm_id) {
  auto it = documents_.find(alarm_id);
  if (it == documents_.end()) {
    return empty_document();
  }
  return it->second;
}

void MemoryStorage::write_document(const std::string& alarm_id, const nlohmann::json& document) {
  documents_[alarm_id] = document;
}

JsonFileStorage::JsonFileStorage(std::filesystem::path root) : root_(std::move(root)) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw std::runtime_error("Failed to create storage root " + root_.string() + ": " +
                             ec.message());
  }
}

// Letters, digits and '-' are kept; every other byte, '_' included, becomes
// '_' plus two hex digits, so distinct ids never share a file.
std::filesystem::path JsonFileStorage::path_for(const std::string& alarm_id) const {
  if (alarm_id.empty()) {
    throw ValidationError("Alarm id must not be empty");
  }
  static const char kHex[] = "0123456789abcdef";
  std::string name;
  name.reserve(alarm_id.size());
  for (char c : alarm_id) {
    const auto byte = static_cast<unsigned char>(c);
    if (std::isalnum(byte) || c == '-') {
      name.push_back(c);
    } else {
      name.push_back('_');
      name.push_back(kHex[byte >> 4]);
      name.push_back(kHex[byte & 0x0f]);
    }
  }
  return root_ / (name + ".json");
}

nlohmann::json JsonFileStorage::read_document(const std::string& alarm_id) {
  const auto path = path_for(alarm_id);
  if (!std::filesystem::exists(path)) {
    return empty_document();
  }
  std::ifstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open alarm document: " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  return nlohmann::json::parse(content);
}

void JsonFileStorage::write_document(const std::string& alarm_id, const nlohmann::json& document) {
  const auto path = path_for(alarm_id);
  auto temp = path;
  temp += ".tmp";
  {
    std::ofstream stream(temp, std::ios::trunc);
    if (!stream) {
      throw std::runtime_error("Failed to write alarm document: " + temp.string());
    }
    stream << document.dump(2);
    if (!stream) {
      throw std::runtime_error("Failed to write alarm document: " + temp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(temp, path, ec);
  if (ec) {
    throw std::runtime_error("Failed to replace alarm document " + path.string() + ": " +
                             ec.message());
  }
}

} // namespace wake

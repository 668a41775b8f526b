#include "wake/condition_catalog.hpp"

#include "debug_log.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace wake {

ConditionCatalog::ConditionCatalog(std::string alarm_id, std::shared_ptr<Storage> storage)
    : alarm_id_(std::move(alarm_id)), storage_(std::move(storage)) {
  if (!storage_) {
    throw ValidationError("ConditionCatalog requires a storage collaborator");
  }
}

void ConditionCatalog::load(std::vector<ConditionDefinition> definitions) {
  for (const auto& def : definitions) {
    def.validate();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  definitions_ = std::move(definitions);
}

std::vector<ConditionDefinition> ConditionCatalog::list(bool enabled_only) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enabled_only) {
    return definitions_;
  }
  std::vector<ConditionDefinition> enabled;
  std::copy_if(definitions_.begin(), definitions_.end(), std::back_inserter(enabled),
               [](const ConditionDefinition& def) { return def.enabled; });
  return enabled;
}

ConditionDefinition ConditionCatalog::get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(id);
  if (it == definitions_.end()) {
    throw NotFoundError("Unknown condition '" + id + "' for alarm '" + alarm_id_ + "'");
  }
  return *it;
}

bool ConditionCatalog::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return find_locked(id) != definitions_.end();
}

std::size_t ConditionCatalog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return definitions_.size();
}

void ConditionCatalog::upsert(const ConditionDefinition& def) {
  def.validate();
  std::lock_guard<std::mutex> lock(mutex_);
  storage_->save_condition(alarm_id_, def);
  auto it = find_locked(def.id);
  if (it == definitions_.end()) {
    definitions_.push_back(def);
  } else {
    *it = def;
  }
  debug_log("wake", "condition " + def.id + " upserted for " + alarm_id_);
}

void ConditionCatalog::update_effectiveness(const std::string& id, double score) {
  if (!(score >= 0.0 && score <= 1.0)) {
    throw ValidationError("effectivenessScore must be within [0, 1]");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(id);
  if (it == definitions_.end()) {
    throw NotFoundError("Unknown condition '" + id + "' for alarm '" + alarm_id_ + "'");
  }
  ConditionDefinition updated = *it;
  updated.effectiveness_score = score;
  storage_->save_condition(alarm_id_, updated);
  *it = std::move(updated);
}

void ConditionCatalog::mark_triggered(const std::vector<std::string>& ids, Timestamp when) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& id : ids) {
    auto it = find_locked(id);
    if (it == definitions_.end()) {
      continue;
    }
    ConditionDefinition updated = *it;
    updated.last_triggered = when;
    storage_->save_condition(alarm_id_, updated);
    *it = std::move(updated);
  }
}

void ConditionCatalog::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(id);
  if (it == definitions_.end()) {
    throw NotFoundError("Unknown condition '" + id + "' for alarm '" + alarm_id_ + "'");
  }
  storage_->remove_condition(alarm_id_, id);
  definitions_.erase(it);
}

std::vector<ConditionDefinition>::iterator ConditionCatalog::find_locked(const std::string& id) {
  return std::find_if(definitions_.begin(), definitions_.end(),
                      [&](const ConditionDefinition& def) { return def.id == id; });
}

std::vector<ConditionDefinition>::const_iterator ConditionCatalog::find_locked(
    const std::string& id) const {
  return std::find_if(definitions_.begin(), definitions_.end(),
                      [&](const ConditionDefinition& def) { return def.id == id; });
}

} // namespace wake

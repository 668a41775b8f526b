#pragma once

#include "collaborators.hpp"
#include "types.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace wake {

// Per-alarm registry of condition definitions. All mutation goes through
// this class; every write is persisted through Storage before the in-memory
// copy changes, so a storage failure leaves the catalog untouched.
class ConditionCatalog {
public:
  ConditionCatalog(std::string alarm_id, std::shared_ptr<Storage> storage);

  // Replaces the in-memory contents without persisting (restore path).
  void load(std::vector<ConditionDefinition> definitions);

  std::vector<ConditionDefinition> list(bool enabled_only = false) const;
  ConditionDefinition get(const std::string& id) const;
  bool contains(const std::string& id) const;
  std::size_t size() const;

  void upsert(const ConditionDefinition& def);
  void update_effectiveness(const std::string& id, double score);
  void mark_triggered(const std::vector<std::string>& ids, Timestamp when);
  void remove(const std::string& id);

private:
  std::vector<ConditionDefinition>::iterator find_locked(const std::string& id);
  std::vector<ConditionDefinition>::const_iterator find_locked(const std::string& id) const;

  std::string alarm_id_;
  std::shared_ptr<Storage> storage_;
  mutable std::mutex mutex_;
  std::vector<ConditionDefinition> definitions_;
};

} // namespace wake

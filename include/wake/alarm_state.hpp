#pragma once

#include "condition_catalog.hpp"
#include "types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wake {

enum class TickState {
  Idle,
  Evaluating,
  Applied,
  Skipped,
  Failed,
  Cancelled
};

inline std::string to_string(TickState state) {
  switch (state) {
    case TickState::Idle: return "idle";
    case TickState::Evaluating: return "evaluating";
    case TickState::Applied: return "applied";
    case TickState::Skipped: return "skipped";
    case TickState::Failed: return "failed";
    case TickState::Cancelled: return "cancelled";
  }
  return "idle";
}

// Everything the engine keeps for one alarm. `tick_mutex` serializes
// adaptation ticks and `feedback_mutex` serializes feedback recording;
// `mutex` guards the alarm, history and feedback and is never held across
// collaborator calls.
struct AlarmState {
  AlarmState(Alarm initial, std::shared_ptr<ConditionCatalog> conditions)
      : alarm(std::move(initial)), catalog(std::move(conditions)) {}

  std::mutex tick_mutex;
  std::mutex feedback_mutex;
  mutable std::mutex mutex;

  Alarm alarm;
  std::shared_ptr<ConditionCatalog> catalog;
  std::vector<AdaptationRecord> history;
  std::vector<WakeUpFeedback> feedback;

  std::atomic<bool> adaptation_active{true};
  TickState state = TickState::Idle;
  int consecutive_failures = 0;
  std::optional<Timestamp> last_tick;
  std::uint64_t next_sequence = 1;
};

} // namespace wake

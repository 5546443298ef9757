#pragma once

#include <cstdint>
#include <string_view>

namespace provgate::model {

/*
  Per-run orchestrator state.

  IDLE -> GATES_RUNNING -> AGGREGATING -> ENFORCING -> SEALED
  Any non-terminal state may move to ABORTED.
*/
enum class RunState : std::uint8_t {
  kIdle = 0,
  kGatesRunning = 1,
  kAggregating = 2,
  kEnforcing = 3,
  kSealed = 4,
  kAborted = 5,
};

constexpr bool IsTerminal(RunState state) {
  return state == RunState::kSealed || state == RunState::kAborted;
}

constexpr bool CanTransition(RunState from, RunState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == RunState::kAborted) {
    return true;
  }

  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view ToString(RunState state) {
  switch (state) {
    case RunState::kIdle:
      return "IDLE";
    case RunState::kGatesRunning:
      return "GATES_RUNNING";
    case RunState::kAggregating:
      return "AGGREGATING";
    case RunState::kEnforcing:
      return "ENFORCING";
    case RunState::kSealed:
      return "SEALED";
    case RunState::kAborted:
      return "ABORTED";
  }
  return "UNKNOWN";
}

}  // namespace provgate::model

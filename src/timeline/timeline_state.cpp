#include "timeline/timeline_state.hpp"

#include <algorithm>

namespace missionline::timeline {

const char* ToString(PhaseStatus status) {
  switch (status) {
  case PhaseStatus::kRunning:
    return "running";
  case PhaseStatus::kCompleted:
    return "completed";
  }
  return "running";
}

const PhaseEntry* RunState::FindPhase(std::string_view phase) const {
  const auto it = std::find_if(phases.begin(), phases.end(),
                               [phase](const PhaseEntry& entry) { return entry.phase == phase; });
  return it == phases.end() ? nullptr : &*it;
}

PhaseEntry* RunState::FindPhase(std::string_view phase) {
  const auto it = std::find_if(phases.begin(), phases.end(),
                               [phase](const PhaseEntry& entry) { return entry.phase == phase; });
  return it == phases.end() ? nullptr : &*it;
}

const RunState* TimelineState::FindRun(std::string_view run_id) const {
  const auto it = runs.find(std::string(run_id));
  return it == runs.end() ? nullptr : &it->second;
}

} // namespace missionline::timeline

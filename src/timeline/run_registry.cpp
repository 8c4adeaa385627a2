#include "timeline/run_registry.hpp"

namespace missionline::timeline {

RunState& EnsureRun(TimelineState& state, const std::string& run_id) {
  auto [it, inserted] = state.runs.try_emplace(run_id);
  if (inserted) {
    it->second.run_id = run_id;
  }
  return it->second;
}

void StartRun(TimelineState& state, const std::string& run_id) {
  EnsureRun(state, run_id);
  state.active_run_id = run_id;
}

std::string ResolvePhaseRun(const TimelineState& state,
                            const std::optional<std::string>& explicit_run_id,
                            std::string_view fallback_run_id) {
  if (explicit_run_id.has_value() && !explicit_run_id->empty()) {
    return *explicit_run_id;
  }
  if (state.active_run_id.has_value()) {
    return *state.active_run_id;
  }
  return std::string(fallback_run_id);
}

void FocusAfterPhaseWrite(TimelineState& state, const std::optional<std::string>& explicit_run_id,
                          const std::string& effective_run_id) {
  if (explicit_run_id.has_value() && !explicit_run_id->empty()) {
    state.active_run_id = *explicit_run_id;
    return;
  }
  if (!state.active_run_id.has_value()) {
    state.active_run_id = effective_run_id;
  }
}

} // namespace missionline::timeline

#pragma once

#include "timeline/timeline_state.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace missionline::timeline {

// Returns the run entry, creating an empty one on first reference.
RunState& EnsureRun(TimelineState& state, const std::string& run_id);

// Handles a run-start signal: creates the run when needed and always makes it
// the active run, even when it already existed. Iteration loops reuse ids and
// every start must refocus consumers on that run.
void StartRun(TimelineState& state, const std::string& run_id);

// Effective run for a phase record, in priority order: the record's own run,
// the active run, then the fallback run.
std::string ResolvePhaseRun(const TimelineState& state,
                            const std::optional<std::string>& explicit_run_id,
                            std::string_view fallback_run_id);

// Moves focus after a phase write to `effective_run_id`. An explicit run id
// from the producer always wins over the currently active run; with no active
// run the effective run becomes active so the active id always names a run.
void FocusAfterPhaseWrite(TimelineState& state, const std::optional<std::string>& explicit_run_id,
                          const std::string& effective_run_id);

} // namespace missionline::timeline

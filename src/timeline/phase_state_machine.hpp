#pragma once

#include "timeline/timeline_state.hpp"

#include <optional>
#include <string>

namespace missionline::timeline {

// Per (run, phase) lifecycle: absent -> running -> completed.
//
// | current   | next      | verdict     |
// |-----------|-----------|-------------|
// | absent    | any       | kApplied    |
// | running   | completed | kApplied    |
// | running   | running   | kIdempotent |
// | completed | completed | kIdempotent |
// | completed | running   | kRejected   |
enum class TransitionVerdict {
  kApplied,
  kIdempotent,
  kRejected,
};

const char* ToString(TransitionVerdict verdict);

TransitionVerdict CheckTransition(std::optional<PhaseStatus> current, PhaseStatus next);

// Current status of `phase` in `run_id`, nullopt when the run or phase is
// unknown. Does not create anything.
std::optional<PhaseStatus> CurrentStatus(const TimelineState& state, const std::string& run_id,
                                         const std::string& phase);

// Writes `next` into the run's phase map unless the transition is rejected.
// New phases are appended, existing ones updated in place so first-insertion
// order is kept.
TransitionVerdict ApplyTransition(RunState& run, const std::string& phase, PhaseStatus next);

} // namespace missionline::timeline

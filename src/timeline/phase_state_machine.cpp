#include "timeline/phase_state_machine.hpp"

namespace missionline::timeline {

const char* ToString(TransitionVerdict verdict) {
  switch (verdict) {
  case TransitionVerdict::kApplied:
    return "applied";
  case TransitionVerdict::kIdempotent:
    return "idempotent";
  case TransitionVerdict::kRejected:
    return "rejected";
  }
  return "rejected";
}

TransitionVerdict CheckTransition(std::optional<PhaseStatus> current, PhaseStatus next) {
  if (!current.has_value()) {
    return TransitionVerdict::kApplied;
  }
  if (*current == next) {
    return TransitionVerdict::kIdempotent;
  }
  if (*current == PhaseStatus::kCompleted && next == PhaseStatus::kRunning) {
    return TransitionVerdict::kRejected;
  }
  return TransitionVerdict::kApplied;
}

std::optional<PhaseStatus> CurrentStatus(const TimelineState& state, const std::string& run_id,
                                         const std::string& phase) {
  const RunState* run = state.FindRun(run_id);
  if (run == nullptr) {
    return std::nullopt;
  }
  const PhaseEntry* entry = run->FindPhase(phase);
  if (entry == nullptr) {
    return std::nullopt;
  }
  return entry->status;
}

TransitionVerdict ApplyTransition(RunState& run, const std::string& phase, PhaseStatus next) {
  PhaseEntry* entry = run.FindPhase(phase);
  const TransitionVerdict verdict =
      CheckTransition(entry == nullptr ? std::nullopt : std::optional<PhaseStatus>(entry->status),
                      next);
  if (verdict == TransitionVerdict::kRejected) {
    return verdict;
  }

  if (entry == nullptr) {
    run.phases.push_back(PhaseEntry{phase, next});
  } else {
    entry->status = next;
  }
  return verdict;
}

} // namespace missionline::timeline

#include "timeline/reducer.hpp"

#include "timeline/ordering_guard.hpp"
#include "timeline/phase_state_machine.hpp"
#include "timeline/run_registry.hpp"

namespace missionline::timeline {

namespace {

ApplyOutcome ApplyPhase(TimelineState& state, const NormalizedEvent& event,
                        const TimelineConfig& config) {
  if (!event.phase.has_value() || !event.status.has_value()) {
    return ApplyOutcome::kUnresolvedPhase;
  }

  const std::string run_id = ResolvePhaseRun(state, event.run_id, config.fallback_run_id);

  // Check before touching the registry: a rejected record must neither create
  // the run nor move focus.
  const auto current = CurrentStatus(state, run_id, *event.phase);
  if (CheckTransition(current, *event.status) == TransitionVerdict::kRejected) {
    return ApplyOutcome::kIllegalTransition;
  }

  RunState& run = EnsureRun(state, run_id);
  (void)ApplyTransition(run, *event.phase, *event.status);
  FocusAfterPhaseWrite(state, event.run_id, run_id);
  return ApplyOutcome::kAccepted;
}

} // namespace

const char* ToString(ApplyOutcome outcome) {
  switch (outcome) {
  case ApplyOutcome::kAccepted:
    return "accepted";
  case ApplyOutcome::kReset:
    return "reset";
  case ApplyOutcome::kStale:
    return "stale";
  case ApplyOutcome::kUnresolvedPhase:
    return "unresolved_phase";
  case ApplyOutcome::kIllegalTransition:
    return "illegal_transition";
  case ApplyOutcome::kMalformed:
    return "malformed";
  case ApplyOutcome::kIgnored:
    return "ignored";
  }
  return "ignored";
}

void ResetTimeline(TimelineState& state) {
  state = TimelineState{};
}

ApplyOutcome ApplyNormalized(TimelineState& state, const NormalizedEvent& event,
                             const TimelineConfig& config) {
  if (event.kind == EventKind::kReset) {
    ResetTimeline(state);
    return ApplyOutcome::kReset;
  }
  // Normalize() already flags a run start without a run id; hand-built events
  // get the same treatment.
  if (event.malformed || (event.kind == EventKind::kRunStarted && !event.run_id.has_value())) {
    return ApplyOutcome::kMalformed;
  }
  if (CheckSequence(state.last_sequence, event.sequence) == SequenceVerdict::kStale) {
    return ApplyOutcome::kStale;
  }

  state.last_sequence = AdvanceSequence(state.last_sequence, event.sequence);

  switch (event.kind) {
  case EventKind::kRunStarted:
    StartRun(state, *event.run_id);
    return ApplyOutcome::kAccepted;
  case EventKind::kPhaseStarted:
  case EventKind::kPhaseCompleted:
    return ApplyPhase(state, event, config);
  case EventKind::kReset:
  case EventKind::kUnknown:
    break;
  }
  return ApplyOutcome::kIgnored;
}

ApplyOutcome ApplyEvent(TimelineState& state, const events::RawEvent& event,
                        const TimelineConfig& config) {
  return ApplyNormalized(state, Normalize(event), config);
}

TimelineState Reduce(TimelineState state, const events::RawEvent& event,
                     const TimelineConfig& config) {
  (void)ApplyEvent(state, event, config);
  return state;
}

} // namespace missionline::timeline

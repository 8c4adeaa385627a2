#pragma once

#include "events/event_model.hpp"
#include "timeline/normalizer.hpp"
#include "timeline/timeline_state.hpp"

namespace missionline::timeline {

// What happened to one record. None of these is an error for the caller; they
// exist so hosts can count and log drops.
enum class ApplyOutcome {
  kAccepted,
  kReset,
  kStale,
  kUnresolvedPhase,
  kIllegalTransition,
  kMalformed,
  kIgnored,
};

// Report order for per-outcome counters.
inline constexpr ApplyOutcome kAllApplyOutcomes[] = {
    ApplyOutcome::kAccepted,        ApplyOutcome::kReset,
    ApplyOutcome::kStale,           ApplyOutcome::kUnresolvedPhase,
    ApplyOutcome::kIllegalTransition, ApplyOutcome::kMalformed,
    ApplyOutcome::kIgnored,
};

const char* ToString(ApplyOutcome outcome);

// Replaces `state` with a fresh empty timeline. Not subject to the ordering
// guard.
void ResetTimeline(TimelineState& state);

// Applies one normalized record in place.
//
// Order of checks:
// 1) reset wipes everything, whatever its sequence;
// 2) malformed records change nothing;
// 3) stale sequences change nothing;
// 4) the cursor advances, then the kind-specific mutation runs (or is
//    skipped as unresolved / illegal / ignored).
ApplyOutcome ApplyNormalized(TimelineState& state, const NormalizedEvent& event,
                             const TimelineConfig& config = {});

// Normalizes and applies one raw record in place.
ApplyOutcome ApplyEvent(TimelineState& state, const events::RawEvent& event,
                        const TimelineConfig& config = {});

// Pure transition `(state, event) -> state` for hosts that keep state as a
// value (stores, actors, replay loops).
TimelineState Reduce(TimelineState state, const events::RawEvent& event,
                     const TimelineConfig& config = {});

} // namespace missionline::timeline

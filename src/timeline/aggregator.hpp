#pragma once

#include "timeline/timeline_state.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace missionline::timeline {

struct ProjectionEntry {
  std::string phase;
  PhaseStatus status = PhaseStatus::kRunning;
};

// Externally consumable timeline: one entry per phase known in any run.
using Projection = std::vector<ProjectionEntry>;

// Numeric iteration suffix of a run id, i.e. the digits after the last
// `separator` ("mission-7:3" -> 3). nullopt when there is no separator, the
// suffix is empty, contains a non-digit, or overflows 64 bits.
std::optional<std::uint64_t> ParseIterationSuffix(std::string_view run_id, char separator);

// Merge walk order over all runs in `state`.
//
// Runs are first ordered lexically. The slots held by ids with an iteration
// suffix are then refilled with those same ids in iteration order (ties broken
// lexically), so a higher iteration is always walked after a lower one even
// when ids without a suffix (e.g. the fallback run) are present.
std::vector<std::string> OrderRunsForMerge(const TimelineState& state, char separator);

// Merges every run's phases in walk order. A later run overwrites an earlier
// run's status for the same phase; entries are emitted in first-seen order
// during the walk. Re-derived from scratch on every call.
Projection BuildProjection(const TimelineState& state, const TimelineConfig& config = {});

} // namespace missionline::timeline

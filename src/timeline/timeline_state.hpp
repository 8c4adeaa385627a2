#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace missionline::timeline {

// Absence of an entry means the phase has not started in that run.
enum class PhaseStatus {
  kRunning,
  kCompleted,
};

// Stable lowercase names: "running" / "completed".
const char* ToString(PhaseStatus status);

struct PhaseEntry {
  std::string phase;
  PhaseStatus status = PhaseStatus::kRunning;
};

// Per-run phase map. Entries keep first-insertion order, which is the order
// the merged projection reports them in.
struct RunState {
  std::string run_id;
  std::vector<PhaseEntry> phases;

  const PhaseEntry* FindPhase(std::string_view phase) const;
  PhaseEntry* FindPhase(std::string_view phase);
};

// Cursor value before any sequenced event has been accepted. Producers start
// at 0, so the first sequenced record is always fresh.
inline constexpr std::int64_t kInitialSequence = -1;

// Whole reconciled timeline. Replaced wholesale on reset, never partially
// pruned.
struct TimelineState {
  std::optional<std::string> active_run_id;
  std::int64_t last_sequence = kInitialSequence;
  std::map<std::string, RunState> runs;

  const RunState* FindRun(std::string_view run_id) const;
};

// Knobs that the reducer treats as constants. Exposed so hosts and tests can
// name them instead of repeating literals.
struct TimelineConfig {
  std::string fallback_run_id = "default_run";
  char iteration_separator = ':';
};

} // namespace missionline::timeline

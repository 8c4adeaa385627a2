#pragma once

#include "events/event_model.hpp"
#include "timeline/timeline_state.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace missionline::timeline {

// Canonical meaning of a record once both vocabularies are folded together.
enum class EventKind {
  kRunStarted,
  kPhaseStarted,
  kPhaseCompleted,
  kReset,
  kUnknown,
};

enum class Vocabulary {
  kCanonical,
  kLegacy,
  kNone,
};

const char* ToString(EventKind kind);
const char* ToString(Vocabulary vocabulary);

// Canonical tuple consumed by the reducer.
//
// - `run_id`: empty strings on the wire are folded to nullopt.
// - `phase`: canonical phase name, nullopt when no label resolves.
// - `status`: implied by `kind` for phase events, nullopt otherwise.
// - `malformed`: required fields missing or unusable; the reducer treats the
//   record as a full no-op.
struct NormalizedEvent {
  EventKind kind = EventKind::kUnknown;
  Vocabulary vocabulary = Vocabulary::kNone;
  std::optional<std::string> run_id;
  std::optional<std::string> phase;
  std::optional<PhaseStatus> status;
  std::optional<std::int64_t> sequence;
  bool malformed = false;
};

// Maps raw producer phase labels (e.g. "PLANNING") to canonical names
// ("plan"). Unknown labels are lowercased and kept; empty or absent labels
// resolve to nullopt.
std::optional<std::string> CanonicalPhaseName(const std::optional<std::string>& raw_label);

// Total over all inputs; never throws.
NormalizedEvent Normalize(const events::RawEvent& event);

// One JSON line describing the normalized tuple, used by `missionline normalize`.
std::string ToJson(const NormalizedEvent& event);

} // namespace missionline::timeline

#pragma once

#include <cstdint>
#include <optional>

namespace missionline::timeline {

enum class SequenceVerdict {
  kFresh,
  kStale,
};

// Forward-progress check against the last accepted sequence number.
//
// - No sequence: always fresh (unsequenced producers are trusted).
// - Sequence <= last: stale; the caller must drop the record untouched.
// There is no reorder buffer; stale records are gone for good.
SequenceVerdict CheckSequence(std::int64_t last_sequence, std::optional<std::int64_t> sequence);

// Cursor value after accepting a fresh record. Unsequenced records leave the
// cursor where it is.
std::int64_t AdvanceSequence(std::int64_t last_sequence, std::optional<std::int64_t> sequence);

} // namespace missionline::timeline

#include "timeline/ordering_guard.hpp"

namespace missionline::timeline {

SequenceVerdict CheckSequence(std::int64_t last_sequence, std::optional<std::int64_t> sequence) {
  if (sequence.has_value() && *sequence <= last_sequence) {
    return SequenceVerdict::kStale;
  }
  return SequenceVerdict::kFresh;
}

std::int64_t AdvanceSequence(std::int64_t last_sequence, std::optional<std::int64_t> sequence) {
  return sequence.has_value() ? *sequence : last_sequence;
}

} // namespace missionline::timeline

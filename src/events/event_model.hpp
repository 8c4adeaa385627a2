#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace missionline::events {

// Payload of one progress record as delivered by the producer. Every field is
// optional on the wire; which ones are required depends on the record type.
struct EventPayload {
  std::optional<std::string> run_id;
  std::optional<std::string> phase;
  std::optional<std::int64_t> seq;
  // Informational only. A phase record's status is implied by its type.
  std::optional<std::string> status;
  // Set by decoders when `seq` was present but not an integer. Such records
  // are malformed and must not move the sequence cursor.
  bool invalid_seq = false;
};

// Raw record in either the canonical or the legacy vocabulary, already
// decoded from the transport. `type` is kept verbatim; interpretation is the
// normalizer's job.
struct RawEvent {
  std::string type;
  EventPayload payload;
};

// Canonical record type strings.
inline constexpr const char* kTypeRunStarted = "RUN_STARTED";
inline constexpr const char* kTypePhaseStarted = "PHASE_STARTED";
inline constexpr const char* kTypePhaseCompleted = "PHASE_COMPLETED";

// Legacy record type strings. These stay supported permanently.
inline constexpr const char* kLegacyTypePhaseStart = "phase_start";
inline constexpr const char* kLegacyTypePhaseCompleted = "phase_completed";
inline constexpr const char* kLegacyTypeConversationInit = "conversation_init";

// Single-line JSON form, `{"type":...,"payload":{...}}`. Absent payload fields
// are omitted. An invalid sequence is written as `"seq":"invalid"`.
std::string ToJson(const RawEvent& event);

} // namespace missionline::events

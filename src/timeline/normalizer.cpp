#include "timeline/normalizer.hpp"

#include "core/json_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace missionline::timeline {

namespace {

// One entry per known record type. Anything not listed here falls through to
// kUnknownEntry and is ignored by the reducer.
struct KindEntry {
  std::string_view type;
  EventKind kind;
  Vocabulary vocabulary;
  std::optional<PhaseStatus> status;
};

constexpr std::array<KindEntry, 6> kKindTable = {{
    {events::kTypeRunStarted, EventKind::kRunStarted, Vocabulary::kCanonical, std::nullopt},
    {events::kTypePhaseStarted, EventKind::kPhaseStarted, Vocabulary::kCanonical,
     PhaseStatus::kRunning},
    {events::kTypePhaseCompleted, EventKind::kPhaseCompleted, Vocabulary::kCanonical,
     PhaseStatus::kCompleted},
    {events::kLegacyTypePhaseStart, EventKind::kPhaseStarted, Vocabulary::kLegacy,
     PhaseStatus::kRunning},
    {events::kLegacyTypePhaseCompleted, EventKind::kPhaseCompleted, Vocabulary::kLegacy,
     PhaseStatus::kCompleted},
    {events::kLegacyTypeConversationInit, EventKind::kReset, Vocabulary::kLegacy, std::nullopt},
}};

constexpr KindEntry kUnknownEntry = {"", EventKind::kUnknown, Vocabulary::kNone, std::nullopt};

struct PhaseAlias {
  std::string_view label;
  std::string_view canonical;
};

// Producer-side stage labels. Lookup is exact; the producer always emits these
// in upper case.
constexpr std::array<PhaseAlias, 7> kPhaseAliases = {{
    {"CONTEXT_ENRICHMENT", "contextualize"},
    {"PLANNING", "plan"},
    {"DESIGN", "design"},
    {"EXECUTION", "execute"},
    {"REFLECTION", "review"},
    {"RE-PLANNING", "replan"},
    {"RESEARCH", "research"},
}};

const KindEntry& LookupKind(std::string_view type) {
  const auto it = std::find_if(kKindTable.begin(), kKindTable.end(),
                               [type](const KindEntry& entry) { return entry.type == type; });
  return it == kKindTable.end() ? kUnknownEntry : *it;
}

std::string FoldCase(std::string_view raw) {
  std::string folded(raw);
  std::transform(folded.begin(), folded.end(), folded.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return folded;
}

std::optional<std::string> NonEmpty(const std::optional<std::string>& value) {
  if (!value.has_value() || value->empty()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

const char* ToString(EventKind kind) {
  switch (kind) {
  case EventKind::kRunStarted:
    return "run_started";
  case EventKind::kPhaseStarted:
    return "phase_started";
  case EventKind::kPhaseCompleted:
    return "phase_completed";
  case EventKind::kReset:
    return "reset";
  case EventKind::kUnknown:
    return "unknown";
  }
  return "unknown";
}

const char* ToString(Vocabulary vocabulary) {
  switch (vocabulary) {
  case Vocabulary::kCanonical:
    return "canonical";
  case Vocabulary::kLegacy:
    return "legacy";
  case Vocabulary::kNone:
    return "none";
  }
  return "none";
}

std::optional<std::string> CanonicalPhaseName(const std::optional<std::string>& raw_label) {
  if (!raw_label.has_value() || raw_label->empty()) {
    return std::nullopt;
  }

  for (const auto& alias : kPhaseAliases) {
    if (alias.label == *raw_label) {
      return std::string(alias.canonical);
    }
  }
  return FoldCase(*raw_label);
}

NormalizedEvent Normalize(const events::RawEvent& event) {
  const KindEntry& entry = LookupKind(event.type);

  NormalizedEvent normalized;
  normalized.kind = entry.kind;
  normalized.vocabulary = entry.vocabulary;
  normalized.status = entry.status;
  normalized.run_id = NonEmpty(event.payload.run_id);
  normalized.sequence = event.payload.seq;
  normalized.malformed = event.payload.invalid_seq;

  switch (entry.kind) {
  case EventKind::kRunStarted:
    if (!normalized.run_id.has_value()) {
      normalized.malformed = true;
    }
    break;
  case EventKind::kPhaseStarted:
  case EventKind::kPhaseCompleted:
    normalized.phase = CanonicalPhaseName(event.payload.phase);
    break;
  case EventKind::kReset:
  case EventKind::kUnknown:
    break;
  }

  if (normalized.malformed) {
    // A record with an unusable sequence has no trustworthy cursor value.
    normalized.sequence.reset();
  }
  return normalized;
}

std::string ToJson(const NormalizedEvent& event) {
  core::JsonObjectWriter out;
  out.String("kind", ToString(event.kind));
  out.String("vocabulary", ToString(event.vocabulary));
  out.Raw("run_id", core::OptionalStringJson(event.run_id));
  out.Raw("phase", core::OptionalStringJson(event.phase));
  out.Raw("status", event.status.has_value() ? core::QuoteJson(ToString(*event.status))
                                             : std::string("null"));
  out.Raw("seq", core::OptionalIntJson(event.sequence));
  out.Raw("malformed", event.malformed ? "true" : "false");
  return out.Finish();
}

} // namespace missionline::timeline

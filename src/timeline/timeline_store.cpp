#include "timeline/timeline_store.hpp"

#include <string>
#include <utility>

namespace missionline::timeline {

std::size_t OutcomeCounters::Count(ApplyOutcome outcome) const {
  const auto it = by_outcome.find(outcome);
  return it == by_outcome.end() ? 0U : it->second;
}

TimelineStore::TimelineStore(TimelineConfig config, core::logging::Logger* logger)
    : config_(std::move(config)), logger_(logger) {}

ApplyOutcome TimelineStore::Dispatch(const events::RawEvent& event) {
  const ApplyOutcome outcome = ApplyEvent(state_, event, config_);
  ++counters_.by_outcome[outcome];
  ++counters_.total;
  LogOutcome(event, outcome);
  return outcome;
}

events::EventChannel::Subscription TimelineStore::Attach(events::EventChannel& channel) {
  return channel.Subscribe([this](const events::RawEvent& event) { (void)Dispatch(event); });
}

Projection TimelineStore::CurrentProjection() const {
  return BuildProjection(state_, config_);
}

void TimelineStore::LogOutcome(const events::RawEvent& event, ApplyOutcome outcome) {
  if (logger_ == nullptr) {
    return;
  }

  logger_->SetActiveRun(state_.active_run_id);
  const std::string seq =
      event.payload.seq.has_value() ? std::to_string(*event.payload.seq) : std::string("-");
  const std::string cursor = std::to_string(state_.last_sequence);

  switch (outcome) {
  case ApplyOutcome::kReset:
    logger_->Info("timeline reset", {{"type", event.type}});
    return;
  case ApplyOutcome::kAccepted:
    logger_->Debug("event applied", {{"type", event.type}, {"seq", seq}, {"cursor", cursor}});
    return;
  case ApplyOutcome::kStale:
  case ApplyOutcome::kUnresolvedPhase:
  case ApplyOutcome::kIllegalTransition:
  case ApplyOutcome::kMalformed:
  case ApplyOutcome::kIgnored:
    logger_->Debug("event dropped", {{"type", event.type},
                                     {"outcome", ToString(outcome)},
                                     {"seq", seq},
                                     {"cursor", cursor}});
    return;
  }
}

} // namespace missionline::timeline

#pragma once

#include "core/logging/logger.hpp"
#include "events/event_channel.hpp"
#include "events/event_model.hpp"
#include "timeline/aggregator.hpp"
#include "timeline/reducer.hpp"
#include "timeline/timeline_state.hpp"

#include <cstddef>
#include <map>

namespace missionline::timeline {

// Per-outcome counters since the store was created. Resets are counted like
// any other outcome and do not clear the counters.
struct OutcomeCounters {
  std::map<ApplyOutcome, std::size_t> by_outcome;
  std::size_t total = 0;

  std::size_t Count(ApplyOutcome outcome) const;
};

// Host for the reducer: owns one TimelineState, applies records one at a time
// and serves the re-derived projection. It does not own any subscription;
// Attach() hands the handle back to the caller.
class TimelineStore {
public:
  explicit TimelineStore(TimelineConfig config = {}, core::logging::Logger* logger = nullptr);

  ApplyOutcome Dispatch(const events::RawEvent& event);

  // Subscribes Dispatch() to `channel`. The store follows the channel for as
  // long as the returned handle lives; the handle must be released before the
  // store is destroyed.
  [[nodiscard]] events::EventChannel::Subscription Attach(events::EventChannel& channel);

  const TimelineState& State() const {
    return state_;
  }

  const TimelineConfig& Config() const {
    return config_;
  }

  const OutcomeCounters& Counters() const {
    return counters_;
  }

  Projection CurrentProjection() const;

private:
  void LogOutcome(const events::RawEvent& event, ApplyOutcome outcome);

  TimelineConfig config_;
  core::logging::Logger* logger_ = nullptr;
  TimelineState state_;
  OutcomeCounters counters_;
};

} // namespace missionline::timeline

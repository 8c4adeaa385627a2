#include "timeline/aggregator.hpp"

#include <algorithm>
#include <charconv>
#include <map>
#include <system_error>
#include <utility>

namespace missionline::timeline {

std::optional<std::uint64_t> ParseIterationSuffix(std::string_view run_id, char separator) {
  const std::size_t split = run_id.rfind(separator);
  if (split == std::string_view::npos) {
    return std::nullopt;
  }

  const std::string_view suffix = run_id.substr(split + 1U);
  if (suffix.empty()) {
    return std::nullopt;
  }
  // from_chars would accept a leading digit run; require the whole suffix.
  if (!std::all_of(suffix.begin(), suffix.end(),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }

  std::uint64_t iteration = 0;
  const auto [ptr, ec] = std::from_chars(suffix.data(), suffix.data() + suffix.size(), iteration);
  if (ec != std::errc() || ptr != suffix.data() + suffix.size()) {
    return std::nullopt;
  }
  return iteration;
}

std::vector<std::string> OrderRunsForMerge(const TimelineState& state, char separator) {
  // `runs` is a std::map, so this starts out lexically sorted.
  std::vector<std::string> ordered;
  ordered.reserve(state.runs.size());
  std::vector<std::size_t> numbered_slots;
  std::vector<std::pair<std::uint64_t, std::string>> numbered;

  for (const auto& entry : state.runs) {
    const std::string& run_id = entry.first;
    const auto iteration = ParseIterationSuffix(run_id, separator);
    if (iteration.has_value()) {
      numbered_slots.push_back(ordered.size());
      numbered.emplace_back(*iteration, run_id);
    }
    ordered.push_back(run_id);
  }

  // Suffixed ids keep the slots they hold lexically but are reordered among
  // themselves by iteration, ties broken lexically.
  std::sort(numbered.begin(), numbered.end());
  for (std::size_t i = 0; i < numbered_slots.size(); ++i) {
    ordered[numbered_slots[i]] = std::move(numbered[i].second);
  }
  return ordered;
}

Projection BuildProjection(const TimelineState& state, const TimelineConfig& config) {
  Projection projection;
  std::map<std::string, std::size_t> slot_by_phase;

  for (const std::string& run_id : OrderRunsForMerge(state, config.iteration_separator)) {
    const RunState* run = state.FindRun(run_id);
    if (run == nullptr) {
      continue;
    }
    for (const PhaseEntry& entry : run->phases) {
      const auto [it, inserted] = slot_by_phase.try_emplace(entry.phase, projection.size());
      if (inserted) {
        projection.push_back(ProjectionEntry{entry.phase, entry.status});
      } else {
        projection[it->second].status = entry.status;
      }
    }
  }
  return projection;
}

} // namespace missionline::timeline

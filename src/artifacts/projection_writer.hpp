#pragma once

#include "timeline/aggregator.hpp"
#include "timeline/timeline_state.hpp"
#include "timeline/timeline_store.hpp"

#include <filesystem>
#include <string>

namespace missionline::artifacts {

// `[{"phase":"plan","status":"completed"},...]` in projection order.
std::string ToJson(const timeline::Projection& projection);

// Full replay report for one store:
// {
//   "active_run_id": <string|null>,
//   "last_seq": <int>,
//   "timeline": [...projection...],
//   "runs": [{"run_id": ..., "phases": [...]}, ...],   // merge walk order
//   "outcomes": {"accepted": n, ..., "total": n}
// }
std::string BuildReplayReportJson(const timeline::TimelineStore& store);

// Writes the replay report to `output_path` atomically.
//
// Contract:
// - creates parent directories when missing.
// - returns false and sets `error` on failure; never leaves a partial file.
bool WriteReplayReport(const timeline::TimelineStore& store,
                       const std::filesystem::path& output_path, std::string& error);

} // namespace missionline::artifacts

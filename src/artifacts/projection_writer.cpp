#include "artifacts/projection_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "timeline/reducer.hpp"

#include <sstream>
#include <vector>

namespace missionline::artifacts {

namespace {

template <typename Entry>
std::string SerializePhaseList(const std::vector<Entry>& entries) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (i > 0U) {
      out << ",";
    }
    core::JsonObjectWriter item;
    item.String("phase", entries[i].phase);
    item.String("status", timeline::ToString(entries[i].status));
    out << item.Finish();
  }
  out << "]";
  return out.str();
}

std::string SerializeRuns(const timeline::TimelineState& state, char separator) {
  std::ostringstream out;
  out << "[";
  bool first = true;
  for (const std::string& run_id : timeline::OrderRunsForMerge(state, separator)) {
    const timeline::RunState* run = state.FindRun(run_id);
    if (run == nullptr) {
      continue;
    }
    if (!first) {
      out << ",";
    }
    first = false;

    core::JsonObjectWriter item;
    item.String("run_id", run->run_id);
    item.Raw("phases", SerializePhaseList(run->phases));
    out << item.Finish();
  }
  out << "]";
  return out.str();
}

std::string SerializeOutcomes(const timeline::OutcomeCounters& counters) {
  core::JsonObjectWriter out;
  for (const timeline::ApplyOutcome outcome : timeline::kAllApplyOutcomes) {
    out.Raw(timeline::ToString(outcome), std::to_string(counters.Count(outcome)));
  }
  out.Raw("total", std::to_string(counters.total));
  return out.Finish();
}

} // namespace

std::string ToJson(const timeline::Projection& projection) {
  return SerializePhaseList(projection);
}

std::string BuildReplayReportJson(const timeline::TimelineStore& store) {
  const timeline::TimelineState& state = store.State();

  core::JsonObjectWriter out;
  out.Raw("active_run_id", core::OptionalStringJson(state.active_run_id));
  out.Raw("last_seq", std::to_string(state.last_sequence));
  out.Raw("timeline", ToJson(store.CurrentProjection()));
  out.Raw("runs", SerializeRuns(state, store.Config().iteration_separator));
  out.Raw("outcomes", SerializeOutcomes(store.Counters()));
  return out.Finish();
}

bool WriteReplayReport(const timeline::TimelineStore& store,
                       const std::filesystem::path& output_path, std::string& error) {
  return core::WriteTextFileAtomic(output_path, BuildReplayReportJson(store) + "\n", error);
}

} // namespace missionline::artifacts

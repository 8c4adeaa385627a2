#include "artifacts/projection_writer.hpp"
#include "timeline/timeline_store.hpp"

#include "common/assertions.hpp"
#include "common/event_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using missionline::tests::common::AssertContains;
using missionline::tests::common::Fail;
using missionline::tests::common::MakeEvent;
using missionline::tests::common::PhaseCompleted;
using missionline::tests::common::PhaseStarted;
using missionline::tests::common::RunStarted;

int main() {
  using missionline::artifacts::BuildReplayReportJson;
  using missionline::artifacts::ToJson;
  using missionline::timeline::TimelineStore;

  if (ToJson(missionline::timeline::Projection{}) != "[]") {
    Fail("empty projection should serialize to []");
  }

  TimelineStore store;
  (void)store.Dispatch(RunStarted("mission:2", 0));
  (void)store.Dispatch(PhaseStarted(std::nullopt, "PLANNING", 1));
  (void)store.Dispatch(PhaseCompleted(std::nullopt, "PLANNING", 2));
  (void)store.Dispatch(RunStarted("mission:10", 3));
  (void)store.Dispatch(PhaseStarted(std::nullopt, "EXECUTION", 4));
  (void)store.Dispatch(PhaseStarted(std::nullopt, "EXECUTION", 4));
  (void)store.Dispatch(MakeEvent("TOOL_CALLED"));

  const std::string projection = ToJson(store.CurrentProjection());
  if (projection !=
      R"([{"phase":"plan","status":"completed"},{"phase":"execute","status":"running"}])") {
    Fail("unexpected projection json: " + projection);
  }

  const std::string report = BuildReplayReportJson(store);
  AssertContains(report, R"("active_run_id":"mission:10")");
  AssertContains(report, R"("last_seq":4)");
  AssertContains(report, R"("timeline":[{"phase":"plan","status":"completed"})");
  // Runs are listed in merge order, numeric iteration first.
  AssertContains(report,
                 R"("runs":[{"run_id":"mission:2","phases":[{"phase":"plan","status":"completed"}]},)"
                 R"({"run_id":"mission:10","phases":[{"phase":"execute","status":"running"}]}])");
  AssertContains(report,
                 R"("outcomes":{"accepted":5,"reset":0,"stale":1,"unresolved_phase":0,)"
                 R"("illegal_transition":0,"malformed":0,"ignored":1,"total":7})");

  {
    TimelineStore empty;
    const std::string empty_report = BuildReplayReportJson(empty);
    AssertContains(empty_report, R"("active_run_id":null)");
    AssertContains(empty_report, R"("last_seq":-1)");
    AssertContains(empty_report, R"("timeline":[])");
    AssertContains(empty_report, R"("runs":[])");
  }

  const auto root = missionline::tests::common::CreateUniqueTempDir("missionline-report-writer");
  const auto path = root / "nested" / "report.json";
  std::string error;
  if (!missionline::artifacts::WriteReplayReport(store, path, error)) {
    Fail("report write failed: " + error);
  }
  const std::string written = missionline::tests::common::ReadFileToString(path);
  if (written != report + "\n") {
    Fail("written report should match the in-memory report");
  }
  missionline::tests::common::RemovePathBestEffort(root);

  std::cout << "projection_writer_smoke: ok\n";
  return 0;
}

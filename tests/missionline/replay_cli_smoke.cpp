#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

using missionline::tests::common::AssertContains;
using missionline::tests::common::AssertNotContains;
using missionline::tests::common::DispatchCaptured;
using missionline::tests::common::Fail;

namespace {

void ExpectExit(int actual, int expected, const std::string& context) {
  if (actual != expected) {
    Fail(context + ": expected exit " + std::to_string(expected) + ", got " +
         std::to_string(actual));
  }
}

} // namespace

int main() {
  const fs::path root = missionline::tests::common::CreateUniqueTempDir("missionline-replay-cli");
  const fs::path clean = root / "clean.jsonl";
  const fs::path noisy = root / "noisy.jsonl";
  const fs::path report = root / "out" / "report.json";

  missionline::tests::common::WriteFileOrFail(
      clean, "{\"type\":\"RUN_STARTED\",\"payload\":{\"run_id\":\"r1\",\"seq\":0}}\n"
             "{\"type\":\"PHASE_STARTED\",\"payload\":{\"run_id\":\"r1\",\"phase\":\"PLANNING\",\"seq\":1}}\n"
             "{\"type\":\"PHASE_COMPLETED\",\"payload\":{\"run_id\":\"r1\",\"phase\":\"PLANNING\",\"seq\":2}}\n"
             "{\"type\":\"PHASE_COMPLETED\",\"payload\":{\"run_id\":\"r1\",\"phase\":\"PLANNING\",\"seq\":2}}\n"
             "{\"type\":\"phase_start\",\"payload\":{\"phase\":\"EXECUTION\"}}\n");
  missionline::tests::common::WriteFileOrFail(
      noisy, "{\"type\":\"phase_start\",\"payload\":{\"phase\":\"EXECUTION\"}}\n"
             "this is not json\n"
             "{\"type\":\"phase_completed\",\"payload\":{\"phase\":\"EXECUTION\"}}\n");

  {
    const auto result = DispatchCaptured({"missionline", "replay", clean.string(), "--out",
                                          report.string()});
    ExpectExit(result.exit_code, 0, "replay");
    if (result.stdout_text !=
        "[{\"phase\":\"plan\",\"status\":\"completed\"},{\"phase\":\"execute\",\"status\":\"running\"}]\n") {
      Fail("unexpected replay stdout: " + result.stdout_text);
    }
    AssertContains(result.stderr_text, "msg=\"replay finished\" events=\"5\" accepted=\"4\" stale=\"1\"");
    AssertContains(result.stderr_text, "msg=\"replay report written\"");

    const std::string report_text = missionline::tests::common::ReadFileToString(report);
    AssertContains(report_text, "\"active_run_id\":\"r1\"");
    AssertContains(report_text, "\"last_seq\":2");
    AssertContains(report_text, "\"stale\":1");
  }

  {
    // Tolerant by default: undecodable lines are logged and skipped.
    const auto result = DispatchCaptured({"missionline", "replay", noisy.string()});
    ExpectExit(result.exit_code, 0, "tolerant replay");
    AssertContains(result.stdout_text, "{\"phase\":\"execute\",\"status\":\"completed\"}");
    AssertContains(result.stderr_text, "level=warn");
    AssertContains(result.stderr_text, "msg=\"skipping undecodable event line\" line=\"2\"");
  }

  {
    const auto result = DispatchCaptured({"missionline", "replay", noisy.string(), "--strict"});
    ExpectExit(result.exit_code, 10, "strict replay");
    AssertContains(result.stderr_text, "error: 1 undecodable line(s)");
    if (!result.stdout_text.empty()) {
      Fail("strict failure should not print a projection");
    }
  }

  {
    const auto result = DispatchCaptured({"missionline", "replay", (root / "missing.jsonl").string()});
    ExpectExit(result.exit_code, 1, "missing input");
    AssertContains(result.stderr_text, "error: input file not found");
  }

  {
    ExpectExit(DispatchCaptured({"missionline"}).exit_code, 2, "no subcommand");
    ExpectExit(DispatchCaptured({"missionline", "replay"}).exit_code, 2, "replay without input");
    ExpectExit(DispatchCaptured({"missionline", "replay", clean.string(), "--out"}).exit_code, 2,
               "dangling --out");
    ExpectExit(DispatchCaptured({"missionline", "replay", clean.string(), "extra.jsonl"}).exit_code,
               2, "extra positional");

    const auto bad_flag = DispatchCaptured({"missionline", "replay", clean.string(), "--fast"});
    ExpectExit(bad_flag.exit_code, 2, "unknown flag");
    AssertContains(bad_flag.stderr_text, "error: unknown option: --fast");

    const auto unknown = DispatchCaptured({"missionline", "rewind"});
    ExpectExit(unknown.exit_code, 2, "unknown subcommand");
    AssertContains(unknown.stderr_text, "usage:");
    AssertContains(unknown.stderr_text, "missionline help");
  }

  {
    const auto result = DispatchCaptured({"missionline", "normalize", noisy.string()});
    ExpectExit(result.exit_code, 0, "normalize");
    AssertContains(result.stdout_text,
                   "{\"kind\":\"phase_started\",\"vocabulary\":\"legacy\",\"run_id\":null,"
                   "\"phase\":\"execute\",\"status\":\"running\",\"seq\":null,\"malformed\":false}\n");
    AssertContains(result.stdout_text, "\"kind\":\"phase_completed\"");
    AssertContains(result.stderr_text, "warning: line 2: ");
    ExpectExit(DispatchCaptured({"missionline", "normalize"}).exit_code, 2, "normalize usage");
  }

  {
    const auto version = DispatchCaptured({"missionline", "version"});
    ExpectExit(version.exit_code, 0, "version");
    AssertContains(version.stdout_text, "missionline 0.1.0");

    const auto help = DispatchCaptured({"missionline", "help"});
    ExpectExit(help.exit_code, 0, "help");
    AssertContains(help.stdout_text, "missionline replay <events.jsonl>");
    AssertContains(help.stdout_text, "missionline help");
    AssertNotContains(help.stdout_text, "error:");
  }

  missionline::tests::common::RemovePathBestEffort(root);
  std::cout << "replay_cli_smoke: ok\n";
  return 0;
}

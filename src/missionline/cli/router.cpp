#include "missionline/cli/router.hpp"

#include "artifacts/projection_writer.hpp"
#include "core/errors/exit_codes.hpp"
#include "events/event_channel.hpp"
#include "events/jsonl_reader.hpp"
#include "timeline/normalizer.hpp"
#include "timeline/timeline_store.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace missionline::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitInputInvalid = core::errors::ToInt(core::errors::ExitCode::kInputInvalid);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  missionline replay <events.jsonl> [--out <report.json>] [--strict] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  missionline normalize <events.jsonl>\n"
      << "  missionline version\n"
      << "  missionline help\n";
}

// Parse `replay` args:
// - exactly one input path
// - optional `--out <file>`, `--strict`, `--log-level <level>`
// Unknown flags and extra positionals are usage errors.
bool ParseReplayOptions(const std::vector<std::string_view>& args, ReplayOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--strict") {
      options.strict = true;
      continue;
    }
    if (token == "--out") {
      if (i + 1 >= args.size()) {
        error = "missing value for --out";
        return false;
      }
      options.output_path = fs::path(args[i + 1]);
      ++i;
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      if (!core::logging::ParseLogLevel(args[i + 1], options.log_level, error)) {
        return false;
      }
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.input_path.empty()) {
      error = "replay accepts exactly 1 input path";
      return false;
    }
    options.input_path = fs::path(token);
  }

  if (options.input_path.empty()) {
    error = "replay requires exactly 1 argument: <events.jsonl>";
    return false;
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "missionline 0.1.0\n";
  return kExitSuccess;
}

int CommandReplay(const std::vector<std::string_view>& args) {
  ReplayOptions options;
  std::string error;
  if (!ParseReplayOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  return ExecuteReplay(options);
}

int CommandNormalize(const std::vector<std::string_view>& args) {
  if (args.size() != 1U || (!args.front().empty() && args.front().front() == '-')) {
    std::cerr << "error: normalize requires exactly 1 argument: <events.jsonl>\n";
    return kExitUsage;
  }

  std::vector<events::RawEvent> records;
  std::vector<events::DecodeIssue> issues;
  std::string error;
  if (!events::ReadEventsJsonl(fs::path(args.front()), records, issues, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  for (const auto& issue : issues) {
    std::cerr << "warning: line " << issue.line << ": " << issue.message << '\n';
  }
  for (const auto& record : records) {
    std::cout << timeline::ToJson(timeline::Normalize(record)) << '\n';
  }
  return kExitSuccess;
}

} // namespace

int ExecuteReplay(const ReplayOptions& options) {
  core::logging::Logger logger(options.log_level);

  std::vector<events::RawEvent> records;
  std::vector<events::DecodeIssue> issues;
  std::string error;
  if (!events::ReadEventsJsonl(options.input_path, records, issues, error)) {
    logger.Error("failed to read event stream", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  for (const auto& issue : issues) {
    logger.Warn("skipping undecodable event line",
                {{"line", std::to_string(issue.line)}, {"error", issue.message}});
  }
  if (options.strict && !issues.empty()) {
    std::cerr << "error: " << issues.size() << " undecodable line(s) in "
              << options.input_path.string() << '\n';
    return kExitInputInvalid;
  }

  timeline::TimelineStore store({}, &logger);
  events::EventChannel channel;
  {
    const auto subscription = store.Attach(channel);
    for (const auto& record : records) {
      channel.Publish(record);
    }
  }

  const timeline::OutcomeCounters& counters = store.Counters();
  logger.Info("replay finished",
              {{"events", std::to_string(counters.total)},
               {"accepted", std::to_string(counters.Count(timeline::ApplyOutcome::kAccepted))},
               {"stale", std::to_string(counters.Count(timeline::ApplyOutcome::kStale))},
               {"runs", std::to_string(store.State().runs.size())}});

  if (!options.output_path.empty()) {
    if (!artifacts::WriteReplayReport(store, options.output_path, error)) {
      logger.Error("failed to write replay report", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    logger.Info("replay report written", {{"path", options.output_path.string()}});
  }

  std::cout << artifacts::ToJson(store.CurrentProjection()) << '\n';
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "replay") {
    return CommandReplay(args);
  }
  if (command == "normalize") {
    return CommandNormalize(args);
  }
  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace missionline::cli

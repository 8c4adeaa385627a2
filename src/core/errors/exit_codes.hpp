#pragma once

namespace missionline::core::errors {

// Process-exit contract for the `missionline` CLI.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// kInputInvalid is returned only by `replay --strict` when the recorded
// stream contains lines that could not be decoded.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kInputInvalid = 10,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace missionline::core::errors

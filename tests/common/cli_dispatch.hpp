#ifndef MISSIONLINE_TESTS_COMMON_CLI_DISPATCH_HPP_
#define MISSIONLINE_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "missionline/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace missionline::tests::common {

struct CapturedDispatch {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

// Runs the CLI router in-process with stdout/stderr captured.
inline CapturedDispatch DispatchCaptured(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }

  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());

  CapturedDispatch result;
  result.exit_code = missionline::cli::Dispatch(static_cast<int>(argv.size()), argv.data());

  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);
  result.stdout_text = captured_out.str();
  result.stderr_text = captured_err.str();
  return result;
}

} // namespace missionline::tests::common

#endif // MISSIONLINE_TESTS_COMMON_CLI_DISPATCH_HPP_

#ifndef MISSIONLINE_TESTS_COMMON_ASSERTIONS_HPP_
#define MISSIONLINE_TESTS_COMMON_ASSERTIONS_HPP_

#include "timeline/aggregator.hpp"
#include "timeline/reducer.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace missionline::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    return;
  }
  std::cerr << "expected to not find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertOutcome(timeline::ApplyOutcome actual, timeline::ApplyOutcome expected,
                          std::string_view context) {
  if (actual == expected) {
    return;
  }
  std::cerr << context << ": expected outcome " << timeline::ToString(expected) << ", got "
            << timeline::ToString(actual) << '\n';
  std::abort();
}

inline std::string DescribeProjection(const timeline::Projection& projection) {
  std::string text = "[";
  for (std::size_t i = 0; i < projection.size(); ++i) {
    if (i > 0U) {
      text += ", ";
    }
    text += projection[i].phase + "=" + timeline::ToString(projection[i].status);
  }
  return text + "]";
}

// Compares phase/status pairs in order.
inline void AssertProjection(
    const timeline::Projection& actual,
    const std::vector<std::pair<std::string, timeline::PhaseStatus>>& expected,
    std::string_view context) {
  bool same = actual.size() == expected.size();
  for (std::size_t i = 0; same && i < actual.size(); ++i) {
    same = actual[i].phase == expected[i].first && actual[i].status == expected[i].second;
  }
  if (same) {
    return;
  }

  timeline::Projection wanted;
  for (const auto& [phase, status] : expected) {
    wanted.push_back({phase, status});
  }
  std::cerr << context << ": projection mismatch\n";
  std::cerr << "  expected: " << DescribeProjection(wanted) << '\n';
  std::cerr << "  actual:   " << DescribeProjection(actual) << '\n';
  std::abort();
}

inline std::string ReadFileToString(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open file: " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

} // namespace missionline::tests::common

#endif // MISSIONLINE_TESTS_COMMON_ASSERTIONS_HPP_

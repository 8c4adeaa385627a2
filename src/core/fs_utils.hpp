#ifndef MISSIONLINE_CORE_FS_UTILS_HPP_
#define MISSIONLINE_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace missionline::core {

// Reads a whole regular file. Directories and missing paths are reported as
// errors instead of yielding empty content.
inline bool ReadTextFile(const std::filesystem::path& input_path, std::string& contents,
                         std::string& error) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(input_path, ec) || ec) {
    error = "input file not found or not a regular file: " + input_path.string();
    return false;
  }

  std::ifstream input(input_path, std::ios::binary);
  if (!input) {
    error = "unable to open input file: " + input_path.string();
    return false;
  }

  contents.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading input file: " + input_path.string();
    return false;
  }
  return true;
}

// Writes `text` to a temporary sibling and renames it into place so readers
// never observe a partially written report.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  std::error_code ec;
  const std::filesystem::path parent_dir = output_path.parent_path();
  if (!parent_dir.empty()) {
    std::filesystem::create_directories(parent_dir, ec);
    if (ec) {
      error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
      return false;
    }
  }

  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::filesystem::path temp_path =
      output_path.string() + ".tmp." + std::to_string(tick) + "." +
      std::to_string(counter.fetch_add(1U, std::memory_order_relaxed));
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }
    out_file << text;
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::filesystem::rename(temp_path, output_path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    (void)std::filesystem::remove(temp_path, cleanup_ec);
    error = "failed to publish output file '" + output_path.string() + "': " + ec.message();
    return false;
  }
  return true;
}

} // namespace missionline::core

#endif // MISSIONLINE_CORE_FS_UTILS_HPP_

#pragma once

#include "events/event_model.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace missionline::events {

// One line of a recorded stream that could not be turned into a RawEvent.
struct DecodeIssue {
  std::size_t line = 0;
  std::string message;
};

// Decodes one JSON record into `event`.
//
// Contract:
// - record must be an object with a string `type`.
// - `payload` may be missing or null (empty payload) but must otherwise be an
//   object.
// - `run_id`/`phase`/`status` are kept only when they are strings.
// - `seq` is kept when it is an integral number in int64 range; null or
//   missing means absent; anything else sets `payload.invalid_seq`.
// - returns false with `error` populated when the record cannot be used.
bool DecodeEventJson(std::string_view text, RawEvent& event, std::string& error);

// Decodes a JSONL stream held in memory. Blank lines are skipped; undecodable
// lines are appended to `issues` and skipped so one bad line never hides the
// rest of the stream.
void DecodeEventsJsonl(std::string_view text, std::vector<RawEvent>& events,
                       std::vector<DecodeIssue>& issues);

// Reads and decodes `<path>`. Returns false only when the file itself cannot
// be read; per-line problems go to `issues`.
bool ReadEventsJsonl(const std::filesystem::path& path, std::vector<RawEvent>& events,
                     std::vector<DecodeIssue>& issues, std::string& error);

} // namespace missionline::events

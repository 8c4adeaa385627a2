#include "events/jsonl_reader.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <optional>
#include <string>
#include <utility>

namespace missionline::events {

namespace {

using core::json::Value;

std::optional<std::string> StringMember(const Value& object, std::string_view key) {
  const Value* member = object.Find(key);
  if (member == nullptr || member->type != Value::Type::kString) {
    return std::nullopt;
  }
  return member->string_value;
}

void DecodeSequence(const Value& payload, EventPayload& out) {
  const Value* seq = payload.Find("seq");
  if (seq == nullptr || seq->type == Value::Type::kNull) {
    return;
  }
  const auto parsed = seq->AsInt64();
  if (!parsed.has_value()) {
    out.invalid_seq = true;
    return;
  }
  out.seq = parsed;
}

std::string_view TrimLine(std::string_view line) {
  // JSONL written on Windows hosts keeps its '\r'.
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
    line.remove_suffix(1);
  }
  while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
    line.remove_prefix(1);
  }
  return line;
}

} // namespace

bool DecodeEventJson(std::string_view text, RawEvent& event, std::string& error) {
  Value root;
  if (!core::json::Parse(text, root, error)) {
    return false;
  }
  if (!root.IsObject()) {
    error = "event record must be a JSON object";
    return false;
  }

  const auto type = StringMember(root, "type");
  if (!type.has_value()) {
    error = "event record requires a string 'type'";
    return false;
  }

  RawEvent decoded;
  decoded.type = *type;

  const Value* payload = root.Find("payload");
  if (payload != nullptr && payload->type != Value::Type::kNull) {
    if (!payload->IsObject()) {
      error = "event 'payload' must be an object";
      return false;
    }
    decoded.payload.run_id = StringMember(*payload, "run_id");
    decoded.payload.phase = StringMember(*payload, "phase");
    decoded.payload.status = StringMember(*payload, "status");
    DecodeSequence(*payload, decoded.payload);
  }

  event = std::move(decoded);
  return true;
}

void DecodeEventsJsonl(std::string_view text, std::vector<RawEvent>& events,
                       std::vector<DecodeIssue>& issues) {
  std::size_t line_number = 0;
  std::size_t cursor = 0;
  while (cursor <= text.size()) {
    const std::size_t newline = text.find('\n', cursor);
    const std::size_t end = newline == std::string_view::npos ? text.size() : newline;
    const std::string_view line = TrimLine(text.substr(cursor, end - cursor));
    ++line_number;

    if (!line.empty()) {
      RawEvent event;
      std::string error;
      if (DecodeEventJson(line, event, error)) {
        events.push_back(std::move(event));
      } else {
        issues.push_back({line_number, error});
      }
    }

    if (newline == std::string_view::npos) {
      break;
    }
    cursor = newline + 1U;
  }
}

bool ReadEventsJsonl(const std::filesystem::path& path, std::vector<RawEvent>& events,
                     std::vector<DecodeIssue>& issues, std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(path, contents, error)) {
    return false;
  }
  DecodeEventsJsonl(contents, events, issues);
  return true;
}

} // namespace missionline::events

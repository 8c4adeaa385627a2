#ifndef MISSIONLINE_CORE_JSON_UTILS_HPP_
#define MISSIONLINE_CORE_JSON_UTILS_HPP_

#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace missionline::core {

// Shared JSON string escaping for event, projection and report writers.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

inline std::string QuoteJson(std::string_view value) {
  return "\"" + EscapeJson(value) + "\"";
}

// Optional fields serialize as `null` rather than being omitted so consumers
// can rely on a fixed key set.
inline std::string OptionalStringJson(const std::optional<std::string>& value) {
  return value.has_value() ? QuoteJson(*value) : std::string("null");
}

inline std::string OptionalIntJson(const std::optional<std::int64_t>& value) {
  return value.has_value() ? std::to_string(*value) : std::string("null");
}

// Incremental object writer used by the hand-rolled serializers. Keeps comma
// placement in one place.
class JsonObjectWriter {
public:
  JsonObjectWriter() {
    out_ << "{";
  }

  void String(std::string_view key, std::string_view value) {
    Raw(key, QuoteJson(value));
  }

  void Raw(std::string_view key, std::string_view raw_value) {
    if (!first_field_) {
      out_ << ",";
    }
    first_field_ = false;
    out_ << "\"" << EscapeJson(key) << "\":" << raw_value;
  }

  std::string Finish() {
    out_ << "}";
    return out_.str();
  }

private:
  std::ostringstream out_;
  bool first_field_ = true;
};

} // namespace missionline::core

#endif // MISSIONLINE_CORE_JSON_UTILS_HPP_

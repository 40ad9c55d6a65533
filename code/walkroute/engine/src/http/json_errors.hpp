#pragma once
#include <algorithm>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

// Where a parse error sits inside a request body. line/column are 1-based;
// text is the whole offending line (tabs and CR blanked), clipped to
// kMaxLine characters around the column.
struct BodyLocation {
  static constexpr std::size_t kMaxLine = 80;

  std::size_t line = 1;
  std::size_t column = 1;
  std::string text;
  std::size_t caret = 0; // offset of the column inside text

  std::string snippet() const {
    return text + "\n" + std::string(caret, ' ') + '^';
  }
};

// nlohmann reports e.byte as the 1-based index of the last character read.
inline BodyLocation locate_in_body(const std::string &body, std::size_t byte) {
  BodyLocation loc;
  const std::size_t pos = std::min(byte > 0 ? byte - 1 : 0, body.size());

  std::size_t line_start = 0;
  for (std::size_t i = 0; i < pos; ++i) {
    if (body[i] == '\n') {
      ++loc.line;
      line_start = i + 1;
    }
  }
  std::size_t line_end = body.find('\n', line_start);
  if (line_end == std::string::npos)
    line_end = body.size();
  loc.column = pos - line_start + 1;

  std::size_t from = line_start;
  if (line_end - line_start > BodyLocation::kMaxLine &&
      pos > line_start + BodyLocation::kMaxLine / 2)
    from = pos - BodyLocation::kMaxLine / 2;
  const std::size_t to = std::min(line_end, from + BodyLocation::kMaxLine);
  loc.text = body.substr(from, to - from);
  std::replace(loc.text.begin(), loc.text.end(), '\t', ' ');
  std::replace(loc.text.begin(), loc.text.end(), '\r', ' ');
  loc.caret = pos - from;
  return loc;
}

// Error body returned for a request that is not valid JSON.
inline nlohmann::json parse_error_json(const std::string &body,
                                       const nlohmann::json::parse_error &e) {
  const BodyLocation loc = locate_in_body(body, e.byte);
  return {{"ok", false},
          {"kind", "parse_error"},
          {"what", e.what()},
          {"line", loc.line},
          {"column", loc.column},
          {"context", loc.snippet()}};
}

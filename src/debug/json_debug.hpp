#pragma once
#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

// Helpers to turn a JSON parse failure offset into something a person editing
// a config file can act on.

// (line, column) of a byte offset in the raw text, both 1-based.
inline std::pair<size_t, size_t> json_line_col(const std::string &text,
                                               size_t byte_pos) {
  byte_pos = std::min(byte_pos, text.size());
  size_t line = 1, col = 1;
  for (size_t i = 0; i < byte_pos; ++i) {
    if (text[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  return {line, col};
}

// The offending line only, with a caret under the failing column.
inline std::string json_error_snippet(const std::string &text, size_t byte_pos) {
  byte_pos = std::min(byte_pos, text.size());
  size_t begin = text.rfind('\n', byte_pos == 0 ? 0 : byte_pos - 1);
  begin = (begin == std::string::npos || begin >= byte_pos) ? 0 : begin + 1;
  size_t end = text.find('\n', byte_pos);
  if (end == std::string::npos)
    end = text.size();

  const std::string line = text.substr(begin, end - begin);
  const size_t caret = byte_pos > begin ? byte_pos - begin - 1 : 0;
  return line + "\n" + std::string(caret, ' ') + "^";
}

// "<source>:<line>:<col>: <what>" followed by the snippet.
inline std::string describe_json_error(const std::string &source,
                                       const std::string &text,
                                       size_t byte_pos,
                                       const std::string &what) {
  const auto lc = json_line_col(text, byte_pos == 0 ? 0 : byte_pos - 1);
  std::ostringstream os;
  os << source << ":" << lc.first << ":" << lc.second << ": " << what << "\n"
     << json_error_snippet(text, byte_pos);
  return os.str();
}

#pragma once

#include <ios>
#include <optional>
#include <string>
#include <vector>

namespace track {

// One time interval of the times log (CSV row)
struct Record {
  std::string start;
  std::optional<std::string> end;   // absent while the interval is still running

  bool is_open() const { return !end.has_value(); }
};

inline bool operator==(const Record& a, const Record& b) {
  return a.start == b.start && a.end == b.end;
}

inline bool operator!=(const Record& a, const Record& b) { return !(a == b); }

// One non-blank line of the log as read from disk, before field-count checks.
struct Row {
  int line_no = 0;                   // 1-based physical line number
  std::streamoff offset = 0;         // byte offset of the first byte of the line
  std::vector<std::string> fields;
};

} // namespace track

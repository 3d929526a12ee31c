#include "track/codec.hpp"

#include <algorithm>
#include <utility>

namespace track {

// Reads the quoted field starting at line[pos] == '"' into field and
// returns the index just past the closing quote, or npos if it never closes.
static size_t read_quoted(const std::string& line, size_t pos, std::string& field) {
  for (size_t i = pos + 1; i < line.size(); ++i) {
    if (line[i] != '"') {
      field.push_back(line[i]);
    } else if (i + 1 < line.size() && line[i + 1] == '"') {
      field.push_back('"');
      ++i;
    } else {
      return i + 1;
    }
  }
  return std::string::npos;
}

bool split_csv_line(const std::string& line,
                    std::vector<std::string>& out,
                    std::string* err) {
  out.clear();

  size_t pos = 0;
  for (;;) {
    std::string field;

    if (pos < line.size() && line[pos] == '"') {
      pos = read_quoted(line, pos, field);
      if (pos == std::string::npos) {
        if (err) *err = "Unterminated quoted field.";
        return false;
      }
      if (pos < line.size() && line[pos] != ',') {
        if (err) *err = "Unexpected text after quoted field.";
        return false;
      }
    } else {
      const size_t comma = std::min(line.find(',', pos), line.size());
      field = line.substr(pos, comma - pos);
      pos = comma;
    }

    out.push_back(std::move(field));
    if (pos >= line.size()) return true;
    ++pos;  // past the comma
  }
}

std::optional<Record> decode_record(const std::vector<std::string>& fields) {
  if (fields.size() == 1) return Record{fields[0], std::nullopt};
  if (fields.size() == 2) return Record{fields[0], fields[1]};
  return std::nullopt;
}

static void append_field(std::string& line, const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    line += field;
    return;
  }
  line.push_back('"');
  for (char c : field) {
    if (c == '"') line.push_back('"');
    line.push_back(c);
  }
  line.push_back('"');
}

std::string encode_record(const Record& r) {
  std::string line;
  append_field(line, r.start);
  if (r.end) {
    line.push_back(',');
    append_field(line, *r.end);
  }
  line.push_back('\n');
  return line;
}

} // namespace track

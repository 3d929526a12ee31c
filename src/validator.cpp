#include "track/validator.hpp"

#include <istream>
#include <string>
#include <utility>

#include "track/codec.hpp"

namespace track {

bool read_log(std::istream& in, LogSnapshot& out, Error* error_out) {
  out = LogSnapshot{};

  in.clear();
  in.seekg(0, std::ios::beg);
  if (!in) return fail_io(error_out, "Failed to seek to the start of the times file.");

  std::string line;
  std::streamoff offset = 0;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;

    const std::streamoff line_start = offset;
    const bool terminated = !in.eof();
    offset += static_cast<std::streamoff>(line.size()) + (terminated ? 1 : 0);
    out.ends_with_newline = terminated;

    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;

    Row row;
    row.line_no = line_no;
    row.offset = line_start;
    // an unparseable line keeps no fields and is reported as bad below
    if (!split_csv_line(line, row.fields)) row.fields.clear();
    out.rows.push_back(std::move(row));
  }

  if (in.bad()) return fail_io(error_out, "Failed to read the times file.");
  in.clear();
  out.size = offset;

  for (const Row& row : out.rows) {
    const bool bad = row.fields.size() != 2;
    out.format.last_is_bad = bad;
    if (bad) out.format.bad_lines.push_back(row.line_no);
  }
  return true;
}

bool read_records(std::istream& in, bool filter,
                  std::vector<Record>& out,
                  Error* error_out) {
  out.clear();

  LogSnapshot snap;
  if (!read_log(in, snap, error_out)) return false;

  for (const Row& row : snap.rows) {
    auto r = decode_record(row.fields);
    if (!r) continue;
    if (filter && r->is_open()) continue;
    out.push_back(std::move(*r));
  }

  if (!snap.well_formed()) return fail_format(error_out, snap.format);
  return true;
}

} // namespace track

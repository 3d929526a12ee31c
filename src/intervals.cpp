#include "track/intervals.hpp"

#include <iostream>
#include <iterator>
#include <string>

#include "track/aggregator.hpp"
#include "track/codec.hpp"
#include "track/validator.hpp"

namespace track {

static bool append_line(std::iostream& log, const LogSnapshot& snap,
                        const std::string& line, Error* error_out) {
  log.clear();
  log.seekp(0, std::ios::end);
  if (!log) return fail_io(error_out, "Failed to seek to the end of the times file.");

  if (snap.size > 0 && !snap.ends_with_newline) log.put('\n');
  log.write(line.data(), static_cast<std::streamsize>(line.size()));
  log.flush();
  if (!log) return fail_io(error_out, "Failed to write to the times file.");
  return true;
}

static bool read_tail(std::iostream& log, std::streamoff from,
                      std::string& tail, Error* error_out) {
  log.clear();
  log.seekg(from, std::ios::beg);
  if (!log) return fail_io(error_out, "Failed to seek in the times file.");

  tail.assign(std::istreambuf_iterator<char>(log), std::istreambuf_iterator<char>());
  if (log.bad()) return fail_io(error_out, "Failed to read the times file.");
  log.clear();
  return true;
}

bool begin_interval(std::iostream& log, bool strict, const Console& console,
                    Error* error_out, const NowFn& now) {
  LogSnapshot snap;
  if (!read_log(log, snap, error_out)) return false;

  if (!snap.well_formed()) {
    if (strict || !snap.format.just_incomplete()) return fail_format(error_out, snap.format);
    console.warn(describe(snap.format));
  }

  const Record open{current_timestamp(now), std::nullopt};
  if (!append_line(log, snap, encode_record(open), error_out)) return false;

  console.inform("BEGIN");
  return true;
}

bool end_interval(std::iostream& log, bool strict, const Console& console,
                  Error* error_out, const NowFn& now) {
  LogSnapshot snap;
  if (!read_log(log, snap, error_out)) return false;

  if (snap.well_formed()) return fail_no_open_interval(error_out);
  if (!snap.format.last_is_bad) return fail_format(error_out, snap.format);

  if (snap.format.bad_lines.size() > 1) {
    if (strict) return fail_format(error_out, snap.format);
    console.warn(describe(snap.format));
  }

  const Row& last = snap.rows.back();
  const auto open = decode_record(last.fields);
  if (!open || !open->is_open()) {
    // the tail is garbage, not a running interval
    return fail_format(error_out, snap.format);
  }

  // The bytes from the start of the last line to EOF must be exactly what
  // begin wrote. Anything else (CRLF, padding, a concurrent append) would be
  // corrupted by the rewrite.
  std::string expected = encode_record(*open);
  if (!snap.ends_with_newline) expected.pop_back();

  std::string tail;
  if (!read_tail(log, last.offset, tail, error_out)) return false;
  if (tail != expected) {
    return fail_io(error_out, "Last entry on line " + std::to_string(last.line_no) +
                              " does not match its expected bytes; refusing to rewrite it.");
  }

  Record closed = *open;
  closed.end = current_timestamp(now);
  const std::string line = encode_record(closed);

  // line is always longer than tail, so the old bytes are fully overwritten.
  log.seekp(last.offset, std::ios::beg);
  if (!log) return fail_io(error_out, "Failed to seek in the times file.");
  log.write(line.data(), static_cast<std::streamsize>(line.size()));
  log.flush();
  if (!log) return fail_io(error_out, "Failed to write to the times file.");

  console.inform("END");
  return true;
}

bool next_interval(std::iostream& log, bool strict, const Console& console,
                   Error* error_out, const NowFn& now) {
  LogSnapshot snap;
  if (!read_log(log, snap, error_out)) return false;

  if (snap.format.last_is_bad) return end_interval(log, strict, console, error_out, now);
  return begin_interval(log, strict, console, error_out, now);
}

bool total_duration(std::istream& log, bool strict, const Console& console,
                    std::chrono::seconds& total,
                    Error* error_out) {
  total = std::chrono::seconds{0};

  LogSnapshot snap;
  if (!read_log(log, snap, error_out)) return false;

  if (!snap.well_formed()) {
    if (strict && !snap.format.just_incomplete()) return fail_format(error_out, snap.format);
    console.warn(describe(snap.format));
  }

  Aggregator agg;
  for (const Row& row : snap.rows) {
    auto r = decode_record(row.fields);
    if (r && !r->is_open()) agg.add(*r, row.line_no);
  }

  if (!agg.unreadable_lines().empty()) {
    FormatError unreadable;
    unreadable.bad_lines = agg.unreadable_lines();
    if (strict) return fail_format(error_out, unreadable);
    console.warn("unreadable times: " + describe(unreadable));
  }

  total = agg.total();
  return true;
}

} // namespace track

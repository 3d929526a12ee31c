#pragma once

#include <string>
#include <vector>

namespace track {

enum class ErrorKind {
  Format,          // the log holds malformed records
  NoOpenInterval,  // "end" with nothing left to close
  Io,              // reading, writing or seeking the log failed
  Usage,           // bad command line
};

// Malformation report for one snapshot of the log.
struct FormatError {
  std::vector<int> bad_lines;   // 1-based, ascending
  bool last_is_bad = false;

  bool empty() const { return bad_lines.empty(); }

  // The only anomaly is a single open interval at the end of the log.
  bool just_incomplete() const { return bad_lines.size() == 1 && last_is_bad; }
};

struct Error {
  ErrorKind kind = ErrorKind::Io;
  std::string message;   // Io and Usage text, verbatim
  FormatError format;    // set for ErrorKind::Format
};

std::string describe(const FormatError& e);
std::string describe(const Error& e);

// Helpers for the bool + Error* convention used across the library.
// Both always return false so callers can write `return fail_io(...)`.
bool fail_io(Error* error_out, const std::string& message);
bool fail_format(Error* error_out, const FormatError& format);
bool fail_no_open_interval(Error* error_out);
bool fail_usage(Error* error_out, const std::string& message);

} // namespace track

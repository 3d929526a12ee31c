#include "track/error.hpp"

#include "track/diagnostics.hpp"

namespace track {

std::string describe(const FormatError& e) {
  if (e.just_incomplete()) return "last entry is incomplete";
  if (e.bad_lines.size() == 1) {
    return "incomplete or invalid entry on line " + std::to_string(e.bad_lines[0]);
  }
  return "incomplete or invalid entries on lines " + spoken_list(e.bad_lines);
}

std::string describe(const Error& e) {
  switch (e.kind) {
    case ErrorKind::Format:
      return describe(e.format);
    case ErrorKind::NoOpenInterval:
      return "no incomplete entry to end";
    case ErrorKind::Io:
    case ErrorKind::Usage:
      return e.message;
  }
  return e.message;
}

bool fail_io(Error* error_out, const std::string& message) {
  if (error_out) {
    error_out->kind = ErrorKind::Io;
    error_out->message = message;
    error_out->format = FormatError{};
  }
  return false;
}

bool fail_format(Error* error_out, const FormatError& format) {
  if (error_out) {
    error_out->kind = ErrorKind::Format;
    error_out->format = format;
    error_out->message = describe(format);
  }
  return false;
}

bool fail_no_open_interval(Error* error_out) {
  if (error_out) {
    error_out->kind = ErrorKind::NoOpenInterval;
    error_out->message = "no incomplete entry to end";
    error_out->format = FormatError{};
  }
  return false;
}

bool fail_usage(Error* error_out, const std::string& message) {
  if (error_out) {
    error_out->kind = ErrorKind::Usage;
    error_out->message = message;
    error_out->format = FormatError{};
  }
  return false;
}

} // namespace track

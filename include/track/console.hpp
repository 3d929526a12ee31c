#pragma once

#include <iosfwd>
#include <string>

namespace track {

// Where the library reports to: informational lines ("BEGIN", "END") on
// `out`, suppressed when quiet, and warnings on `err`.
struct Console {
  std::ostream& out;
  std::ostream& err;
  bool quiet = false;

  void inform(const std::string& line) const;
  void warn(const std::string& message) const;
};

} // namespace track

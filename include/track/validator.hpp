#pragma once

#include <iosfwd>
#include <vector>

#include "track/error.hpp"
#include "track/types.hpp"

namespace track {

struct LogSnapshot {
  std::vector<Row> rows;            // every non-empty line, in file order
  FormatError format;               // empty when every record is closed
  std::streamoff size = 0;          // bytes in the log
  bool ends_with_newline = true;    // false when the last line is unterminated

  bool well_formed() const { return format.empty(); }
};

// Reads the whole log from offset 0 and classifies every row. A row is bad
// unless it holds a closed record, so an open interval at the end shows up as
// format.just_incomplete(). On return the stream state is cleared so the
// caller can seek and write.
bool read_log(std::istream& in, LogSnapshot& out, Error* error_out = nullptr);

// Reads the records of the log. With filter set only closed records are
// returned, otherwise every row that decodes (open or closed) is returned.
// Returns false with a Format error when any row is bad; `out` is still
// filled in that case so callers can warn and carry on.
bool read_records(std::istream& in, bool filter,
                  std::vector<Record>& out,
                  Error* error_out = nullptr);

} // namespace track

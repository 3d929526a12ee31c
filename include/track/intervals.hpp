#pragma once

#include <chrono>
#include <iosfwd>

#include "track/console.hpp"
#include "track/error.hpp"
#include "track/timestamp.hpp"

namespace track {

// Appends a new open interval stamped with now(). An open interval already
// at the end of the log is overridden with a warning unless strict; any
// other anomaly fails without writing.
bool begin_interval(std::iostream& log, bool strict, const Console& console,
                    Error* error_out = nullptr,
                    const NowFn& now = &Clock::now);

// Closes the open interval at the end of the log by rewriting its line in
// place with now() as the end. Other lines are never touched.
bool end_interval(std::iostream& log, bool strict, const Console& console,
                  Error* error_out = nullptr,
                  const NowFn& now = &Clock::now);

// Ends the interval if the last line is open, begins a new one otherwise.
bool next_interval(std::iostream& log, bool strict, const Console& console,
                   Error* error_out = nullptr,
                   const NowFn& now = &Clock::now);

// Sums every closed interval. Anomalies are warned about; in strict mode
// they fail unless the log is just incomplete.
bool total_duration(std::istream& log, bool strict, const Console& console,
                    std::chrono::seconds& total,
                    Error* error_out = nullptr);

} // namespace track

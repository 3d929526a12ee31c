#include "track/aggregator.hpp"

#include "track/timestamp.hpp"

namespace track {

void Aggregator::add(const Record& r, int line_no) {
  if (r.is_open()) return;

  Clock::time_point start;
  Clock::time_point end;
  if (!parse_timestamp(r.start, start) || !parse_timestamp(*r.end, end)) {
    unreadable_.push_back(line_no);
    return;
  }

  total_ += std::chrono::duration_cast<std::chrono::seconds>(end - start);
}

std::chrono::seconds sum_durations(const std::vector<Record>& closed) {
  Aggregator agg;
  for (const auto& r : closed) agg.add(r);
  return agg.total();
}

} // namespace track

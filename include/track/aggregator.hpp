#pragma once

#include <chrono>
#include <vector>

#include "track/types.hpp"

namespace track {

class Aggregator {
public:
  // Adds end - start of a closed record. Open records and records whose
  // times do not parse are not counted; the latter are remembered by line.
  void add(const Record& r, int line_no = 0);

  std::chrono::seconds total() const { return total_; }

  const std::vector<int>& unreadable_lines() const { return unreadable_; }

private:
  std::chrono::seconds total_{0};
  std::vector<int> unreadable_;
};

std::chrono::seconds sum_durations(const std::vector<Record>& closed);

} // namespace track

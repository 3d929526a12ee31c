#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace track {

// "5", "5 and 6", "5, 6, and 7"
std::string spoken_list(const std::vector<int>& items);

// H:MM:SS, hours unbounded, leading '-' for negative spans
std::string format_duration(std::chrono::seconds d);

} // namespace track

#include "track/diagnostics.hpp"

#include <cstdint>
#include <cstdio>

namespace track {

std::string spoken_list(const std::vector<int>& items) {
  std::string out;
  const size_t n = items.size();
  for (size_t i = 0; i < n; ++i) {
    out += std::to_string(items[i]);
    if (i + 2 < n) {
      out += ", ";
    } else if (i + 1 < n) {
      out += (n == 2) ? " and " : ", and ";
    }
  }
  return out;
}

std::string format_duration(std::chrono::seconds d) {
  std::int64_t s = d.count();
  const bool negative = s < 0;
  if (negative) s = -s;

  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s%lld:%02lld:%02lld",
                negative ? "-" : "",
                static_cast<long long>(s / 3600),
                static_cast<long long>((s / 60) % 60),
                static_cast<long long>(s % 60));
  return buf;
}

} // namespace track

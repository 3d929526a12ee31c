#include "track/timestamp.hpp"

#include <cctype>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace track {

// Accepts +hh, -hh, +hhmm and -hhmm, as strftime prints zones without an
// abbreviation.
static bool parse_numeric_offset(const std::string& zone, long& seconds_east) {
  if (zone.size() != 3 && zone.size() != 5) return false;
  if (zone[0] != '+' && zone[0] != '-') return false;
  for (size_t i = 1; i < zone.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(zone[i]))) return false;
  }
  const long hours = std::stol(zone.substr(1, 2));
  const long minutes = zone.size() == 5 ? std::stol(zone.substr(3, 2)) : 0;
  if (hours > 23 || minutes > 59) return false;
  seconds_east = hours * 3600 + minutes * 60;
  if (zone[0] == '-') seconds_east = -seconds_east;
  return true;
}

std::string format_timestamp(Clock::time_point t) {
  const std::time_t tt = Clock::to_time_t(t);
  std::tm local{};
  localtime_r(&tt, &local);

  char buf[64];
  const size_t n = std::strftime(buf, sizeof(buf), kTimeFormat, &local);
  return std::string(buf, n);
}

bool parse_timestamp(const std::string& s, Clock::time_point& out) {
  std::tm tm{};
  std::istringstream ss(s);
  ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) return false;

  std::string zone;
  std::string rest;
  if (!(ss >> zone)) return false;
  if (ss >> rest) return false;

  std::time_t t = 0;
  long offset = 0;
  if (zone == "UTC" || zone == "GMT" || zone == "Z") {
    t = timegm(&tm);
  } else if (parse_numeric_offset(zone, offset)) {
    t = timegm(&tm) - offset;
  } else {
    tzset();
    const bool standard = zone == tzname[0];
    const bool daylight = zone == tzname[1];
    if (standard || daylight) {
      if (std::strcmp(tzname[0], tzname[1]) == 0) tm.tm_isdst = -1;
      else tm.tm_isdst = daylight ? 1 : 0;
      t = std::mktime(&tm);
    } else {
      // unknown abbreviation: no offset
      t = timegm(&tm);
    }
  }

  out = Clock::from_time_t(t);
  return true;
}

std::string current_timestamp(const NowFn& now) {
  return format_timestamp(now ? now() : Clock::now());
}

} // namespace track

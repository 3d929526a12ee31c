#include "track/console.hpp"

#include <ostream>

namespace track {

void Console::inform(const std::string& line) const {
  if (!quiet) out << line << "\n" << std::flush;
}

void Console::warn(const std::string& message) const {
  err << "Warning: " << message << "\n";
}

} // namespace track

#pragma once

#include <fstream>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "track/console.hpp"
#include "track/error.hpp"
#include "track/timestamp.hpp"

namespace track {

// Options read from the command line.
struct Config {
  std::string program = "track";     // argv[0], re-executed by "fork"
  std::string command = "status";
  std::string path = "TIMES.csv";
  bool strict = false;               // --fail
  bool quiet = false;                // --quiet
};

using CommandFn = std::function<bool(const Config&, const Console&, Error*)>;
using CommandTable = std::map<std::string, CommandFn>;

// Builds the table of every track command. `now` stamps new times.
CommandTable make_command_table(const NowFn& now = &Clock::now);

// Looks up cfg.command and runs it. Unknown commands are Usage errors.
bool dispatch(const CommandTable& table, const Config& cfg,
              const Console& console, Error* error_out = nullptr);

// Arguments handed to the detached "wait" process started by "fork".
std::vector<std::string> fork_arguments(const Config& cfg);

// Opens the log read-only, or for reading and writing (created if missing)
// when writable.
bool open_log(const std::string& path, bool writable, std::fstream& f,
              Error* error_out = nullptr);

} // namespace track

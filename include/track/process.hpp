#pragma once

#include <string>
#include <vector>

#include "track/error.hpp"

namespace track {

// Blocks the termination signals (SIGINT, SIGTERM, SIGHUP, SIGQUIT) for the
// calling thread so they queue up for wait_for_termination instead of
// killing the process.
bool block_termination_signals(Error* error_out = nullptr);

// Waits for one of the blocked termination signals. SIGKILL can never be
// observed here, so a killed waiter leaves its interval open.
bool wait_for_termination(int* signal_out, Error* error_out = nullptr);

// Starts program with args in a new session and does not wait for it.
bool spawn_detached(const std::string& program,
                    const std::vector<std::string>& args,
                    Error* error_out = nullptr);

} // namespace track

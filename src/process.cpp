#include "track/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <pthread.h>
#include <sys/types.h>
#include <unistd.h>

namespace track {

static sigset_t termination_signals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  sigaddset(&set, SIGHUP);
  sigaddset(&set, SIGQUIT);
  return set;
}

bool block_termination_signals(Error* error_out) {
  const sigset_t set = termination_signals();
  const int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
  if (rc != 0) return fail_io(error_out, std::string("pthread_sigmask() failed: ") + strerror(rc));
  return true;
}

bool wait_for_termination(int* signal_out, Error* error_out) {
  const sigset_t set = termination_signals();
  int sig = 0;
  const int rc = sigwait(&set, &sig);
  if (rc != 0) return fail_io(error_out, std::string("sigwait() failed: ") + strerror(rc));
  if (signal_out) *signal_out = sig;
  return true;
}

bool spawn_detached(const std::string& program,
                    const std::vector<std::string>& args,
                    Error* error_out) {
  if (program.empty()) return fail_io(error_out, "Program path is empty.");

  pid_t pid = fork();
  if (pid < 0) return fail_io(error_out, std::string("fork() failed: ") + strerror(errno));

  if (pid == 0) {
    setsid();

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    execvp(program.c_str(), argv.data());
    _exit(127);
  }

  return true;
}

} // namespace track

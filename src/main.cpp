#include <iostream>
#include <string>
#include <vector>

#include "track/commands.hpp"
#include "track/console.hpp"
#include "track/error.hpp"

static const char* kVersion = "1.0";

static void print_usage(std::ostream& os) {
  os << "Usage: track [options] [command [file]]\n"
     << "\n"
     << "The default command is:\n"
     << "  track status TIMES.csv\n"
     << "\n"
     << "Commands:\n"
     << "  begin    begin a new time entry\n"
     << "  end      complete the begun time entry\n"
     << "  fork     begin a new time entry and fork to complete it on termination\n"
     << "  list     list all the times\n"
     << "  next     begin or end an entry depending on the contents\n"
     << "  run      begin a new time entry and complete it on termination\n"
     << "  status   show the current status of the times\n"
     << "  total    print the sum of all the times\n"
     << "  verify   verify the validity of the times\n"
     << "  wait     on termination, complete the begun time entry\n"
     << "\n"
     << "Options:\n"
     << "  --fail                  Fail if there are any invalid time entries.\n"
     << "  --quiet                 Do not print informative messages.\n"
     << "  --help                  Print this help.\n"
     << "  --version               Print version.\n";
}

int main(int argc, char** argv) {
  // Global flags
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage(std::cout);
      return 0;
    }
    if (a == "--version") {
      std::cout << "track v" << kVersion << "\n";
      return 0;
    }
  }

  track::Config cfg;
  if (argc > 0 && argv[0][0] != '\0') cfg.program = argv[0];

  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];

    if (a == "--fail") {
      cfg.strict = true;
      continue;
    }
    if (a == "--quiet" || a == "-q") {
      cfg.quiet = true;
      continue;
    }
    if (a.size() > 1 && a[0] == '-') {
      std::cerr << "Unknown argument: " << a << "\n";
      print_usage(std::cerr);
      return 2;
    }
    positional.push_back(a);
  }

  if (positional.size() > 2) {
    print_usage(std::cerr);
    return 2;
  }
  if (!positional.empty()) cfg.command = positional[0];
  if (positional.size() == 2) cfg.path = positional[1];

  const track::Console console{std::cout, std::cerr, cfg.quiet};
  const track::CommandTable table = track::make_command_table();

  track::Error err;
  if (!track::dispatch(table, cfg, console, &err)) {
    if (err.kind == track::ErrorKind::Usage) {
      std::cerr << track::describe(err) << "\n";
      print_usage(std::cerr);
      return 2;
    }
    std::cerr << "Error: " << track::describe(err) << "\n";
    return 1;
  }

  return 0;
}

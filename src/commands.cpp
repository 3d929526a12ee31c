#include "track/commands.hpp"

#include <cstdint>
#include <ostream>
#include <vector>

#include "track/aggregator.hpp"
#include "track/codec.hpp"
#include "track/diagnostics.hpp"
#include "track/intervals.hpp"
#include "track/process.hpp"
#include "track/validator.hpp"

namespace track {

bool open_log(const std::string& path, bool writable, std::fstream& f,
              Error* error_out) {
  std::ios::openmode mode = std::ios::in | std::ios::binary;
  if (writable) {
    // O_CREAT without truncation
    std::ofstream touch(path, std::ios::app | std::ios::binary);
    if (!touch) return fail_io(error_out, "Failed to open file: " + path);
    mode |= std::ios::out;
  }

  f.open(path, mode);
  if (!f) return fail_io(error_out, "Failed to open file: " + path);
  return true;
}

std::vector<std::string> fork_arguments(const Config& cfg) {
  std::vector<std::string> args;
  if (cfg.strict) args.push_back("--fail");
  if (cfg.quiet) args.push_back("--quiet");
  args.push_back("wait");
  args.push_back(cfg.path);
  return args;
}

// Shared by the read-only commands: anything but a single open interval at
// the end is a warning, or an error under --fail.
static bool check_snapshot(const LogSnapshot& snap, const Config& cfg,
                           const Console& console, Error* error_out) {
  if (snap.well_formed() || snap.format.just_incomplete()) return true;
  if (cfg.strict) return fail_format(error_out, snap.format);
  console.warn(describe(snap.format));
  return true;
}

static std::string elapsed_text(const std::string& start, const std::string& end) {
  Clock::time_point a;
  Clock::time_point b;
  if (!parse_timestamp(start, a) || !parse_timestamp(end, b)) return "?";
  return format_duration(std::chrono::duration_cast<std::chrono::seconds>(b - a));
}

static bool cmd_begin(const NowFn& now, const Config& cfg, const Console& console, Error* err) {
  std::fstream f;
  if (!open_log(cfg.path, true, f, err)) return false;
  return begin_interval(f, cfg.strict, console, err, now);
}

static bool cmd_end(const NowFn& now, const Config& cfg, const Console& console, Error* err) {
  std::fstream f;
  if (!open_log(cfg.path, true, f, err)) return false;
  // always strict: interior damage must be repaired before a close
  return end_interval(f, true, console, err, now);
}

static bool cmd_next(const NowFn& now, const Config& cfg, const Console& console, Error* err) {
  std::fstream f;
  if (!open_log(cfg.path, true, f, err)) return false;
  return next_interval(f, cfg.strict, console, err, now);
}

static bool cmd_wait(const NowFn& now, const Config& cfg, const Console& console, Error* err) {
  if (!block_termination_signals(err)) return false;

  console.inform("WAIT");
  int sig = 0;
  if (!wait_for_termination(&sig, err)) return false;
  return cmd_end(now, cfg, console, err);
}

static bool cmd_run(const NowFn& now, const Config& cfg, const Console& console, Error* err) {
  // blocked before begin so an early Ctrl-C still ends the interval
  if (!block_termination_signals(err)) return false;
  if (!cmd_begin(now, cfg, console, err)) return false;
  return cmd_wait(now, cfg, console, err);
}

static bool cmd_fork(const NowFn& now, const Config& cfg, const Console& console, Error* err) {
  if (!cmd_begin(now, cfg, console, err)) return false;

  console.inform("FORK");
  return spawn_detached(cfg.program, fork_arguments(cfg), err);
}

static bool cmd_status(const NowFn& now, const Config& cfg, const Console& console, Error* err) {
  std::fstream f;
  if (!open_log(cfg.path, false, f, err)) return false;

  LogSnapshot snap;
  if (!read_log(f, snap, err)) return false;
  if (!check_snapshot(snap, cfg, console, err)) return false;

  if (snap.rows.empty()) {
    console.out << "empty\n";
    return true;
  }

  const auto last = decode_record(snap.rows.back().fields);
  if (last && last->is_open()) {
    console.out << "open since " << last->start
                << " (" << elapsed_text(last->start, current_timestamp(now)) << ")\n";
    return true;
  }

  std::int64_t closed = 0;
  for (const Row& row : snap.rows) {
    if (row.fields.size() == 2) ++closed;
  }
  console.out << "closed (" << closed << (closed == 1 ? " entry" : " entries") << ")\n";
  return true;
}

static bool cmd_list(const NowFn&, const Config& cfg, const Console& console, Error* err) {
  std::fstream f;
  if (!open_log(cfg.path, false, f, err)) return false;

  LogSnapshot snap;
  if (!read_log(f, snap, err)) return false;
  if (!check_snapshot(snap, cfg, console, err)) return false;

  for (const Row& row : snap.rows) {
    const auto r = decode_record(row.fields);
    if (!r) continue;

    if (r->is_open()) {
      console.out << r->start << " - ...  (running)\n";
    } else {
      console.out << r->start << " - " << *r->end
                  << "  " << elapsed_text(r->start, *r->end) << "\n";
    }
  }
  return true;
}

static bool cmd_total(const NowFn&, const Config& cfg, const Console& console, Error* err) {
  std::fstream f;
  if (!open_log(cfg.path, false, f, err)) return false;

  std::chrono::seconds total{0};
  if (!total_duration(f, cfg.strict, console, total, err)) return false;

  console.out << format_duration(total) << "\n";
  return true;
}

static bool cmd_verify(const NowFn&, const Config& cfg, const Console& console, Error* err) {
  std::fstream f;
  if (!open_log(cfg.path, false, f, err)) return false;

  LogSnapshot snap;
  if (!read_log(f, snap, err)) return false;

  if (snap.well_formed()) {
    console.out << "OK\n";
    return true;
  }
  if (snap.format.just_incomplete()) {
    console.out << "OK (" << describe(snap.format) << ")\n";
    return true;
  }
  return fail_format(err, snap.format);
}

CommandTable make_command_table(const NowFn& now) {
  auto wrap = [now](bool (*fn)(const NowFn&, const Config&, const Console&, Error*)) {
    return CommandFn([now, fn](const Config& cfg, const Console& console, Error* err) {
      return fn(now, cfg, console, err);
    });
  };

  CommandTable table;
  table["begin"] = wrap(cmd_begin);
  table["end"] = wrap(cmd_end);
  table["fork"] = wrap(cmd_fork);
  table["list"] = wrap(cmd_list);
  table["next"] = wrap(cmd_next);
  table["run"] = wrap(cmd_run);
  table["status"] = wrap(cmd_status);
  table["total"] = wrap(cmd_total);
  table["verify"] = wrap(cmd_verify);
  table["wait"] = wrap(cmd_wait);
  return table;
}

bool dispatch(const CommandTable& table, const Config& cfg,
              const Console& console, Error* error_out) {
  auto it = table.find(cfg.command);
  if (it == table.end()) return fail_usage(error_out, "Unknown command: " + cfg.command);
  return it->second(cfg, console, error_out);
}

} // namespace track

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "PlantSimulator.hpp"

namespace GridHelpers {

// ---------------------------
// CLI arguments / config
// ---------------------------
struct Args {
  int    nticks         = 3600;      // control cycles to run
  double dt             = 1.0;       // seconds per control cycle
  int    horizonSteps   = 15;        // forecast steps
  int    gossipEvery    = 5;         // kick the slow cadence every N cycles
  int    aggregateEvery = 3;         // federated round every N gossip rounds
  int    fanout         = 3;         // peers contacted per gossip round
  int    neighbours     = 8;         // bound on the peer set (ring neighbours)
  double peerTimeout    = 30.0;      // s before a silent peer is unreachable
  double debounce       = 2.0;       // s of abnormal grid before islanding
  double resyncConfirm  = 5.0;       // s of alignment before reconnecting
  double budgetMs       = 50.0;      // control-cycle budget
  double startHour      = 6.0;       // wall-clock hour at t = 0
  bool   inlineGossip   = false;     // force gossip onto the control thread
  bool   verbose        = false;     // let [debug] lines through
  std::string configPath;
  std::string eventsPath;
  bool   showHelp       = false;
};

// Logger function type used by helpers (implemented in main.cpp).
using LogFn = std::function<void(const std::string&)>;

// Argument helpers. Flags override whatever `base` already holds.
Args parse_args(int argc, char** argv, const Args& base = Args{});
void print_usage();

// key = value file, keys are the long flag names without dashes
// ('-' and '_' interchangeable). Returns false if the file cannot be read.
bool load_config_file(const std::string& path, Args& args, LogFn log_fn);

// Clamp nonsensical values back to defaults, one [warn] per fix.
void sanitize_args(Args& args, LogFn log_fn);

// Grid-event schedule: "<kind> <start_tick> <end_tick> [value] [target]".
// '#' starts a comment; malformed lines are skipped with a [warn].
std::vector<GridEvent> load_events(const std::string& path, LogFn log_fn);

// Bounded neighbour set on a ring of `size` ranks: +1, -1, +2, -2, ...
// Every other rank when the bound covers them all.
std::vector<int> ring_neighbours(int rank, int size, int bound);

} // namespace GridHelpers

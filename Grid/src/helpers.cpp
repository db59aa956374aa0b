#include "helpers.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace GridHelpers {

// ---------------------------
// Tiny CLI helpers (no deps)
// ---------------------------
static bool arg_eq(const char* a, const char* b) {
  return std::strcmp(a, b) == 0;
}

static std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

static bool parse_bool(const std::string& v) {
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

Args parse_args(int argc, char** argv, const Args& base) {
  Args a = base;
  for (int i = 1; i < argc; ++i) {
    if (arg_eq(argv[i], "--nticks") && i + 1 < argc)               a.nticks = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--dt") && i + 1 < argc)              a.dt = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--horizon-steps") && i + 1 < argc)   a.horizonSteps = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--gossip-every") && i + 1 < argc)    a.gossipEvery = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--aggregate-every") && i + 1 < argc) a.aggregateEvery = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--fanout") && i + 1 < argc)          a.fanout = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--neighbours") && i + 1 < argc)      a.neighbours = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--peer-timeout") && i + 1 < argc)    a.peerTimeout = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--debounce") && i + 1 < argc)        a.debounce = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--resync-confirm") && i + 1 < argc)  a.resyncConfirm = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--budget-ms") && i + 1 < argc)       a.budgetMs = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--start-hour") && i + 1 < argc)      a.startHour = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--config") && i + 1 < argc)          a.configPath = argv[++i];
    else if (arg_eq(argv[i], "--events") && i + 1 < argc)          a.eventsPath = argv[++i];
    else if (arg_eq(argv[i], "--inline-gossip"))                   a.inlineGossip = true;
    else if (arg_eq(argv[i], "--verbose"))                         a.verbose = true;
    else if (arg_eq(argv[i], "--help"))                            a.showHelp = true;
  }
  return a;
}

void print_usage() {
  std::cout <<
    "Usage: ngnode [--nticks N] [--dt seconds]\n"
    "              [--horizon-steps N] [--gossip-every N] [--aggregate-every N]\n"
    "              [--fanout N] [--neighbours N] [--peer-timeout seconds]\n"
    "              [--debounce seconds] [--resync-confirm seconds]\n"
    "              [--budget-ms ms] [--start-hour h]\n"
    "              [--config file] [--events file]\n"
    "              [--inline-gossip] [--verbose]\n"
    "\n"
    "One MPI rank per microgrid node. Each rank runs its control cycle every\n"
    "dt seconds of simulated time and gossips with up to --neighbours ring\n"
    "neighbours, contacting --fanout of them per round.\n"
    "\n"
    "Config file: key = value per line, keys as the flags above without the\n"
    "leading dashes. Command-line flags win over the file.\n"
    "\n"
    "Events file: <kind> <start_tick> <end_tick> [value] [target]\n"
    "  kinds: outage, freq, storage_loss, cloud, pv_dropout, clear\n"
    "\n"
    "Env: NG_LOG_DIR (CSV base dir), RUN_ID (run sub-directory).\n";
}

bool load_config_file(const std::string& path, Args& a, LogFn log_fn) {
  std::ifstream in(path);
  if (!in) {
    if (log_fn) log_fn("[warn] Cannot open config file " + path + "\n");
    return false;
  }

  std::string line;
  int lineno = 0;
  int applied = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);
    line = trim(line);
    if (line.empty()) continue;

    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      std::ostringstream oss;
      oss << "[warn] " << path << " line " << lineno << " malformed, skipping: " << line << "\n";
      if (log_fn) log_fn(oss.str());
      continue;
    }

    std::string key = trim(line.substr(0, eq));
    const std::string val = trim(line.substr(eq + 1));
    std::replace(key.begin(), key.end(), '_', '-');

    try {
      if (key == "nticks")               a.nticks = std::stoi(val);
      else if (key == "dt")              a.dt = std::stod(val);
      else if (key == "horizon-steps")   a.horizonSteps = std::stoi(val);
      else if (key == "gossip-every")    a.gossipEvery = std::stoi(val);
      else if (key == "aggregate-every") a.aggregateEvery = std::stoi(val);
      else if (key == "fanout")          a.fanout = std::stoi(val);
      else if (key == "neighbours")      a.neighbours = std::stoi(val);
      else if (key == "peer-timeout")    a.peerTimeout = std::stod(val);
      else if (key == "debounce")        a.debounce = std::stod(val);
      else if (key == "resync-confirm")  a.resyncConfirm = std::stod(val);
      else if (key == "budget-ms")       a.budgetMs = std::stod(val);
      else if (key == "start-hour")      a.startHour = std::stod(val);
      else if (key == "events")          a.eventsPath = val;
      else if (key == "inline-gossip")   a.inlineGossip = parse_bool(val);
      else if (key == "verbose")         a.verbose = parse_bool(val);
      else {
        if (log_fn) log_fn("[warn] " + path + ": unknown key '" + key + "' ignored\n");
        continue;
      }
      ++applied;
    } catch (const std::logic_error&) {
      // stoi/stod throw invalid_argument or out_of_range
      std::ostringstream oss;
      oss << "[warn] " << path << " line " << lineno << ": bad value for " << key
          << " ('" << val << "'), skipping\n";
      if (log_fn) log_fn(oss.str());
    }
  }

  std::ostringstream oss;
  oss << "[info] Loaded " << applied << " setting(s) from " << path << "\n";
  if (log_fn) log_fn(oss.str());
  return true;
}

// ---------------------------
// Sanity clamps so bad CLI/config values cannot kill the control loop
// ---------------------------
void sanitize_args(Args& a, LogFn log_fn) {
  const Args d;
  auto warn = [&](const std::string& s) { if (log_fn) log_fn("[warn] " + s + "\n"); };

  if (a.nticks <= 0)          { warn("nticks <= 0; defaulting to 3600.");        a.nticks = d.nticks; }
  if (!(a.dt > 0.0))          { warn("dt <= 0; defaulting to 1 s.");             a.dt = d.dt; }
  if (a.horizonSteps <= 0)    { warn("horizon-steps <= 0; defaulting to 15.");   a.horizonSteps = d.horizonSteps; }
  if (a.gossipEvery <= 0)     { warn("gossip-every <= 0; defaulting to 5.");     a.gossipEvery = d.gossipEvery; }
  if (a.aggregateEvery <= 0)  { warn("aggregate-every <= 0; defaulting to 3.");  a.aggregateEvery = d.aggregateEvery; }
  if (a.fanout <= 0)          { warn("fanout <= 0; defaulting to 3.");           a.fanout = d.fanout; }
  if (a.neighbours <= 0)      { warn("neighbours <= 0; defaulting to 8.");       a.neighbours = d.neighbours; }
  if (!(a.peerTimeout > 0.0)) { warn("peer-timeout <= 0; defaulting to 30 s.");  a.peerTimeout = d.peerTimeout; }
  if (a.debounce < 0.0)       { warn("debounce < 0; defaulting to 2 s.");        a.debounce = d.debounce; }
  if (a.resyncConfirm < 0.0)  { warn("resync-confirm < 0; defaulting to 5 s.");  a.resyncConfirm = d.resyncConfirm; }
  if (!(a.budgetMs > 0.0))    { warn("budget-ms <= 0; defaulting to 50 ms.");    a.budgetMs = d.budgetMs; }
  if (a.startHour < 0.0 || a.startHour >= 24.0) {
    warn("start-hour outside [0, 24); defaulting to 6.");
    a.startHour = d.startHour;
  }
}

std::vector<GridEvent> load_events(const std::string& path, LogFn log_fn) {
  std::vector<GridEvent> events;
  std::ifstream ef(path);
  if (!ef) {
    std::ostringstream oss;
    oss << "[info] No events file at " << path << ", running undisturbed.\n";
    if (log_fn) log_fn(oss.str());
    return events;
  }

  std::string line;
  int lineno = 0;
  while (std::getline(ef, line)) {
    ++lineno;
    if (line.empty()) continue;
    if (line[0] == '#') continue;

    std::istringstream iss(line);
    std::string kind;
    GridEvent e{};
    if (!(iss >> kind >> e.start_tick >> e.end_tick)) {
      std::ostringstream oss;
      oss << "[warn] " << path << " line " << lineno << " malformed, skipping: " << line << "\n";
      if (log_fn) log_fn(oss.str());
      continue;
    }
    try {
      e.kind = eventKindFromString(kind);
    } catch (const std::invalid_argument& ex) {
      std::ostringstream oss;
      oss << "[warn] " << path << " line " << lineno << ": " << ex.what() << ", skipping\n";
      if (log_fn) log_fn(oss.str());
      continue;
    }
    if (!(iss >> e.value)) {
      e.value = e.kind == GridEvent::Kind::Cloud ? 1.0 : 0.0;
    } else {
      iss >> e.target;
    }
    if (e.end_tick < e.start_tick) std::swap(e.end_tick, e.start_tick);
    events.push_back(e);
  }

  std::ostringstream oss;
  oss << "[info] Loaded " << events.size() << " event(s) from " << path << "\n";
  if (log_fn) log_fn(oss.str());
  for (std::size_t i = 0; i < events.size(); ++i) {
    const GridEvent& e = events[i];
    std::ostringstream eoss;
    eoss << "  [event " << i << "] " << toString(e.kind)
         << " ticks " << e.start_tick << "-" << e.end_tick
         << ", value=" << e.value;
    if (!e.target.empty()) eoss << ", target=" << e.target;
    eoss << "\n";
    if (log_fn) log_fn(eoss.str());
  }
  return events;
}

std::vector<int> ring_neighbours(int rank, int size, int bound) {
  std::vector<int> out;
  if (size <= 1 || bound <= 0) return out;
  const int others = size - 1;
  const int take = std::min(bound, others);
  for (int k = 1; static_cast<int>(out.size()) < take; ++k) {
    const int fwd = (rank + k) % size;
    const int bwd = ((rank - k) % size + size) % size;
    if (fwd != rank && std::find(out.begin(), out.end(), fwd) == out.end()) out.push_back(fwd);
    if (static_cast<int>(out.size()) < take && bwd != rank &&
        std::find(out.begin(), out.end(), bwd) == out.end()) {
      out.push_back(bwd);
    }
  }
  return out;
}

} // namespace GridHelpers

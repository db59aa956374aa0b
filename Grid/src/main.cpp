// Grid/src/main.cpp
// mpirun -np 4 ./build/ngnode
/**
Build (from repo root):
  cmake -S . -B build -DCMAKE_BUILD_TYPE=Release
  cmake --build build -j

Run (one microgrid per rank):
  mpirun -np 4 ./build/ngnode                               // 1 h at 1 s cycles
  mpirun -np 4 ./build/ngnode --nticks 7200 --gossip-every 10
  mpirun -np 8 ./build/ngnode --events input/events.txt --fanout 2 --neighbours 4
  RUN_ID=outage NG_LOG_DIR=/tmp/ng mpirun -np 4 ./build/ngnode --config input/node.cfg
*/

#include <mpi.h>
#include <algorithm>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "CadenceWorker.hpp"
#include "FederatedLearningCoordinator.hpp"
#include "GossipTransport.hpp"
#include "LocalController.hpp"
#include "Logger.hpp"
#include "MicrogridNode.hpp"
#include "NodeRuntime.hpp"
#include "PeerExchange.hpp"
#include "PeerGossip.hpp"
#include "PlantSimulator.hpp"
#include "helpers.hpp"

using GridHelpers::Args;
using GridHelpers::LogFn;
using GridHelpers::load_config_file;
using GridHelpers::load_events;
using GridHelpers::parse_args;
using GridHelpers::print_usage;
using GridHelpers::ring_neighbours;
using GridHelpers::sanitize_args;

static std::string nodeIdFor(int rank) {
  return "mg-" + std::to_string(rank);
}

// Storage fleet of one node, fastest first. Sizes vary a little by rank so
// the nodes do not move in lockstep.
static std::vector<StorageTier> buildTiers(int rank) {
  const double s = 1.0 + 0.1 * (rank % 3);
  std::vector<StorageTier> tiers;
  tiers.emplace_back("battery",  TierKind::Electrochemical, 0, 200.0 * s, 0.60, 100.0, 120.0, 0.92);
  tiers.emplace_back("thermal",  TierKind::Thermal,         1, 400.0 * s, 0.50,  40.0,  30.0, 0.70);
  tiers.emplace_back("hydrogen", TierKind::Hydrogen,        2, 2000.0,    0.40,  30.0,  25.0, 0.40);
  tiers.emplace_back("v2g",      TierKind::Mobile,          3, 300.0,     0.70,  50.0,  50.0, 0.85);
  return tiers;
}

static std::vector<ConsumerLoad> buildLoads(int rank) {
  const double s = 1.0 + 0.15 * (rank % 4);
  return {
    {"hospital",     1, 25.0 * s, 0.0},
    {"residential",  3, 60.0 * s, 0.3},
    {"commercial",   4, 45.0 * s, 0.5},
    {"ev_charging",  6, 20.0 * s, 1.0},
    {"water_heating",7, 15.0 * s, 0.9},
  };
}

int main(int argc, char** argv) {
  int provided = MPI_THREAD_SINGLE;
  MPI_Init_thread(&argc, &argv, MPI_THREAD_SERIALIZED, &provided);

  // Codec and transport errors come back as return codes and are turned
  // into exceptions instead of aborting the job.
  MPI_Comm_set_errhandler(MPI_COMM_WORLD, MPI_ERRORS_RETURN);

  int rank = 0, size = 1;
  MPI_Comm_rank(MPI_COMM_WORLD, &rank);
  MPI_Comm_size(MPI_COMM_WORLD, &size);

  const std::string node_id = nodeIdFor(rank);
  Logger::instance().setNodeTag(node_id);
  // Only rank 0 echoes to stderr; every rank keeps its own debug file.
  Logger::instance().setEcho(rank == 0);

  LogFn log_msg = [](const std::string& s) { Logger::instance().message(s); };

  Args args = parse_args(argc, argv);
  if (args.showHelp) {
    if (rank == 0) print_usage();
    MPI_Finalize();
    return 0;
  }
  if (!args.configPath.empty()) {
    Args base;
    load_config_file(args.configPath, base, log_msg);
    args = parse_args(argc, argv, base);
  }
  Logger::instance().setVerbose(args.verbose);
  sanitize_args(args, log_msg);

  int exit_code = 0;
  try {
    {
      const char* env_run_id = std::getenv("RUN_ID");
      const char* env_logdir = std::getenv("NG_LOG_DIR");
      std::ostringstream oss;
      oss << "[info] " << node_id << " of " << size << " node(s), MPI thread level "
          << provided << "\n";
      oss << "[info] Args: nticks=" << args.nticks
          << " dt=" << args.dt
          << " horizonSteps=" << args.horizonSteps
          << " gossipEvery=" << args.gossipEvery
          << " aggregateEvery=" << args.aggregateEvery
          << " fanout=" << args.fanout
          << " neighbours=" << args.neighbours
          << " peerTimeout=" << args.peerTimeout
          << " debounce=" << args.debounce
          << " resyncConfirm=" << args.resyncConfirm
          << " budgetMs=" << args.budgetMs << "\n";
      oss << "[info] Env: RUN_ID="     << (env_run_id ? env_run_id : "<unset>") << "\n";
      oss << "[info] Env: NG_LOG_DIR=" << (env_logdir ? env_logdir : "<unset>") << "\n";
      log_msg(oss.str());
    }

    std::vector<GridEvent> events;
    if (!args.eventsPath.empty()) events = load_events(args.eventsPath, log_msg);

    // --------------------------------------------------------------------
    // Provisioning
    // --------------------------------------------------------------------
    MicrogridNode node;
    node.node_id       = node_id;
    node.rank          = rank;
    node.latitude_deg  = 47.0 + 0.01 * rank;
    node.longitude_deg = 8.0 + 0.01 * rank;
    node.feeder        = "feeder-" + std::to_string(rank / 4);
    for (int r : ring_neighbours(rank, size, args.neighbours)) {
      node.peers.push_back(PeerRef{nodeIdFor(r), r});
    }

    ControllerConfig ccfg;
    ccfg.estimator.horizon_steps  = args.horizonSteps;
    ccfg.dispatcher.dt_s          = args.dt;
    ccfg.islanding.debounce_s     = args.debounce;
    ccfg.islanding.resync_confirm_s = args.resyncConfirm;
    ccfg.budget_ms                = args.budgetMs;
    ccfg.grid_staleness_s         = std::max(3.0, 3.0 * args.dt);
    ccfg.estimator.staleness_s    = std::max(10.0, 5.0 * args.dt);

    PlantConfig pcfg;
    pcfg.start_hour      = args.startHour;
    pcfg.forecast_steps  = args.horizonSteps;
    pcfg.forecast_step_s = ccfg.estimator.step_s;

    PlantSimulator plant(node_id, buildTiers(rank), buildLoads(rank), events, pcfg);
    LocalController controller(node, buildTiers(rank), LoadShedder(buildLoads(rank)), plant, ccfg);

    plant.setOutputs(
      [&controller](const TelemetrySample& s) { controller.submitTelemetry(s); },
      [&controller](const ForecastFeedUpdate& f) { controller.submitForecast(f); });

    // --------------------------------------------------------------------
    // Slow cadence: gossip + federated averaging
    // --------------------------------------------------------------------
    MpiGossipTransport transport(MPI_COMM_WORLD);
    GossipConfig gcfg;
    gcfg.fanout         = static_cast<std::size_t>(args.fanout);
    gcfg.peer_timeout_s = args.peerTimeout;
    PeerGossip gossip(node_id, node.peers, transport, gcfg, MPI_COMM_WORLD);
    FederatedLearningCoordinator federation;
    PeerExchange exchange(gossip, federation, args.aggregateEvery);

    CadenceWorker slow("gossip", [&]() {
      auto snap = controller.snapshot();
      if (!snap) return;
      controller.postInbox(exchange.runRound(*snap, snap->time_s));
    });

    const bool threaded = !args.inlineGossip && provided >= MPI_THREAD_SERIALIZED;
    if (threaded) {
      slow.start();
    } else {
      log_msg("[info] gossip runs inline between control cycles\n");
    }

    // --------------------------------------------------------------------
    // Control loop
    // --------------------------------------------------------------------
    NodeRuntime runtime;
    runtime.setTickStep(args.dt);
    runtime.addSubsystem(&plant);
    runtime.addSubsystem(&controller);

    runtime.setAfterTick([&](const TickContext& ctx) {
      for (const auto& e : events) {
        if (e.kind == GridEvent::Kind::OperatorClear && e.start_tick == ctx.tick_index &&
            controller.state() == ConnectionState::Fault) {
          const std::string op = e.target.empty() ? "operator" : e.target;
          controller.clearFault(ctx.time, op);
        }
      }

      if (ctx.tick_index % args.gossipEvery != 0) return;
      if (threaded) {
        if (!slow.kick()) log_msg("[debug] gossip round still pending, kick coalesced\n");
      } else {
        slow.runInline();
      }
    });

    runtime.initialize();
    for (int t = 0; t < args.nticks; ++t) {
      runtime.tick();
    }
    runtime.shutdown();

    slow.stop();
    transport.quiesce();

    std::ostringstream oss;
    oss << "[info] " << node_id << " done: " << exchange.rounds() << " gossip round(s), "
        << exchange.aggregations() << " aggregation(s), " << slow.failedRounds()
        << " failed round(s), final state " << toString(controller.state()) << "\n";
    log_msg(oss.str());

  } catch (const std::exception& ex) {
    std::ostringstream oss;
    oss << "[fatal] " << node_id << ": " << ex.what() << "\n";
    Logger::instance().message(oss.str());
    std::cerr << oss.str();
    MPI_Abort(MPI_COMM_WORLD, 1);
    exit_code = 1;
  }

  MPI_Barrier(MPI_COMM_WORLD);
  MPI_Finalize();
  return exit_code;
}

#include "LocalController.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

const char* kGridTie    = "grid_tie";
const char* kGeneration = "generation";

// Plan with every tier idle; the whole imbalance is residual.
DispatchPlan idle_plan(int plan_id, double dt_s, double production_kw, double consumption_kw,
                       const std::vector<StorageTier>& tiers) {
    DispatchPlan p;
    p.plan_id        = plan_id;
    p.dt_s           = dt_s;
    p.production_kw  = production_kw;
    p.consumption_kw = consumption_kw;
    for (const auto& t : tiers) p.flows.push_back(TierFlow{t.id(), 0.0});
    p.residual_kw = production_kw - consumption_kw;
    p.flag = p.residual_kw > 0.0 ? ResidualFlag::CurtailedSurplus
           : p.residual_kw < 0.0 ? ResidualFlag::UnmetDemand
                                 : ResidualFlag::Balanced;
    return p;
}

} // namespace

LocalController::LocalController(MicrogridNode& node,
                                 std::vector<StorageTier> tiers,
                                 LoadShedder loads,
                                 CommandSink& sink,
                                 const ControllerConfig& cfg)
    : Subsystem("LocalController"),
      node_(node),
      tiers_(std::move(tiers)),
      loads_(std::move(loads)),
      sink_(sink),
      cfg_(cfg),
      window_(cfg.window_s),
      estimator_(cfg.estimator),
      dispatcher_(cfg.dispatcher),
      islanding_(cfg.islanding) {
    if (tiers_.empty()) {
        throw std::invalid_argument("LocalController " + node_.node_id + ": no storage tiers");
    }
}

void LocalController::initialize() {
    node_.state = islanding_.state();

    TickContext ctx{0, 0.0, cfg_.dispatcher.dt_s};
    publishSnapshot_(ctx);

    std::ostringstream oss;
    oss << "[info] " << node_.node_id << " controller up: " << tiers_.size()
        << " storage tier(s), " << loads_.loads().size() << " controllable load(s), "
        << node_.peers.size() << " peer(s), budget " << cfg_.budget_ms << " ms\n";
    Logger::instance().message(oss.str());
}

void LocalController::submitTelemetry(const TelemetrySample& sample) {
    std::lock_guard<std::mutex> lock(io_mtx_);
    queued_samples_.push_back(sample);
}

void LocalController::submitForecast(const ForecastFeedUpdate& update) {
    std::lock_guard<std::mutex> lock(io_mtx_);
    queued_feeds_.push_back(update);
}

std::shared_ptr<const NodeSnapshot> LocalController::snapshot() const {
    std::lock_guard<std::mutex> lock(io_mtx_);
    return snapshot_;
}

void LocalController::postInbox(NodeInbox inbox) {
    std::lock_guard<std::mutex> lock(io_mtx_);
    inbox_.push_back(std::move(inbox));
}

bool LocalController::clearFault(double now_s, const std::string& operator_id) {
    if (!islanding_.clearFault(now_s, operator_id)) return false;
    node_.state = islanding_.state();
    return true;
}

double LocalController::shedKw() const {
    double s = 0.0;
    for (const auto& kv : shed_active_) s += kv.second;
    return s;
}

void LocalController::mergeInbox_() {
    std::vector<NodeInbox> pending;
    {
        std::lock_guard<std::mutex> lock(io_mtx_);
        pending.swap(inbox_);
    }

    for (auto& in : pending) {
        peer_view_         = std::move(in.peers);
        peers_unreachable_ = in.unreachable;

        if (!in.model) continue;
        // An aggregate built on an older base would undo a newer install.
        if (in.based_on_version != estimator_.baseModel().version) {
            Logger::instance().message("[debug] discarding aggregate built on superseded model\n");
            continue;
        }
        estimator_.setModel(*in.model);
        reaggregation_pending_ = false;
    }
}

void LocalController::drainInputs_() {
    std::vector<TelemetrySample> samples;
    std::vector<ForecastFeedUpdate> feeds;
    {
        std::lock_guard<std::mutex> lock(io_mtx_);
        samples.swap(queued_samples_);
        feeds.swap(queued_feeds_);
    }

    for (const auto& s : samples) {
        if (!window_.ingest(s)) {
            std::ostringstream oss;
            oss << "[debug] rejected sample " << toString(s.quantity)
                << " from " << s.source << " at t=" << s.timestamp_s << "\n";
            Logger::instance().message(oss.str());
        }
    }
    for (const auto& f : feeds) window_.ingestForecast(f);
}

void LocalController::refreshTierTelemetry_(double now_s) {
    for (std::size_t i = 0; i < tiers_.size(); ++i) {
        const bool fresh = window_.isFresh(Quantity::StorageSoc, static_cast<int>(i),
                                           now_s, cfg_.estimator.staleness_s);
        if (fresh != tiers_[i].telemetryOk()) {
            std::ostringstream oss;
            oss << (fresh ? "[info] " : "[warn] ") << toString(FaultKind::SensorStale)
                << ": tier " << tiers_[i].id()
                << (fresh ? " telemetry restored\n" : " telemetry lost, excluded from dispatch\n");
            Logger::instance().message(oss.str());
        }
        tiers_[i].setTelemetryOk(fresh);
    }
}

GridSignals LocalController::gridSignals_(double now_s) const {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    auto fresh_value = [&](Quantity q) {
        auto s = window_.latest(q);
        if (s && now_s - s->timestamp_s <= cfg_.grid_staleness_s) return s->value;
        return nan;
    };

    GridSignals g;
    const double hb   = fresh_value(Quantity::GridHeartbeat);
    g.heartbeat_ok    = std::isfinite(hb) && hb >= 0.5;
    g.frequency_hz    = fresh_value(Quantity::GridFrequencyHz);
    g.voltage_pu      = fresh_value(Quantity::GridVoltagePu);
    g.phase_error_deg = fresh_value(Quantity::GridPhaseDeg);
    g.storage_telemetry_ok = std::any_of(tiers_.begin(), tiers_.end(),
                                         [](const StorageTier& t) { return t.telemetryOk(); });
    return g;
}

bool LocalController::emit_(const Command& cmd) {
    if (!islanding_.permits(cmd.kind)) {
        ++withheld_;
        std::ostringstream oss;
        oss << "[debug] withheld " << toString(cmd.kind) << " " << cmd.target
            << " in " << toString(islanding_.state()) << "\n";
        Logger::instance().message(oss.str());
        return false;
    }
    if (sink_.apply(cmd)) ++emitted_;
    return true;
}

void LocalController::handleTransition_(ConnectionState from, ConnectionState to) {
    if (to == ConnectionState::Fault ||
        (from == ConnectionState::GridConnected && to == ConnectionState::IslandDetected)) {
        emit_(Command{CommandKind::BreakerOpen, kGridTie, 0.0, -1});
    } else if (to == ConnectionState::GridConnected) {
        emit_(Command{CommandKind::GridTieClose, kGridTie, 0.0, -1});
    }
}

//
// Cover what storage could not: peer imports first, then shed flexible
// load. Surplus is curtailed. Zero residual releases earlier actions.
//
void LocalController::resolveResidual_(double deficit_kw, double surplus_kw) {
    import_requested_kw_ = 0.0;
    double remaining = deficit_kw;

    if (remaining > 0.0 && islanding_.permits(CommandKind::PeerImportRequest)) {
        std::vector<PeerSummary> donors;
        for (const auto& p : peer_view_) {
            if (p.state != ConnectionState::Fault && p.residual_kw > cfg_.import_min_kw) {
                donors.push_back(p);
            }
        }
        std::sort(donors.begin(), donors.end(), [](const PeerSummary& a, const PeerSummary& b) {
            if (a.residual_kw != b.residual_kw) return a.residual_kw > b.residual_kw;
            return a.node_id < b.node_id;
        });
        for (const auto& d : donors) {
            if (remaining < cfg_.import_min_kw) break;
            const double take = std::min(remaining, d.residual_kw);
            if (emit_(Command{CommandKind::PeerImportRequest, d.node_id, take, -1})) {
                import_requested_kw_ += take;
                remaining -= take;
            }
        }
    }

    std::map<std::string, double> next_shed;
    for (const auto& a : loads_.plan(std::max(0.0, remaining))) {
        next_shed[a.consumer_id] = a.reduce_kw;
    }
    for (const auto& kv : shed_active_) {
        if (!next_shed.count(kv.first)) {
            emit_(Command{CommandKind::LoadShed, kv.first, 0.0, -1});
        }
    }
    for (const auto& kv : next_shed) {
        emit_(Command{CommandKind::LoadShed, kv.first, kv.second, -1});
    }
    shed_active_ = std::move(next_shed);

    if (surplus_kw != curtail_active_kw_) {
        if (emit_(Command{CommandKind::Curtail, kGeneration, surplus_kw, -1})) {
            curtail_active_kw_ = surplus_kw;
        }
    }
}

void LocalController::publishSnapshot_(const TickContext& ctx) {
    auto snap = std::make_shared<NodeSnapshot>();
    snap->node_id     = node_.node_id;
    snap->tick        = ctx.tick_index;
    snap->time_s      = ctx.time;
    snap->state       = islanding_.state();
    snap->residual_kw = plan_.residual_kw;
    snap->base_model  = estimator_.baseModel();
    snap->local_delta = estimator_.localDelta(node_.node_id, ctx.time);
    snap->reaggregation_requested = reaggregation_pending_;

    std::lock_guard<std::mutex> lock(io_mtx_);
    snapshot_ = std::move(snap);
}

void LocalController::tick(const TickContext& ctx) {
    const auto t0 = std::chrono::steady_clock::now();
    const double now = ctx.time;

    mergeInbox_();
    drainInputs_();
    refreshTierTelemetry_(now);

    const bool was_degraded = forecast_.anyDegraded();
    forecast_ = estimator_.estimate(window_, now);
    if (forecast_.anyDegraded() != was_degraded) {
        Logger::instance().message(forecast_.anyDegraded()
            ? std::string("[warn] ") + toString(FaultKind::SensorStale) + ": forecast degraded\n"
            : std::string("[info] forecast inputs fresh again\n"));
    }
    if (estimator_.takeReaggregationRequest()) reaggregation_pending_ = true;

    const ForecastStep& next = forecast_.steps.front();
    AutonomyReport autonomy;
    bool plan_ok = true;
    try {
        if (islanding_.state() == ConnectionState::IslandDetected) {
            autonomy = dispatcher_.assessAutonomy(forecast_, tiers_, cfg_.islanding.min_autonomy_s);
        }
        plan_ = dispatcher_.plan(++plan_seq_, forecast_, tiers_);
    } catch (const std::logic_error& e) {
        plan_ok = false;
        plan_ = idle_plan(plan_seq_, cfg_.dispatcher.dt_s, next.production_kw, next.consumption_kw, tiers_);
        islanding_.enterFault(now, std::string("dispatch contract failure: ") + e.what());
    }

    // While tied to the grid the grid absorbs any residual, so nothing is
    // unmet even if storage has gone blind.
    GridSignals signals = gridSignals_(now);
    signals.unmet_demand_kw        = islanding_.state() == ConnectionState::GridConnected
                                   ? 0.0 : plan_.unmetDemandKw();
    signals.communication_degraded = overrun_streak_ >= cfg_.overrun_limit;

    const ConnectionState before = islanding_.state();
    const ConnectionState after  = islanding_.update(now, signals, autonomy);
    node_.state = after;
    if (after != before) handleTransition_(before, after);

    double deficit = plan_.unmetDemandKw();
    double surplus = plan_.curtailedKw();
    if (plan_ok && islanding_.permits(CommandKind::StorageDispatch)) {
        dispatcher_.commit(plan_, tiers_);
        for (const auto& f : plan_.flows) {
            emit_(Command{CommandKind::StorageDispatch, f.tier_id, f.flow_kw, plan_.plan_id});
        }
    } else {
        const double net = plan_.production_kw - plan_.consumption_kw;
        deficit = std::max(0.0, -net);
        surplus = std::max(0.0, net);
    }

    if (after == ConnectionState::GridConnected) {
        deficit = 0.0;
        surplus = 0.0;
    }
    resolveResidual_(deficit, surplus);

    publishSnapshot_(ctx);

    last_cycle_ms_ = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();
    if (last_cycle_ms_ > cfg_.budget_ms) {
        if (++overrun_streak_ == cfg_.overrun_limit) {
            std::ostringstream oss;
            oss << "[warn] " << toString(FaultKind::CommunicationLoss) << ": "
                << overrun_streak_ << " consecutive cycles over " << cfg_.budget_ms
                << " ms budget (last " << last_cycle_ms_ << " ms)\n";
            Logger::instance().message(oss.str());
        }
    } else {
        overrun_streak_ = 0;
    }

    logRow_(ctx);
}

void LocalController::logRow_(const TickContext& ctx) {
    const ForecastStep& next = forecast_.steps.front();
    Logger::instance().log_wide(
        name_, ctx.tick_index, ctx.time,
        {"state", "production_kw", "consumption_kw", "net_forecast_kw",
         "lower_kw", "upper_kw", "degraded", "residual_kw", "unmet_kw",
         "curtailed_kw", "shed_kw", "import_kw", "error_kw", "model_version",
         "peers_reachable", "peers_unreachable", "cycle_ms", "overrun_streak"},
        {static_cast<double>(stateCode(islanding_.state())),
         next.production_kw, next.consumption_kw, next.net_kw,
         next.lower_kw, next.upper_kw, next.degraded ? 1.0 : 0.0,
         plan_.residual_kw, plan_.unmetDemandKw(), plan_.curtailedKw(),
         shedKw(), import_requested_kw_, estimator_.errorMetric(),
         static_cast<double>(estimator_.baseModel().version),
         static_cast<double>(peer_view_.size()), static_cast<double>(peers_unreachable_),
         last_cycle_ms_, static_cast<double>(overrun_streak_)}
    );

    std::vector<std::string> cols;
    std::vector<double> vals;
    for (const auto& t : tiers_) {
        cols.push_back(t.id() + "_soc");
        vals.push_back(t.soc());
        cols.push_back(t.id() + "_flow_kw");
        vals.push_back(plan_.flowFor(t.id()));
    }
    Logger::instance().log_wide("StorageTiers", ctx.tick_index, ctx.time, cols, vals);
}

void LocalController::shutdown() {
    std::ostringstream oss;
    oss << "[info] " << node_.node_id << " controller down in "
        << toString(islanding_.state()) << ": " << emitted_ << " command(s) emitted, "
        << withheld_ << " withheld, " << islanding_.history().size() << " transition(s), "
        << dispatcher_.rejectedPlans() << " rejected plan(s), model v"
        << estimator_.baseModel().version << "\n";
    Logger::instance().message(oss.str());
}

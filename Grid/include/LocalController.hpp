#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "CommandSink.hpp"
#include "IslandingStateMachine.hpp"
#include "LoadShedder.hpp"
#include "MicrogridNode.hpp"
#include "NodeSnapshot.hpp"
#include "StorageDispatcher.hpp"
#include "Subsystem.hpp"
#include "SupplyDemandEstimator.hpp"
#include "TelemetryIngest.hpp"

struct ControllerConfig {
    double           window_s = 900.0;
    EstimatorConfig  estimator;
    DispatcherConfig dispatcher;
    IslandingConfig  islanding;
    double budget_ms        = 50.0;   // end-to-end cycle budget
    int    overrun_limit    = 3;      // consecutive overruns before it counts as degraded comms
    double grid_staleness_s = 3.0;    // heartbeat / grid-side sensor freshness
    double import_min_kw    = 0.5;    // smaller peer imports are not worth requesting
};

// The per-microgrid control cycle. Owns the telemetry window, tier states
// and connection state; other threads interact only through the submit /
// snapshot / inbox calls, which are mutex-guarded.
class LocalController : public Subsystem {
public:
    LocalController(MicrogridNode& node,
                    std::vector<StorageTier> tiers,
                    LoadShedder loads,
                    CommandSink& sink,
                    const ControllerConfig& cfg = ControllerConfig{});

    void initialize() override;
    void tick(const TickContext& ctx) override;
    void shutdown() override;

    // Inputs from the physical layer; queued until the next cycle.
    void submitTelemetry(const TelemetrySample& sample);
    void submitForecast(const ForecastFeedUpdate& update);

    // Slow-cadence interface
    std::shared_ptr<const NodeSnapshot> snapshot() const;
    void postInbox(NodeInbox inbox);

    // Supervisory interface
    bool clearFault(double now_s, const std::string& operator_id);

    ConnectionState state() const { return islanding_.state(); }
    const DispatchPlan& lastPlan() const { return plan_; }
    const ForecastWindow& lastForecast() const { return forecast_; }
    const std::vector<StorageTier>& tiers() const { return tiers_; }
    const IslandingStateMachine& islanding() const { return islanding_; }
    const SupplyDemandEstimator& estimator() const { return estimator_; }
    const TelemetryIngest& telemetry() const { return window_; }
    const std::vector<PeerSummary>& peerView() const { return peer_view_; }

    int overrunStreak() const { return overrun_streak_; }
    double lastCycleMs() const { return last_cycle_ms_; }
    std::size_t emittedCommands() const { return emitted_; }
    std::size_t withheldCommands() const { return withheld_; }
    double shedKw() const;
    double importRequestedKw() const { return import_requested_kw_; }

    void setBudgetMs(double ms) { cfg_.budget_ms = ms; }

private:
    void mergeInbox_();
    void drainInputs_();
    void refreshTierTelemetry_(double now_s);
    GridSignals gridSignals_(double now_s) const;
    void handleTransition_(ConnectionState from, ConnectionState to);
    void resolveResidual_(double deficit_kw, double surplus_kw);
    bool emit_(const Command& cmd);
    void publishSnapshot_(const TickContext& ctx);
    void logRow_(const TickContext& ctx);

    MicrogridNode& node_;
    std::vector<StorageTier> tiers_;
    LoadShedder loads_;
    CommandSink& sink_;
    ControllerConfig cfg_;

    TelemetryIngest       window_;
    SupplyDemandEstimator estimator_;
    StorageDispatcher     dispatcher_;
    IslandingStateMachine islanding_;

    ForecastWindow forecast_;
    DispatchPlan   plan_;
    int            plan_seq_ = 0;
    std::vector<PeerSummary> peer_view_;
    std::size_t    peers_unreachable_ = 0;

    std::map<std::string, double> shed_active_;
    double curtail_active_kw_   = 0.0;
    double import_requested_kw_ = 0.0;

    int    overrun_streak_ = 0;
    double last_cycle_ms_  = 0.0;
    std::size_t emitted_   = 0;
    std::size_t withheld_  = 0;
    bool   reaggregation_pending_ = false;

    // Cross-thread hand-off
    mutable std::mutex io_mtx_;
    std::vector<TelemetrySample> queued_samples_;
    std::vector<ForecastFeedUpdate> queued_feeds_;
    std::shared_ptr<const NodeSnapshot> snapshot_;
    std::vector<NodeInbox> inbox_;
};

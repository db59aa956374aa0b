#undef NDEBUG
#include "CommandSink.hpp"
#include "IslandingStateMachine.hpp"
#include "LoadShedder.hpp"
#include "LocalController.hpp"
#include "Logger.hpp"
#include "NodeRuntime.hpp"
#include "PlantSimulator.hpp"
#include "StorageDispatcher.hpp"
#include "SupplyDemandEstimator.hpp"
#include "TelemetryIngest.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static bool near(double a, double b, double tol = 1e-6) {
    return std::fabs(a - b) <= tol;
}

static TelemetrySample sample(double t, Quantity q, double v, int tier = -1) {
    TelemetrySample s;
    s.timestamp_s = t;
    s.source      = "meter";
    s.quantity    = q;
    s.tier        = tier;
    s.value       = v;
    return s;
}

static std::size_t countCommands(const RecordingCommandSink& sink, CommandKind kind,
                                 const std::string& target = "") {
    return static_cast<std::size_t>(std::count_if(
        sink.applied().begin(), sink.applied().end(), [&](const Command& c) {
            return c.kind == kind && (target.empty() || c.target == target);
        }));
}

// ✅ Helper: one cycle's worth of plant readings
struct Readings {
    double production_kw  = 100.0;
    double consumption_kw = 80.0;
    bool   grid_up        = true;
    bool   soc_reported   = true;
    double phase_deg      = 0.0;
};

static void submit(LocalController& ctl, double t, const Readings& r, std::size_t ntiers) {
    ctl.submitTelemetry(sample(t, Quantity::ProductionKw, r.production_kw));
    ctl.submitTelemetry(sample(t, Quantity::ConsumptionKw, r.consumption_kw));
    if (r.soc_reported) {
        for (std::size_t i = 0; i < ntiers; ++i) {
            ctl.submitTelemetry(sample(t, Quantity::StorageSoc, 0.5, static_cast<int>(i)));
        }
    }
    ctl.submitTelemetry(sample(t, Quantity::GridHeartbeat, r.grid_up ? 1.0 : 0.0));
    if (r.grid_up) {
        ctl.submitTelemetry(sample(t, Quantity::GridFrequencyHz, 50.0));
        ctl.submitTelemetry(sample(t, Quantity::GridVoltagePu, 1.0));
        ctl.submitTelemetry(sample(t, Quantity::GridPhaseDeg, r.phase_deg));
    }
}

static void step(LocalController& ctl, RecordingCommandSink& sink, int tick,
                 const Readings& r) {
    const double t = static_cast<double>(tick);
    submit(ctl, t, r, ctl.tiers().size());
    sink.setTick(tick, t);
    ctl.tick(TickContext{tick, t, 1.0});
}

static std::vector<StorageTier> controllerTiers() {
    return {
        StorageTier("battery", TierKind::Electrochemical, 0, 500.0, 0.5, 100.0, 100.0, 0.90),
        StorageTier("thermal", TierKind::Thermal,         1, 500.0, 0.5,  30.0,  30.0, 0.70),
    };
}

static std::vector<ConsumerLoad> controllerLoads() {
    return {
        {"hospital", 1,  50.0, 0.0},
        {"homes",    4, 100.0, 0.5},
        {"ev",       7,  40.0, 1.0},
    };
}

static ControllerConfig controllerConfig() {
    ControllerConfig cfg;
    cfg.dispatcher.dt_s             = 1.0;
    cfg.islanding.debounce_s        = 2.0;
    cfg.islanding.resync_confirm_s  = 5.0;
    cfg.islanding.min_autonomy_s    = 300.0;
    cfg.budget_ms                   = 1000.0;
    return cfg;
}

// ✅ Test 1: 100 kW produced, 80 kW consumed: +20 kW into the fast tier
void test_surplus_charges_fast_tier() {
    std::vector<StorageTier> tiers = {
        StorageTier("battery", TierKind::Electrochemical, 0, 200.0, 0.5, 50.0, 50.0, 0.90),
        StorageTier("thermal", TierKind::Thermal,         1, 400.0, 0.5, 40.0, 30.0, 0.70),
    };
    StorageDispatcher d;
    DispatchPlan p = d.plan(1, 100.0, 80.0, tiers);

    assert(near(p.flowFor("battery"), 20.0));
    assert(near(p.flowFor("thermal"), 0.0));
    assert(near(p.residual_kw, 0.0));
    assert(p.flag == ResidualFlag::Balanced);
    assert(!d.findViolation(p, tiers));
    std::cout << "[PASS] Surplus charges the fastest tier first.\n";
}

// ✅ Test 2: 40 kW produced, 100 kW consumed, fast tier empty
void test_deficit_falls_back_in_rank_order() {
    std::vector<StorageTier> tiers = {
        StorageTier("battery",  TierKind::Electrochemical, 0, 200.0, 0.0, 50.0, 50.0, 0.90),
        StorageTier("thermal",  TierKind::Thermal,         1, 400.0, 0.8, 40.0, 10.0, 0.70),
        StorageTier("hydrogen", TierKind::Hydrogen,        2, 900.0, 0.8, 20.0, 20.0, 0.40),
    };
    StorageDispatcher d;
    DispatchPlan p = d.plan(2, 40.0, 100.0, tiers);

    assert(near(p.flowFor("battery"), 0.0));
    assert(near(p.flowFor("thermal"), -10.0));
    assert(near(p.flowFor("hydrogen"), -20.0));
    assert(p.flag == ResidualFlag::UnmetDemand);
    assert(near(p.unmetDemandKw(), 30.0));
    assert(near(p.curtailedKw(), 0.0));
    std::cout << "[PASS] Deficit discharges thermal then hydrogen, 30 kW unmet.\n";
}

// ✅ Test 3: no plan ever exceeds a rate or capacity limit
void test_plans_respect_limits() {
    const double dt = 60.0;
    DispatcherConfig cfg;
    cfg.dt_s = dt;
    StorageDispatcher d(cfg);

    std::vector<StorageTier> tiers = {
        StorageTier("nearly_full",  TierKind::Electrochemical, 0, 10.0, 0.999, 80.0, 80.0, 0.90),
        StorageTier("nearly_empty", TierKind::Thermal,         1, 10.0, 0.001, 30.0, 30.0, 0.70),
        StorageTier("h2",           TierKind::Hydrogen,        2, 50.0, 0.5,   15.0, 15.0, 0.40),
        StorageTier("fleet",        TierKind::Mobile,          0, 40.0, 0.5,   25.0, 25.0, 0.85),
    };

    int id = 10;
    for (double p = 0.0; p <= 300.0; p += 37.5) {
        for (double c = 0.0; c <= 300.0; c += 42.0) {
            DispatchPlan plan = d.plan(id++, p, c, tiers);
            assert(!d.findViolation(plan, tiers));
            for (const auto& t : tiers) {
                const double f = plan.flowFor(t.id());
                assert(f <= t.maxChargeKw(dt) + 1e-6);
                assert(-f <= t.maxDischargeKw(dt) + 1e-6);
            }
            assert(near(p - c, plan.totalFlowKw() + plan.residual_kw, 1e-6));
        }
    }
    std::cout << "[PASS] Every plan within rate/capacity limits and balanced.\n";
}

// ✅ Test 4: re-committing the same plan is a no-op
void test_commit_is_idempotent() {
    std::vector<StorageTier> tiers = {
        StorageTier("battery", TierKind::Electrochemical, 0, 100.0, 0.5, 50.0, 50.0, 0.90),
    };
    DispatcherConfig cfg;
    cfg.dt_s = 60.0;
    StorageDispatcher d(cfg);

    DispatchPlan p = d.plan(7, 30.0, 0.0, tiers);
    const double before = tiers[0].soc();
    assert(d.commit(p, tiers));
    const double after = tiers[0].soc();
    assert(after > before);

    assert(!d.commit(p, tiers));
    assert(tiers[0].soc() == after);
    assert(tiers[0].lastAppliedPlan() == 7);
    std::cout << "[PASS] Commit applies a plan exactly once.\n";
}

// ✅ Test 5: equal response rank goes to the more efficient tier; mobile last
void test_dispatch_order_tie_breaks() {
    std::vector<StorageTier> tiers = {
        StorageTier("a",     TierKind::Electrochemical, 0, 100.0, 0.5, 50.0, 50.0, 0.80),
        StorageTier("b",     TierKind::Electrochemical, 0, 100.0, 0.5, 50.0, 50.0, 0.95),
        StorageTier("fleet", TierKind::Mobile,          0, 100.0, 0.5, 50.0, 50.0, 0.99),
        StorageTier("heat",  TierKind::Thermal,         2, 100.0, 0.5, 50.0, 50.0, 0.60),
    };
    auto order = StorageDispatcher::dispatchOrder(tiers);
    assert(tiers[order[0]].id() == "b");
    assert(tiers[order[1]].id() == "a");
    assert(tiers[order[2]].id() == "heat");
    assert(tiers[order[3]].id() == "fleet");

    StorageDispatcher d;
    DispatchPlan p = d.plan(1, 10.0, 0.0, tiers);
    assert(near(p.flowFor("b"), 10.0));
    assert(near(p.flowFor("a"), 0.0));
    std::cout << "[PASS] Same-rank tie goes to higher efficiency, mobile last.\n";
}

// ✅ Test 6: an out-of-bounds plan never reaches the tiers
void test_commit_rejects_violation() {
    std::vector<StorageTier> tiers = {
        StorageTier("battery", TierKind::Electrochemical, 0, 100.0, 0.5, 10.0, 10.0, 0.90),
    };
    StorageDispatcher d;
    DispatchPlan p = d.plan(3, 5.0, 0.0, tiers);
    p.flows[0].flow_kw = 25.0;
    p.residual_kw      = 5.0 - 25.0;

    assert(d.findViolation(p, tiers));
    bool threw = false;
    try {
        (void)d.commit(p, tiers);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(tiers[0].soc() == 0.5);
    assert(tiers[0].lastAppliedPlan() == -1);

    // Tiers without telemetry are left out of the plan entirely.
    tiers[0].setTelemetryOk(false);
    DispatchPlan q = d.plan(4, 5.0, 0.0, tiers);
    assert(q.flowFor("battery") == 0.0);
    assert(q.flag == ResidualFlag::CurtailedSurplus);
    std::cout << "[PASS] Over-limit plan rejected before commit.\n";
}

// ✅ Test 7: fresh inputs give a non-degraded forecast
void test_fresh_forecast_not_degraded() {
    TelemetryIngest window(900.0);
    for (int t = 0; t <= 10; ++t) {
        assert(window.ingest(sample(t, Quantity::ProductionKw, 50.0)));
        assert(window.ingest(sample(t, Quantity::ConsumptionKw, 30.0)));
    }
    SupplyDemandEstimator est;
    ForecastWindow fw = est.estimate(window, 10.0);

    assert(fw.steps.size() == static_cast<std::size_t>(est.config().horizon_steps));
    assert(!fw.anyDegraded());
    for (const auto& s : fw.steps) {
        assert(near(s.production_kw, 50.0, 1e-9));
        assert(near(s.consumption_kw, 30.0, 1e-9));
        assert(near(s.net_kw, 20.0, 1e-9));
        assert(s.lower_kw <= s.net_kw && s.net_kw <= s.upper_kw);
    }
    std::cout << "[PASS] Fresh inputs: no degraded step.\n";
}

// ✅ Test 8: sensor dropout degrades instead of failing
void test_stale_forecast_degrades() {
    TelemetryIngest window(900.0);
    for (int t = 0; t <= 10; ++t) {
        window.ingest(sample(t, Quantity::ProductionKw, 50.0));
        window.ingest(sample(t, Quantity::ConsumptionKw, 30.0));
    }
    SupplyDemandEstimator est;
    ForecastWindow fresh = est.estimate(window, 10.0);
    ForecastWindow stale = est.estimate(window, 30.0);   // 20 s > 10 s bound

    assert(stale.steps.size() == fresh.steps.size());
    for (const auto& s : stale.steps) {
        assert(s.degraded);
        assert(near(s.production_kw, 50.0, 1e-9));
        assert(near(s.consumption_kw, 30.0, 1e-9));
    }
    const double w_fresh = fresh.steps[0].upper_kw - fresh.steps[0].lower_kw;
    const double w_stale = stale.steps[0].upper_kw - stale.steps[0].lower_kw;
    assert(near(w_stale, est.config().degraded_widen * w_fresh, 1e-9));

    // Never-seen quantities are treated the same way.
    TelemetryIngest empty(900.0);
    SupplyDemandEstimator est2;
    ForecastWindow none = est2.estimate(empty, 0.0);
    assert(none.anyDegraded());
    assert(none.steps.front().net_kw == 0.0);
    std::cout << "[PASS] Stale inputs: extrapolated, every step degraded.\n";
}

// ✅ Test 9: sustained prediction error asks for re-aggregation
void test_sustained_error_requests_reaggregation() {
    EstimatorConfig cfg;
    cfg.step_s             = 1.0;
    cfg.error_threshold_kw = 1.0;
    cfg.sustained_cycles   = 3;
    SupplyDemandEstimator est(cfg);
    TelemetryIngest window(900.0);

    bool requested = false;
    for (int t = 0; t <= 30; ++t) {
        window.ingest(sample(t, Quantity::ProductionKw, (t % 2 == 0) ? 100.0 : 0.0));
        window.ingest(sample(t, Quantity::ConsumptionKw, 30.0));
        est.estimate(window, static_cast<double>(t));
        if (est.takeReaggregationRequest()) requested = true;
    }
    assert(requested);
    assert(est.errorMetric() > cfg.error_threshold_kw);

    ModelDelta d = est.localDelta("mg-0", 30.0);
    assert(d.origin == "mg-0");
    assert(d.sample_count > 0);
    assert(d.norm() > 0.0);

    // Installing a model starts local learning afresh.
    est.setModel(est.model());
    assert(est.localDelta("mg-0", 31.0).sample_count == 0);
    assert(est.localDelta("mg-0", 31.0).norm() == 0.0);
    std::cout << "[PASS] Sustained error raises a re-aggregation request.\n";
}

// ✅ Test 10: window ordering, eviction and rejection
void test_telemetry_window() {
    TelemetryIngest w(100.0);
    assert(w.ingest(sample(10.0, Quantity::ConsumptionKw, 1.0)));
    assert(w.ingest(sample(5.0,  Quantity::ConsumptionKw, 2.0)));   // late arrival
    assert(w.ingest(sample(7.0,  Quantity::ConsumptionKw, 3.0)));

    auto r = w.recent(Quantity::ConsumptionKw, -1, 10);
    assert(r.size() == 3);
    assert(r[0].timestamp_s == 5.0 && r[1].timestamp_s == 7.0 && r[2].timestamp_s == 10.0);
    assert(w.latest(Quantity::ConsumptionKw)->value == 1.0);

    const std::vector<TelemetrySample> before = w.snapshot();
    assert(before.size() == 3);
    assert(before.front().timestamp_s == 5.0 && before.back().timestamp_s == 10.0);

    assert(w.ingest(sample(200.0, Quantity::ConsumptionKw, 4.0)));
    assert(w.size() == 1);                                           // 5, 7, 10 evicted
    assert(before.size() == 3 && before[1].value == 3.0);            // copy unaffected
    assert(w.snapshot().size() == 1 && w.snapshot()[0].timestamp_s == 200.0);
    assert(!w.ingest(sample(50.0, Quantity::ConsumptionKw, 5.0)));  // older than the window
    assert(!w.ingest(sample(201.0, Quantity::ConsumptionKw, std::nan(""))));
    assert(w.rejectedCount() == 2);

    assert(w.isFresh(Quantity::ConsumptionKw, -1, 205.0, 10.0));
    assert(!w.isFresh(Quantity::ConsumptionKw, -1, 215.0, 10.0));
    assert(!w.isFresh(Quantity::StorageSoc, 0, 200.0, 10.0));

    bool threw = false;
    try {
        TelemetryIngest bad(0.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Telemetry window ordered, bounded, rejects bad samples.\n";
}

static GridSignals healthy() {
    GridSignals s;
    s.heartbeat_ok         = true;
    s.frequency_hz         = 50.0;
    s.voltage_pu           = 1.0;
    s.phase_error_deg      = 0.0;
    s.storage_telemetry_ok = true;
    return s;
}

// ✅ Test 11: heartbeat loss islands within one debounce interval
void test_islanding_debounce() {
    IslandingConfig cfg;
    cfg.debounce_s = 2.0;
    IslandingStateMachine sm(cfg);
    AutonomyReport none;

    assert(sm.update(0.0, healthy(), none) == ConnectionState::GridConnected);

    GridSignals lost = healthy();
    lost.heartbeat_ok = false;
    assert(sm.update(1.0, lost, none) == ConnectionState::GridConnected);
    assert(sm.update(2.0, lost, none) == ConnectionState::GridConnected);
    assert(sm.update(3.0, lost, none) == ConnectionState::IslandDetected);

    // A single glitch shorter than the debounce does not island.
    IslandingStateMachine sm2(cfg);
    sm2.update(0.0, lost, none);
    sm2.update(1.0, healthy(), none);
    sm2.update(2.5, lost, none);
    assert(sm2.update(3.5, lost, none) == ConnectionState::GridConnected);

    // Out-of-band frequency counts as abnormal too.
    IslandingStateMachine sm3(cfg);
    GridSignals off = healthy();
    off.frequency_hz = 51.0;
    sm3.update(0.0, off, none);
    assert(sm3.update(2.0, off, none) == ConnectionState::IslandDetected);
    std::cout << "[PASS] Islanding detected after debounce, glitches ignored.\n";
}

// ✅ Test 12: reconnection only through Resynchronizing
void test_no_direct_reconnect() {
    IslandingConfig cfg;
    cfg.debounce_s       = 0.0;
    cfg.resync_confirm_s = 5.0;
    IslandingStateMachine sm(cfg);
    GridSignals lost = healthy();
    lost.heartbeat_ok = false;

    sm.update(0.0, lost, AutonomyReport{});
    assert(sm.state() == ConnectionState::IslandDetected);

    // Grid is back and aligned, but IslandDetected never jumps to GridConnected.
    assert(sm.update(1.0, healthy(), AutonomyReport{}) == ConnectionState::IslandDetected);

    AutonomyReport ok;
    ok.sustainable = true;
    assert(sm.update(2.0, healthy(), ok) == ConnectionState::IslandStable);
    assert(sm.update(3.0, healthy(), ok) == ConnectionState::Resynchronizing);
    assert(sm.update(7.0, healthy(), ok) == ConnectionState::Resynchronizing);
    assert(sm.update(8.0, healthy(), ok) == ConnectionState::GridConnected);

    for (const auto& t : sm.history()) {
        assert(!(t.from == ConnectionState::IslandDetected && t.to == ConnectionState::GridConnected));
        if (t.to == ConnectionState::GridConnected) assert(t.from == ConnectionState::Resynchronizing);
    }
    std::cout << "[PASS] GridConnected reached only via Resynchronizing.\n";
}

// ✅ Test 13: a failed synchronization check falls back to IslandStable
void test_resync_failure() {
    IslandingConfig cfg;
    cfg.debounce_s = 0.0;
    IslandingStateMachine sm(cfg);
    GridSignals lost = healthy();
    lost.heartbeat_ok = false;
    AutonomyReport ok;
    ok.sustainable = true;

    sm.update(0.0, lost, ok);
    sm.update(1.0, lost, ok);
    assert(sm.state() == ConnectionState::IslandStable);

    // Healthy but out of phase: stays islanded.
    GridSignals skewed = healthy();
    skewed.phase_error_deg = 40.0;
    assert(sm.update(2.0, skewed, ok) == ConnectionState::IslandStable);

    assert(sm.update(3.0, healthy(), ok) == ConnectionState::Resynchronizing);
    assert(sm.update(4.0, skewed, ok) == ConnectionState::IslandStable);

    // A fresh attempt needs the full confirmation interval again.
    assert(sm.update(5.0, healthy(), ok) == ConnectionState::Resynchronizing);
    assert(sm.update(9.0, healthy(), ok) == ConnectionState::Resynchronizing);
    assert(sm.update(10.0, healthy(), ok) == ConnectionState::GridConnected);
    std::cout << "[PASS] Resync failure returns to IslandStable.\n";
}

// ✅ Test 14: Fault is sticky, gates commands, clears only by operator
void test_fault_sticky_and_gating() {
    IslandingStateMachine sm;
    GridSignals blind = healthy();
    blind.storage_telemetry_ok = false;
    blind.unmet_demand_kw      = 5.0;

    assert(sm.update(0.0, blind, AutonomyReport{}) == ConnectionState::Fault);
    assert(sm.update(100.0, healthy(), AutonomyReport{}) == ConnectionState::Fault);

    assert(!sm.permits(CommandKind::StorageDispatch));
    assert(!sm.permits(CommandKind::Curtail));
    assert(!sm.permits(CommandKind::GridTieClose));
    assert(!sm.permits(CommandKind::PeerImportRequest));
    assert(sm.permits(CommandKind::LoadShed));
    assert(sm.permits(CommandKind::BreakerOpen));

    assert(sm.clearFault(101.0, "ops"));
    assert(sm.state() == ConnectionState::IslandDetected);
    assert(!sm.clearFault(102.0, "ops"));
    assert(!sm.permits(CommandKind::GridTieClose));
    assert(sm.permits(CommandKind::StorageDispatch));

    assert(!IslandingStateMachine::permits(ConnectionState::IslandStable, CommandKind::GridTieClose));
    assert(IslandingStateMachine::permits(ConnectionState::GridConnected, CommandKind::GridTieClose));

    // Exhausted storage while islanded is a fault as well.
    IslandingStateMachine sm2;
    sm2.enterFault(0.0, "test");
    assert(sm2.state() == ConnectionState::Fault);
    IslandingConfig cfg;
    cfg.debounce_s = 0.0;
    IslandingStateMachine sm3(cfg);
    GridSignals lost = healthy();
    lost.heartbeat_ok = false;
    sm3.update(0.0, lost, AutonomyReport{});
    AutonomyReport dry;
    dry.storage_exhausted = true;
    assert(sm3.update(1.0, lost, dry) == ConnectionState::Fault);
    std::cout << "[PASS] Fault sticky, safety-only, operator clear.\n";
}

// ✅ Test 15: least critical, most flexible loads go first
void test_load_shedder() {
    LoadShedder shed(std::vector<ConsumerLoad>{
        {"hospital",    1, 50.0, 1.0},
        {"residential", 3, 40.0, 0.5},
        {"ev",          6, 20.0, 1.0},
        {"heating",     6, 10.0, 0.5},
    });
    auto a = shed.plan(30.0);
    assert(a.size() == 3);
    assert(a[0].consumer_id == "ev"          && near(a[0].reduce_kw, 20.0));
    assert(a[1].consumer_id == "heating"     && near(a[1].reduce_kw, 5.0));
    assert(a[2].consumer_id == "residential" && near(a[2].reduce_kw, 5.0));

    auto all = shed.plan(1000.0);
    double total = 0.0;
    for (const auto& x : all) {
        assert(x.consumer_id != "hospital");
        total += x.reduce_kw;
    }
    assert(near(total, 45.0));
    assert(near(shed.sheddableKw(), 45.0));
    assert(shed.plan(0.0).empty());
    std::cout << "[PASS] Load shedding order and protection.\n";
}

// ✅ Test 16: full cycle: connected, outage, deficit, resync
void test_controller_outage_cycle() {
    MicrogridNode node;
    node.node_id = "mg-test";
    RecordingCommandSink sink("TestCommands");
    LocalController ctl(node, controllerTiers(), LoadShedder(controllerLoads()), sink, controllerConfig());
    ctl.initialize();
    assert(ctl.snapshot() && ctl.snapshot()->tick == 0);

    Readings r;
    for (int t = 1; t <= 10; ++t) step(ctl, sink, t, r);
    assert(ctl.state() == ConnectionState::GridConnected);
    assert(near(ctl.lastPlan().flowFor("battery"), 20.0, 1e-6));
    assert(countCommands(sink, CommandKind::StorageDispatch, "battery") == 10);
    assert(!sink.breakerOpen());
    assert(ctl.snapshot()->tick == 10);

    // Upstream grid disappears
    r.grid_up = false;
    for (int t = 11; t <= 14; ++t) step(ctl, sink, t, r);
    assert(sink.breakerOpen());
    assert(countCommands(sink, CommandKind::BreakerOpen) == 1);
    assert(ctl.state() == ConnectionState::IslandStable);
    assert(node.state == ConnectionState::IslandStable);

    // Islanded deficit beyond storage: every flexible kW is shed, the
    // protected load never is. The step change also drives the trend term,
    // so the forecast deficit stays well above the 90 kW that can be shed.
    r.production_kw  = 20.0;
    r.consumption_kw = 190.0;
    for (int t = 15; t <= 20; ++t) {
        step(ctl, sink, t, r);
        assert(ctl.state() == ConnectionState::IslandStable);
        assert(near(ctl.lastPlan().flowFor("battery"), -100.0, 1e-6));
        assert(near(ctl.lastPlan().flowFor("thermal"), -30.0, 1e-6));
        assert(ctl.lastPlan().unmetDemandKw() > 90.0);
        assert(near(ctl.shedKw(), 90.0, 1e-6));
    }
    assert(countCommands(sink, CommandKind::LoadShed, "ev") == 1);      // re-issues are no-ops
    assert(countCommands(sink, CommandKind::LoadShed, "homes") == 1);
    assert(countCommands(sink, CommandKind::LoadShed, "hospital") == 0);

    // A neighbour with surplus is asked for help first; a faulted one is not
    NodeInbox inbox;
    inbox.based_on_version = ctl.estimator().baseModel().version;
    inbox.peers.push_back(PeerSummary{"mg-peer", ConnectionState::GridConnected, 25.0, 20.0});
    inbox.peers.push_back(PeerSummary{"mg-faulted", ConnectionState::Fault, 100.0, 20.0});
    ctl.postInbox(inbox);
    step(ctl, sink, 21, r);
    assert(ctl.peerView().size() == 2);
    assert(near(ctl.importRequestedKw(), 25.0, 1e-6));
    assert(countCommands(sink, CommandKind::PeerImportRequest, "mg-peer") == 1);
    assert(countCommands(sink, CommandKind::PeerImportRequest, "mg-faulted") == 0);

    // Grid returns in phase: resync, then reconnect after confirmation
    r = Readings{};
    step(ctl, sink, 22, r);
    assert(ctl.state() == ConnectionState::Resynchronizing);
    for (int t = 23; t <= 27; ++t) step(ctl, sink, t, r);
    assert(ctl.state() == ConnectionState::GridConnected);
    assert(!sink.breakerOpen());
    assert(countCommands(sink, CommandKind::GridTieClose) == 1);
    assert(near(ctl.shedKw(), 0.0));

    for (const auto& tr : ctl.islanding().history()) {
        assert(!(tr.from == ConnectionState::IslandDetected && tr.to == ConnectionState::GridConnected));
    }
    for (const auto& t : ctl.tiers()) {
        assert(t.soc() >= 0.0 && t.soc() <= 1.0);
    }
    ctl.shutdown();
    std::cout << "[PASS] Controller outage cycle: island, shed, import, resync.\n";
}

// ✅ Test 17: blind storage with unmet demand faults; operator clear
void test_controller_fault_and_clear() {
    MicrogridNode node;
    node.node_id = "mg-fault";
    RecordingCommandSink sink("TestFaultCommands");
    LocalController ctl(node, controllerTiers(), LoadShedder(controllerLoads()), sink, controllerConfig());
    ctl.initialize();

    Readings r;
    for (int t = 1; t <= 3; ++t) step(ctl, sink, t, r);

    r.grid_up        = false;
    r.soc_reported   = false;
    r.production_kw  = 20.0;
    r.consumption_kw = 150.0;
    for (int t = 4; t <= 16; ++t) step(ctl, sink, t, r);
    assert(ctl.state() == ConnectionState::Fault);
    assert(sink.breakerOpen());
    assert(ctl.shedKw() > 0.0);
    const std::size_t dispatches = countCommands(sink, CommandKind::StorageDispatch);

    // Still faulted: no dispatch, curtailment withheld
    r.production_kw  = 200.0;
    r.consumption_kw = 50.0;
    step(ctl, sink, 17, r);
    assert(ctl.state() == ConnectionState::Fault);
    assert(countCommands(sink, CommandKind::StorageDispatch) == dispatches);
    assert(countCommands(sink, CommandKind::Curtail) == 0);
    assert(ctl.withheldCommands() > 0);

    assert(ctl.clearFault(17.5, "ops"));
    assert(ctl.state() == ConnectionState::IslandDetected);
    assert(!ctl.clearFault(17.6, "ops"));

    // Telemetry back: the node stays out of Fault
    r.soc_reported = true;
    for (int t = 18; t <= 20; ++t) step(ctl, sink, t, r);
    assert(ctl.state() != ConnectionState::Fault);
    std::cout << "[PASS] Storage telemetry loss faults; operator clear recovers.\n";
}

// ✅ Test 18: blind storage while tied to a healthy grid is only degraded
void test_grid_absorbs_deficit_when_storage_blind() {
    MicrogridNode node;
    node.node_id = "mg-blind";
    RecordingCommandSink sink("TestBlindCommands");
    LocalController ctl(node, controllerTiers(), LoadShedder(controllerLoads()), sink, controllerConfig());
    ctl.initialize();

    Readings r;
    for (int t = 1; t <= 3; ++t) step(ctl, sink, t, r);

    r.soc_reported   = false;
    r.production_kw  = 20.0;
    r.consumption_kw = 60.0;
    for (int t = 4; t <= 30; ++t) {
        step(ctl, sink, t, r);
        assert(ctl.state() == ConnectionState::GridConnected);
    }
    for (const auto& t : ctl.tiers()) assert(!t.telemetryOk());
    assert(ctl.lastPlan().unmetDemandKw() > 0.0);
    assert(!sink.breakerOpen());
    assert(countCommands(sink, CommandKind::BreakerOpen) == 0);
    assert(countCommands(sink, CommandKind::LoadShed) == 0);
    assert(near(ctl.shedKw(), 0.0));
    assert(ctl.islanding().history().empty());
    std::cout << "[PASS] Grid covers the deficit while storage telemetry is stale.\n";
}

// ✅ Test 19: persistent budget overruns escalate toward islanding
void test_controller_overrun_escalates() {
    MicrogridNode node;
    node.node_id = "mg-slow";
    RecordingCommandSink sink("TestSlowCommands");
    ControllerConfig cfg = controllerConfig();
    LocalController ctl(node, controllerTiers(), LoadShedder(controllerLoads()), sink, cfg);
    ctl.initialize();
    ctl.setBudgetMs(1e-9);

    Readings r;
    for (int t = 1; t <= 8; ++t) step(ctl, sink, t, r);
    assert(ctl.overrunStreak() >= cfg.overrun_limit);
    assert(ctl.state() != ConnectionState::GridConnected);
    bool budget_reason = false;
    for (const auto& tr : ctl.islanding().history()) {
        if (tr.reason.find("budget") != std::string::npos) budget_reason = true;
    }
    assert(budget_reason);
    std::cout << "[PASS] Cycle overruns escalate to IslandDetected.\n";
}

// ✅ Test 20: plant + controller under the runtime, with an outage
void test_runtime_with_plant() {
    std::vector<GridEvent> events = {
        {GridEvent::Kind::Outage, 20, 40, 0.0, ""},
    };
    PlantConfig pcfg;
    pcfg.start_hour = 12.0;

    MicrogridNode node;
    node.node_id = "mg-plant";
    PlantSimulator plant(node.node_id, controllerTiers(), controllerLoads(), events, pcfg);
    LocalController ctl(node, controllerTiers(), LoadShedder(controllerLoads()), plant, controllerConfig());
    plant.setOutputs(
        [&ctl](const TelemetrySample& s) { ctl.submitTelemetry(s); },
        [&ctl](const ForecastFeedUpdate& f) { ctl.submitForecast(f); });

    NodeRuntime rt;
    rt.setTickStep(1.0);
    rt.addSubsystem(&plant);
    rt.addSubsystem(&ctl);
    int hooks = 0;
    rt.setAfterTick([&](const TickContext&) { ++hooks; });

    rt.initialize();
    bool islanded = false;
    for (int i = 0; i < 80; ++i) {
        rt.tick();
        if (plant.breakerOpen()) islanded = true;
    }
    rt.shutdown();

    assert(hooks == 80);
    assert(islanded);

    const char* dir = std::getenv("NG_LOG_DIR");
    if (dir && *dir) {
        std::string path(dir);
        const char* run = std::getenv("RUN_ID");
        if (run && *run) path += std::string("/") + run;
        std::ifstream csv(path + "/NodeRuntime.csv");
        std::string header;
        std::getline(csv, header);
        assert(header == "tick,time_s,state,residual_kw,cycle_ms,emitted,withheld,"
                         "grid_kw,unserved_kw,breaker_open");
    }
    assert(ctl.telemetry().forecastFeed().has_value());
    for (std::size_t i = 0; i < plant.tiers().size(); ++i) {
        assert(near(plant.tiers()[i].soc(), ctl.tiers()[i].soc(), 1e-9));
    }
    std::cout << "[PASS] Runtime drives plant and controller through an outage.\n";
}

// ✅ Test 21: CLI overrides, clamps and neighbour sets
void test_helpers() {
    const char* argv[] = {"ngnode", "--nticks", "-5", "--fanout", "2", "--dt", "0.5"};
    GridHelpers::Args a = GridHelpers::parse_args(7, const_cast<char**>(argv));
    assert(a.nticks == -5 && a.fanout == 2 && a.dt == 0.5);
    int warnings = 0;
    GridHelpers::sanitize_args(a, [&](const std::string&) { ++warnings; });
    assert(warnings == 1 && a.nticks == 3600);

    auto n = GridHelpers::ring_neighbours(0, 8, 4);
    assert((n == std::vector<int>{1, 7, 2, 6}));
    auto all = GridHelpers::ring_neighbours(2, 4, 10);
    assert(all.size() == 3);
    assert(std::find(all.begin(), all.end(), 2) == all.end());
    assert(GridHelpers::ring_neighbours(0, 1, 3).empty());

    assert(eventKindFromString("outage") == GridEvent::Kind::Outage);
    bool threw = false;
    try {
        eventKindFromString("meteor");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] CLI parsing, clamps and ring neighbours.\n";
}

int main() {
    Logger::instance().setEcho(false);

    test_surplus_charges_fast_tier();
    test_deficit_falls_back_in_rank_order();
    test_plans_respect_limits();
    test_commit_is_idempotent();
    test_dispatch_order_tie_breaks();
    test_commit_rejects_violation();
    test_fresh_forecast_not_degraded();
    test_stale_forecast_degrades();
    test_sustained_error_requests_reaggregation();
    test_telemetry_window();
    test_islanding_debounce();
    test_no_direct_reconnect();
    test_resync_failure();
    test_fault_sticky_and_gating();
    test_load_shedder();
    test_controller_outage_cycle();
    test_controller_fault_and_clear();
    test_grid_absorbs_deficit_when_storage_blind();
    test_controller_overrun_escalates();
    test_runtime_with_plant();
    test_helpers();

    std::cout << "✅ All control tests passed.\n";
    return 0;
}

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "GridTypes.hpp"
#include "StorageDispatcher.hpp"

// Grid-side and local health observed during one control cycle.
struct GridSignals {
    bool   heartbeat_ok           = true;
    double frequency_hz           = 50.0;
    double voltage_pu             = 1.0;
    double phase_error_deg        = 0.0;
    bool   storage_telemetry_ok   = true;
    double unmet_demand_kw        = 0.0;
    bool   communication_degraded = false;   // sustained control-budget overrun
};

struct IslandingConfig {
    double nominal_hz            = 50.0;
    double frequency_tol_hz      = 0.5;   // out of this band counts as grid trouble
    double voltage_tol_pu        = 0.1;
    double sync_frequency_tol_hz = 0.1;   // tighter band required to reconnect
    double sync_voltage_tol_pu   = 0.05;
    double sync_phase_tol_deg    = 10.0;
    double debounce_s            = 2.0;
    double resync_confirm_s      = 5.0;   // any misalignment before this aborts the resync
    double min_autonomy_s        = 900.0;
    double unmet_tolerance_kw    = 0.01;
};

struct StateTransition {
    double          time_s = 0.0;
    ConnectionState from   = ConnectionState::GridConnected;
    ConnectionState to     = ConnectionState::GridConnected;
    std::string     reason;
};

class IslandingStateMachine {
public:
    explicit IslandingStateMachine(const IslandingConfig& cfg = IslandingConfig{});

    // Advance one cycle. autonomy is only consulted in IslandDetected.
    ConnectionState update(double now_s, const GridSignals& signals,
                           const AutonomyReport& autonomy);

    // Out-of-band supervisory reset. The machine never leaves Fault on its own.
    bool clearFault(double now_s, const std::string& operator_id);

    // Escalate from outside the update path (e.g. a contract failure).
    void enterFault(double now_s, const std::string& reason);

    bool permits(CommandKind kind) const { return permits(state_, kind); }
    static bool permits(ConnectionState state, CommandKind kind);

    ConnectionState state() const { return state_; }
    const std::vector<StateTransition>& history() const { return history_; }
    const IslandingConfig& config() const { return cfg_; }

private:
    bool gridHealthy_(const GridSignals& s) const;
    bool aligned_(const GridSignals& s) const;
    void transition_(double now_s, ConnectionState to, const std::string& reason);

    IslandingConfig cfg_;
    ConnectionState state_ = ConnectionState::GridConnected;
    std::vector<StateTransition> history_;

    std::optional<double> abnormal_since_;
    std::optional<double> aligned_since_;
};

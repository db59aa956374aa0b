#include "IslandingStateMachine.hpp"
#include "Logger.hpp"

#include <cmath>
#include <sstream>

IslandingStateMachine::IslandingStateMachine(const IslandingConfig& cfg)
    : cfg_(cfg) {}

bool IslandingStateMachine::gridHealthy_(const GridSignals& s) const {
    if (!s.heartbeat_ok || s.communication_degraded) return false;
    if (!std::isfinite(s.frequency_hz) || !std::isfinite(s.voltage_pu)) return false;
    if (std::fabs(s.frequency_hz - cfg_.nominal_hz) > cfg_.frequency_tol_hz) return false;
    if (std::fabs(s.voltage_pu - 1.0) > cfg_.voltage_tol_pu) return false;
    return true;
}

bool IslandingStateMachine::aligned_(const GridSignals& s) const {
    if (!std::isfinite(s.phase_error_deg)) return false;
    return std::fabs(s.frequency_hz - cfg_.nominal_hz) <= cfg_.sync_frequency_tol_hz
        && std::fabs(s.voltage_pu - 1.0) <= cfg_.sync_voltage_tol_pu
        && std::fabs(s.phase_error_deg) <= cfg_.sync_phase_tol_deg;
}

void IslandingStateMachine::transition_(double now_s, ConnectionState to,
                                        const std::string& reason) {
    StateTransition t{now_s, state_, to, reason};
    history_.push_back(t);

    std::ostringstream oss;
    oss << (to == ConnectionState::Fault ? "[fault] " : "[info] ")
        << "t=" << now_s << " s " << toString(state_) << " -> " << toString(to)
        << " (" << reason << ")\n";
    Logger::instance().message(oss.str());

    state_ = to;
    abnormal_since_.reset();
    aligned_since_.reset();
    if (to == ConnectionState::Resynchronizing) aligned_since_ = now_s;
}

void IslandingStateMachine::enterFault(double now_s, const std::string& reason) {
    if (state_ == ConnectionState::Fault) return;
    transition_(now_s, ConnectionState::Fault, reason);
}

ConnectionState IslandingStateMachine::update(double now_s, const GridSignals& s,
                                              const AutonomyReport& autonomy) {
    if (state_ == ConnectionState::Fault) return state_;

    // Any state: storage blind and demand already unmet.
    if (!s.storage_telemetry_ok && s.unmet_demand_kw > cfg_.unmet_tolerance_kw) {
        transition_(now_s, ConnectionState::Fault,
                    std::string(toString(FaultKind::IrrecoverableLocalFailure)) +
                    ": storage telemetry lost with unmet demand");
        return state_;
    }

    switch (state_) {
    case ConnectionState::GridConnected: {
        if (gridHealthy_(s)) {
            abnormal_since_.reset();
            break;
        }
        if (!abnormal_since_) abnormal_since_ = now_s;
        if (now_s - *abnormal_since_ >= cfg_.debounce_s) {
            std::string why;
            if (!s.heartbeat_ok)               why = "grid heartbeat lost";
            else if (s.communication_degraded) why = "control cycle over budget";
            else                               why = "grid frequency/voltage out of tolerance";
            transition_(now_s, ConnectionState::IslandDetected,
                        std::string(toString(FaultKind::CommunicationLoss)) + ": " + why);
        }
        break;
    }

    case ConnectionState::IslandDetected:
        if (autonomy.sustainable) {
            transition_(now_s, ConnectionState::IslandStable,
                        "storage sustains forecast demand for minimum horizon");
        } else if (autonomy.storage_exhausted) {
            transition_(now_s, ConnectionState::Fault,
                        std::string(toString(FaultKind::IrrecoverableLocalFailure)) +
                        ": autonomy horizon unmet and storage exhausted");
        }
        break;

    case ConnectionState::IslandStable:
        if (gridHealthy_(s) && aligned_(s)) {
            transition_(now_s, ConnectionState::Resynchronizing,
                        "grid heartbeat and phase/frequency alignment restored");
        }
        break;

    case ConnectionState::Resynchronizing:
        if (!gridHealthy_(s) || !aligned_(s)) {
            transition_(now_s, ConnectionState::IslandStable, "synchronization check failed");
        } else if (now_s - *aligned_since_ >= cfg_.resync_confirm_s) {
            transition_(now_s, ConnectionState::GridConnected, "synchronization confirmed");
        }
        break;

    case ConnectionState::Fault:
        break;
    }
    return state_;
}

bool IslandingStateMachine::clearFault(double now_s, const std::string& operator_id) {
    if (state_ != ConnectionState::Fault) return false;
    // Restart from detection so reconnection still goes through the resync path.
    transition_(now_s, ConnectionState::IslandDetected, "fault cleared by " + operator_id);
    return true;
}

bool IslandingStateMachine::permits(ConnectionState state, CommandKind kind) {
    switch (state) {
    case ConnectionState::Fault:
        return kind == CommandKind::LoadShed || kind == CommandKind::BreakerOpen;
    case ConnectionState::IslandDetected:
    case ConnectionState::IslandStable:
    case ConnectionState::Resynchronizing:
        return kind != CommandKind::GridTieClose;
    case ConnectionState::GridConnected:
        return true;
    }
    return false;
}

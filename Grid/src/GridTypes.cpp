#include "GridTypes.hpp"

#include <stdexcept>
#include <string>

const char* toString(ConnectionState s) {
    switch (s) {
        case ConnectionState::GridConnected:   return "GridConnected";
        case ConnectionState::IslandDetected:  return "IslandDetected";
        case ConnectionState::IslandStable:    return "IslandStable";
        case ConnectionState::Resynchronizing: return "Resynchronizing";
        case ConnectionState::Fault:           return "Fault";
    }
    return "Unknown";
}

const char* toString(Quantity q) {
    switch (q) {
        case Quantity::ProductionKw:    return "production_kw";
        case Quantity::ConsumptionKw:   return "consumption_kw";
        case Quantity::StorageSoc:      return "storage_soc";
        case Quantity::GridFrequencyHz: return "grid_frequency_hz";
        case Quantity::GridVoltagePu:   return "grid_voltage_pu";
        case Quantity::GridPhaseDeg:    return "grid_phase_deg";
        case Quantity::GridHeartbeat:   return "grid_heartbeat";
    }
    return "unknown";
}

const char* toString(FaultKind k) {
    switch (k) {
        case FaultKind::SensorStale:               return "SensorStale";
        case FaultKind::PeerUnreachable:           return "PeerUnreachable";
        case FaultKind::CapacityViolation:         return "CapacityViolation";
        case FaultKind::CommunicationLoss:         return "CommunicationLoss";
        case FaultKind::IrrecoverableLocalFailure: return "IrrecoverableLocalFailure";
    }
    return "Unknown";
}

const char* toString(CommandKind k) {
    switch (k) {
        case CommandKind::StorageDispatch:   return "StorageDispatch";
        case CommandKind::GridTieClose:      return "GridTieClose";
        case CommandKind::BreakerOpen:       return "BreakerOpen";
        case CommandKind::LoadShed:          return "LoadShed";
        case CommandKind::Curtail:           return "Curtail";
        case CommandKind::PeerImportRequest: return "PeerImportRequest";
    }
    return "Unknown";
}

int stateCode(ConnectionState s) {
    return static_cast<int>(s);
}

ConnectionState stateFromCode(int code) {
    if (code < 0 || code > static_cast<int>(ConnectionState::Fault)) {
        throw std::invalid_argument("stateFromCode: bad connection state code " +
                                    std::to_string(code));
    }
    return static_cast<ConnectionState>(code);
}

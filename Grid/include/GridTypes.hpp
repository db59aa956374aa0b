#pragma once
#include <string>

// Connectivity mode of a microgrid. Owned by IslandingStateMachine.
enum class ConnectionState {
    GridConnected,
    IslandDetected,
    IslandStable,
    Resynchronizing,
    Fault
};

// Quantities carried by TelemetrySample.
enum class Quantity {
    ProductionKw,
    ConsumptionKw,
    StorageSoc,       // per tier, fraction 0..1
    GridFrequencyHz,
    GridVoltagePu,
    GridPhaseDeg,     // phase error across the grid tie
    GridHeartbeat     // 1.0 = heartbeat received this sample period
};

// Error taxonomy for conditions the control core absorbs or escalates.
enum class FaultKind {
    SensorStale,
    PeerUnreachable,
    CapacityViolation,
    CommunicationLoss,
    IrrecoverableLocalFailure
};

// Commands emitted to the physical actuation layer.
enum class CommandKind {
    StorageDispatch,
    GridTieClose,
    BreakerOpen,
    LoadShed,
    Curtail,
    PeerImportRequest
};

const char* toString(ConnectionState s);
const char* toString(Quantity q);
const char* toString(FaultKind k);
const char* toString(CommandKind k);

// Numeric code used in CSV rows and on the wire.
int stateCode(ConnectionState s);
ConnectionState stateFromCode(int code);

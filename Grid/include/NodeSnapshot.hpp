#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "ForecastModel.hpp"
#include "GridTypes.hpp"

// Immutable view of a node taken at a control-cycle boundary. The slow
// cadence reads only this, never live controller state.
struct NodeSnapshot {
    std::string     node_id;
    int             tick        = 0;
    double          time_s      = 0.0;
    ConnectionState state       = ConnectionState::GridConnected;
    double          residual_kw = 0.0;
    ForecastModel   base_model;
    ModelDelta      local_delta;
    bool            reaggregation_requested = false;
};

// What a peer last told us, minus its model delta.
struct PeerSummary {
    std::string     node_id;
    ConnectionState state       = ConnectionState::GridConnected;
    double          residual_kw = 0.0;
    double          timestamp_s = 0.0;
};

// Results of a slow-cadence round, merged at the start of the next cycle.
struct NodeInbox {
    std::optional<ForecastModel> model;
    std::uint64_t                based_on_version = 0;
    std::vector<PeerSummary>     peers;
    std::size_t                  unreachable = 0;
    double                       produced_at_s = 0.0;
};

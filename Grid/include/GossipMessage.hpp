#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <mpi.h>
#include "ForecastModel.hpp"
#include "GridTypes.hpp"

// State summary exchanged between microgrids. Derived data only.
struct GossipMessage {
    std::string     node_id;
    ConnectionState state       = ConnectionState::GridConnected;
    double          residual_kw = 0.0;   // > 0 surplus available, < 0 unmet demand
    ModelDelta      delta;
    double          timestamp_s = 0.0;
    std::uint64_t   sequence    = 0;
};

// Wire codec built on MPI_Pack/MPI_Unpack so the byte layout is portable
// across heterogeneous ranks. MPI must be initialized. decodeGossip throws
// std::runtime_error on a malformed buffer.
std::vector<char> encodeGossip(const GossipMessage& msg, MPI_Comm comm = MPI_COMM_WORLD);
GossipMessage     decodeGossip(const std::vector<char>& buf, MPI_Comm comm = MPI_COMM_WORLD);

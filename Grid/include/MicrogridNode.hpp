#pragma once
#include <string>
#include <vector>
#include "GridTypes.hpp"

// A peer microgrid this node knows how to reach. rank is the transport
// address (MPI rank, or loopback mailbox index in tests).
struct PeerRef {
    std::string node_id;
    int         rank = -1;
};

// Provisioned identity of one microgrid. State is written by the local
// controller from IslandingStateMachine; peers are fixed at provisioning.
struct MicrogridNode {
    std::string          node_id;
    int                  rank = 0;
    double               latitude_deg  = 0.0;
    double               longitude_deg = 0.0;
    std::string          feeder;          // topology label, e.g. "feeder-3"
    std::vector<PeerRef> peers;
    ConnectionState      state = ConnectionState::GridConnected;
};

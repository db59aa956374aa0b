#pragma once
#include <cstddef>
#include "FederatedLearningCoordinator.hpp"
#include "NodeSnapshot.hpp"
#include "PeerGossip.hpp"

// One slow-cadence round: gossip our snapshot, collect reachable peers,
// and every few rounds (or on request) aggregate model deltas.
class PeerExchange {
public:
    PeerExchange(PeerGossip& gossip,
                 const FederatedLearningCoordinator& federation,
                 int aggregate_every_rounds = 3);

    NodeInbox runRound(const NodeSnapshot& snapshot, double now_s);

    int rounds() const { return rounds_; }
    int aggregations() const { return aggregations_; }
    std::size_t abandonedSends() const { return abandoned_; }

private:
    PeerGossip& gossip_;
    const FederatedLearningCoordinator& federation_;
    int aggregate_every_;
    int rounds_ = 0;
    int aggregations_ = 0;
    std::size_t abandoned_ = 0;
};

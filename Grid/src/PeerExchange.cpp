#include "PeerExchange.hpp"
#include "Logger.hpp"

#include <sstream>

PeerExchange::PeerExchange(PeerGossip& gossip,
                           const FederatedLearningCoordinator& federation,
                           int aggregate_every_rounds)
    : gossip_(gossip),
      federation_(federation),
      aggregate_every_(aggregate_every_rounds > 0 ? aggregate_every_rounds : 1) {}

NodeInbox PeerExchange::runRound(const NodeSnapshot& snap, double now_s) {
    ++rounds_;

    GossipMessage out;
    out.state       = snap.state;
    out.residual_kw = snap.residual_kw;
    out.delta       = snap.local_delta;
    out.timestamp_s = now_s;
    const GossipRoundStats stats = gossip_.round(out, now_s);
    if (stats.abandoned > 0) {
        abandoned_ += stats.abandoned;
        std::ostringstream oss;
        oss << "[warn] " << toString(FaultKind::PeerUnreachable) << ": abandoned "
            << stats.abandoned << " send(s) older than the gossip send timeout\n";
        Logger::instance().message(oss.str());
    }

    NodeInbox inbox;
    inbox.produced_at_s    = now_s;
    inbox.based_on_version = snap.base_model.version;
    inbox.unreachable      = gossip_.unreachableCount(now_s);

    std::vector<ModelDelta> deltas;
    for (const auto& m : gossip_.reachable(now_s)) {
        inbox.peers.push_back(PeerSummary{m.node_id, m.state, m.residual_kw, m.timestamp_s});
        deltas.push_back(m.delta);
    }

    const bool due = (rounds_ % aggregate_every_ == 0) || snap.reaggregation_requested;
    if (!due) return inbox;

    auto agg = federation_.aggregate(snap.base_model, snap.local_delta, deltas);
    if (!agg) return inbox;

    ++aggregations_;
    inbox.model = agg->model;

    std::ostringstream oss;
    oss << "[info] federated round " << aggregations_ << ": model v"
        << agg->model.version << " from " << agg->contributors
        << " delta(s), " << agg->discarded << " discarded, "
        << inbox.unreachable << " peer(s) unreachable\n";
    Logger::instance().message(oss.str());

    return inbox;
}

#include "PeerGossip.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

PeerGossip::PeerGossip(std::string self_id,
                       std::vector<PeerRef> peers,
                       GossipTransport& transport,
                       const GossipConfig& cfg,
                       MPI_Comm comm)
    : self_id_(std::move(self_id)),
      transport_(transport),
      cfg_(cfg),
      comm_(comm) {
    for (auto& p : peers) {
        if (p.node_id == self_id_) continue;
        PeerRecord r;
        r.ref = std::move(p);
        peers_.push_back(std::move(r));
    }
    if (cfg_.fanout == 0) cfg_.fanout = 1;
}

std::vector<PeerRef> PeerGossip::selectTargets() {
    std::vector<PeerRef> out;
    if (peers_.empty()) return out;

    const std::size_t n = std::min(cfg_.fanout, peers_.size());
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(peers_[(cursor_ + i) % peers_.size()].ref);
    }
    cursor_ = (cursor_ + n) % peers_.size();
    return out;
}

void PeerGossip::absorb_(const GossipEnvelope& env, double now_s, GossipRoundStats& stats) {
    GossipMessage msg;
    try {
        msg = decodeGossip(env.bytes, comm_);
    } catch (const std::exception& e) {
        ++stats.malformed;
        std::ostringstream oss;
        oss << "[warn] dropping malformed gossip from rank " << env.from_rank
            << ": " << e.what() << "\n";
        Logger::instance().message(oss.str());
        return;
    }

    auto it = std::find_if(peers_.begin(), peers_.end(), [&](const PeerRecord& r) {
        return r.ref.node_id == msg.node_id;
    });
    if (it == peers_.end()) {
        ++stats.unknown;
        Logger::instance().message("[debug] gossip from unknown node " + msg.node_id + "\n");
        return;
    }
    if (it->heard && msg.sequence <= it->last.sequence) {
        ++stats.duplicates;
        return;
    }

    it->heard        = true;
    it->last         = std::move(msg);
    it->last_heard_s = now_s;
    it->rounds_held  = 0;
    ++stats.accepted;
}

GossipRoundStats PeerGossip::round(GossipMessage outgoing, double now_s) {
    GossipRoundStats stats;

    for (auto& r : peers_) {
        if (r.heard) ++r.rounds_held;
    }

    stats.abandoned = transport_.abandonStale(now_s, cfg_.send_timeout_s);

    outgoing.node_id      = self_id_;
    outgoing.delta.origin = self_id_;
    outgoing.sequence     = ++sequence_;
    std::vector<char> bytes = encodeGossip(outgoing, comm_);

    for (const auto& target : selectTargets()) {
        transport_.send(target.rank, bytes, now_s);
        ++stats.sent;
    }

    for (const auto& env : transport_.poll(now_s)) {
        ++stats.received;
        absorb_(env, now_s, stats);
    }

    std::ostringstream oss;
    oss << "[gossip] t=" << now_s << " seq=" << sequence_
        << " sent=" << stats.sent << " accepted=" << stats.accepted
        << " reachable=" << reachable(now_s).size() << "/" << peers_.size()
        << " abandoned=" << stats.abandoned << "\n";
    Logger::instance().message(oss.str());

    return stats;
}

std::vector<GossipMessage> PeerGossip::reachable(double now_s) const {
    std::vector<GossipMessage> out;
    for (const auto& r : peers_) {
        if (!r.heard || now_s - r.last_heard_s > cfg_.peer_timeout_s) continue;
        GossipMessage m = r.last;
        m.delta.staleness += r.rounds_held;
        out.push_back(std::move(m));
    }
    return out;
}

std::vector<ModelDelta> PeerGossip::reachableDeltas(double now_s) const {
    std::vector<ModelDelta> out;
    for (auto& m : reachable(now_s)) out.push_back(std::move(m.delta));
    return out;
}

std::size_t PeerGossip::unreachableCount(double now_s) const {
    return peers_.size() - reachable(now_s).size();
}

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <mpi.h>
#include "GossipMessage.hpp"
#include "GossipTransport.hpp"
#include "MicrogridNode.hpp"

struct GossipConfig {
    std::size_t fanout         = 3;      // peers contacted per round; >= peer count means full mesh
    double      peer_timeout_s = 30.0;   // silent longer than this = unreachable
    double      send_timeout_s = 10.0;   // in-flight sends older than this are abandoned
};

struct PeerRecord {
    PeerRef       ref;
    bool          heard       = false;
    GossipMessage last;
    double        last_heard_s = 0.0;
    std::uint32_t rounds_held  = 0;      // rounds since last was refreshed
};

struct GossipRoundStats {
    std::size_t sent       = 0;
    std::size_t received   = 0;
    std::size_t accepted   = 0;
    std::size_t malformed  = 0;
    std::size_t unknown    = 0;
    std::size_t duplicates = 0;
    std::size_t abandoned  = 0;
};

// Exchanges state summaries with a bounded neighbour set. Only the slow
// cadence thread touches an instance.
class PeerGossip {
public:
    PeerGossip(std::string self_id,
               std::vector<PeerRef> peers,
               GossipTransport& transport,
               const GossipConfig& cfg = GossipConfig{},
               MPI_Comm comm = MPI_COMM_WORLD);

    // Send our summary to the next fan-out subset, then absorb whatever
    // peers have sent. The sequence number is assigned here.
    GossipRoundStats round(GossipMessage outgoing, double now_s);

    // Latest message of every peer heard within the timeout. Delta
    // staleness includes the rounds the message has been held locally.
    std::vector<GossipMessage> reachable(double now_s) const;
    std::vector<ModelDelta> reachableDeltas(double now_s) const;
    std::size_t unreachableCount(double now_s) const;

    // Round-robin choice of this round's targets (advances the cursor).
    std::vector<PeerRef> selectTargets();

    const std::vector<PeerRecord>& peers() const { return peers_; }
    std::uint64_t sequence() const { return sequence_; }

private:
    void absorb_(const GossipEnvelope& env, double now_s, GossipRoundStats& stats);

    std::string self_id_;
    std::vector<PeerRecord> peers_;
    GossipTransport& transport_;
    GossipConfig cfg_;
    MPI_Comm comm_;
    std::size_t cursor_ = 0;
    std::uint64_t sequence_ = 0;
};

#pragma once
#include <cstddef>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <utility>
#include <vector>
#include <mpi.h>

struct GossipEnvelope {
    int               from_rank = -1;
    std::vector<char> bytes;
};

// Best-effort datagram exchange between microgrid nodes.
class GossipTransport {
public:
    virtual ~GossipTransport() = default;

    // Queue bytes for a peer; never blocks.
    virtual void send(int peer_rank, std::vector<char> bytes, double now_s) = 0;

    // Everything that has arrived since the last poll.
    virtual std::vector<GossipEnvelope> poll(double now_s) = 0;

    // Give up on sends older than timeout_s. Returns how many were abandoned.
    virtual std::size_t abandonStale(double now_s, double timeout_s) = 0;

    virtual int localRank() const = 0;
};

// In-process mailboxes shared by several LoopbackGossipTransport instances.
// Links can be cut to simulate unreachable peers, or held so sends stay in
// flight until released or abandoned.
class LoopbackHub {
public:
    void deliver(int from, int to, std::vector<char> bytes);
    std::vector<GossipEnvelope> drain(int rank);

    void setLinkDown(int a, int b, bool down);
    bool linkDown(int a, int b) const;
    void setLinkHeld(int a, int b, bool held);
    bool linkHeld(int a, int b) const;
    std::size_t dropped() const;

private:
    mutable std::mutex mtx_;
    std::map<int, std::vector<GossipEnvelope>> mailboxes_;
    std::set<std::pair<int, int>> down_;
    std::set<std::pair<int, int>> held_;
    std::size_t dropped_ = 0;
};

class LoopbackGossipTransport : public GossipTransport {
public:
    LoopbackGossipTransport(std::shared_ptr<LoopbackHub> hub, int rank);

    void send(int peer_rank, std::vector<char> bytes, double now_s) override;
    std::vector<GossipEnvelope> poll(double now_s) override;
    std::size_t abandonStale(double now_s, double timeout_s) override;
    int localRank() const override { return rank_; }

    std::size_t inFlight() const { return held_.size(); }

private:
    struct HeldSend {
        int               to = -1;
        std::vector<char> bytes;
        double            sent_at_s = 0.0;
    };

    std::shared_ptr<LoopbackHub> hub_;
    int rank_;
    std::list<HeldSend> held_;
};

// One MPI rank per microgrid. Non-blocking sends; receives are drained with
// MPI_Iprobe so a poll never waits on a slow peer.
class MpiGossipTransport : public GossipTransport {
public:
    explicit MpiGossipTransport(MPI_Comm comm = MPI_COMM_WORLD, int tag = 77);
    ~MpiGossipTransport() override;

    void send(int peer_rank, std::vector<char> bytes, double now_s) override;
    std::vector<GossipEnvelope> poll(double now_s) override;
    std::size_t abandonStale(double now_s, double timeout_s) override;
    int localRank() const override { return rank_; }

    // Collective: every rank must call it once sending has stopped. Drains
    // in-flight traffic so MPI_Finalize sees no pending requests.
    void quiesce();

    std::size_t inFlight() const { return pending_.size(); }

private:
    struct Pending {
        MPI_Request       req = MPI_REQUEST_NULL;
        std::vector<char> buf;
        double            sent_at_s = 0.0;
        int               peer = -1;
    };

    void reap_(std::list<Pending>& xs);
    void receiveAvailable_(std::vector<GossipEnvelope>& out);

    MPI_Comm comm_;
    int tag_;
    int rank_ = 0;
    std::list<Pending> pending_;
    // Abandoned sends: no longer waited on, buffers kept until MPI is done with them.
    std::list<Pending> orphaned_;
};

#include "GossipTransport.hpp"
#include "Logger.hpp"
#include "GridTypes.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

// ---------------- LoopbackHub ----------------

void LoopbackHub::deliver(int from, int to, std::vector<char> bytes) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (down_.count({std::min(from, to), std::max(from, to)})) {
        ++dropped_;
        return;
    }
    mailboxes_[to].push_back(GossipEnvelope{from, std::move(bytes)});
}

std::vector<GossipEnvelope> LoopbackHub::drain(int rank) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<GossipEnvelope> out;
    out.swap(mailboxes_[rank]);
    return out;
}

void LoopbackHub::setLinkDown(int a, int b, bool down) {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto key = std::make_pair(std::min(a, b), std::max(a, b));
    if (down) down_.insert(key);
    else      down_.erase(key);
}

bool LoopbackHub::linkDown(int a, int b) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return down_.count({std::min(a, b), std::max(a, b)}) > 0;
}

void LoopbackHub::setLinkHeld(int a, int b, bool held) {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto key = std::make_pair(std::min(a, b), std::max(a, b));
    if (held) held_.insert(key);
    else      held_.erase(key);
}

bool LoopbackHub::linkHeld(int a, int b) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return held_.count({std::min(a, b), std::max(a, b)}) > 0;
}

std::size_t LoopbackHub::dropped() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_;
}

// ---------------- LoopbackGossipTransport ----------------

LoopbackGossipTransport::LoopbackGossipTransport(std::shared_ptr<LoopbackHub> hub, int rank)
    : hub_(std::move(hub)), rank_(rank) {
    if (!hub_) throw std::invalid_argument("LoopbackGossipTransport: null hub");
}

void LoopbackGossipTransport::send(int peer_rank, std::vector<char> bytes, double now_s) {
    if (hub_->linkHeld(rank_, peer_rank)) {
        held_.push_back(HeldSend{peer_rank, std::move(bytes), now_s});
        return;
    }
    hub_->deliver(rank_, peer_rank, std::move(bytes));
}

std::vector<GossipEnvelope> LoopbackGossipTransport::poll(double /*now_s*/) {
    // Sends whose link was released complete now.
    for (auto it = held_.begin(); it != held_.end();) {
        if (hub_->linkHeld(rank_, it->to)) {
            ++it;
            continue;
        }
        hub_->deliver(rank_, it->to, std::move(it->bytes));
        it = held_.erase(it);
    }
    return hub_->drain(rank_);
}

std::size_t LoopbackGossipTransport::abandonStale(double now_s, double timeout_s) {
    std::size_t n = 0;
    for (auto it = held_.begin(); it != held_.end();) {
        if (now_s - it->sent_at_s > timeout_s) {
            it = held_.erase(it);
            ++n;
        } else {
            ++it;
        }
    }
    return n;
}

// ---------------- MpiGossipTransport ----------------

MpiGossipTransport::MpiGossipTransport(MPI_Comm comm, int tag)
    : comm_(comm), tag_(tag) {
    MPI_Comm_rank(comm_, &rank_);
}

MpiGossipTransport::~MpiGossipTransport() {
    // quiesce() is collective and must be called explicitly before
    // MPI_Finalize; here we only drop what has already completed.
    reap_(pending_);
    reap_(orphaned_);
}

void MpiGossipTransport::send(int peer_rank, std::vector<char> bytes, double now_s) {
    if (peer_rank == rank_ || bytes.empty()) return;

    pending_.emplace_back();
    Pending& p = pending_.back();
    p.buf       = std::move(bytes);
    p.sent_at_s = now_s;
    p.peer      = peer_rank;

    int rc = MPI_Isend(p.buf.data(), static_cast<int>(p.buf.size()), MPI_PACKED,
                       peer_rank, tag_, comm_, &p.req);
    if (rc != MPI_SUCCESS) {
        pending_.pop_back();
        throw std::runtime_error("MpiGossipTransport: MPI_Isend to rank " +
                                 std::to_string(peer_rank) + " failed");
    }
}

void MpiGossipTransport::reap_(std::list<Pending>& xs) {
    for (auto it = xs.begin(); it != xs.end();) {
        int done = 0;
        MPI_Test(&it->req, &done, MPI_STATUS_IGNORE);
        if (done) it = xs.erase(it);
        else      ++it;
    }
}

void MpiGossipTransport::receiveAvailable_(std::vector<GossipEnvelope>& out) {
    while (true) {
        int flag = 0;
        MPI_Status status;
        MPI_Iprobe(MPI_ANY_SOURCE, tag_, comm_, &flag, &status);
        if (!flag) break;

        int count = 0;
        MPI_Get_count(&status, MPI_PACKED, &count);

        GossipEnvelope env;
        env.from_rank = status.MPI_SOURCE;
        env.bytes.resize(static_cast<std::size_t>(count > 0 ? count : 0));
        // Already matched by the probe, so this returns immediately.
        MPI_Recv(env.bytes.data(), count, MPI_PACKED, status.MPI_SOURCE, tag_,
                 comm_, MPI_STATUS_IGNORE);
        out.push_back(std::move(env));
    }
}

std::vector<GossipEnvelope> MpiGossipTransport::poll(double /*now_s*/) {
    reap_(pending_);
    reap_(orphaned_);

    std::vector<GossipEnvelope> out;
    receiveAvailable_(out);
    return out;
}

std::size_t MpiGossipTransport::abandonStale(double now_s, double timeout_s) {
    reap_(pending_);

    std::size_t n = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (now_s - it->sent_at_s > timeout_s) {
            std::ostringstream oss;
            oss << "[debug] " << toString(FaultKind::PeerUnreachable)
                << ": abandoning send to rank " << it->peer << "\n";
            Logger::instance().message(oss.str());

            auto next = std::next(it);
            orphaned_.splice(orphaned_.end(), pending_, it);
            it = next;
            ++n;
        } else {
            ++it;
        }
    }
    return n;
}

void MpiGossipTransport::quiesce() {
    // Non-blocking consensus: keep receiving until our own sends are matched
    // and every rank has reached the same point.
    std::vector<GossipEnvelope> sink;
    while (!pending_.empty() || !orphaned_.empty()) {
        receiveAvailable_(sink);
        reap_(pending_);
        reap_(orphaned_);
    }

    MPI_Request barrier = MPI_REQUEST_NULL;
    MPI_Ibarrier(comm_, &barrier);
    int done = 0;
    while (!done) {
        receiveAvailable_(sink);
        MPI_Test(&barrier, &done, MPI_STATUS_IGNORE);
    }
    receiveAvailable_(sink);
    sink.clear();
}

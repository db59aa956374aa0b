#undef NDEBUG
#include "CadenceWorker.hpp"
#include "CommandSink.hpp"
#include "FederatedLearningCoordinator.hpp"
#include "GossipMessage.hpp"
#include "GossipTransport.hpp"
#include "LocalController.hpp"
#include "Logger.hpp"
#include "PeerExchange.hpp"
#include "PeerGossip.hpp"
#include <mpi.h>
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

static ModelDelta delta(const std::string& origin, double v, std::uint32_t samples,
                        std::uint32_t staleness, double ts = 0.0) {
    ModelDelta d;
    d.origin = origin;
    for (std::size_t i = 0; i < kModelParams; ++i) d.params[i] = v * (1.0 + 0.1 * i);
    d.sample_count = samples;
    d.staleness    = staleness;
    d.timestamp_s  = ts;
    return d;
}

static bool throwsOnDecode(const std::vector<char>& buf) {
    try {
        decodeGossip(buf);
    } catch (const std::exception&) {
        return true;
    }
    return false;
}

// Healthy grid, one storage tier reporting, given production vs 40 kW load.
static void feed(LocalController& c, double t, double p) {
    TelemetrySample s;
    s.timestamp_s = t;
    s.source = "test";
    for (auto q : {Quantity::ProductionKw, Quantity::ConsumptionKw}) {
        s.quantity = q;
        s.value = q == Quantity::ProductionKw ? p : 40.0;
        c.submitTelemetry(s);
    }
    s.quantity = Quantity::StorageSoc;
    s.tier = 0;
    s.value = 0.5;
    c.submitTelemetry(s);
    s.tier = -1;
    s.value = 1.0;
    s.quantity = Quantity::GridHeartbeat;
    c.submitTelemetry(s);
    s.value = 50.0;
    s.quantity = Quantity::GridFrequencyHz;
    c.submitTelemetry(s);
    s.quantity = Quantity::GridVoltagePu;
    s.value = 1.0;
    c.submitTelemetry(s);
    s.quantity = Quantity::GridPhaseDeg;
    s.value = 0.0;
    c.submitTelemetry(s);
}

// ✅ Test 1: what goes on the wire comes back unchanged
void test_codec_round_trip() {
    GossipMessage m;
    m.node_id     = "mg-3";
    m.state       = ConnectionState::Resynchronizing;
    m.residual_kw = -12.5;
    m.delta       = delta("mg-3", 0.25, 42, 2, 17.0);
    m.timestamp_s = 123.5;
    m.sequence    = 9000000001ULL;

    GossipMessage back = decodeGossip(encodeGossip(m));
    assert(back.node_id == m.node_id);
    assert(back.state == m.state);
    assert(back.residual_kw == m.residual_kw);
    assert(back.timestamp_s == m.timestamp_s);
    assert(back.sequence == m.sequence);
    assert(back.delta.origin == "mg-3");
    assert(back.delta.params == m.delta.params);
    assert(back.delta.sample_count == 42);
    assert(back.delta.staleness == 2);
    assert(back.delta.timestamp_s == 17.0);
    std::cout << "[PASS] Gossip codec round trip.\n";
}

// ✅ Test 2: malformed buffers are rejected, never trusted
void test_codec_rejects_malformed() {
    GossipMessage m;
    m.node_id      = "mg-1";
    m.delta.origin = "mg-1";
    const std::vector<char> good = encodeGossip(m);

    assert(throwsOnDecode({}));
    assert(throwsOnDecode(std::vector<char>(good.begin(), good.begin() + good.size() / 2)));

    std::vector<char> bad_magic = good;
    bad_magic[0] = static_cast<char>(bad_magic[0] ^ 0x5A);
    assert(throwsOnDecode(bad_magic));

    GossipMessage spoof = m;
    spoof.delta.origin = "mg-2";   // delta claims another origin
    assert(throwsOnDecode(encodeGossip(spoof)));

    bool threw = false;
    try {
        GossipMessage huge;
        huge.node_id = std::string(1000, 'x');
        encodeGossip(huge);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Malformed gossip rejected.\n";
}

// ✅ Test 3: loopback gossip, duplicates, strangers and a cut link
void test_loopback_gossip() {
    auto hub = std::make_shared<LoopbackHub>();
    LoopbackGossipTransport ta(hub, 0), tb(hub, 1), tc(hub, 2);
    std::vector<PeerRef> all = {{"mg-0", 0}, {"mg-1", 1}, {"mg-2", 2}};

    GossipConfig cfg;
    cfg.fanout         = 2;
    cfg.peer_timeout_s = 30.0;
    PeerGossip a("mg-0", all, ta, cfg), b("mg-1", all, tb, cfg), c("mg-2", all, tc, cfg);
    assert(a.peers().size() == 2);   // self is dropped

    for (double t : {0.0, 1.0}) {
        a.round(GossipMessage{}, t);
        b.round(GossipMessage{}, t);
        c.round(GossipMessage{}, t);
    }
    assert(a.reachable(1.0).size() == 2);
    assert(b.reachable(1.0).size() == 2);
    assert(c.reachable(1.0).size() == 2);
    assert(a.unreachableCount(1.0) == 0);

    // Replays, strangers and garbage are counted, not absorbed
    GossipMessage old;
    old.node_id      = "mg-1";
    old.delta.origin = "mg-1";
    old.sequence     = 1;
    hub->deliver(1, 0, encodeGossip(old));
    GossipMessage stranger;
    stranger.node_id      = "mg-99";
    stranger.delta.origin = "mg-99";
    hub->deliver(5, 0, encodeGossip(stranger));
    hub->deliver(1, 0, std::vector<char>{1, 2, 3});
    GossipRoundStats s = a.round(GossipMessage{}, 2.0);
    assert(s.duplicates >= 1);
    assert(s.unknown == 1);
    assert(s.malformed == 1);

    // mg-0 and mg-2 lose each other; mg-1 still hears both
    hub->setLinkDown(0, 2, true);
    for (double t = 10.0; t <= 50.0; t += 10.0) {
        a.round(GossipMessage{}, t);
        b.round(GossipMessage{}, t);
        c.round(GossipMessage{}, t);
    }
    auto ra = a.reachable(50.0);
    assert(ra.size() == 1 && ra[0].node_id == "mg-1");
    assert(a.unreachableCount(50.0) == 1);
    assert(c.unreachableCount(50.0) == 1);
    assert(b.reachable(50.0).size() == 2);
    assert(hub->dropped() > 0);

    // Held messages age by the rounds they sit locally
    hub->setLinkDown(0, 1, true);
    a.round(GossipMessage{}, 51.0);   // absorbs what mg-1 sent at t=50
    a.round(GossipMessage{}, 52.0);
    a.round(GossipMessage{}, 53.0);
    auto deltas = a.reachableDeltas(53.0);
    assert(deltas.size() == 1);
    assert(deltas[0].staleness == 2);
    std::cout << "[PASS] Loopback gossip with unreachable peers.\n";
}

// ✅ Test 4: merge result is independent of arrival order
void test_aggregation_commutative() {
    FederatedLearningCoordinator fl;
    ForecastModel base = ForecastModel::defaults();
    ModelDelta local = delta("mg-0", 0.10, 10, 0);

    std::vector<ModelDelta> peers = {
        delta("mg-1", -0.20, 5, 1),
        delta("mg-2",  0.35, 20, 3),
        delta("mg-3",  0.05, 1, 0),
        delta("mg-2",  0.30, 20, 1),    // fresher copy of mg-2 wins
        delta("mg-4",  9.00, 7, 0),     // clipped
    };

    std::vector<std::size_t> idx(peers.size());
    for (std::size_t i = 0; i < idx.size(); ++i) idx[i] = i;

    auto first = fl.aggregate(base, local, peers);
    assert(first);
    assert(first->contributors == 5);
    assert(first->model.version == base.version + 1);

    int perms = 0;
    do {
        std::vector<ModelDelta> shuffled;
        for (std::size_t i : idx) shuffled.push_back(peers[i]);
        auto r = fl.aggregate(base, local, shuffled);
        assert(r);
        assert(r->model.weights == first->model.weights);
        assert(r->contributors == first->contributors);
        ++perms;
    } while (std::next_permutation(idx.begin(), idx.end()));
    assert(perms == 120);
    std::cout << "[PASS] Aggregation commutative over all orderings.\n";
}

// ✅ Test 5: stale deltas are dropped, oversized ones clipped
void test_aggregation_staleness_and_clip() {
    FederationConfig cfg;
    cfg.max_staleness  = 5;
    cfg.max_delta_norm = 5.0;
    FederatedLearningCoordinator fl(cfg);
    ForecastModel base = ForecastModel::defaults();

    ModelDelta untrained = delta("mg-0", 0.0, 0, 0);
    auto none = fl.aggregate(base, untrained, {delta("mg-1", 1.0, 10, 6)});
    assert(!none);

    auto one = fl.aggregate(base, untrained, {delta("mg-1", 1.0, 10, 6), delta("mg-2", 1.0, 4, 5)});
    assert(one);
    assert(one->contributors == 1);
    assert(one->discarded == 1);

    auto clipped = fl.aggregate(base, untrained, {delta("mg-3", 100.0, 3, 0)});
    assert(clipped);
    ModelDelta moved;
    moved.params = clipped->model.weights - base.weights;
    assert(std::fabs(moved.norm() - cfg.max_delta_norm) < 1e-9);
    std::cout << "[PASS] Stale deltas discarded, large deltas clipped.\n";
}

// ✅ Test 6: slow-cadence rounds feed controllers a merged model
void test_exchange_feeds_controller() {
    auto hub = std::make_shared<LoopbackHub>();
    LoopbackGossipTransport ta(hub, 0), tb(hub, 1);
    std::vector<PeerRef> all = {{"mg-0", 0}, {"mg-1", 1}};
    PeerGossip ga("mg-0", all, ta), gb("mg-1", all, tb);
    FederatedLearningCoordinator fl;
    PeerExchange xa(ga, fl, 1), xb(gb, fl, 1);

    auto tiers = [] {
        return std::vector<StorageTier>{
            StorageTier("battery", TierKind::Electrochemical, 0, 300.0, 0.5, 80.0, 80.0, 0.9)};
    };
    MicrogridNode na, nb;
    na.node_id = "mg-0";
    nb.node_id = "mg-1";
    RecordingCommandSink sa("XA"), sb("XB");
    LocalController ca(na, tiers(), LoadShedder(std::vector<ConsumerLoad>{}), sa);
    LocalController cb(nb, tiers(), LoadShedder(std::vector<ConsumerLoad>{}), sb);
    ca.initialize();
    cb.initialize();

    for (int t = 1; t <= 130; ++t) {
        feed(ca, t, 60.0 + (t % 7));
        feed(cb, t, 55.0 + (t % 5));
        ca.tick(TickContext{t, static_cast<double>(t), 1.0});
        cb.tick(TickContext{t, static_cast<double>(t), 1.0});
        if (t % 5 == 0) {
            auto snap_a = ca.snapshot();
            auto snap_b = cb.snapshot();
            ca.postInbox(xa.runRound(*snap_a, snap_a->time_s));
            cb.postInbox(xb.runRound(*snap_b, snap_b->time_s));
        }
    }
    assert(xa.rounds() == 26);
    assert(xa.aggregations() >= 1);
    assert(ca.estimator().baseModel().version >= 1);
    assert(cb.estimator().baseModel().version >= 1);
    assert(ca.peerView().size() == 1 && ca.peerView()[0].node_id == "mg-1");

    // An aggregate built on a superseded model is not installed
    feed(ca, 131.0, 60.0);
    ca.tick(TickContext{131, 131.0, 1.0});
    const auto v = ca.estimator().baseModel().version;
    NodeInbox stale;
    stale.model = ForecastModel::defaults();
    stale.model->version = 999;
    stale.based_on_version = v + 7;
    ca.postInbox(stale);
    feed(ca, 132.0, 60.0);
    ca.tick(TickContext{132, 132.0, 1.0});
    assert(ca.estimator().baseModel().version == v);
    std::cout << "[PASS] Peer exchange merges models into controllers.\n";
}

// ✅ Test 7: re-aggregation request bypasses the round cadence
void test_exchange_on_request() {
    auto hub = std::make_shared<LoopbackHub>();
    LoopbackGossipTransport t0(hub, 0);
    PeerGossip g("mg-0", {{"mg-1", 1}}, t0);
    FederatedLearningCoordinator fl;
    PeerExchange x(g, fl, 100);

    NodeSnapshot snap;
    snap.node_id     = "mg-0";
    snap.base_model  = ForecastModel::defaults();
    snap.local_delta = delta("mg-0", 0.1, 4, 0);

    NodeInbox in = x.runRound(snap, 1.0);
    assert(!in.model);
    assert(in.unreachable == 1);

    snap.reaggregation_requested = true;
    in = x.runRound(snap, 2.0);
    assert(in.model);
    assert(in.based_on_version == snap.base_model.version);
    assert(in.model->version == snap.base_model.version + 1);
    std::cout << "[PASS] Re-aggregation request triggers a merge.\n";
}

// ✅ Test 8: background cadence coalesces kicks and survives failures
void test_cadence_worker() {
    std::atomic<int> runs{0};
    CadenceWorker w("test", [&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        ++runs;
    });
    w.start();
    assert(w.running());
    for (int i = 0; i < 20; ++i) w.kick();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (w.completedRounds() < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    w.stop();
    assert(!w.running());
    assert(w.completedRounds() >= 1);
    assert(w.completedRounds() <= 20);
    assert(runs.load() == w.completedRounds());

    CadenceWorker bad("failing", []() { throw std::runtime_error("peer exploded"); });
    bad.runInline();
    bad.runInline();
    assert(bad.failedRounds() == 2);
    assert(bad.completedRounds() == 0);
    std::cout << "[PASS] Cadence worker coalesces kicks, contains failures.\n";
}

// ✅ Test 9: MPI transport on a single rank
void test_mpi_transport_single_rank() {
    MpiGossipTransport t(MPI_COMM_WORLD);
    int rank = -1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    assert(t.localRank() == rank);

    t.send(rank, std::vector<char>{1, 2, 3}, 0.0);   // self-sends are dropped
    assert(t.inFlight() == 0);
    assert(t.poll(0.0).empty());
    assert(t.abandonStale(100.0, 10.0) == 0);
    t.quiesce();
    std::cout << "[PASS] MPI transport quiesces cleanly.\n";
}

// ✅ Test 10: sends stuck past the timeout are dropped; the cycle carries on
void test_abandoned_sends() {
    auto hub = std::make_shared<LoopbackHub>();
    LoopbackGossipTransport ta(hub, 0), tb(hub, 1);
    std::vector<PeerRef> all = {{"mg-0", 0}, {"mg-1", 1}};
    GossipConfig gcfg;
    gcfg.send_timeout_s = 10.0;
    PeerGossip ga("mg-0", all, ta, gcfg), gb("mg-1", all, tb, gcfg);
    FederatedLearningCoordinator fl;
    PeerExchange xa(ga, fl, 1);

    MicrogridNode na;
    na.node_id = "mg-0";
    RecordingCommandSink sink("XHeld");
    LocalController ca(na,
        std::vector<StorageTier>{
            StorageTier("battery", TierKind::Electrochemical, 0, 300.0, 0.5, 80.0, 80.0, 0.9)},
        LoadShedder(std::vector<ConsumerLoad>{}), sink);
    ca.initialize();

    // Nothing sent to mg-1 completes while the link is held.
    hub->setLinkHeld(0, 1, true);
    for (int t = 1; t <= 30; ++t) {
        feed(ca, t, 60.0);
        ca.tick(TickContext{t, static_cast<double>(t), 1.0});
        if (t % 5 == 0) {
            auto snap = ca.snapshot();
            ca.postInbox(xa.runRound(*snap, snap->time_s));
        }
        assert(ca.state() == ConnectionState::GridConnected);
        assert(ca.lastPlan().plan_id == t);
    }
    // Sends from t=5, 10 and 15 passed the timeout at t=20, 25 and 30.
    assert(xa.abandonedSends() == 3);
    assert(ta.inFlight() == 3);
    assert(gb.reachable(30.0).empty());

    std::size_t dispatched = 0;
    for (const auto& c : sink.applied()) {
        if (c.kind == CommandKind::StorageDispatch) ++dispatched;
    }
    assert(dispatched == 30);

    // Released: what is still within the timeout gets through.
    hub->setLinkHeld(0, 1, false);
    GossipRoundStats s = ga.round(GossipMessage{}, 35.0);
    assert(s.abandoned == 1);          // the t=20 send
    assert(ta.inFlight() == 0);
    gb.round(GossipMessage{}, 35.0);
    assert(gb.reachable(35.0).size() == 1);
    std::cout << "[PASS] Stale in-flight sends are abandoned without stalling control.\n";
}

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);
    MPI_Comm_set_errhandler(MPI_COMM_WORLD, MPI_ERRORS_RETURN);
    Logger::instance().setEcho(false);

    test_codec_round_trip();
    test_codec_rejects_malformed();
    test_loopback_gossip();
    test_aggregation_commutative();
    test_aggregation_staleness_and_clip();
    test_exchange_feeds_controller();
    test_exchange_on_request();
    test_cadence_worker();
    test_mpi_transport_single_rank();
    test_abandoned_sends();

    std::cout << "✅ All gossip tests passed.\n";
    MPI_Finalize();
    return 0;
}

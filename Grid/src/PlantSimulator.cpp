#include "PlantSimulator.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {
constexpr double kPi = 3.14159265358979323846;
}

const char* toString(GridEvent::Kind k) {
    switch (k) {
        case GridEvent::Kind::Outage:                  return "outage";
        case GridEvent::Kind::FrequencyExcursion:      return "freq";
        case GridEvent::Kind::StorageTelemetryLoss:    return "storage_loss";
        case GridEvent::Kind::Cloud:                   return "cloud";
        case GridEvent::Kind::ProductionSensorDropout: return "pv_dropout";
        case GridEvent::Kind::OperatorClear:           return "clear";
    }
    return "unknown";
}

GridEvent::Kind eventKindFromString(const std::string& name) {
    for (auto k : {GridEvent::Kind::Outage, GridEvent::Kind::FrequencyExcursion,
                   GridEvent::Kind::StorageTelemetryLoss, GridEvent::Kind::Cloud,
                   GridEvent::Kind::ProductionSensorDropout, GridEvent::Kind::OperatorClear}) {
        if (name == toString(k)) return k;
    }
    throw std::invalid_argument("unknown grid event kind '" + name + "'");
}

PlantSimulator::PlantSimulator(std::string node_id,
                               std::vector<StorageTier> tiers,
                               std::vector<ConsumerLoad> loads,
                               std::vector<GridEvent> events,
                               const PlantConfig& cfg)
    : Subsystem("Plant"),
      node_id_(std::move(node_id)),
      tiers_(std::move(tiers)),
      loads_(std::move(loads)),
      events_(std::move(events)),
      cfg_(cfg) {}

void PlantSimulator::setOutputs(SampleFn on_sample, FeedFn on_feed) {
    on_sample_ = std::move(on_sample);
    on_feed_   = std::move(on_feed);
}

double PlantSimulator::solarShape(double time_s) const {
    const double hour = std::fmod(cfg_.start_hour + time_s / 3600.0, 24.0);
    if (hour <= cfg_.sunrise_h || hour >= cfg_.sunset_h) return 0.0;
    const double x = (hour - cfg_.sunrise_h) / (cfg_.sunset_h - cfg_.sunrise_h);
    return std::sin(kPi * x);
}

double PlantSimulator::loadShape(double time_s) const {
    // Overnight floor with a morning and a larger evening peak.
    const double hour = std::fmod(cfg_.start_hour + time_s / 3600.0, 24.0);
    const double morning = std::exp(-0.5 * std::pow((hour - 8.0) / 1.5, 2.0));
    const double evening = std::exp(-0.5 * std::pow((hour - 19.0) / 2.0, 2.0));
    return 0.5 + 0.3 * morning + 0.5 * evening;
}

bool PlantSimulator::anyActive_(GridEvent::Kind k, int tick) const {
    return std::any_of(events_.begin(), events_.end(),
                       [&](const GridEvent& e) { return e.kind == k && e.activeAt(tick); });
}

double PlantSimulator::valueOf_(GridEvent::Kind k, int tick, double fallback) const {
    for (const auto& e : events_) {
        if (e.kind == k && e.activeAt(tick)) return e.value;
    }
    return fallback;
}

void PlantSimulator::emitSample_(double t, Quantity q, int tier, double value, double rate_hz) {
    if (!on_sample_) return;
    TelemetrySample s;
    s.timestamp_s    = t;
    s.source         = node_id_ + "/" + toString(q);
    s.quantity       = q;
    s.tier           = tier;
    s.value          = value;
    s.sample_rate_hz = rate_hz;
    on_sample_(s);
}

void PlantSimulator::publishFeed_(double now_s, double cloud) {
    if (!on_feed_) return;
    ForecastFeedUpdate f;
    f.issued_at_s = now_s;
    f.step_s      = cfg_.forecast_step_s;
    f.production_scale.reserve(cfg_.forecast_steps + 1);
    for (int k = 0; k <= cfg_.forecast_steps; ++k) {
        f.production_scale.push_back(solarShape(now_s + k * cfg_.forecast_step_s) * cloud);
    }
    on_feed_(f);
}

void PlantSimulator::initialize() {
    breaker_open_    = false;
    grid_available_  = true;
    phase_error_deg_ = 0.0;
    last_feed_s_     = -1.0;

    std::ostringstream oss;
    oss << "[info] " << node_id_ << " plant: " << tiers_.size() << " tier(s), "
        << loads_.size() << " load(s), " << events_.size() << " scheduled event(s)\n";
    Logger::instance().message(oss.str());
}

bool PlantSimulator::apply(const Command& cmd) {
    switch (cmd.kind) {
        case CommandKind::StorageDispatch: {
            for (auto& t : tiers_) {
                if (t.id() != cmd.target) continue;
                flow_kw_[cmd.target] = cmd.setpoint_kw;
                return t.apply(cmd.setpoint_kw, dt_s_, cmd.plan_id);
            }
            Logger::instance().message("[warn] plant: dispatch for unknown tier " + cmd.target + "\n");
            return false;
        }
        case CommandKind::BreakerOpen:
            if (breaker_open_) return false;
            breaker_open_ = true;
            return true;
        case CommandKind::GridTieClose:
            if (!breaker_open_) return false;
            if (!grid_available_) {
                Logger::instance().message("[warn] plant: refusing to close tie onto a dead grid\n");
                return false;
            }
            breaker_open_ = false;
            return true;
        case CommandKind::LoadShed: {
            const double prev = shed_kw_.count(cmd.target) ? shed_kw_[cmd.target] : 0.0;
            if (prev == cmd.setpoint_kw) return false;
            if (cmd.setpoint_kw <= 0.0) shed_kw_.erase(cmd.target);
            else shed_kw_[cmd.target] = cmd.setpoint_kw;
            return true;
        }
        case CommandKind::Curtail:
            if (curtail_kw_ == cmd.setpoint_kw) return false;
            curtail_kw_ = std::max(0.0, cmd.setpoint_kw);
            return true;
        case CommandKind::PeerImportRequest: {
            const double prev = import_kw_.count(cmd.target) ? import_kw_[cmd.target] : 0.0;
            if (prev == cmd.setpoint_kw) return false;
            import_kw_[cmd.target] = cmd.setpoint_kw;
            return true;
        }
    }
    return false;
}

void PlantSimulator::tick(const TickContext& ctx) {
    dt_s_ = ctx.dt;
    const double rate_hz = ctx.dt > 0.0 ? 1.0 / ctx.dt : 0.0;

    // Upstream grid
    const bool was_available = grid_available_;
    grid_available_ = !anyActive_(GridEvent::Kind::Outage, ctx.tick_index);
    if (grid_available_ && !was_available) {
        phase_error_deg_ = cfg_.resync_phase_deg;
    } else {
        phase_error_deg_ *= cfg_.phase_decay;
        if (phase_error_deg_ < 1e-3) phase_error_deg_ = 0.0;
    }

    // Production
    double cloud = valueOf_(GridEvent::Kind::Cloud, ctx.tick_index, 1.0);
    if (!std::isfinite(cloud) || cloud < 0.0) cloud = 0.0;
    if (cloud > 1.0) cloud = 1.0;
    const double available_pv = cfg_.peak_solar_kw * solarShape(ctx.time) * cloud;
    production_kw_ = std::max(0.0, available_pv - curtail_kw_);

    // Consumption
    const double shape = loadShape(ctx.time);
    consumption_kw_ = 0.0;
    for (const auto& l : loads_) {
        const double demand = l.demand_kw * shape;
        auto it = shed_kw_.find(l.id);
        const double shed = it == shed_kw_.end() ? 0.0 : std::min(it->second, demand);
        consumption_kw_ += demand - shed;
    }

    // Storage flows held at the last commanded setpoints
    double storage_kw = 0.0;
    for (const auto& kv : flow_kw_) storage_kw += kv.second;
    import_requested_kw_ = 0.0;
    for (const auto& kv : import_kw_) import_requested_kw_ += kv.second;

    const double need = consumption_kw_ + storage_kw - production_kw_ - import_requested_kw_;
    if (!breaker_open_ && grid_available_) {
        grid_kw_     = need;
        unserved_kw_ = 0.0;
    } else {
        grid_kw_     = 0.0;
        unserved_kw_ = std::max(0.0, need);
    }

    // Telemetry
    if (!anyActive_(GridEvent::Kind::ProductionSensorDropout, ctx.tick_index)) {
        emitSample_(ctx.time, Quantity::ProductionKw, -1, production_kw_, rate_hz);
    }
    emitSample_(ctx.time, Quantity::ConsumptionKw, -1, consumption_kw_, rate_hz);

    for (std::size_t i = 0; i < tiers_.size(); ++i) {
        bool lost = false;
        for (const auto& e : events_) {
            if (e.kind == GridEvent::Kind::StorageTelemetryLoss && e.activeAt(ctx.tick_index) &&
                (e.target.empty() || e.target == tiers_[i].id())) {
                lost = true;
            }
        }
        if (!lost) {
            emitSample_(ctx.time, Quantity::StorageSoc, static_cast<int>(i), tiers_[i].soc(), rate_hz);
        }
    }

    emitSample_(ctx.time, Quantity::GridHeartbeat, -1, grid_available_ ? 1.0 : 0.0, rate_hz);
    if (grid_available_) {
        const double df = valueOf_(GridEvent::Kind::FrequencyExcursion, ctx.tick_index, 0.0);
        emitSample_(ctx.time, Quantity::GridFrequencyHz, -1, cfg_.nominal_hz + df, rate_hz);
        emitSample_(ctx.time, Quantity::GridVoltagePu, -1, 1.0, rate_hz);
        emitSample_(ctx.time, Quantity::GridPhaseDeg, -1, phase_error_deg_, rate_hz);
    }

    if (last_feed_s_ < 0.0 || ctx.time - last_feed_s_ >= cfg_.forecast_every_s) {
        publishFeed_(ctx.time, cloud);
        last_feed_s_ = ctx.time;
    }

    logRow_(ctx, storage_kw);
}

void PlantSimulator::logRow_(const TickContext& ctx, double storage_kw) {
    double shed = 0.0;
    for (const auto& kv : shed_kw_) shed += kv.second;

    Logger::instance().log_wide(
        name_, ctx.tick_index, ctx.time,
        {"production_kw", "consumption_kw", "storage_kw", "grid_kw", "unserved_kw",
         "import_kw", "curtail_kw", "shed_kw", "breaker_open", "grid_available", "phase_deg"},
        {production_kw_, consumption_kw_, storage_kw, grid_kw_, unserved_kw_,
         import_requested_kw_, curtail_kw_, shed, breaker_open_ ? 1.0 : 0.0,
         grid_available_ ? 1.0 : 0.0, phase_error_deg_}
    );
}

void PlantSimulator::shutdown() {}

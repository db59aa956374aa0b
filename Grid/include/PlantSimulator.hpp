#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "CommandSink.hpp"
#include "LoadShedder.hpp"
#include "StorageTier.hpp"
#include "Subsystem.hpp"
#include "TelemetryIngest.hpp"

// One scripted disturbance, active on ticks [start_tick, end_tick].
struct GridEvent {
    enum class Kind {
        Outage,                  // upstream grid gone: heartbeat drops
        FrequencyExcursion,      // value = offset from nominal (Hz)
        StorageTelemetryLoss,    // target = tier id, empty = all tiers
        Cloud,                   // value = production multiplier
        ProductionSensorDropout, // production meter goes silent
        OperatorClear            // target = operator id, fires at start_tick
    };

    Kind        kind       = Kind::Outage;
    int         start_tick = 0;
    int         end_tick   = -1;
    double      value      = 0.0;
    std::string target;

    bool activeAt(int tick) const { return tick >= start_tick && tick <= end_tick; }
};

const char* toString(GridEvent::Kind k);
// Throws std::invalid_argument for unknown names.
GridEvent::Kind eventKindFromString(const std::string& name);

struct PlantConfig {
    double peak_solar_kw    = 120.0;
    double sunrise_h        = 6.0;
    double sunset_h         = 18.0;
    double start_hour       = 0.0;     // wall-clock hour at t = 0
    double forecast_every_s = 300.0;   // cadence of the irradiance feed
    int    forecast_steps   = 15;
    double forecast_step_s  = 60.0;
    double nominal_hz       = 50.0;
    double resync_phase_deg = 40.0;    // phase error right after the grid returns
    double phase_decay      = 0.85;    // per-tick multiplier on the phase error
};

/**
 * PlantSimulator
 *
 * Stands in for the physical layer of one microgrid. Each tick it produces
 *
 *   production  = peak_solar_kw * diurnal(hour) * cloud - curtailment
 *   consumption = sum over loads of demand * profile(hour) - shed
 *
 * and publishes meter, per-tier SOC and grid-side samples to whatever is
 * attached with setOutputs(). Commands arriving through apply() act on a
 * private copy of the storage tiers, so the SOC it reports is what the
 * controller committed.
 */
class PlantSimulator : public Subsystem, public CommandSink {
public:
    using SampleFn = std::function<void(const TelemetrySample&)>;
    using FeedFn   = std::function<void(const ForecastFeedUpdate&)>;

    PlantSimulator(std::string node_id,
                   std::vector<StorageTier> tiers,
                   std::vector<ConsumerLoad> loads,
                   std::vector<GridEvent> events,
                   const PlantConfig& cfg = PlantConfig{});

    void initialize() override;
    void tick(const TickContext& ctx) override;
    void shutdown() override;

    bool apply(const Command& cmd) override;

    void setOutputs(SampleFn on_sample, FeedFn on_feed);

    // Diurnal production shape in [0, 1] at absolute time t.
    double solarShape(double time_s) const;
    // Consumption profile multiplier at absolute time t.
    double loadShape(double time_s) const;

    double productionKw() const { return production_kw_; }
    double consumptionKw() const { return consumption_kw_; }
    double gridExchangeKw() const { return grid_kw_; }
    double unservedKw() const { return unserved_kw_; }
    double importRequestedKw() const { return import_requested_kw_; }
    bool breakerOpen() const { return breaker_open_; }
    bool gridAvailable() const { return grid_available_; }
    const std::vector<StorageTier>& tiers() const { return tiers_; }

private:
    bool anyActive_(GridEvent::Kind k, int tick) const;
    double valueOf_(GridEvent::Kind k, int tick, double fallback) const;
    void emitSample_(double t, Quantity q, int tier, double value, double rate_hz);
    void publishFeed_(double now_s, double cloud);
    void logRow_(const TickContext& ctx, double storage_kw);

    std::string node_id_;
    std::vector<StorageTier> tiers_;
    std::vector<ConsumerLoad> loads_;
    std::vector<GridEvent> events_;
    PlantConfig cfg_;

    SampleFn on_sample_;
    FeedFn   on_feed_;

    std::map<std::string, double> flow_kw_;     // charge > 0
    std::map<std::string, double> shed_kw_;
    std::map<std::string, double> import_kw_;
    double curtail_kw_          = 0.0;
    bool   breaker_open_        = false;
    bool   grid_available_      = true;
    double phase_error_deg_     = 0.0;
    double last_feed_s_         = -1.0;
    double dt_s_                = 1.0;

    double production_kw_       = 0.0;
    double consumption_kw_      = 0.0;
    double grid_kw_             = 0.0;
    double unserved_kw_         = 0.0;
    double import_requested_kw_ = 0.0;
};

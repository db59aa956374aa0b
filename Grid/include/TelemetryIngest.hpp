#pragma once
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include "GridTypes.hpp"

// One normalized sensor/meter reading. Immutable once ingested.
struct TelemetrySample {
    double      timestamp_s    = 0.0;
    std::string source;               // meter or sensor id
    Quantity    quantity       = Quantity::ProductionKw;
    int         tier           = -1;  // storage tier index, -1 if not tier-specific
    double      value          = 0.0;
    double      sample_rate_hz = 1.0;
};

// External weather/irradiance forecast. production_scale[k] multiplies the
// current production for step k+1 (1.0 = unchanged).
struct ForecastFeedUpdate {
    double              issued_at_s = 0.0;
    double              step_s      = 60.0;
    std::vector<double> production_scale;
};

// Bounded rolling window of samples, ordered by timestamp.
class TelemetryIngest {
public:
    explicit TelemetryIngest(double window_s = 900.0);

    // Returns false when the sample is rejected (non-finite value, bad
    // sample rate, or older than the window).
    bool ingest(const TelemetrySample& sample);
    void ingestForecast(const ForecastFeedUpdate& update);

    std::optional<TelemetrySample> latest(Quantity q, int tier = -1) const;
    bool isFresh(Quantity q, int tier, double now_s, double staleness_s) const;

    // Up to n most recent samples of (q, tier), oldest first.
    std::vector<TelemetrySample> recent(Quantity q, int tier, std::size_t n) const;

    // Mean value of (q, tier) over the retained window, nullopt if none.
    std::optional<double> mean(Quantity q, int tier = -1) const;

    // Owned copy of the whole window, oldest first. Later ingests do not
    // touch it.
    std::vector<TelemetrySample> snapshot() const;
    const std::optional<ForecastFeedUpdate>& forecastFeed() const { return feed_; }

    std::size_t size() const { return samples_.size(); }
    std::size_t rejectedCount() const { return rejected_; }
    double windowSeconds() const { return window_s_; }

private:
    void evict_();

    double window_s_;
    std::deque<TelemetrySample> samples_;
    std::optional<ForecastFeedUpdate> feed_;
    std::size_t rejected_ = 0;
};

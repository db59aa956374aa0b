#include "TelemetryIngest.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

TelemetryIngest::TelemetryIngest(double window_s)
    : window_s_(window_s) {
    if (!std::isfinite(window_s_) || window_s_ <= 0.0) {
        throw std::invalid_argument("TelemetryIngest: window must be positive");
    }
}

bool TelemetryIngest::ingest(const TelemetrySample& s) {
    if (!std::isfinite(s.value) || !std::isfinite(s.timestamp_s) ||
        !std::isfinite(s.sample_rate_hz) || s.sample_rate_hz < 0.0) {
        ++rejected_;
        return false;
    }

    // Too old to ever be inside the window
    if (!samples_.empty() &&
        s.timestamp_s < samples_.back().timestamp_s - window_s_) {
        ++rejected_;
        return false;
    }

    // Late arrivals go in place; equal timestamps keep arrival order.
    auto pos = std::upper_bound(
        samples_.begin(), samples_.end(), s.timestamp_s,
        [](double t, const TelemetrySample& x) { return t < x.timestamp_s; });
    samples_.insert(pos, s);

    evict_();
    return true;
}

void TelemetryIngest::ingestForecast(const ForecastFeedUpdate& update) {
    feed_ = update;
}

void TelemetryIngest::evict_() {
    if (samples_.empty()) return;
    const double cutoff = samples_.back().timestamp_s - window_s_;
    while (!samples_.empty() && samples_.front().timestamp_s < cutoff) {
        samples_.pop_front();
    }
}

std::optional<TelemetrySample> TelemetryIngest::latest(Quantity q, int tier) const {
    for (auto it = samples_.rbegin(); it != samples_.rend(); ++it) {
        if (it->quantity == q && it->tier == tier) return *it;
    }
    return std::nullopt;
}

bool TelemetryIngest::isFresh(Quantity q, int tier, double now_s, double staleness_s) const {
    auto s = latest(q, tier);
    if (!s) return false;
    return (now_s - s->timestamp_s) <= staleness_s;
}

std::vector<TelemetrySample> TelemetryIngest::snapshot() const {
    return std::vector<TelemetrySample>(samples_.begin(), samples_.end());
}

std::vector<TelemetrySample> TelemetryIngest::recent(Quantity q, int tier, std::size_t n) const {
    std::vector<TelemetrySample> out;
    for (auto it = samples_.rbegin(); it != samples_.rend() && out.size() < n; ++it) {
        if (it->quantity == q && it->tier == tier) out.push_back(*it);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<double> TelemetryIngest::mean(Quantity q, int tier) const {
    double sum = 0.0;
    std::size_t n = 0;
    for (const auto& s : samples_) {
        if (s.quantity == q && s.tier == tier) {
            sum += s.value;
            ++n;
        }
    }
    if (n == 0) return std::nullopt;
    return sum / static_cast<double>(n);
}

#include "FederatedLearningCoordinator.hpp"

#include <algorithm>
#include <map>
#include <string>

FederatedLearningCoordinator::FederatedLearningCoordinator(const FederationConfig& cfg)
    : cfg_(cfg) {}

namespace {

// Prefer fresher, then better-trained, then newer.
bool better(const ModelDelta& a, const ModelDelta& b) {
    if (a.staleness != b.staleness) return a.staleness < b.staleness;
    if (a.sample_count != b.sample_count) return a.sample_count > b.sample_count;
    if (a.timestamp_s != b.timestamp_s) return a.timestamp_s > b.timestamp_s;
    return a.params < b.params;
}

} // namespace

std::optional<AggregationResult> FederatedLearningCoordinator::aggregate(
        const ForecastModel& base,
        const ModelDelta& local,
        const std::vector<ModelDelta>& peers) const {
    AggregationResult result;

    // std::map keeps origins sorted, which fixes the summation order.
    std::map<std::string, ModelDelta> by_origin;
    auto consider = [&](const ModelDelta& d) {
        if (d.staleness > cfg_.max_staleness) {
            ++result.discarded;
            return;
        }
        auto it = by_origin.find(d.origin);
        if (it == by_origin.end()) {
            by_origin.emplace(d.origin, d);
        } else {
            ++result.discarded;
            if (better(d, it->second)) it->second = d;
        }
    };
    consider(local);
    for (const auto& d : peers) consider(d);

    ModelVector sum{};
    double total = 0.0;
    for (const auto& [origin, d] : by_origin) {
        const double w = static_cast<double>(d.sample_count) / (1.0 + d.staleness);
        if (w <= 0.0) continue;

        double scale = 1.0;
        const double n = d.norm();
        if (n > cfg_.max_delta_norm && n > 0.0) scale = cfg_.max_delta_norm / n;

        for (std::size_t i = 0; i < kModelParams; ++i) {
            sum[i] += w * scale * d.params[i];
        }
        total += w;
        ++result.contributors;
    }

    if (total <= 0.0) return std::nullopt;

    result.model.weights = base.weights + sum * (1.0 / total);
    result.model.version = base.version + 1;
    result.total_weight  = total;
    return result;
}

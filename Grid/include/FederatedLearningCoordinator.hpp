#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "ForecastModel.hpp"

struct FederationConfig {
    std::uint32_t max_staleness  = 5;     // older deltas are discarded
    double        max_delta_norm = 5.0;   // per-delta clip
};

struct AggregationResult {
    ForecastModel model;
    std::size_t   contributors = 0;
    std::size_t   discarded    = 0;
    double        total_weight = 0.0;
};

// Staleness-weighted federated averaging over model deltas.
//
//   weight(d)  = sample_count / (1 + staleness)
//   new model  = base + sum(weight * clip(d)) / sum(weight)
//
// One delta per origin (lowest staleness wins); contributions are summed in
// origin order so any permutation of the same inputs gives the same model.
class FederatedLearningCoordinator {
public:
    explicit FederatedLearningCoordinator(const FederationConfig& cfg = FederationConfig{});

    // nullopt when nothing usable remains (every delta stale or untrained).
    std::optional<AggregationResult> aggregate(const ForecastModel& base,
                                               const ModelDelta& local,
                                               const std::vector<ModelDelta>& peers) const;

    const FederationConfig& config() const { return cfg_; }

private:
    FederationConfig cfg_;
};

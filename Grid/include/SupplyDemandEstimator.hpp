#pragma once
#include <optional>
#include <string>
#include <vector>
#include "ForecastModel.hpp"
#include "TelemetryIngest.hpp"

struct EstimatorConfig {
    int    horizon_steps      = 15;
    double step_s             = 60.0;   // forecast step length
    double staleness_s        = 10.0;   // sensor dropout bound
    std::size_t trend_samples = 8;
    double ewma_alpha         = 0.2;
    double error_threshold_kw = 5.0;    // sustained error above this asks for re-aggregation
    int    sustained_cycles   = 10;
    double learning_rate      = 0.05;   // NLMS step size
    double min_sigma_kw       = 0.5;
    double degraded_widen     = 2.0;
    double z_score            = 1.96;
};

struct ForecastStep {
    double offset_s       = 0.0;
    double production_kw  = 0.0;
    double consumption_kw = 0.0;
    double net_kw         = 0.0;   // production - consumption
    double lower_kw       = 0.0;
    double upper_kw       = 0.0;
    bool   degraded       = false;
};

// Regenerated every control cycle; the previous one is discarded.
struct ForecastWindow {
    double                    generated_at_s = 0.0;
    double                    step_s         = 60.0;
    std::vector<ForecastStep> steps;

    bool anyDegraded() const;
};

class SupplyDemandEstimator {
public:
    explicit SupplyDemandEstimator(const EstimatorConfig& cfg = EstimatorConfig{});

    // Never fails on stale or missing inputs: those steps are extrapolated
    // from the model and marked degraded.
    ForecastWindow estimate(const TelemetryIngest& window, double now_s);

    // Install an aggregated model. Local training restarts from it.
    void setModel(const ForecastModel& model);
    const ForecastModel& model() const { return model_; }
    const ForecastModel& baseModel() const { return base_; }

    // Change of the live model relative to the last installed one.
    ModelDelta localDelta(const std::string& origin, double now_s) const;

    double errorMetric() const { return ewma_error_kw_; }

    // True once per sustained high-error episode.
    bool takeReaggregationRequest();

    const EstimatorConfig& config() const { return cfg_; }

private:
    struct Features {
        std::array<double, 4> production{};
        std::array<double, 4> consumption{};
    };

    struct PendingCheck {
        double   target_s = 0.0;
        Features features;
        double   production_kw  = 0.0;
        double   consumption_kw = 0.0;
    };

    double feedScale_(const TelemetryIngest& window, double now_s, double ahead_s) const;
    void   resolvePending_(const TelemetryIngest& window, double now_s);
    void   nlmsStep_(std::size_t first, const std::array<double, 4>& f, double err);

    EstimatorConfig cfg_;
    ForecastModel   model_;
    ForecastModel   base_;
    std::uint32_t   trained_steps_ = 0;

    std::optional<PendingCheck> pending_;
    double last_extrapolated_p_ = 0.0;
    double last_extrapolated_c_ = 0.0;

    double ewma_error_kw_  = 0.0;
    int    high_error_run_ = 0;
    bool   reaggregation_requested_ = false;
};

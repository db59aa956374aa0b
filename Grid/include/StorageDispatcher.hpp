#pragma once
#include <optional>
#include <string>
#include <vector>
#include "StorageTier.hpp"
#include "SupplyDemandEstimator.hpp"

enum class ResidualFlag {
    Balanced,
    UnmetDemand,
    CurtailedSurplus
};

const char* toString(ResidualFlag f);

struct TierFlow {
    std::string tier_id;
    double      flow_kw = 0.0;   // charge > 0, discharge < 0
};

// One cycle's storage decision.
// production - consumption - sum(flows) == residual_kw (within tolerance).
struct DispatchPlan {
    int                   plan_id        = -1;
    double                dt_s           = 0.0;
    double                production_kw  = 0.0;
    double                consumption_kw = 0.0;
    std::vector<TierFlow> flows;           // one entry per tier, tier order
    double                residual_kw    = 0.0;
    ResidualFlag          flag           = ResidualFlag::Balanced;

    double flowFor(const std::string& tier_id) const;
    double totalFlowKw() const;
    double unmetDemandKw() const { return flag == ResidualFlag::UnmetDemand ? -residual_kw : 0.0; }
    double curtailedKw() const { return flag == ResidualFlag::CurtailedSurplus ? residual_kw : 0.0; }
};

struct AutonomyReport {
    bool   sustainable       = false;
    bool   storage_exhausted = false;
    double covered_s         = 0.0;   // how far into the horizon demand was met
};

struct DispatcherConfig {
    double dt_s         = 1.0;     // cycle period the flows are held for
    double tolerance_kw = 1e-6;
    double deadband_kw  = 0.01;    // net balance treated as zero
    // Safety margins tried in order when a plan fails validation.
    std::vector<double> margins{1.0, 0.99, 0.95, 0.9};
};

class StorageDispatcher {
public:
    explicit StorageDispatcher(const DispatcherConfig& cfg = DispatcherConfig{});

    // Plan against the first step of the forecast.
    DispatchPlan plan(int plan_id,
                      const ForecastWindow& forecast,
                      const std::vector<StorageTier>& tiers) const;

    DispatchPlan plan(int plan_id,
                      double production_kw,
                      double consumption_kw,
                      const std::vector<StorageTier>& tiers) const;

    // Description of the first rate/capacity/balance violation, if any.
    std::optional<std::string> findViolation(const DispatchPlan& plan,
                                             const std::vector<StorageTier>& tiers) const;

    // Apply a validated plan to tier state. Idempotent per plan id; returns
    // true when at least one tier changed. Throws std::logic_error for an
    // out-of-bounds plan.
    bool commit(const DispatchPlan& plan, std::vector<StorageTier>& tiers) const;

    // Can storage carry the forecast for horizon_s without unmet demand?
    AutonomyReport assessAutonomy(const ForecastWindow& forecast,
                                  const std::vector<StorageTier>& tiers,
                                  double horizon_s) const;

    // Indices into tiers in consultation order: response rank, then higher
    // round-trip efficiency, mobile/V2G always last.
    static std::vector<std::size_t> dispatchOrder(const std::vector<StorageTier>& tiers);

    const DispatcherConfig& config() const { return cfg_; }
    std::size_t rejectedPlans() const { return rejected_plans_; }

private:
    DispatchPlan build_(int plan_id, double production_kw, double consumption_kw,
                        const std::vector<StorageTier>& tiers,
                        double dt_s, double margin) const;
    DispatchPlan planWithDt_(int plan_id, double production_kw, double consumption_kw,
                             const std::vector<StorageTier>& tiers, double dt_s) const;

    DispatcherConfig cfg_;
    mutable std::size_t rejected_plans_ = 0;
};

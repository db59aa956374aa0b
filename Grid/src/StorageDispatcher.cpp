#include "StorageDispatcher.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <stdexcept>

const char* toString(ResidualFlag f) {
    switch (f) {
        case ResidualFlag::Balanced:         return "Balanced";
        case ResidualFlag::UnmetDemand:      return "UnmetDemand";
        case ResidualFlag::CurtailedSurplus: return "CurtailedSurplus";
    }
    return "Unknown";
}

double DispatchPlan::flowFor(const std::string& tier_id) const {
    for (const auto& f : flows) {
        if (f.tier_id == tier_id) return f.flow_kw;
    }
    return 0.0;
}

double DispatchPlan::totalFlowKw() const {
    double s = 0.0;
    for (const auto& f : flows) s += f.flow_kw;
    return s;
}

StorageDispatcher::StorageDispatcher(const DispatcherConfig& cfg)
    : cfg_(cfg) {
    if (cfg_.dt_s <= 0.0) {
        throw std::invalid_argument("StorageDispatcher: dt must be positive");
    }
    if (cfg_.margins.empty()) cfg_.margins.push_back(1.0);
}

std::vector<std::size_t> StorageDispatcher::dispatchOrder(const std::vector<StorageTier>& tiers) {
    std::vector<std::size_t> order(tiers.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        const StorageTier& ta = tiers[a];
        const StorageTier& tb = tiers[b];
        const bool ma = ta.kind() == TierKind::Mobile;
        const bool mb = tb.kind() == TierKind::Mobile;
        if (ma != mb) return !ma;
        if (ta.responseRank() != tb.responseRank()) return ta.responseRank() < tb.responseRank();
        if (ta.roundTripEfficiency() != tb.roundTripEfficiency()) {
            return ta.roundTripEfficiency() > tb.roundTripEfficiency();
        }
        return ta.id() < tb.id();
    });
    return order;
}

DispatchPlan StorageDispatcher::build_(int plan_id, double production_kw, double consumption_kw,
                                       const std::vector<StorageTier>& tiers,
                                       double dt_s, double margin) const {
    DispatchPlan plan;
    plan.plan_id        = plan_id;
    plan.dt_s           = dt_s;
    plan.production_kw  = production_kw;
    plan.consumption_kw = consumption_kw;
    plan.flows.reserve(tiers.size());
    for (const auto& t : tiers) plan.flows.push_back(TierFlow{t.id(), 0.0});

    const double net = production_kw - consumption_kw;
    double remaining = std::fabs(net);
    const bool surplus = net > 0.0;

    if (remaining > cfg_.deadband_kw) {
        for (std::size_t idx : dispatchOrder(tiers)) {
            if (remaining <= cfg_.tolerance_kw) break;
            const StorageTier& t = tiers[idx];
            if (!t.telemetryOk()) continue;

            const double limit = margin * (surplus ? t.maxChargeKw(dt_s) : t.maxDischargeKw(dt_s));
            const double take  = std::min(limit, remaining);
            if (take <= 0.0) continue;

            plan.flows[idx].flow_kw = surplus ? take : -take;
            remaining -= take;
        }
    }

    plan.residual_kw = net - plan.totalFlowKw();
    if (plan.residual_kw > cfg_.deadband_kw) {
        plan.flag = ResidualFlag::CurtailedSurplus;
    } else if (plan.residual_kw < -cfg_.deadband_kw) {
        plan.flag = ResidualFlag::UnmetDemand;
    } else {
        plan.flag = ResidualFlag::Balanced;
    }
    return plan;
}

std::optional<std::string> StorageDispatcher::findViolation(const DispatchPlan& plan,
                                                            const std::vector<StorageTier>& tiers) const {
    const double tol = cfg_.tolerance_kw;
    for (const auto& f : plan.flows) {
        auto it = std::find_if(tiers.begin(), tiers.end(),
                               [&](const StorageTier& t) { return t.id() == f.tier_id; });
        if (it == tiers.end()) {
            return "flow for unknown tier " + f.tier_id;
        }
        if (!std::isfinite(f.flow_kw)) {
            return "non-finite flow on tier " + f.tier_id;
        }
        if (f.flow_kw != 0.0 && !it->telemetryOk()) {
            return "flow on tier without telemetry " + f.tier_id;
        }
        if (f.flow_kw > it->maxChargeKw(plan.dt_s) + tol) {
            std::ostringstream oss;
            oss << "charge " << f.flow_kw << " kW exceeds limit "
                << it->maxChargeKw(plan.dt_s) << " kW on tier " << f.tier_id;
            return oss.str();
        }
        if (-f.flow_kw > it->maxDischargeKw(plan.dt_s) + tol) {
            std::ostringstream oss;
            oss << "discharge " << -f.flow_kw << " kW exceeds limit "
                << it->maxDischargeKw(plan.dt_s) << " kW on tier " << f.tier_id;
            return oss.str();
        }
    }

    const double balance = plan.production_kw - plan.consumption_kw
                         - plan.totalFlowKw() - plan.residual_kw;
    if (std::fabs(balance) > std::max(tol, 1e-6 * std::fabs(plan.production_kw + plan.consumption_kw))) {
        std::ostringstream oss;
        oss << "balance mismatch " << balance << " kW";
        return oss.str();
    }
    return std::nullopt;
}

DispatchPlan StorageDispatcher::planWithDt_(int plan_id, double production_kw, double consumption_kw,
                                            const std::vector<StorageTier>& tiers, double dt_s) const {
    for (double margin : cfg_.margins) {
        DispatchPlan p = build_(plan_id, production_kw, consumption_kw, tiers, dt_s, margin);
        auto bad = findViolation(p, tiers);
        if (!bad) return p;

        ++rejected_plans_;
        std::ostringstream oss;
        oss << "[warn] " << toString(FaultKind::CapacityViolation)
            << ": plan " << plan_id << " rejected at margin " << margin
            << " (" << *bad << "); recomputing\n";
        Logger::instance().message(oss.str());
    }
    throw std::logic_error("StorageDispatcher: no plan within tier limits for plan " +
                           std::to_string(plan_id));
}

DispatchPlan StorageDispatcher::plan(int plan_id,
                                     double production_kw,
                                     double consumption_kw,
                                     const std::vector<StorageTier>& tiers) const {
    return planWithDt_(plan_id, production_kw, consumption_kw, tiers, cfg_.dt_s);
}

DispatchPlan StorageDispatcher::plan(int plan_id,
                                     const ForecastWindow& forecast,
                                     const std::vector<StorageTier>& tiers) const {
    if (forecast.steps.empty()) {
        throw std::invalid_argument("StorageDispatcher: empty forecast window");
    }
    const ForecastStep& next = forecast.steps.front();
    return plan(plan_id, next.production_kw, next.consumption_kw, tiers);
}

bool StorageDispatcher::commit(const DispatchPlan& plan, std::vector<StorageTier>& tiers) const {
    if (auto bad = findViolation(plan, tiers)) {
        // Bounds are guaranteed by plan(); reaching here is a caller bug.
        throw std::logic_error("StorageDispatcher::commit: " + *bad);
    }

    bool changed = false;
    for (auto& t : tiers) {
        if (t.apply(plan.flowFor(t.id()), plan.dt_s, plan.plan_id)) changed = true;
    }
    return changed;
}

AutonomyReport StorageDispatcher::assessAutonomy(const ForecastWindow& forecast,
                                                 const std::vector<StorageTier>& tiers,
                                                 double horizon_s) const {
    AutonomyReport r;
    if (forecast.steps.empty() || forecast.step_s <= 0.0) return r;

    std::vector<StorageTier> sim = tiers;
    const double step = forecast.step_s;

    auto drained = [&]() {
        for (const auto& t : sim) {
            if (t.telemetryOk() && t.maxDischargeKw(step) > cfg_.deadband_kw) return false;
        }
        return true;
    };

    int k = 0;
    while (r.covered_s < horizon_s) {
        // Past the forecast, hold the last step.
        const std::size_t idx = std::min<std::size_t>(k, forecast.steps.size() - 1);
        const ForecastStep& st = forecast.steps[idx];

        // Planning ids below -1 never collide with live plans.
        DispatchPlan p = planWithDt_(-2 - k, st.production_kw, st.consumption_kw, sim, step);
        if (p.flag == ResidualFlag::UnmetDemand) {
            r.sustainable       = false;
            r.storage_exhausted = drained();
            return r;
        }
        commit(p, sim);
        r.covered_s += step;
        ++k;
    }

    r.sustainable       = true;
    r.storage_exhausted = drained();
    return r;
}

#include "StorageTier.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

const char* toString(TierKind k) {
    switch (k) {
        case TierKind::Electrochemical: return "electrochemical";
        case TierKind::Thermal:         return "thermal";
        case TierKind::Hydrogen:        return "hydrogen";
        case TierKind::Mobile:          return "mobile";
    }
    return "unknown";
}

StorageTier::StorageTier(std::string id,
                         TierKind kind,
                         int response_rank,
                         double capacity_kwh,
                         double soc,
                         double max_charge_kw,
                         double max_discharge_kw,
                         double round_trip_efficiency)
    : id_(std::move(id)),
      kind_(kind),
      rank_(response_rank),
      capacity_kwh_(capacity_kwh),
      soc_(std::clamp(soc, 0.0, 1.0)),
      max_charge_kw_(max_charge_kw),
      max_discharge_kw_(max_discharge_kw),
      efficiency_(round_trip_efficiency) {
    if (!(capacity_kwh_ > 0.0) || max_charge_kw_ < 0.0 || max_discharge_kw_ < 0.0) {
        throw std::invalid_argument("StorageTier " + id_ + ": bad capacity or rate limits");
    }
    if (!(efficiency_ > 0.0) || efficiency_ > 1.0) {
        throw std::invalid_argument("StorageTier " + id_ + ": efficiency must be in (0, 1]");
    }
}

double StorageTier::legEfficiency_() const {
    return std::sqrt(efficiency_);
}

//
// Headroom in kWh → bus kW over dt, respecting the charge rate
//
double StorageTier::maxChargeKw(double dt_s) const {
    if (dt_s <= 0.0) return 0.0;
    const double dt_h      = dt_s / 3600.0;
    const double headroom  = (1.0 - soc_) * capacity_kwh_;
    const double energy_kw = headroom / (dt_h * legEfficiency_());
    return std::max(0.0, std::min(max_charge_kw_, energy_kw));
}

//
// Stored kWh → deliverable bus kW over dt, respecting the discharge rate
//
double StorageTier::maxDischargeKw(double dt_s) const {
    if (dt_s <= 0.0) return 0.0;
    const double dt_h      = dt_s / 3600.0;
    const double energy_kw = energyKwh() * legEfficiency_() / dt_h;
    return std::max(0.0, std::min(max_discharge_kw_, energy_kw));
}

bool StorageTier::apply(double flow_kw, double dt_s, int plan_id) {
    if (plan_id == last_plan_) return false;
    last_plan_ = plan_id;

    const double dt_h = dt_s / 3600.0;
    double delta_kwh = 0.0;
    if (flow_kw > 0.0) {
        delta_kwh = flow_kw * dt_h * legEfficiency_();
    } else if (flow_kw < 0.0) {
        delta_kwh = flow_kw * dt_h / legEfficiency_();
    }

    soc_ = std::clamp((energyKwh() + delta_kwh) / capacity_kwh_, 0.0, 1.0);
    return true;
}

#pragma once
#include <string>

enum class TierKind {
    Electrochemical,   // fast battery
    Thermal,
    Hydrogen,
    Mobile             // V2G fleet, always consulted last
};

const char* toString(TierKind k);

// One storage resource. Power is measured at the bus (kW), energy inside
// the store (kWh); the round-trip efficiency is split evenly between the
// charge and discharge legs.
class StorageTier {
public:
    StorageTier(std::string id,
                TierKind kind,
                int response_rank,
                double capacity_kwh,
                double soc,
                double max_charge_kw,
                double max_discharge_kw,
                double round_trip_efficiency);

    // Bus-side limits for holding a flow over dt_s
    double maxChargeKw(double dt_s) const;
    double maxDischargeKw(double dt_s) const;

    // Apply a signed flow (charge > 0) for dt_s on behalf of plan_id.
    // Re-applying the same plan is a no-op and returns false.
    bool apply(double flow_kw, double dt_s, int plan_id);

    // SOC telemetry only decides whether the tier may be dispatched.
    void setTelemetryOk(bool ok) { telemetry_ok_ = ok; }

    const std::string& id() const { return id_; }
    TierKind kind() const { return kind_; }
    int responseRank() const { return rank_; }
    double capacityKwh() const { return capacity_kwh_; }
    double soc() const { return soc_; }
    double energyKwh() const { return soc_ * capacity_kwh_; }
    double maxChargeRateKw() const { return max_charge_kw_; }
    double maxDischargeRateKw() const { return max_discharge_kw_; }
    double roundTripEfficiency() const { return efficiency_; }
    bool telemetryOk() const { return telemetry_ok_; }
    int lastAppliedPlan() const { return last_plan_; }

private:
    double legEfficiency_() const;

    std::string id_;
    TierKind    kind_;
    int         rank_;
    double      capacity_kwh_;
    double      soc_;               // 0..1
    double      max_charge_kw_;
    double      max_discharge_kw_;
    double      efficiency_;        // round trip, 0..1
    bool        telemetry_ok_ = true;
    int         last_plan_    = -1;
};

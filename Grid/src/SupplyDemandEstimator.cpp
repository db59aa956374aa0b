#include "SupplyDemandEstimator.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

// Least-squares slope (units per second) of a short sample run.
double slope_of(const std::vector<TelemetrySample>& xs) {
    if (xs.size() < 2) return 0.0;
    const double t0 = xs.front().timestamp_s;
    double st = 0.0, sv = 0.0;
    for (const auto& s : xs) {
        st += s.timestamp_s - t0;
        sv += s.value;
    }
    const double n = static_cast<double>(xs.size());
    const double mt = st / n, mv = sv / n;
    double num = 0.0, den = 0.0;
    for (const auto& s : xs) {
        const double dt = (s.timestamp_s - t0) - mt;
        num += dt * (s.value - mv);
        den += dt * dt;
    }
    return den > 0.0 ? num / den : 0.0;
}

double dot4(const ModelVector& w, std::size_t first, const std::array<double, 4>& f) {
    double s = 0.0;
    for (std::size_t i = 0; i < 4; ++i) s += w[first + i] * f[i];
    return s;
}

} // namespace

bool ForecastWindow::anyDegraded() const {
    for (const auto& s : steps) {
        if (s.degraded) return true;
    }
    return false;
}

SupplyDemandEstimator::SupplyDemandEstimator(const EstimatorConfig& cfg)
    : cfg_(cfg),
      model_(ForecastModel::defaults()),
      base_(ForecastModel::defaults()) {
    if (cfg_.horizon_steps < 1) cfg_.horizon_steps = 1;
    if (cfg_.step_s <= 0.0)     cfg_.step_s = 60.0;
}

void SupplyDemandEstimator::setModel(const ForecastModel& model) {
    model_ = model;
    base_  = model;
    trained_steps_ = 0;
}

ModelDelta SupplyDemandEstimator::localDelta(const std::string& origin, double now_s) const {
    ModelDelta d;
    d.origin       = origin;
    for (std::size_t i = 0; i < kModelParams; ++i) {
        d.params[i] = model_.weights[i] - base_.weights[i];
    }
    d.sample_count = trained_steps_;
    d.staleness    = 0;
    d.timestamp_s  = now_s;
    return d;
}

bool SupplyDemandEstimator::takeReaggregationRequest() {
    const bool r = reaggregation_requested_;
    reaggregation_requested_ = false;
    return r;
}

//
// Weather feed multiplier for a point ahead_s in the future, relative to now.
//
double SupplyDemandEstimator::feedScale_(const TelemetryIngest& window,
                                         double now_s, double ahead_s) const {
    const auto& feed = window.forecastFeed();
    if (!feed || feed->production_scale.empty() || feed->step_s <= 0.0) return 1.0;

    auto at = [&](double t) {
        const double rel = std::max(0.0, t - feed->issued_at_s);
        auto idx = static_cast<std::size_t>(rel / feed->step_s);
        idx = std::min(idx, feed->production_scale.size() - 1);
        return feed->production_scale[idx];
    };

    const double base = at(now_s);
    if (!std::isfinite(base) || base <= 1e-6) return 1.0;
    const double s = at(now_s + ahead_s) / base;
    return std::isfinite(s) ? std::clamp(s, 0.0, 4.0) : 1.0;
}

void SupplyDemandEstimator::nlmsStep_(std::size_t first,
                                      const std::array<double, 4>& f, double err) {
    double ff = 1e-6;
    for (double v : f) ff += v * v;
    for (std::size_t i = 0; i < 4; ++i) {
        model_.weights[first + i] += cfg_.learning_rate * err * f[i] / ff;
    }
}

//
// Compare the pending one-step prediction with what was observed, learn
// from the error, and feed the error into the EWMA trigger.
//
void SupplyDemandEstimator::resolvePending_(const TelemetryIngest& window, double now_s) {
    if (!pending_ || now_s < pending_->target_s) return;

    const bool p_fresh = window.isFresh(Quantity::ProductionKw, -1, now_s, cfg_.staleness_s);
    const bool c_fresh = window.isFresh(Quantity::ConsumptionKw, -1, now_s, cfg_.staleness_s);

    if (p_fresh && c_fresh) {
        const double obs_p = window.latest(Quantity::ProductionKw)->value;
        const double obs_c = window.latest(Quantity::ConsumptionKw)->value;

        const double err_p = obs_p - pending_->production_kw;
        const double err_c = obs_c - pending_->consumption_kw;

        nlmsStep_(ModelIndex::P_PERSIST, pending_->features.production,  err_p);
        nlmsStep_(ModelIndex::C_PERSIST, pending_->features.consumption, err_c);
        ++trained_steps_;

        const double abs_err = std::fabs(err_p) + std::fabs(err_c);
        ewma_error_kw_ = cfg_.ewma_alpha * abs_err + (1.0 - cfg_.ewma_alpha) * ewma_error_kw_;

        if (ewma_error_kw_ > cfg_.error_threshold_kw) {
            if (++high_error_run_ >= cfg_.sustained_cycles) {
                reaggregation_requested_ = true;
                high_error_run_ = 0;

                std::ostringstream oss;
                oss << "[info] estimator error " << ewma_error_kw_
                    << " kW sustained; requesting model re-aggregation\n";
                Logger::instance().message(oss.str());
            }
        } else {
            high_error_run_ = 0;
        }
    }
    // A stale observation cannot score the prediction; drop it either way.
    pending_.reset();
}

ForecastWindow SupplyDemandEstimator::estimate(const TelemetryIngest& window, double now_s) {
    resolvePending_(window, now_s);

    const bool p_fresh = window.isFresh(Quantity::ProductionKw, -1, now_s, cfg_.staleness_s);
    const bool c_fresh = window.isFresh(Quantity::ConsumptionKw, -1, now_s, cfg_.staleness_s);

    // Stale or missing inputs fall back to the last extrapolation, flat trend.
    const double last_p = p_fresh ? window.latest(Quantity::ProductionKw)->value
                                  : last_extrapolated_p_;
    const double last_c = c_fresh ? window.latest(Quantity::ConsumptionKw)->value
                                  : last_extrapolated_c_;
    const double slope_p = p_fresh
        ? slope_of(window.recent(Quantity::ProductionKw, -1, cfg_.trend_samples)) : 0.0;
    const double slope_c = c_fresh
        ? slope_of(window.recent(Quantity::ConsumptionKw, -1, cfg_.trend_samples)) : 0.0;
    const double mean_c = window.mean(Quantity::ConsumptionKw).value_or(last_c);

    const bool degraded = !(p_fresh && c_fresh);
    const double sigma0 = std::max(ewma_error_kw_, cfg_.min_sigma_kw);
    const auto& w = model_.weights;

    ForecastWindow out;
    out.generated_at_s = now_s;
    out.step_s         = cfg_.step_s;
    out.steps.reserve(static_cast<std::size_t>(cfg_.horizon_steps));

    Features first_features;
    for (int k = 1; k <= cfg_.horizon_steps; ++k) {
        const double ahead = k * cfg_.step_s;
        const double feed  = feedScale_(window, now_s, ahead);

        Features f;
        f.production  = {last_p, slope_p * ahead, last_p * (feed - 1.0), 1.0};
        f.consumption = {last_c, slope_c * ahead, mean_c - last_c, 1.0};
        if (k == 1) first_features = f;

        ForecastStep st;
        st.offset_s       = ahead;
        st.production_kw  = std::max(0.0, dot4(w, ModelIndex::P_PERSIST, f.production));
        st.consumption_kw = std::max(0.0, dot4(w, ModelIndex::C_PERSIST, f.consumption));
        st.net_kw         = st.production_kw - st.consumption_kw;

        double sigma = sigma0 * std::sqrt(static_cast<double>(k));
        if (degraded) sigma *= cfg_.degraded_widen;
        st.lower_kw = st.net_kw - cfg_.z_score * sigma;
        st.upper_kw = st.net_kw + cfg_.z_score * sigma;
        st.degraded = degraded;

        out.steps.push_back(st);
    }

    last_extrapolated_p_ = out.steps.front().production_kw;
    last_extrapolated_c_ = out.steps.front().consumption_kw;

    // Only fresh inputs are worth scoring later.
    if (!pending_ && !degraded) {
        PendingCheck pc;
        pc.target_s       = now_s + cfg_.step_s;
        pc.features       = first_features;
        pc.production_kw  = out.steps.front().production_kw;
        pc.consumption_kw = out.steps.front().consumption_kw;
        pending_ = pc;
    }

    return out;
}

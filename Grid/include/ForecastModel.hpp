#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

// Parameter layout of the linear net-balance forecaster.
//
//   production(k)  = last_p * (P_PERSIST + P_FEED * (feed_k - 1))
//                  + P_TREND * slope_p * k * step_s + P_BIAS
//   consumption(k) = C_PERSIST * last_c + C_TREND * slope_c * k * step_s
//                  + C_REVERT * (mean_c - last_c) + C_BIAS
namespace ModelIndex {
constexpr std::size_t P_PERSIST = 0;
constexpr std::size_t P_TREND   = 1;
constexpr std::size_t P_FEED    = 2;
constexpr std::size_t P_BIAS    = 3;
constexpr std::size_t C_PERSIST = 4;
constexpr std::size_t C_TREND   = 5;
constexpr std::size_t C_REVERT  = 6;
constexpr std::size_t C_BIAS    = 7;
}

constexpr std::size_t kModelParams = 8;
using ModelVector = std::array<double, kModelParams>;

struct ForecastModel {
    ModelVector   weights{};
    std::uint64_t version = 0;

    static ForecastModel defaults();
};

// Bounded summary of local parameter updates. Carries no telemetry.
struct ModelDelta {
    std::string   origin;              // node id that trained it
    ModelVector   params{};            // change relative to the origin's base model
    std::uint32_t sample_count = 0;    // training steps folded into params
    std::uint32_t staleness    = 0;    // gossip rounds since it was produced
    double        timestamp_s  = 0.0;

    double norm() const;
};

ModelVector operator+(const ModelVector& a, const ModelVector& b);
ModelVector operator-(const ModelVector& a, const ModelVector& b);
ModelVector operator*(const ModelVector& a, double s);

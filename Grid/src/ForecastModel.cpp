#include "ForecastModel.hpp"

#include <cmath>

ForecastModel ForecastModel::defaults() {
    ForecastModel m;
    m.weights[ModelIndex::P_PERSIST] = 1.0;
    m.weights[ModelIndex::P_TREND]   = 0.5;
    m.weights[ModelIndex::P_FEED]    = 1.0;
    m.weights[ModelIndex::P_BIAS]    = 0.0;
    m.weights[ModelIndex::C_PERSIST] = 1.0;
    m.weights[ModelIndex::C_TREND]   = 0.5;
    m.weights[ModelIndex::C_REVERT]  = 0.2;
    m.weights[ModelIndex::C_BIAS]    = 0.0;
    m.version = 0;
    return m;
}

double ModelDelta::norm() const {
    double s = 0.0;
    for (double v : params) s += v * v;
    return std::sqrt(s);
}

ModelVector operator+(const ModelVector& a, const ModelVector& b) {
    ModelVector r{};
    for (std::size_t i = 0; i < kModelParams; ++i) r[i] = a[i] + b[i];
    return r;
}

ModelVector operator-(const ModelVector& a, const ModelVector& b) {
    ModelVector r{};
    for (std::size_t i = 0; i < kModelParams; ++i) r[i] = a[i] - b[i];
    return r;
}

ModelVector operator*(const ModelVector& a, double s) {
    ModelVector r{};
    for (std::size_t i = 0; i < kModelParams; ++i) r[i] = a[i] * s;
    return r;
}

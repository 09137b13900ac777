/**
 * @file blenders.cpp
 * @brief Fractal layer blend strategies
 */

#include "finenoise/blenders.hpp"

#include <cmath>
#include <cstddef>

namespace finenoise {

double HomogeneousBlender::blend(std::span<const double> values) const {
    double result = 0.0;
    double amplitude = 1.0;
    for (double value : values) {
        result += value * amplitude;
        amplitude *= persistence_;
    }
    return result;
}

double HeterogeneousBlender::blend(std::span<const double> values) const {
    if (values.empty()) {
        return 0.0;
    }

    double result = values[0];
    double amplitude = persistence_;
    for (size_t k = 1; k < values.size(); ++k) {
        result += values[k] * amplitude * result;
        amplitude *= persistence_;
    }
    return result;
}

double RidgedBlender::blend(std::span<const double> values) const {
    double result = 0.0;
    double weight = 1.0;
    double amplitude = 1.0;
    for (double value : values) {
        // Invert so ridges sit at the zero crossings, then sharpen
        double signal = 1.0 - std::abs(value);
        signal *= signal;
        signal *= weight;

        weight = signal / attenuation_;
        if (weight < 0.0) weight = 0.0;
        if (weight > 1.0) weight = 1.0;

        result += signal * amplitude;
        amplitude *= persistence_;
    }
    return result;
}

double BillowBlender::blend(std::span<const double> values) const {
    double result = 0.0;
    double amplitude = 1.0;
    for (double value : values) {
        result += (2.0 * std::abs(value) - 1.0) * amplitude;
        amplitude *= persistence_;
    }
    return result;
}

}  // namespace finenoise

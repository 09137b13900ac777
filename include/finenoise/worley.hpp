/**
 * @file worley.hpp
 * @brief Worley (cellular) noise
 *
 * Each unit lattice cell holds one feature point at a seeded jitter inside
 * the cell. Evaluation reports distances to the nearest (F1) and second
 * nearest (F2) feature points, or a value tied to the nearest cell.
 */

#pragma once

#include "finenoise/noise.hpp"
#include "finenoise/seed.hpp"

#include <cstdint>

namespace finenoise {

/// Quantity reported by Worley::evaluate
enum class WorleyReturnType {
    Distance,       ///< F1
    Value,          ///< Pseudo-random value of the nearest feature's cell
    Distance2,      ///< F2
    Distance2Add,   ///< F1 + F2
    Distance2Sub,   ///< F2 - F1 (small near cell borders)
    Distance2Mul,   ///< F1 * F2
    Distance2Div,   ///< F1 / F2
};

enum class DistanceMetric {
    Euclidean,
    EuclideanSquared,
    Manhattan,
    Chebyshev,
};

/// Raw search result, before mapping to the output range
struct WorleyResult {
    double distance1 = 0.0;   ///< Distance to nearest feature point
    double distance2 = 0.0;   ///< Distance to second-nearest feature point
    uint8_t cellValue = 0;    ///< Hash byte of the nearest feature's cell
};

/// Worley noise in 2D, 3D and 4D
class Worley : public Noise2D, public Noise3D, public Noise4D {
public:
    static constexpr uint32_t DEFAULT_SEED = 0;
    static constexpr double DEFAULT_FREQUENCY = 1.0;

    explicit Worley(uint32_t seed = DEFAULT_SEED);

    [[nodiscard]] Worley withSeed(uint32_t seed) const;
    [[nodiscard]] Worley withFrequency(double frequency) const;
    [[nodiscard]] Worley withReturnType(WorleyReturnType type) const;
    [[nodiscard]] Worley withDistanceMetric(DistanceMetric metric) const;

    [[nodiscard]] uint32_t seed() const { return seed_; }
    [[nodiscard]] double frequency() const { return frequency_; }
    [[nodiscard]] WorleyReturnType returnType() const { return returnType_; }
    [[nodiscard]] DistanceMetric distanceMetric() const { return metric_; }

    [[nodiscard]] double evaluate(const Point2& p) const override;
    [[nodiscard]] double evaluate(const Point3& p) const override;
    [[nodiscard]] double evaluate(const Point4& p) const override;

    /// Nearest-feature search at a point (frequency already applied inside)
    [[nodiscard]] WorleyResult features(const Point2& p) const;
    [[nodiscard]] WorleyResult features(const Point3& p) const;
    [[nodiscard]] WorleyResult features(const Point4& p) const;

    /// Feature point of a lattice cell, in frequency-scaled space
    [[nodiscard]] Point2 featurePoint(const LatticePoint<2>& cell) const;
    [[nodiscard]] Point3 featurePoint(const LatticePoint<3>& cell) const;
    [[nodiscard]] Point4 featurePoint(const LatticePoint<4>& cell) const;

    /// Distance between two points under the configured metric
    template<glm::length_t L>
    [[nodiscard]] double distance(const Point<L>& a, const Point<L>& b) const;

private:
    uint32_t seed_;
    double frequency_ = DEFAULT_FREQUENCY;
    WorleyReturnType returnType_ = WorleyReturnType::Distance;
    DistanceMetric metric_ = DistanceMetric::Euclidean;
    PermutationTable perm_;

    /// Feature point offset from the cell's minimum corner, each axis in [0, 1)
    template<glm::length_t L>
    [[nodiscard]] Point<L> jitter(const LatticePoint<L>& cell) const;

    template<glm::length_t L>
    [[nodiscard]] WorleyResult search(const Point<L>& scaled) const;

    [[nodiscard]] double mapResult(const WorleyResult& result) const;
};

// ============================================================================
// Template implementation
// ============================================================================

template<glm::length_t L>
double Worley::distance(const Point<L>& a, const Point<L>& b) const {
    const Point<L> d = glm::abs(a - b);
    switch (metric_) {
        case DistanceMetric::Euclidean:
            return glm::length(d);
        case DistanceMetric::EuclideanSquared:
            return glm::dot(d, d);
        case DistanceMetric::Manhattan: {
            double sum = 0.0;
            for (glm::length_t i = 0; i < L; ++i) sum += d[i];
            return sum;
        }
        case DistanceMetric::Chebyshev: {
            double largest = 0.0;
            for (glm::length_t i = 0; i < L; ++i) largest = d[i] > largest ? d[i] : largest;
            return largest;
        }
    }
    return glm::length(d);
}

}  // namespace finenoise

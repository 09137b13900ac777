/**
 * @file noise_worley.cpp
 * @brief Worley (cellular) noise implementation
 *
 * The containing cell and its immediate neighbours are always searched.
 * Further rings of cells are searched while the closest any of their feature
 * points could be is still below the current second-nearest distance.
 */

#include "finenoise/worley.hpp"

#include <glm/gtc/type_ptr.hpp>

#include <array>
#include <cmath>
#include <limits>
#include <span>

namespace finenoise {

Worley::Worley(uint32_t seed)
    : seed_(seed), perm_(seed) {
}

Worley Worley::withSeed(uint32_t seed) const {
    Worley copy(seed);
    copy.frequency_ = frequency_;
    copy.returnType_ = returnType_;
    copy.metric_ = metric_;
    return copy;
}

Worley Worley::withFrequency(double frequency) const {
    Worley copy = *this;
    copy.frequency_ = frequency;
    return copy;
}

Worley Worley::withReturnType(WorleyReturnType type) const {
    Worley copy = *this;
    copy.returnType_ = type;
    return copy;
}

Worley Worley::withDistanceMetric(DistanceMetric metric) const {
    Worley copy = *this;
    copy.metric_ = metric;
    return copy;
}

// ============================================================================
// Feature points
// ============================================================================

template<glm::length_t L>
Point<L> Worley::jitter(const LatticePoint<L>& cell) const {
    // Two hash bytes per axis give 16 bits of jitter
    std::array<int32_t, L + 1> key{};
    for (glm::length_t i = 0; i < L; ++i) {
        key[static_cast<size_t>(i)] = cell[i];
    }

    Point<L> offset(0.0);
    for (glm::length_t axis = 0; axis < L; ++axis) {
        key[L] = axis * 2;
        uint32_t high = perm_.hash(std::span<const int32_t>(key));
        key[L] = axis * 2 + 1;
        uint32_t low = perm_.hash(std::span<const int32_t>(key));
        offset[axis] = static_cast<double>((high << 8) | low) / 65536.0;
    }
    return offset;
}

Point2 Worley::featurePoint(const LatticePoint<2>& cell) const { return Point2(cell) + jitter<2>(cell); }
Point3 Worley::featurePoint(const LatticePoint<3>& cell) const { return Point3(cell) + jitter<3>(cell); }
Point4 Worley::featurePoint(const LatticePoint<4>& cell) const { return Point4(cell) + jitter<4>(cell); }

// ============================================================================
// Search
// ============================================================================

template<glm::length_t L>
WorleyResult Worley::search(const Point<L>& scaled) const {
    WorleyResult result;
    if (!isFinitePoint(scaled)) {
        result.distance1 = std::numeric_limits<double>::quiet_NaN();
        result.distance2 = result.distance1;
        return result;
    }

    // Distances are measured inside the base cell's frame, so they stay
    // exact however far the point is from the origin
    const LatticePoint<L> base = latticeFloor(scaled);
    const Point<L> frac = scaled - glm::floor(scaled);

    // Closest approach to the cell boundary along any axis
    double edge = 1.0;
    for (glm::length_t i = 0; i < L; ++i) {
        double nearest = frac[i] < 1.0 - frac[i] ? frac[i] : 1.0 - frac[i];
        edge = nearest < edge ? nearest : edge;
    }

    double dist1 = std::numeric_limits<double>::max();
    double dist2 = std::numeric_limits<double>::max();
    LatticePoint<L> closestCell = base;

    // F2 never exceeds L + 1 (a face neighbour's feature under the Manhattan
    // metric), so a ring with bound L + 1 always ends the search
    constexpr int32_t MAX_RING = L + 2;

    for (int32_t ring = 0; ring <= MAX_RING; ++ring) {
        if (ring >= 2) {
            // Every cell in this ring is at least this far away on some axis
            double bound = static_cast<double>(ring - 1) + edge;
            if (metric_ == DistanceMetric::EuclideanSquared) {
                bound *= bound;
            }
            if (bound >= dist2) {
                break;
            }
        }

        // Walk the (2 * ring + 1)^L block, keeping only its outer shell
        const int32_t width = 2 * ring + 1;
        int32_t total = 1;
        for (glm::length_t i = 0; i < L; ++i) total *= width;

        for (int32_t index = 0; index < total; ++index) {
            LatticePoint<L> offset;
            int32_t rest = index;
            bool onShell = false;
            for (glm::length_t i = 0; i < L; ++i) {
                offset[i] = rest % width - ring;
                rest /= width;
                if (offset[i] == ring || offset[i] == -ring) {
                    onShell = true;
                }
            }
            if (!onShell) {
                continue;
            }

            const LatticePoint<L> cell = base + offset;
            double dist = distance<L>(frac, Point<L>(offset) + jitter<L>(cell));
            if (dist < dist1) {
                dist2 = dist1;
                dist1 = dist;
                closestCell = cell;
            } else if (dist < dist2) {
                dist2 = dist;
            }
        }
    }

    result.distance1 = dist1;
    result.distance2 = dist2;
    result.cellValue = perm_.hash(std::span<const int32_t>(glm::value_ptr(closestCell), L));
    return result;
}

WorleyResult Worley::features(const Point2& p) const { return search<2>(p * frequency_); }
WorleyResult Worley::features(const Point3& p) const { return search<3>(p * frequency_); }
WorleyResult Worley::features(const Point4& p) const { return search<4>(p * frequency_); }

// ============================================================================
// Evaluation
// ============================================================================

double Worley::mapResult(const WorleyResult& result) const {
    double f1 = result.distance1;
    double f2 = result.distance2;
    if (std::isnan(f1)) {
        return f1;
    }

    double v = 0.0;
    switch (returnType_) {
        case WorleyReturnType::Distance:
            v = f1;
            break;
        case WorleyReturnType::Value:
            return static_cast<double>(result.cellValue) / 255.0 * 2.0 - 1.0;
        case WorleyReturnType::Distance2:
            v = f2;
            break;
        case WorleyReturnType::Distance2Add:
            v = f1 + f2;
            break;
        case WorleyReturnType::Distance2Sub:
            v = f2 - f1;
            break;
        case WorleyReturnType::Distance2Mul:
            v = f1 * f2;
            break;
        case WorleyReturnType::Distance2Div:
            v = f2 > 0.0 ? f1 / f2 : 0.0;
            break;
    }
    return v * 2.0 - 1.0;
}

double Worley::evaluate(const Point2& p) const { return mapResult(features(p)); }
double Worley::evaluate(const Point3& p) const { return mapResult(features(p)); }
double Worley::evaluate(const Point4& p) const { return mapResult(features(p)); }

}  // namespace finenoise

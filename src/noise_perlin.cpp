/**
 * @file noise_perlin.cpp
 * @brief Perlin gradient noise, Perlin surflets and value noise (2D, 3D, 4D)
 *
 * Based on Ken Perlin's improved noise (2002). Corner gradients are picked
 * by hashing the lattice vertex through the seeded permutation table.
 */

#include "finenoise/generators.hpp"

#include "detail/lattice.hpp"

#include <numbers>

namespace finenoise {

// ============================================================================
// Gradient helpers
// ============================================================================

namespace {

/// Low 2 bits select one of the four diagonals (±1, ±1)
inline double grad2(uint8_t hash, const Point2& d) {
    int h = hash & 3;
    double u = (h & 2) == 0 ? d.x : -d.x;
    double v = (h & 1) == 0 ? d.y : -d.y;
    return u + v;
}

/// Low 4 bits select one of the 12 cube edge directions
inline double grad3(uint8_t hash, const Point3& d) {
    int h = hash & 15;
    double u = h < 8 ? d.x : d.y;
    double v = h < 4 ? d.y : (h == 12 || h == 14 ? d.x : d.z);
    return ((h & 1) == 0 ? u : -u) + ((h & 2) == 0 ? v : -v);
}

/// Low 5 bits select one of 32 directions with one zero component
inline double grad4(uint8_t hash, const Point4& d) {
    int h = hash & 31;
    double u = h < 24 ? d.x : d.y;
    double v = h < 16 ? d.y : d.z;
    double w = h < 8 ? d.z : d.w;
    return ((h & 1) == 0 ? u : -u) + ((h & 2) == 0 ? v : -v) + ((h & 4) == 0 ? w : -w);
}

inline double grad(uint8_t hash, const Point2& d) { return grad2(hash, d); }
inline double grad(uint8_t hash, const Point3& d) { return grad3(hash, d); }
inline double grad(uint8_t hash, const Point4& d) { return grad4(hash, d); }

// 4D gradients have three unit components; bring the peak back near 1
constexpr double PERLIN_SCALE_4D = 2.0 / 3.0;

// Surflet peaks, adjusted for gradient length (sqrt 2 for 2D/3D, sqrt 3 for 4D)
constexpr double SURFLET_SCALE_2D = 3.1604938271604937 / std::numbers::sqrt2;
constexpr double SURFLET_SCALE_3D = 3.8898553255531074 / std::numbers::sqrt2;
constexpr double SURFLET_SCALE_4D = 4.424369240215691 / std::numbers::sqrt3;

template<glm::length_t L>
double perlin(const PermutationTable& perm, const Point<L>& p) {
    return detail::interpolateCell<L>(p, [&](const LatticePoint<L>& vertex, const Point<L>& offset) {
        return grad(detail::hashVertex<L>(perm, vertex), offset);
    });
}

template<glm::length_t L>
double surflets(const PermutationTable& perm, const Point<L>& p) {
    auto values = detail::cellCorners<L>(p, [&](const LatticePoint<L>& vertex, const Point<L>& offset) {
        double falloff = 1.0 - glm::dot(offset, offset);
        if (falloff <= 0.0) {
            return 0.0;
        }
        double f2 = falloff * falloff;
        return f2 * f2 * grad(detail::hashVertex<L>(perm, vertex), offset);
    });

    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum;
}

template<glm::length_t L>
double valueNoise(const PermutationTable& perm, const Point<L>& p) {
    return detail::interpolateCell<L>(p, [&](const LatticePoint<L>& vertex, const Point<L>&) {
        return static_cast<double>(detail::hashVertex<L>(perm, vertex)) / 255.0 * 2.0 - 1.0;
    });
}

}  // namespace

// ============================================================================
// Perlin
// ============================================================================

double Perlin::evaluate(const Point2& p) const {
    return perlin<2>(perm_, p);
}

double Perlin::evaluate(const Point3& p) const {
    return perlin<3>(perm_, p);
}

double Perlin::evaluate(const Point4& p) const {
    return perlin<4>(perm_, p) * PERLIN_SCALE_4D;
}

// ============================================================================
// PerlinSurflet
// ============================================================================

double PerlinSurflet::evaluate(const Point2& p) const {
    return surflets<2>(perm_, p) * SURFLET_SCALE_2D;
}

double PerlinSurflet::evaluate(const Point3& p) const {
    return surflets<3>(perm_, p) * SURFLET_SCALE_3D;
}

double PerlinSurflet::evaluate(const Point4& p) const {
    return surflets<4>(perm_, p) * SURFLET_SCALE_4D;
}

// ============================================================================
// Value
// ============================================================================

double Value::evaluate(const Point2& p) const {
    return valueNoise<2>(perm_, p);
}

double Value::evaluate(const Point3& p) const {
    return valueNoise<3>(perm_, p);
}

double Value::evaluate(const Point4& p) const {
    return valueNoise<4>(perm_, p);
}

}  // namespace finenoise

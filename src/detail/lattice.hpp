/**
 * @file lattice.hpp
 * @brief Internal helpers shared by the lattice-based generators
 */

#pragma once

#include "finenoise/point.hpp"
#include "finenoise/seed.hpp"

#include <glm/gtc/type_ptr.hpp>

#include <array>
#include <cstdint>
#include <span>

namespace finenoise::detail {

/// Improved Perlin fade curve: 6t^5 - 15t^4 + 10t^3
inline double quintic(double t) {
    return t * t * t * (t * (t * 6.0 - 15.0) + 10.0);
}

/// Linear interpolation
inline double lerp(double t, double a, double b) {
    return a + t * (b - a);
}

template<glm::length_t L>
inline uint8_t hashVertex(const PermutationTable& perm, const LatticePoint<L>& vertex) {
    return perm.hash(std::span<const int32_t>(glm::value_ptr(vertex), L));
}

/// Visit the 2^L corners of the unit cell containing `point`. `corner` is
/// called with (lattice vertex, offset from vertex to point) and its result
/// is stored at the corner index (bit i set = +1 along axis i).
template<glm::length_t L, typename CornerFn>
std::array<double, (1u << L)> cellCorners(const Point<L>& point, CornerFn&& corner) {
    const LatticePoint<L> base = latticeFloor(point);
    const Point<L> frac = point - glm::floor(point);

    std::array<double, (1u << L)> values{};
    for (uint32_t c = 0; c < (1u << L); ++c) {
        LatticePoint<L> vertex = base;
        Point<L> offset = frac;
        for (glm::length_t axis = 0; axis < L; ++axis) {
            if (c & (1u << axis)) {
                vertex[axis] += 1;
                offset[axis] -= 1.0;
            }
        }
        values[c] = corner(vertex, offset);
    }
    return values;
}

/// Smoothly interpolate corner values of the cell containing `point`, one
/// axis at a time
template<glm::length_t L, typename CornerFn>
double interpolateCell(const Point<L>& point, CornerFn&& corner) {
    auto values = cellCorners<L>(point, corner);
    const Point<L> frac = point - glm::floor(point);

    uint32_t count = 1u << L;
    for (glm::length_t axis = 0; axis < L; ++axis) {
        double t = quintic(frac[axis]);
        count /= 2;
        for (uint32_t i = 0; i < count; ++i) {
            values[i] = lerp(t, values[2 * i], values[2 * i + 1]);
        }
    }
    return values[0];
}

}  // namespace finenoise::detail

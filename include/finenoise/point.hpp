/**
 * @file point.hpp
 * @brief Sample point types shared by every noise source
 *
 * Points are plain glm double vectors. A node only implements evaluation
 * for the arities its algorithm supports, so passing an unsupported point
 * type is a compile error rather than a runtime fault.
 */

#pragma once

#include <glm/glm.hpp>

#include <cmath>
#include <cstdint>

namespace finenoise {

template<glm::length_t L>
using Point = glm::vec<L, double, glm::defaultp>;

template<glm::length_t L>
using LatticePoint = glm::vec<L, int32_t, glm::defaultp>;

using Point2 = Point<2>;
using Point3 = Point<3>;
using Point4 = Point<4>;

/// Number of coordinates carried by a point type
template<typename P>
inline constexpr glm::length_t pointArity = P::length();

/// Lattice coordinates wrap with this period (2^24). Lattice hashes only read
/// the low 8 bits, so the wrap never changes a hash and keeps vertex
/// arithmetic well inside int32.
inline constexpr double LATTICE_PERIOD = 16777216.0;

/// Integer lattice coordinate of an already floored value. Non-finite
/// values map to 0; the fractional part carries the NaN instead.
[[nodiscard]] inline int32_t wrapLattice(double floored) {
    if (!std::isfinite(floored)) {
        return 0;
    }
    return static_cast<int32_t>(std::fmod(floored, LATTICE_PERIOD));
}

/// Floor every coordinate onto the (wrapped) integer lattice. Offsets within
/// the cell must be taken against glm::floor(p), not this result.
template<glm::length_t L>
[[nodiscard]] inline LatticePoint<L> latticeFloor(const Point<L>& p) {
    LatticePoint<L> cell;
    for (glm::length_t i = 0; i < L; ++i) {
        cell[i] = wrapLattice(std::floor(p[i]));
    }
    return cell;
}

template<glm::length_t L>
[[nodiscard]] inline bool isFinitePoint(const Point<L>& p) {
    for (glm::length_t i = 0; i < L; ++i) {
        if (!std::isfinite(p[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace finenoise

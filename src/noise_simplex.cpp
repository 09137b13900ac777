/**
 * @file noise_simplex.cpp
 * @brief Simplex-lattice noise: OpenSimplex (2D, 3D, 4D) and SuperSimplex (2D, 3D)
 *
 * OpenSimplex sums the d+1 vertices of the containing simplex with kernel
 * radius^2 0.5. SuperSimplex widens the kernel: 2D to radius^2 2/3 on the
 * same triangular lattice, 3D to radius^2 3/4 on a body-centred cubic
 * lattice reached through a rotation of the input.
 */

#include "finenoise/generators.hpp"

#include "detail/lattice.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <numeric>

namespace finenoise {

// ============================================================================
// Gradients
// ============================================================================

namespace {

// 2D gradients (24 unit directions for better isotropy)
constexpr double GRAD2[] = {
     0.130526192220052,  0.99144486137381,
     0.38268343236509,   0.923879532511287,
     0.608761429008721,  0.793353340291235,
     0.793353340291235,  0.608761429008721,
     0.923879532511287,  0.38268343236509,
     0.99144486137381,   0.130526192220052,
     0.99144486137381,  -0.130526192220052,
     0.923879532511287, -0.38268343236509,
     0.793353340291235, -0.608761429008721,
     0.608761429008721, -0.793353340291235,
     0.38268343236509,  -0.923879532511287,
     0.130526192220052, -0.99144486137381,
    -0.130526192220052, -0.99144486137381,
    -0.38268343236509,  -0.923879532511287,
    -0.608761429008721, -0.793353340291235,
    -0.793353340291235, -0.608761429008721,
    -0.923879532511287, -0.38268343236509,
    -0.99144486137381,  -0.130526192220052,
    -0.99144486137381,   0.130526192220052,
    -0.923879532511287,  0.38268343236509,
    -0.793353340291235,  0.608761429008721,
    -0.608761429008721,  0.793353340291235,
    -0.38268343236509,   0.923879532511287,
    -0.130526192220052,  0.99144486137381,
};
constexpr int GRAD2_COUNT = 24;

// 3D gradients: the 12 cube edge midpoints
constexpr double GRAD3[] = {
     1.0,  1.0,  0.0,
    -1.0,  1.0,  0.0,
     1.0, -1.0,  0.0,
    -1.0, -1.0,  0.0,
     1.0,  0.0,  1.0,
    -1.0,  0.0,  1.0,
     1.0,  0.0, -1.0,
    -1.0,  0.0, -1.0,
     0.0,  1.0,  1.0,
     0.0, -1.0,  1.0,
     0.0,  1.0, -1.0,
     0.0, -1.0, -1.0,
};
constexpr int GRAD3_COUNT = 12;
constexpr double GRAD3_NORM = 0.7071067811865476;  // 1 / sqrt(2)

// 4D gradients: 32 directions with one zero component
constexpr double GRAD4_NORM = 0.5773502691896258;  // 1 / sqrt(3)

inline double gradDot(uint8_t hash, const Point2& d) {
    int i = (hash % GRAD2_COUNT) * 2;
    return GRAD2[i] * d.x + GRAD2[i + 1] * d.y;
}

inline double gradDot(uint8_t hash, const Point3& d) {
    int i = (hash % GRAD3_COUNT) * 3;
    return (GRAD3[i] * d.x + GRAD3[i + 1] * d.y + GRAD3[i + 2] * d.z) * GRAD3_NORM;
}

inline double gradDot(uint8_t hash, const Point4& d) {
    int h = hash & 31;
    double u = h < 24 ? d.x : d.y;
    double v = h < 16 ? d.y : d.z;
    double w = h < 8 ? d.z : d.w;
    return (((h & 1) == 0 ? u : -u) + ((h & 2) == 0 ? v : -v) + ((h & 4) == 0 ? w : -w)) *
           GRAD4_NORM;
}

/// Radial kernel contribution (r^2 - |d|^2)^4 * (g . d)
template<glm::length_t L>
inline double contribution(double radiusSquared, uint8_t hash, const Point<L>& d) {
    double attn = radiusSquared - glm::dot(d, d);
    if (attn <= 0.0) {
        return 0.0;
    }
    attn *= attn;
    return attn * attn * gradDot(hash, d);
}

// ============================================================================
// Simplex lattice constants
// ============================================================================

template<glm::length_t L>
struct SimplexLattice {
    /// Skew factor (sqrt(d+1) - 1) / d
    static double skew() { return (std::sqrt(L + 1.0) - 1.0) / L; }
    /// Unskew factor (1 - 1/sqrt(d+1)) / d
    static double unskew() { return (1.0 - 1.0 / std::sqrt(L + 1.0)) / L; }
};

constexpr double OPEN_SIMPLEX_RSQUARED = 0.5;

// Output scale per dimension, bringing the peak sum to roughly 1
constexpr double OPEN_SIMPLEX_SCALE[] = {0.0, 0.0, 99.20689070704672, 96.0, 92.0};

template<glm::length_t L>
double openSimplex(const PermutationTable& perm, const Point<L>& p) {
    // The axis ranking below needs ordered coordinates
    if (!isFinitePoint(p)) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    const double skew = SimplexLattice<L>::skew();
    const double unskew = SimplexLattice<L>::unskew();

    // Skew input to simplex space and find the base vertex
    double s = 0.0;
    for (glm::length_t i = 0; i < L; ++i) s += p[i];
    const Point<L> skewed = p + s * skew;
    const Point<L> cell = glm::floor(skewed);
    const LatticePoint<L> base = latticeFloor(skewed);

    // Offset from the base vertex, unskewed back to real space
    double t = 0.0;
    for (glm::length_t i = 0; i < L; ++i) t += cell[i];
    const Point<L> d0 = p - (cell - t * unskew);

    // Rank the axes: walking them in descending order visits the simplex vertices
    std::array<glm::length_t, L> order;
    std::iota(order.begin(), order.end(), glm::length_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](glm::length_t a, glm::length_t b) { return d0[a] > d0[b]; });

    double value = 0.0;
    LatticePoint<L> vertex = base;
    Point<L> step(0.0);
    for (glm::length_t k = 0; k <= L; ++k) {
        if (k > 0) {
            vertex[order[k - 1]] += 1;
            step[order[k - 1]] = 1.0;
        }
        Point<L> d = d0 - step + static_cast<double>(k) * unskew;
        value += contribution<L>(OPEN_SIMPLEX_RSQUARED, detail::hashVertex<L>(perm, vertex), d);
    }
    return value * OPEN_SIMPLEX_SCALE[L];
}

// SuperSimplex 2D: triangular lattice, wider kernel
constexpr double SUPER_RSQUARED_2D = 2.0 / 3.0;
constexpr double SUPER_SCALE_2D = 18.24196194486065;

// The containing triangle plus the far vertex across each of its edges
constexpr int SUPER_LOWER_2D[6][2] = {{0, 0}, {1, 0}, {1, 1}, {0, -1}, {2, 1}, {0, 1}};
constexpr int SUPER_UPPER_2D[6][2] = {{0, 0}, {0, 1}, {1, 1}, {-1, 0}, {1, 2}, {1, 0}};

// SuperSimplex 3D: two interleaved cubic lattices
constexpr double SUPER_R3 = 2.0 / 3.0;
constexpr double SUPER_RSQUARED_3D = 3.0 / 4.0;
constexpr double SUPER_SCALE_3D = 14.0;

}  // namespace

// ============================================================================
// OpenSimplex
// ============================================================================

double OpenSimplex::evaluate(const Point2& p) const {
    return openSimplex<2>(perm_, p);
}

double OpenSimplex::evaluate(const Point3& p) const {
    return openSimplex<3>(perm_, p);
}

double OpenSimplex::evaluate(const Point4& p) const {
    return openSimplex<4>(perm_, p);
}

// ============================================================================
// SuperSimplex
// ============================================================================

double SuperSimplex::evaluate(const Point2& p) const {
    const double skew = SimplexLattice<2>::skew();
    const double unskew = SimplexLattice<2>::unskew();

    double s = (p.x + p.y) * skew;
    const Point2 skewed(p.x + s, p.y + s);
    const Point2 cell = glm::floor(skewed);
    const LatticePoint<2> base = latticeFloor(skewed);
    const Point2 frac = skewed - cell;

    double t = (cell.x + cell.y) * unskew;
    const Point2 d0 = p - (cell - t);

    const int (*vertices)[2] = frac.x >= frac.y ? SUPER_LOWER_2D : SUPER_UPPER_2D;

    double value = 0.0;
    for (int i = 0; i < 6; ++i) {
        const int* v = vertices[i];
        Point2 d = d0 - Point2(v[0], v[1]) + static_cast<double>(v[0] + v[1]) * unskew;
        uint8_t hash = perm_.hash2D(base.x + v[0], base.y + v[1]);
        value += contribution<2>(SUPER_RSQUARED_2D, hash, d);
    }
    return value * SUPER_SCALE_2D;
}

double SuperSimplex::evaluate(const Point3& p) const {
    // Re-orient so the main diagonal points up; this is an orthonormal map
    double r = SUPER_R3 * (p.x + p.y + p.z);
    const Point3 q(r - p.x, r - p.y, r - p.z);

    double value = 0.0;
    for (int32_t lattice = 0; lattice < 2; ++lattice) {
        // Second lattice sits at the cube centres of the first
        Point3 local = lattice == 0 ? q : q - 0.5;
        auto corners = detail::cellCorners<3>(local, [&](const LatticePoint<3>& vertex, const Point3& offset) {
            uint8_t hash = perm_.hash4D(vertex.x, vertex.y, vertex.z, lattice);
            return contribution<3>(SUPER_RSQUARED_3D, hash, offset);
        });
        for (double c : corners) {
            value += c;
        }
    }
    return value * SUPER_SCALE_3D;
}

}  // namespace finenoise

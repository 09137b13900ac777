/**
 * @file generators.hpp
 * @brief Leaf noise generators: constant, pattern, lattice and simplex noise
 *
 * All seeded generators are deterministic: same seed + point = same output.
 * Coherent generators return approximately [-1, 1]. Reseeding returns a new
 * generator value and leaves the original untouched.
 */

#pragma once

#include "finenoise/noise.hpp"
#include "finenoise/seed.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace finenoise {

// ============================================================================
// Constant
// ============================================================================

/// Outputs the same value at every point
class Constant : public Noise2D, public Noise3D, public Noise4D {
public:
    explicit Constant(double value = 0.0) : value_(value) {}

    [[nodiscard]] Constant withValue(double value) const { return Constant(value); }
    [[nodiscard]] double value() const { return value_; }

    [[nodiscard]] double evaluate(const Point2&) const override { return value_; }
    [[nodiscard]] double evaluate(const Point3&) const override { return value_; }
    [[nodiscard]] double evaluate(const Point4&) const override { return value_; }

private:
    double value_;
};

// ============================================================================
// Checkerboard
// ============================================================================

/// Alternating -1 / +1 blocks of 2^size units. A debugging aid, not coherent noise.
class Checkerboard : public Noise2D, public Noise3D, public Noise4D {
public:
    static constexpr uint32_t DEFAULT_SIZE = 0;

    /// @param sizeExponent Block edge length is 2^sizeExponent
    explicit Checkerboard(uint32_t sizeExponent = DEFAULT_SIZE);

    [[nodiscard]] Checkerboard withSize(uint32_t sizeExponent) const {
        return Checkerboard(sizeExponent);
    }

    /// Block edge length (already expanded from the exponent)
    [[nodiscard]] uint64_t size() const { return size_; }

    [[nodiscard]] double evaluate(const Point2& p) const override { return evaluateAny(p); }
    [[nodiscard]] double evaluate(const Point3& p) const override { return evaluateAny(p); }
    [[nodiscard]] double evaluate(const Point4& p) const override { return evaluateAny(p); }

private:
    uint64_t size_;

    // Cells wrap modulo 2^63, which keeps every bit the size mask can select
    static constexpr double CELL_PERIOD = 9223372036854775808.0;

    template<glm::length_t L>
    [[nodiscard]] double evaluateAny(const Point<L>& p) const {
        if (!isFinitePoint(p)) {
            return std::numeric_limits<double>::quiet_NaN();
        }

        uint64_t parity = 0;
        for (glm::length_t i = 0; i < L; ++i) {
            auto cell = static_cast<int64_t>(std::fmod(std::floor(p[i]), CELL_PERIOD));
            parity ^= static_cast<uint64_t>(cell) & size_;
        }
        return parity != 0 ? -1.0 : 1.0;
    }
};

// ============================================================================
// Cylinders
// ============================================================================

/// Concentric unit-spaced cylinders around the z axis, like tree rings.
/// Only x and y take part; further axes are ignored.
class Cylinders : public Noise2D, public Noise3D, public Noise4D {
public:
    static constexpr double DEFAULT_FREQUENCY = 1.0;

    explicit Cylinders(double frequency = DEFAULT_FREQUENCY) : frequency_(frequency) {}

    [[nodiscard]] Cylinders withFrequency(double frequency) const { return Cylinders(frequency); }
    [[nodiscard]] double frequency() const { return frequency_; }

    [[nodiscard]] double evaluate(const Point2& p) const override { return rings(p.x, p.y); }
    [[nodiscard]] double evaluate(const Point3& p) const override { return rings(p.x, p.y); }
    [[nodiscard]] double evaluate(const Point4& p) const override { return rings(p.x, p.y); }

private:
    double frequency_;

    [[nodiscard]] double rings(double x, double y) const;
};

// ============================================================================
// Perlin noise
// ============================================================================

/// Improved Perlin gradient noise (2D, 3D, 4D). Exactly zero on the integer lattice.
class Perlin : public Noise2D, public Noise3D, public Noise4D {
public:
    static constexpr uint32_t DEFAULT_SEED = 0;

    explicit Perlin(uint32_t seed = DEFAULT_SEED) : seed_(seed), perm_(seed) {}

    [[nodiscard]] Perlin withSeed(uint32_t seed) const { return Perlin(seed); }
    [[nodiscard]] uint32_t seed() const { return seed_; }

    [[nodiscard]] double evaluate(const Point2& p) const override;
    [[nodiscard]] double evaluate(const Point3& p) const override;
    [[nodiscard]] double evaluate(const Point4& p) const override;

private:
    uint32_t seed_;
    PermutationTable perm_;
};

/// Perlin lattice walk with radial surflet falloff per corner instead of
/// interpolation between corners (2D, 3D, 4D).
class PerlinSurflet : public Noise2D, public Noise3D, public Noise4D {
public:
    static constexpr uint32_t DEFAULT_SEED = 0;

    explicit PerlinSurflet(uint32_t seed = DEFAULT_SEED) : seed_(seed), perm_(seed) {}

    [[nodiscard]] PerlinSurflet withSeed(uint32_t seed) const { return PerlinSurflet(seed); }
    [[nodiscard]] uint32_t seed() const { return seed_; }

    [[nodiscard]] double evaluate(const Point2& p) const override;
    [[nodiscard]] double evaluate(const Point3& p) const override;
    [[nodiscard]] double evaluate(const Point4& p) const override;

private:
    uint32_t seed_;
    PermutationTable perm_;
};

/// Lattice value noise: a pseudo-random value per lattice corner, smoothly
/// interpolated (2D, 3D, 4D).
class Value : public Noise2D, public Noise3D, public Noise4D {
public:
    static constexpr uint32_t DEFAULT_SEED = 0;

    explicit Value(uint32_t seed = DEFAULT_SEED) : seed_(seed), perm_(seed) {}

    [[nodiscard]] Value withSeed(uint32_t seed) const { return Value(seed); }
    [[nodiscard]] uint32_t seed() const { return seed_; }

    [[nodiscard]] double evaluate(const Point2& p) const override;
    [[nodiscard]] double evaluate(const Point3& p) const override;
    [[nodiscard]] double evaluate(const Point4& p) const override;

private:
    uint32_t seed_;
    PermutationTable perm_;
};

// ============================================================================
// Simplex family
// ============================================================================

/// Simplex-lattice noise (2D, 3D, 4D): sums the d+1 vertices of the
/// containing simplex with a radial kernel.
class OpenSimplex : public Noise2D, public Noise3D, public Noise4D {
public:
    static constexpr uint32_t DEFAULT_SEED = 0;

    explicit OpenSimplex(uint32_t seed = DEFAULT_SEED) : seed_(seed), perm_(seed) {}

    [[nodiscard]] OpenSimplex withSeed(uint32_t seed) const { return OpenSimplex(seed); }
    [[nodiscard]] uint32_t seed() const { return seed_; }

    [[nodiscard]] double evaluate(const Point2& p) const override;
    [[nodiscard]] double evaluate(const Point3& p) const override;
    [[nodiscard]] double evaluate(const Point4& p) const override;

private:
    uint32_t seed_;
    PermutationTable perm_;
};

/// Wide-kernel simplex noise (2D, 3D). Smoother than OpenSimplex at the cost
/// of more vertices per sample: 2D sums six triangular-lattice vertices,
/// 3D sums two interleaved cubic lattices.
class SuperSimplex : public Noise2D, public Noise3D {
public:
    static constexpr uint32_t DEFAULT_SEED = 0;

    explicit SuperSimplex(uint32_t seed = DEFAULT_SEED) : seed_(seed), perm_(seed) {}

    [[nodiscard]] SuperSimplex withSeed(uint32_t seed) const { return SuperSimplex(seed); }
    [[nodiscard]] uint32_t seed() const { return seed_; }

    [[nodiscard]] double evaluate(const Point2& p) const override;
    [[nodiscard]] double evaluate(const Point3& p) const override;

private:
    uint32_t seed_;
    PermutationTable perm_;
};

}  // namespace finenoise

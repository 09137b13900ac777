/**
 * @file blenders.hpp
 * @brief Layer blend strategies for Fractal
 *
 * A blender reduces the per-layer values of one fractal evaluation (layer 0
 * first) to a single output. Every blender carries a persistence: the
 * amplitude falloff between consecutive layers.
 */

#pragma once

#include <span>

namespace finenoise {

/// Plain fractal sum: sum of v_k * persistence^k
class HomogeneousBlender {
public:
    static constexpr double DEFAULT_PERSISTENCE = 0.5;

    explicit HomogeneousBlender(double persistence = DEFAULT_PERSISTENCE)
        : persistence_(persistence) {}

    [[nodiscard]] HomogeneousBlender withPersistence(double persistence) const {
        return HomogeneousBlender(persistence);
    }
    [[nodiscard]] double persistence() const { return persistence_; }

    [[nodiscard]] double blend(std::span<const double> values) const;

private:
    double persistence_;
};

/// Each layer's contribution is scaled by the running result, so detail
/// grows where the lower layers are already high
class HeterogeneousBlender {
public:
    static constexpr double DEFAULT_PERSISTENCE = 0.5;

    explicit HeterogeneousBlender(double persistence = DEFAULT_PERSISTENCE)
        : persistence_(persistence) {}

    [[nodiscard]] HeterogeneousBlender withPersistence(double persistence) const {
        return HeterogeneousBlender(persistence);
    }
    [[nodiscard]] double persistence() const { return persistence_; }

    [[nodiscard]] double blend(std::span<const double> values) const;

private:
    double persistence_;
};

/// Ridged multifractal. Sharp ridges where layer values cross zero; the
/// weight carried between layers damps detail in the valleys.
/// The sum is not normalized.
class RidgedBlender {
public:
    static constexpr double DEFAULT_PERSISTENCE = 0.5;
    static constexpr double DEFAULT_ATTENUATION = 2.0;

    explicit RidgedBlender(double persistence = DEFAULT_PERSISTENCE,
                           double attenuation = DEFAULT_ATTENUATION)
        : persistence_(persistence), attenuation_(attenuation) {}

    [[nodiscard]] RidgedBlender withPersistence(double persistence) const {
        return RidgedBlender(persistence, attenuation_);
    }
    [[nodiscard]] RidgedBlender withAttenuation(double attenuation) const {
        return RidgedBlender(persistence_, attenuation);
    }
    [[nodiscard]] double persistence() const { return persistence_; }
    [[nodiscard]] double attenuation() const { return attenuation_; }

    [[nodiscard]] double blend(std::span<const double> values) const;

private:
    double persistence_;
    double attenuation_;
};

/// Billow: sum of (2|v_k| - 1) * persistence^k, puffy appearance
class BillowBlender {
public:
    static constexpr double DEFAULT_PERSISTENCE = 0.5;

    explicit BillowBlender(double persistence = DEFAULT_PERSISTENCE)
        : persistence_(persistence) {}

    [[nodiscard]] BillowBlender withPersistence(double persistence) const {
        return BillowBlender(persistence);
    }
    [[nodiscard]] double persistence() const { return persistence_; }

    [[nodiscard]] double blend(std::span<const double> values) const;

private:
    double persistence_;
};

}  // namespace finenoise

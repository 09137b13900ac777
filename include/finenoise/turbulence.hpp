/**
 * @file turbulence.hpp
 * @brief Random per-axis displacement of the input point
 *
 * Each input axis is pushed by its own Perlin fractal field, sampled at the
 * point scaled by the frequency, so the source appears swirled. Power scales the displacement; zero power leaves the
 * source unchanged.
 */

#pragma once

#include "finenoise/fractal.hpp"
#include "finenoise/noise.hpp"
#include "finenoise/seed.hpp"
#include "finenoise/transformers.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace finenoise {

template<typename P>
class Turbulence : public NoiseSource<P> {
public:
    using Field = Transformed<P, Fractal<P>>;

    static constexpr uint32_t DEFAULT_SEED = 0;
    static constexpr double DEFAULT_FREQUENCY = 1.0;
    static constexpr double DEFAULT_POWER = 1.0;
    static constexpr size_t DEFAULT_ROUGHNESS = 3;
    static constexpr size_t FIELD_COUNT = 4;

    explicit Turbulence(SourcePtr<P> source)
        : source_(detail::requireSource(std::move(source), "Turbulence")) {
        reseedFields();
    }

    [[nodiscard]] Turbulence withSeed(uint32_t seed) const {
        Turbulence copy = *this;
        copy.seed_ = seed;
        copy.reseedFields();
        return copy;
    }

    [[nodiscard]] Turbulence withFrequency(double frequency) const {
        Turbulence copy = *this;
        copy.frequency_ = frequency;
        for (Field& field : copy.fields_) {
            field = field.withTransform(UniformScale(frequency));
        }
        return copy;
    }

    [[nodiscard]] Turbulence withPower(double power) const {
        Turbulence copy = *this;
        copy.power_ = power;
        return copy;
    }

    /// Number of layers in each displacement field
    /// @throws std::invalid_argument outside [1, Fractal::MAX_LAYERS]
    [[nodiscard]] Turbulence withRoughness(size_t roughness) const {
        Turbulence copy = *this;
        for (Field& field : copy.fields_) {
            field = field.withSource(field.source().withLayers(roughness));
        }
        copy.roughness_ = roughness;
        return copy;
    }

    [[nodiscard]] uint32_t seed() const { return seed_; }
    [[nodiscard]] double frequency() const { return frequency_; }
    [[nodiscard]] double power() const { return power_; }
    [[nodiscard]] size_t roughness() const { return roughness_; }
    [[nodiscard]] const Field& field(size_t axis) const { return fields_.at(axis); }
    [[nodiscard]] const SourcePtr<P>& source() const { return source_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        P displaced = point;
        for (glm::length_t i = 0; i < pointArity<P>; ++i) {
            P sample = point;
            for (glm::length_t j = 0; j < pointArity<P>; ++j) {
                sample[j] = point[j] + FIELD_OFFSETS[i][j] / 65536.0;
            }
            displaced[i] += fields_[static_cast<size_t>(i)].evaluate(sample) * power_;
        }
        return source_->evaluate(displaced);
    }

private:
    // Sample offsets per field, in 1/65536 units, kept off the integer lattice
    static constexpr double FIELD_OFFSETS[FIELD_COUNT][4] = {
        {12414.0, 65124.0, 31337.0, 57948.0},
        {26519.0, 18128.0, 60943.0, 48513.0},
        {53820.0, 11213.0, 44845.0, 39357.0},
        {18128.0, 44845.0, 12414.0, 60943.0},
    };

    SourcePtr<P> source_;
    uint32_t seed_ = DEFAULT_SEED;
    double frequency_ = DEFAULT_FREQUENCY;
    double power_ = DEFAULT_POWER;
    size_t roughness_ = DEFAULT_ROUGHNESS;
    std::array<Field, FIELD_COUNT> fields_;

    void reseedFields() {
        SeedSequence seeds(seed_);
        for (Field& field : fields_) {
            field = scaled<P>(Fractal<P>().withSeed(seeds.next()).withLayers(roughness_), frequency_);
        }
    }
};

}  // namespace finenoise

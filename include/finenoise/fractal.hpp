/**
 * @file fractal.hpp
 * @brief Multi-layer (octave) fractal noise
 *
 * Layer 0 is evaluated at the input point; the transform is applied to the
 * point before each following layer. The blender reduces the layer values
 * to the output.
 *
 *   Fractal<Point3> fbm;                                  // 6 Perlin layers
 *   auto ridged = fbm.withLayerSource(OpenSimplex())
 *                    .withBlender(RidgedBlender())
 *                    .withLayers(8);
 *
 * Layer k is seeded with the k-th draw of SeedSequence(seed()), so changing
 * the layer count never changes the retained layers.
 */

#pragma once

#include "finenoise/blenders.hpp"
#include "finenoise/generators.hpp"
#include "finenoise/noise.hpp"
#include "finenoise/seed.hpp"
#include "finenoise/transformers.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace finenoise {

template<typename P, typename Layer = Perlin, typename Blender = HomogeneousBlender,
         typename Transform = UniformScale>
class Fractal : public NoiseSource<P> {
public:
    static constexpr uint32_t DEFAULT_SEED = 0xD0786B3E;
    static constexpr size_t DEFAULT_LAYERS = 6;
    static constexpr size_t MAX_LAYERS = 32;
    static constexpr double DEFAULT_LACUNARITY = std::numbers::pi * 2.0 / 3.0;
    static constexpr double DEFAULT_PERSISTENCE = 0.5;

    Fractal()
        : Fractal(Layer(), defaultTransform(), Blender(DEFAULT_PERSISTENCE),
                  DEFAULT_SEED, DEFAULT_LAYERS) {}

    /// @param layerTemplate Copied and reseeded for every layer
    /// @throws std::invalid_argument if layerCount is 0 or above MAX_LAYERS
    Fractal(Layer layerTemplate, Transform transform, Blender blender,
            uint32_t seed, size_t layerCount)
        : seed_(seed),
          template_(std::move(layerTemplate)),
          transform_(std::move(transform)),
          blender_(std::move(blender)) {
        layers_ = buildLayers(template_, seed_, layerCount);
    }

    // ========================================================================
    // Configuration
    // ========================================================================

    [[nodiscard]] Fractal withSeed(uint32_t seed) const {
        return Fractal(template_, transform_, blender_, seed, layers_.size());
    }

    [[nodiscard]] Fractal withLayers(size_t count) const {
        checkLayerCount(count);
        Fractal copy = *this;
        if (count <= layers_.size()) {
            copy.layers_.resize(count, template_);
            return copy;
        }

        std::vector<uint32_t> seeds = SeedSequence::take(seed_, count);
        for (size_t k = layers_.size(); k < count; ++k) {
            copy.layers_.push_back(template_.withSeed(seeds[k]));
        }
        return copy;
    }

    /// Replace the layer type; every layer becomes a reseeded copy of the template
    template<typename NewLayer>
    [[nodiscard]] Fractal<P, NewLayer, Blender, Transform> withLayerSource(NewLayer layerTemplate) const {
        return Fractal<P, NewLayer, Blender, Transform>(
            std::move(layerTemplate), transform_, blender_, seed_, layers_.size());
    }

    template<typename NewTransform>
    [[nodiscard]] Fractal<P, Layer, Blender, NewTransform> withTransform(NewTransform transform) const {
        return Fractal<P, Layer, Blender, NewTransform>(
            template_, std::move(transform), blender_, seed_, layers_.size());
    }

    template<typename NewBlender>
    [[nodiscard]] Fractal<P, Layer, NewBlender, Transform> withBlender(NewBlender blender) const {
        return Fractal<P, Layer, NewBlender, Transform>(
            template_, transform_, std::move(blender), seed_, layers_.size());
    }

    /// Point scale between consecutive layers (UniformScale transform only)
    [[nodiscard]] Fractal withLacunarity(double lacunarity) const {
        Fractal copy = *this;
        copy.transform_ = transform_.withScale(lacunarity);
        return copy;
    }

    [[nodiscard]] Fractal withPersistence(double persistence) const {
        Fractal copy = *this;
        copy.blender_ = blender_.withPersistence(persistence);
        return copy;
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] uint32_t seed() const { return seed_; }
    [[nodiscard]] size_t layerCount() const { return layers_.size(); }
    [[nodiscard]] const Layer& layer(size_t k) const { return layers_.at(k); }
    [[nodiscard]] const Blender& blender() const { return blender_; }
    [[nodiscard]] const Transform& transform() const { return transform_; }

    // ========================================================================
    // Evaluation
    // ========================================================================

    [[nodiscard]] double evaluate(const P& point) const override {
        std::array<double, MAX_LAYERS> values{};
        P current = point;
        for (size_t k = 0; k < layers_.size(); ++k) {
            values[k] = layers_[k].evaluate(current);
            current = transform_.apply(current);
        }
        return blender_.blend(std::span<const double>(values.data(), layers_.size()));
    }

private:
    uint32_t seed_;
    Layer template_;
    Transform transform_;
    Blender blender_;
    std::vector<Layer> layers_;

    static Transform defaultTransform() {
        if constexpr (std::is_same_v<Transform, UniformScale>) {
            return UniformScale(DEFAULT_LACUNARITY);
        } else {
            return Transform();
        }
    }

    static void checkLayerCount(size_t count) {
        if (count == 0 || count > MAX_LAYERS) {
            throw std::invalid_argument("Fractal: layer count " + std::to_string(count) +
                                        " out of range [1, " + std::to_string(MAX_LAYERS) + "]");
        }
    }

    static std::vector<Layer> buildLayers(const Layer& layerTemplate, uint32_t seed, size_t count) {
        checkLayerCount(count);
        std::vector<Layer> layers;
        layers.reserve(count);
        for (uint32_t layerSeed : SeedSequence::take(seed, count)) {
            layers.push_back(layerTemplate.withSeed(layerSeed));
        }
        return layers;
    }
};

}  // namespace finenoise

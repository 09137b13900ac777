/**
 * @file noise_preset.cpp
 * @brief Preset document to noise graph
 */

#include "finenoise/preset/noise_preset.hpp"

#include "finenoise/fractal.hpp"
#include "finenoise/generators.hpp"
#include "finenoise/modifiers.hpp"
#include "finenoise/transformers.hpp"
#include "finenoise/turbulence.hpp"
#include "finenoise/worley.hpp"

#include <algorithm>
#include <array>
#include <iostream>

namespace finenoise {

namespace {

constexpr std::array<std::string_view, 21> KNOWN_KEYS = {
    "generator", "seed", "value", "size", "frequency", "return_type", "distance",
    "fractal", "layers", "lacunarity", "persistence", "attenuation",
    "turbulence", "turbulence_seed", "turbulence_frequency", "turbulence_power",
    "turbulence_roughness",
    "scale", "bias", "clamp", "point_scale",
};

WorleyReturnType parseReturnType(std::string_view name) {
    if (name == "distance") return WorleyReturnType::Distance;
    if (name == "value") return WorleyReturnType::Value;
    if (name == "distance2") return WorleyReturnType::Distance2;
    if (name == "distance2_add") return WorleyReturnType::Distance2Add;
    if (name == "distance2_sub") return WorleyReturnType::Distance2Sub;
    if (name == "distance2_mul") return WorleyReturnType::Distance2Mul;
    if (name == "distance2_div") return WorleyReturnType::Distance2Div;
    throw PresetError("return_type", "unknown return type '" + std::string(name) + "'");
}

DistanceMetric parseMetric(std::string_view name) {
    if (name == "euclidean") return DistanceMetric::Euclidean;
    if (name == "euclidean_squared") return DistanceMetric::EuclideanSquared;
    if (name == "manhattan") return DistanceMetric::Manhattan;
    if (name == "chebyshev") return DistanceMetric::Chebyshev;
    throw PresetError("distance", "unknown distance metric '" + std::string(name) + "'");
}

size_t layerCount(const ConfigDocument& doc, std::string_view key, size_t defaultVal) {
    int count = doc.getInt(key, static_cast<int>(defaultVal));
    if (count < 1 || static_cast<size_t>(count) > Fractal<Point2>::MAX_LAYERS) {
        throw PresetError(std::string(key), "layer count " + std::to_string(count) + " out of range [1, " +
                                                std::to_string(Fractal<Point2>::MAX_LAYERS) + "]");
    }
    return static_cast<size_t>(count);
}

// ============================================================================
// Fractal wrapping
// ============================================================================

template<typename P, typename Layer>
SourcePtr<P> layered(const ConfigDocument& doc, Layer layerTemplate) {
    using Base = Fractal<P>;

    auto fractal = Base()
        .withLayerSource(std::move(layerTemplate))
        .withSeed(doc.getUnsigned("seed", Base::DEFAULT_SEED))
        .withLayers(layerCount(doc, "layers", Base::DEFAULT_LAYERS))
        .withLacunarity(doc.getDouble("lacunarity", Base::DEFAULT_LACUNARITY));

    double persistence = doc.getDouble("persistence", Base::DEFAULT_PERSISTENCE);
    std::string_view kind = doc.getString("fractal");

    if (kind == "homogeneous") {
        return share<P>(fractal.withBlender(HomogeneousBlender(persistence)));
    }
    if (kind == "heterogeneous") {
        return share<P>(fractal.withBlender(HeterogeneousBlender(persistence)));
    }
    if (kind == "ridged") {
        double attenuation = doc.getDouble("attenuation", RidgedBlender::DEFAULT_ATTENUATION);
        return share<P>(fractal.withBlender(RidgedBlender(persistence, attenuation)));
    }
    if (kind == "billow") {
        return share<P>(fractal.withBlender(BillowBlender(persistence)));
    }
    throw PresetError("fractal", "unknown fractal type '" + std::string(kind) + "'");
}

/// Seeded generator: layered when a fractal is requested
template<typename P, typename Generator>
SourcePtr<P> seededLeaf(const ConfigDocument& doc, Generator generator) {
    if (doc.has("fractal")) {
        return layered<P>(doc, std::move(generator));
    }
    return share<P>(std::move(generator));
}

/// Unseeded generator: cannot be layered
template<typename P, typename Generator>
SourcePtr<P> plainLeaf(const ConfigDocument& doc, Generator generator) {
    if (doc.has("fractal")) {
        throw PresetError("fractal", "generator '" + std::string(doc.getString("generator")) +
                                         "' has no seed and cannot be layered");
    }
    return share<P>(std::move(generator));
}

template<typename P>
SourcePtr<P> buildGenerator(const ConfigDocument& doc) {
    if (!doc.has("generator")) {
        throw PresetError("generator", "missing required entry");
    }

    const std::string_view name = doc.getString("generator");
    const uint32_t seed = doc.getUnsigned("seed", 0);

    if (name == "constant") {
        return plainLeaf<P>(doc, Constant(doc.getDouble("value", 0.0)));
    }
    if (name == "checkerboard") {
        int exponent = doc.getInt("size", 0);
        if (exponent < 0 || exponent >= 63) {
            throw PresetError("size", "checkerboard size exponent " + std::to_string(exponent) +
                                          " out of range [0, 62]");
        }
        return plainLeaf<P>(doc, Checkerboard(static_cast<uint32_t>(exponent)));
    }
    if (name == "cylinders") {
        return plainLeaf<P>(doc, Cylinders(doc.getDouble("frequency", Cylinders::DEFAULT_FREQUENCY)));
    }
    if (name == "perlin") {
        return seededLeaf<P>(doc, Perlin(seed));
    }
    if (name == "perlin_surflet") {
        return seededLeaf<P>(doc, PerlinSurflet(seed));
    }
    if (name == "open_simplex") {
        return seededLeaf<P>(doc, OpenSimplex(seed));
    }
    if (name == "super_simplex") {
        return seededLeaf<P>(doc, SuperSimplex(seed));
    }
    if (name == "value") {
        return seededLeaf<P>(doc, Value(seed));
    }
    if (name == "worley") {
        Worley worley = Worley(seed)
            .withFrequency(doc.getDouble("frequency", Worley::DEFAULT_FREQUENCY))
            .withReturnType(parseReturnType(doc.getString("return_type", "distance")))
            .withDistanceMetric(parseMetric(doc.getString("distance", "euclidean")));
        return seededLeaf<P>(doc, std::move(worley));
    }

    throw PresetError("generator", "unknown generator type '" + std::string(name) + "'");
}

}  // namespace

// ============================================================================
// NoisePreset
// ============================================================================

NoisePreset::NoisePreset(ConfigDocument document)
    : document_(std::move(document)) {
    for (const auto& entry : document_) {
        if (std::find(KNOWN_KEYS.begin(), KNOWN_KEYS.end(), entry.key) == KNOWN_KEYS.end()) {
            std::cerr << "[NoisePreset] WARNING: ignoring unknown key '" << entry.key
                      << "' (line " << entry.line << ")\n";
        }
    }
}

NoisePreset NoisePreset::fromString(std::string_view text) {
    ConfigParser parser;
    return NoisePreset(parser.parseString(text));
}

std::optional<NoisePreset> NoisePreset::fromFile(const std::string& path) {
    ConfigParser parser;
    auto document = parser.parseFile(path);
    if (!document) {
        return std::nullopt;
    }
    return NoisePreset(std::move(*document));
}

template<typename P>
SourcePtr<P> NoisePreset::build() const {
    const ConfigDocument& doc = document_;
    SourcePtr<P> node = buildGenerator<P>(doc);

    if (doc.getBool("turbulence", false)) {
        using Turb = Turbulence<P>;
        node = share<P>(Turb(node)
            .withSeed(doc.getUnsigned("turbulence_seed", Turb::DEFAULT_SEED))
            .withFrequency(doc.getDouble("turbulence_frequency", Turb::DEFAULT_FREQUENCY))
            .withPower(doc.getDouble("turbulence_power", Turb::DEFAULT_POWER))
            .withRoughness(layerCount(doc, "turbulence_roughness", Turb::DEFAULT_ROUGHNESS)));
    }

    if (doc.has("point_scale")) {
        node = share<P>(ScalePoint<P>(node).withScale(doc.getDouble("point_scale", 1.0)));
    }

    if (doc.has("scale") || doc.has("bias")) {
        node = share<P>(ScaleBias<P>(node)
            .withScale(doc.getDouble("scale", ScaleBias<P>::DEFAULT_SCALE))
            .withBias(doc.getDouble("bias", ScaleBias<P>::DEFAULT_BIAS)));
    }

    if (const ConfigEntry* clamp = doc.get("clamp")) {
        if (!clamp->hasData() || clamp->dataLines.front().size() != 2) {
            throw PresetError("clamp", "expected one data line with two numbers");
        }
        const auto& bounds = clamp->dataLines.front();
        node = share<P>(Clamp<P>(node).withBounds(bounds[0], bounds[1]));
    }

    return node;
}

SourcePtr<Point2> NoisePreset::build2D() const {
    return build<Point2>();
}

SourcePtr<Point3> NoisePreset::build3D() const {
    return build<Point3>();
}

}  // namespace finenoise

/**
 * @file noise_preset.hpp
 * @brief Build noise graphs from configuration documents
 *
 * A preset names one generator and optionally wraps it in a fractal,
 * turbulence, a point scale, an output scale/bias and a clamp:
 *
 * ```
 * generator: open_simplex
 * seed: 1234
 * fractal: ridged
 * layers: 5
 * turbulence: true
 * turbulence_power: 0.25
 * scale: 0.5
 * clamp:
 *     -1.0 1.0
 * ```
 *
 * The wrappers are applied in that order, innermost first.
 */

#pragma once

#include "finenoise/preset/config_parser.hpp"
#include "finenoise/noise.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace finenoise {

/// A preset document that cannot be turned into a graph
class PresetError : public std::runtime_error {
public:
    PresetError(std::string key, const std::string& message)
        : std::runtime_error("preset '" + key + "': " + message), key_(std::move(key)) {}

    /// Offending configuration key
    [[nodiscard]] const std::string& key() const { return key_; }

private:
    std::string key_;
};

class NoisePreset {
public:
    /// Unknown keys are reported as warnings here and otherwise ignored
    explicit NoisePreset(ConfigDocument document);

    [[nodiscard]] static NoisePreset fromString(std::string_view text);

    /// @return nullopt if the file cannot be opened
    [[nodiscard]] static std::optional<NoisePreset> fromFile(const std::string& path);

    /// @throws PresetError on a malformed preset
    [[nodiscard]] SourcePtr<Point2> build2D() const;
    [[nodiscard]] SourcePtr<Point3> build3D() const;

    [[nodiscard]] const ConfigDocument& document() const { return document_; }

private:
    ConfigDocument document_;

    template<typename P>
    [[nodiscard]] SourcePtr<P> build() const;
};

}  // namespace finenoise

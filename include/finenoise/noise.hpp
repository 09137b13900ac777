/**
 * @file noise.hpp
 * @brief Evaluation contract for composable noise sources
 *
 * Every generator, combiner, modifier, selector, transformer and fractal
 * implements NoiseSource<Point> for each point arity it supports.
 * All evaluation is deterministic and const: same configuration + point =
 * same output, with no shared mutable state, so one source may be
 * evaluated from many threads at once.
 *
 * Composite nodes hold their children as SourcePtr (shared, read-only).
 * A constructed node may feed several parents:
 *
 *   auto perlin = std::make_shared<Perlin>(7);
 *   Combiner<Point2> sum(CombineOp::Add, perlin, perlin);
 */

#pragma once

#include "finenoise/point.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace finenoise {

// ============================================================================
// Base interface
// ============================================================================

/// Abstract noise evaluator for one point arity
template<typename P>
class NoiseSource {
public:
    virtual ~NoiseSource() = default;

    /// Evaluate noise at a point. Generators return approximately [-1, 1];
    /// composites may exceed that range.
    [[nodiscard]] virtual double evaluate(const P& point) const = 0;
};

using Noise2D = NoiseSource<Point2>;
using Noise3D = NoiseSource<Point3>;
using Noise4D = NoiseSource<Point4>;

/// Shared, read-only handle to a child source
template<typename P>
using SourcePtr = std::shared_ptr<const NoiseSource<P>>;

/// Move a configured node into a shareable handle
template<typename P, typename Node>
[[nodiscard]] SourcePtr<P> share(Node node) {
    return std::make_shared<const Node>(std::move(node));
}

namespace detail {

template<typename P>
SourcePtr<P> requireSource(SourcePtr<P> source, const char* owner) {
    if (!source) {
        throw std::invalid_argument(std::string(owner) + ": source must not be null");
    }
    return source;
}

}  // namespace detail

}  // namespace finenoise

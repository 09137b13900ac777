/**
 * @file transformers.hpp
 * @brief Nodes that alter the input point before delegating to a source
 *
 * Axis setters follow the (x, y, z, u) naming; axes beyond the point's
 * arity are stored but have no effect.
 */

#pragma once

#include "finenoise/noise.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace finenoise {

// ============================================================================
// Point transforms
// ============================================================================

/// Multiplies every axis by one factor. Used between fractal layers.
class UniformScale {
public:
    explicit UniformScale(double scale = 1.0) : scale_(scale) {}

    [[nodiscard]] UniformScale withScale(double scale) const { return UniformScale(scale); }
    [[nodiscard]] double scale() const { return scale_; }

    template<typename P>
    [[nodiscard]] P apply(const P& point) const { return point * scale_; }

private:
    double scale_;
};

// ============================================================================
// Transformed
// ============================================================================

/// Applies a point transform (any type with `P apply(const P&) const`) before
/// delegating to a source held by value. Reseeding forwards to the source.
template<typename P, typename Source, typename Transform = UniformScale>
class Transformed : public NoiseSource<P> {
public:
    Transformed() = default;

    Transformed(Source source, Transform transform)
        : source_(std::move(source)), transform_(std::move(transform)) {}

    [[nodiscard]] Transformed withSource(Source source) const { return Transformed(std::move(source), transform_); }
    [[nodiscard]] Transformed withTransform(Transform transform) const { return Transformed(source_, std::move(transform)); }

    [[nodiscard]] Transformed withSeed(uint32_t seed) const { return Transformed(source_.withSeed(seed), transform_); }
    [[nodiscard]] uint32_t seed() const { return source_.seed(); }

    [[nodiscard]] const Source& source() const { return source_; }
    [[nodiscard]] const Transform& transform() const { return transform_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        return source_.evaluate(transform_.apply(point));
    }

private:
    Source source_;
    Transform transform_;
};

template<typename P, typename Source, typename Transform>
[[nodiscard]] Transformed<P, Source, Transform> transformed(Source source, Transform transform) {
    return Transformed<P, Source, Transform>(std::move(source), std::move(transform));
}

/// Sample `source` at the point multiplied by `scale`
template<typename P, typename Source>
[[nodiscard]] Transformed<P, Source> scaled(Source source, double scale) {
    return Transformed<P, Source>(std::move(source), UniformScale(scale));
}

// ============================================================================
// ScalePoint
// ============================================================================

template<typename P>
class ScalePoint : public NoiseSource<P> {
public:
    explicit ScalePoint(SourcePtr<P> source)
        : source_(detail::requireSource(std::move(source), "ScalePoint")) {}

    /// Same factor on every axis
    [[nodiscard]] ScalePoint withScale(double scale) const {
        return withScales(scale, scale, scale, scale);
    }

    [[nodiscard]] ScalePoint withScales(double x, double y, double z, double u) const {
        ScalePoint copy = *this;
        copy.scale_ = Point4(x, y, z, u);
        return copy;
    }

    [[nodiscard]] ScalePoint withXScale(double x) const { return withAxis(0, x); }
    [[nodiscard]] ScalePoint withYScale(double y) const { return withAxis(1, y); }
    [[nodiscard]] ScalePoint withZScale(double z) const { return withAxis(2, z); }
    [[nodiscard]] ScalePoint withUScale(double u) const { return withAxis(3, u); }

    [[nodiscard]] const Point4& scales() const { return scale_; }
    [[nodiscard]] const SourcePtr<P>& source() const { return source_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        P scaled = point;
        for (glm::length_t i = 0; i < pointArity<P>; ++i) {
            scaled[i] *= scale_[i];
        }
        return source_->evaluate(scaled);
    }

private:
    SourcePtr<P> source_;
    Point4 scale_{1.0};

    [[nodiscard]] ScalePoint withAxis(glm::length_t axis, double value) const {
        ScalePoint copy = *this;
        copy.scale_[axis] = value;
        return copy;
    }
};

// ============================================================================
// TranslatePoint
// ============================================================================

template<typename P>
class TranslatePoint : public NoiseSource<P> {
public:
    explicit TranslatePoint(SourcePtr<P> source)
        : source_(detail::requireSource(std::move(source), "TranslatePoint")) {}

    /// Same offset on every axis
    [[nodiscard]] TranslatePoint withTranslation(double offset) const {
        return withTranslations(offset, offset, offset, offset);
    }

    [[nodiscard]] TranslatePoint withTranslations(double x, double y, double z, double u) const {
        TranslatePoint copy = *this;
        copy.offset_ = Point4(x, y, z, u);
        return copy;
    }

    [[nodiscard]] TranslatePoint withXTranslation(double x) const { return withAxis(0, x); }
    [[nodiscard]] TranslatePoint withYTranslation(double y) const { return withAxis(1, y); }
    [[nodiscard]] TranslatePoint withZTranslation(double z) const { return withAxis(2, z); }
    [[nodiscard]] TranslatePoint withUTranslation(double u) const { return withAxis(3, u); }

    [[nodiscard]] const Point4& translations() const { return offset_; }
    [[nodiscard]] const SourcePtr<P>& source() const { return source_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        P moved = point;
        for (glm::length_t i = 0; i < pointArity<P>; ++i) {
            moved[i] += offset_[i];
        }
        return source_->evaluate(moved);
    }

private:
    SourcePtr<P> source_;
    Point4 offset_{0.0};

    [[nodiscard]] TranslatePoint withAxis(glm::length_t axis, double value) const {
        TranslatePoint copy = *this;
        copy.offset_[axis] = value;
        return copy;
    }
};

// ============================================================================
// RotatePoint
// ============================================================================

/// Rotates the (x, y, z) part of the point by angles (in degrees) around the
/// x, y and z axes. 2D points rotate as (x, y, 0); the u axis passes through.
template<typename P>
class RotatePoint : public NoiseSource<P> {
public:
    explicit RotatePoint(SourcePtr<P> source)
        : source_(detail::requireSource(std::move(source), "RotatePoint")),
          rotation_(1.0) {}

    [[nodiscard]] RotatePoint withAngles(double x, double y, double z) const {
        RotatePoint copy = *this;
        copy.angles_ = Point3(x, y, z);
        copy.rotation_ = buildRotation(copy.angles_);
        return copy;
    }

    [[nodiscard]] RotatePoint withXAngle(double x) const { return withAngles(x, angles_.y, angles_.z); }
    [[nodiscard]] RotatePoint withYAngle(double y) const { return withAngles(angles_.x, y, angles_.z); }
    [[nodiscard]] RotatePoint withZAngle(double z) const { return withAngles(angles_.x, angles_.y, z); }

    [[nodiscard]] const Point3& angles() const { return angles_; }
    [[nodiscard]] const SourcePtr<P>& source() const { return source_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        Point3 v(point[0], point[1], 0.0);
        if constexpr (pointArity<P> >= 3) {
            v.z = point[2];
        }

        const Point3 r = rotation_ * v;

        P rotated = point;
        rotated[0] = r.x;
        rotated[1] = r.y;
        if constexpr (pointArity<P> >= 3) {
            rotated[2] = r.z;
        }
        return source_->evaluate(rotated);
    }

private:
    SourcePtr<P> source_;
    Point3 angles_{0.0};
    glm::dmat3 rotation_;

    static glm::dmat3 buildRotation(const Point3& degrees) {
        const Point3 rad = glm::radians(degrees);
        double xc = std::cos(rad.x), xs = std::sin(rad.x);
        double yc = std::cos(rad.y), ys = std::sin(rad.y);
        double zc = std::cos(rad.z), zs = std::sin(rad.z);

        // Columns: images of the x, y and z unit vectors
        return glm::dmat3(
            Point3(ys * xs * zs + yc * zc, ys * xs * zc - yc * zs, -ys * xc),
            Point3(xc * zs, xc * zc, xs),
            Point3(ys * zc - yc * xs * zs, -yc * xs * zc - ys * zs, yc * xc));
    }
};

// ============================================================================
// Displace
// ============================================================================

/// Offsets each axis of the point by the value of its own displacement
/// source, sampled at the original point
template<typename P>
class Displace : public NoiseSource<P> {
public:
    static constexpr size_t AXES = static_cast<size_t>(pointArity<P>);

    Displace(SourcePtr<P> source, std::array<SourcePtr<P>, AXES> displacements)
        : source_(detail::requireSource(std::move(source), "Displace")) {
        for (size_t i = 0; i < AXES; ++i) {
            displacements_[i] = detail::requireSource(std::move(displacements[i]), "Displace");
        }
    }

    [[nodiscard]] const SourcePtr<P>& displacement(size_t axis) const { return displacements_[axis]; }
    [[nodiscard]] const SourcePtr<P>& source() const { return source_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        P displaced = point;
        for (size_t i = 0; i < AXES; ++i) {
            displaced[static_cast<glm::length_t>(i)] += displacements_[i]->evaluate(point);
        }
        return source_->evaluate(displaced);
    }

private:
    SourcePtr<P> source_;
    std::array<SourcePtr<P>, AXES> displacements_;
};

}  // namespace finenoise

/**
 * @file modifiers.hpp
 * @brief Unary nodes reshaping one source's output: Abs, Negate, Clamp,
 *        Exponent, ScaleBias
 */

#pragma once

#include "finenoise/noise.hpp"

#include <cmath>

namespace finenoise {

// ============================================================================
// Abs / Negate
// ============================================================================

/// Absolute value of the source
template<typename P>
class Abs : public NoiseSource<P> {
public:
    explicit Abs(SourcePtr<P> source)
        : source_(detail::requireSource(std::move(source), "Abs")) {}

    [[nodiscard]] const SourcePtr<P>& source() const { return source_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        return std::abs(source_->evaluate(point));
    }

private:
    SourcePtr<P> source_;
};

template<typename P>
class Negate : public NoiseSource<P> {
public:
    explicit Negate(SourcePtr<P> source)
        : source_(detail::requireSource(std::move(source), "Negate")) {}

    [[nodiscard]] const SourcePtr<P>& source() const { return source_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        return -source_->evaluate(point);
    }

private:
    SourcePtr<P> source_;
};

// ============================================================================
// Clamp
// ============================================================================

/// Clamp the source output to [lower, upper].
/// Inverted bounds are accepted; every output is then one of the two bounds.
template<typename P>
class Clamp : public NoiseSource<P> {
public:
    static constexpr double DEFAULT_LOWER_BOUND = -1.0;
    static constexpr double DEFAULT_UPPER_BOUND = 1.0;

    explicit Clamp(SourcePtr<P> source)
        : source_(detail::requireSource(std::move(source), "Clamp")) {}

    [[nodiscard]] Clamp withBounds(double lower, double upper) const {
        Clamp copy = *this;
        copy.lower_ = lower;
        copy.upper_ = upper;
        return copy;
    }

    [[nodiscard]] Clamp withLowerBound(double lower) const { return withBounds(lower, upper_); }
    [[nodiscard]] Clamp withUpperBound(double upper) const { return withBounds(lower_, upper); }

    [[nodiscard]] double lowerBound() const { return lower_; }
    [[nodiscard]] double upperBound() const { return upper_; }
    [[nodiscard]] const SourcePtr<P>& source() const { return source_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        // Not std::clamp: that is undefined for lower > upper
        double value = source_->evaluate(point);
        if (value < lower_) return lower_;
        if (value > upper_) return upper_;
        return value;
    }

private:
    SourcePtr<P> source_;
    double lower_ = DEFAULT_LOWER_BOUND;
    double upper_ = DEFAULT_UPPER_BOUND;
};

// ============================================================================
// Exponent
// ============================================================================

/// Remap the output to [0, 1], raise it to an exponent, remap back to [-1, 1]
template<typename P>
class Exponent : public NoiseSource<P> {
public:
    static constexpr double DEFAULT_EXPONENT = 1.0;

    explicit Exponent(SourcePtr<P> source)
        : source_(detail::requireSource(std::move(source), "Exponent")) {}

    [[nodiscard]] Exponent withExponent(double exponent) const {
        Exponent copy = *this;
        copy.exponent_ = exponent;
        return copy;
    }

    [[nodiscard]] double exponent() const { return exponent_; }
    [[nodiscard]] const SourcePtr<P>& source() const { return source_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        double value = (source_->evaluate(point) + 1.0) / 2.0;
        return std::pow(std::abs(value), exponent_) * 2.0 - 1.0;
    }

private:
    SourcePtr<P> source_;
    double exponent_ = DEFAULT_EXPONENT;
};

// ============================================================================
// ScaleBias
// ============================================================================

/// Affine output transform: value * scale + bias
template<typename P>
class ScaleBias : public NoiseSource<P> {
public:
    static constexpr double DEFAULT_SCALE = 1.0;
    static constexpr double DEFAULT_BIAS = 0.0;

    explicit ScaleBias(SourcePtr<P> source)
        : source_(detail::requireSource(std::move(source), "ScaleBias")) {}

    [[nodiscard]] ScaleBias withScale(double scale) const {
        ScaleBias copy = *this;
        copy.scale_ = scale;
        return copy;
    }

    [[nodiscard]] ScaleBias withBias(double bias) const {
        ScaleBias copy = *this;
        copy.bias_ = bias;
        return copy;
    }

    [[nodiscard]] double scale() const { return scale_; }
    [[nodiscard]] double bias() const { return bias_; }
    [[nodiscard]] const SourcePtr<P>& source() const { return source_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        return source_->evaluate(point) * scale_ + bias_;
    }

private:
    SourcePtr<P> source_;
    double scale_ = DEFAULT_SCALE;
    double bias_ = DEFAULT_BIAS;
};

}  // namespace finenoise

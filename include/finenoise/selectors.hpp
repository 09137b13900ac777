/**
 * @file selectors.hpp
 * @brief Nodes choosing between two sources using a control source
 */

#pragma once

#include "finenoise/noise.hpp"

namespace finenoise {

namespace detail {

/// Cubic s-curve t^2 (3 - 2t)
inline double cubicEase(double t) {
    return t * t * (3.0 - 2.0 * t);
}

}  // namespace detail

// ============================================================================
// Blend
// ============================================================================

/// Linear interpolation from source1 to source2, weighted by the control value.
/// The weight is not clamped; control values outside [0, 1] extrapolate.
template<typename P>
class Blend : public NoiseSource<P> {
public:
    Blend(SourcePtr<P> source1, SourcePtr<P> source2, SourcePtr<P> control)
        : source1_(detail::requireSource(std::move(source1), "Blend")),
          source2_(detail::requireSource(std::move(source2), "Blend")),
          control_(detail::requireSource(std::move(control), "Blend")) {}

    [[nodiscard]] const SourcePtr<P>& source1() const { return source1_; }
    [[nodiscard]] const SourcePtr<P>& source2() const { return source2_; }
    [[nodiscard]] const SourcePtr<P>& control() const { return control_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        double a = source1_->evaluate(point);
        double b = source2_->evaluate(point);
        double t = control_->evaluate(point);
        return a + t * (b - a);
    }

private:
    SourcePtr<P> source1_;
    SourcePtr<P> source2_;
    SourcePtr<P> control_;
};

// ============================================================================
// Select
// ============================================================================

/// Outputs source2 where the control value lies within [lower, upper] and
/// source1 elsewhere. A non-zero falloff eases between them over
/// [bound - falloff, bound + falloff] around each bound.
template<typename P>
class Select : public NoiseSource<P> {
public:
    static constexpr double DEFAULT_LOWER_BOUND = 0.0;
    static constexpr double DEFAULT_UPPER_BOUND = 1.0;
    static constexpr double DEFAULT_FALLOFF = 0.0;

    Select(SourcePtr<P> source1, SourcePtr<P> source2, SourcePtr<P> control)
        : source1_(detail::requireSource(std::move(source1), "Select")),
          source2_(detail::requireSource(std::move(source2), "Select")),
          control_(detail::requireSource(std::move(control), "Select")) {}

    [[nodiscard]] const SourcePtr<P>& source1() const { return source1_; }
    [[nodiscard]] const SourcePtr<P>& source2() const { return source2_; }
    [[nodiscard]] const SourcePtr<P>& control() const { return control_; }

    [[nodiscard]] Select withBounds(double lower, double upper) const {
        Select copy = *this;
        copy.lower_ = lower;
        copy.upper_ = upper;
        return copy;
    }

    [[nodiscard]] Select withFalloff(double falloff) const {
        Select copy = *this;
        copy.falloff_ = falloff;
        return copy;
    }

    [[nodiscard]] double lowerBound() const { return lower_; }
    [[nodiscard]] double upperBound() const { return upper_; }
    [[nodiscard]] double falloff() const { return falloff_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        double control = control_->evaluate(point);

        if (falloff_ <= 0.0) {
            if (control < lower_ || control > upper_) {
                return source1_->evaluate(point);
            }
            return source2_->evaluate(point);
        }

        if (control < lower_ - falloff_) {
            return source1_->evaluate(point);
        }
        if (control < lower_ + falloff_) {
            double t = detail::cubicEase((control - (lower_ - falloff_)) / (2.0 * falloff_));
            double a = source1_->evaluate(point);
            return a + t * (source2_->evaluate(point) - a);
        }
        if (control < upper_ - falloff_) {
            return source2_->evaluate(point);
        }
        if (control < upper_ + falloff_) {
            double t = detail::cubicEase((control - (upper_ - falloff_)) / (2.0 * falloff_));
            double b = source2_->evaluate(point);
            return b + t * (source1_->evaluate(point) - b);
        }
        return source1_->evaluate(point);
    }

private:
    SourcePtr<P> source1_;
    SourcePtr<P> source2_;
    SourcePtr<P> control_;
    double lower_ = DEFAULT_LOWER_BOUND;
    double upper_ = DEFAULT_UPPER_BOUND;
    double falloff_ = DEFAULT_FALLOFF;
};

}  // namespace finenoise

/**
 * @file combiner.hpp
 * @brief Binary node merging two sources with an arithmetic operation
 *
 * Both children are evaluated at the identical point:
 *
 *   auto a = share<Point2>(Perlin(1));
 *   auto b = share<Point2>(Worley(2));
 *   Combiner<Point2> sum(CombineOp::Add, a, b);
 */

#pragma once

#include "finenoise/noise.hpp"

#include <cmath>

namespace finenoise {

/// Operation applied by Combiner
enum class CombineOp {
    Add,       ///< a + b
    Multiply,  ///< a * b
    Power,     ///< a ^ b
    Min,       ///< min(a, b)
    Max,       ///< max(a, b)
};

template<typename P>
class Combiner : public NoiseSource<P> {
public:
    Combiner(CombineOp op, SourcePtr<P> source1, SourcePtr<P> source2)
        : op_(op),
          source1_(detail::requireSource(std::move(source1), "Combiner")),
          source2_(detail::requireSource(std::move(source2), "Combiner")) {}

    [[nodiscard]] Combiner withOp(CombineOp op) const {
        Combiner copy = *this;
        copy.op_ = op;
        return copy;
    }

    [[nodiscard]] CombineOp op() const { return op_; }
    [[nodiscard]] const SourcePtr<P>& source1() const { return source1_; }
    [[nodiscard]] const SourcePtr<P>& source2() const { return source2_; }

    [[nodiscard]] double evaluate(const P& point) const override {
        double a = source1_->evaluate(point);
        double b = source2_->evaluate(point);

        switch (op_) {
            case CombineOp::Add:      return a + b;
            case CombineOp::Multiply: return a * b;
            case CombineOp::Power:    return std::pow(a, b);
            case CombineOp::Min:      return a < b ? a : b;
            case CombineOp::Max:      return a > b ? a : b;
        }
        return a + b;
    }

private:
    CombineOp op_;
    SourcePtr<P> source1_;
    SourcePtr<P> source2_;
};

}  // namespace finenoise

/**
 * @file test_composition.cpp
 * @brief Unit tests for combiners, modifiers and selectors
 */

#include "finenoise/combiner.hpp"
#include "finenoise/generators.hpp"
#include "finenoise/modifiers.hpp"
#include "finenoise/selectors.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace finenoise;

namespace {

SourcePtr<Point2> constant(double v) {
    return share<Point2>(Constant(v));
}

const std::vector<Point2>& samplePoints() {
    static const std::vector<Point2> points = {
        {0.1, 0.2}, {-3.7, 5.25}, {12.5, -0.75}, {0.5, 0.5}, {100.3, 42.9},
    };
    return points;
}

}  // namespace

// ============================================================================
// Combiner
// ============================================================================

TEST(CombinerTest, Operations) {
    auto a = constant(2.0);
    auto b = constant(3.0);
    Point2 p(0.0, 0.0);

    EXPECT_DOUBLE_EQ(Combiner<Point2>(CombineOp::Add, a, b).evaluate(p), 5.0);
    EXPECT_DOUBLE_EQ(Combiner<Point2>(CombineOp::Multiply, a, b).evaluate(p), 6.0);
    EXPECT_DOUBLE_EQ(Combiner<Point2>(CombineOp::Power, a, b).evaluate(p), 8.0);
    EXPECT_DOUBLE_EQ(Combiner<Point2>(CombineOp::Min, a, b).evaluate(p), 2.0);
    EXPECT_DOUBLE_EQ(Combiner<Point2>(CombineOp::Max, a, b).evaluate(p), 3.0);
}

TEST(CombinerTest, Identities) {
    auto perlin = share<Point2>(Perlin(3));
    Combiner<Point2> plusZero(CombineOp::Add, perlin, constant(0.0));
    Combiner<Point2> timesOne(CombineOp::Multiply, perlin, constant(1.0));
    Combiner<Point2> minSelf(CombineOp::Min, perlin, perlin);
    Combiner<Point2> maxSelf(CombineOp::Max, perlin, perlin);

    for (const Point2& p : samplePoints()) {
        double v = perlin->evaluate(p);
        EXPECT_DOUBLE_EQ(plusZero.evaluate(p), v);
        EXPECT_DOUBLE_EQ(timesOne.evaluate(p), v);
        EXPECT_DOUBLE_EQ(minSelf.evaluate(p), v);
        EXPECT_DOUBLE_EQ(maxSelf.evaluate(p), v);
    }
}

TEST(CombinerTest, MinMaxPointwise) {
    auto first = share<Point2>(Perlin(1));
    auto second = share<Point2>(Perlin(2));
    Combiner<Point2> lower(CombineOp::Min, first, second);
    Combiner<Point2> upper(CombineOp::Max, first, second);

    int differing = 0;
    for (double x = -4.0; x < 4.0; x += 0.37) {
        for (double y = -4.0; y < 4.0; y += 0.53) {
            Point2 p(x, y);
            double a = first->evaluate(p);
            double b = second->evaluate(p);
            EXPECT_DOUBLE_EQ(lower.evaluate(p), std::min(a, b));
            EXPECT_DOUBLE_EQ(upper.evaluate(p), std::max(a, b));
            EXPECT_DOUBLE_EQ(lower.evaluate(p) + upper.evaluate(p), a + b);
            if (a != b) ++differing;
        }
    }
    EXPECT_GT(differing, 0);
}

TEST(CombinerTest, WithOpKeepsChildren) {
    Combiner<Point2> add(CombineOp::Add, constant(4.0), constant(2.0));
    Combiner<Point2> mul = add.withOp(CombineOp::Multiply);
    EXPECT_EQ(add.op(), CombineOp::Add);
    EXPECT_EQ(mul.source1(), add.source1());
    EXPECT_DOUBLE_EQ(mul.evaluate(Point2(0.0, 0.0)), 8.0);
}

TEST(CombinerTest, NullChildThrows) {
    EXPECT_THROW(Combiner<Point2>(CombineOp::Add, nullptr, constant(1.0)), std::invalid_argument);
}

TEST(CombinerTest, NestedSharedSubtree) {
    auto shared = share<Point3>(Perlin(8));
    auto sum = share<Point3>(Combiner<Point3>(CombineOp::Add, shared, shared));
    Combiner<Point3> doubled(CombineOp::Multiply, sum, share<Point3>(Constant(0.5)));

    Point3 p(0.3, 0.6, 0.9);
    EXPECT_DOUBLE_EQ(doubled.evaluate(p), (shared->evaluate(p) + shared->evaluate(p)) * 0.5);
}

// ============================================================================
// Modifiers
// ============================================================================

TEST(ModifierTest, AbsAndNegate) {
    Point2 p(1.0, 1.0);
    EXPECT_DOUBLE_EQ(Abs<Point2>(constant(-0.25)).evaluate(p), 0.25);
    EXPECT_DOUBLE_EQ(Negate<Point2>(constant(0.75)).evaluate(p), -0.75);
}

TEST(ModifierTest, ScaleBiasAffineLaw) {
    ScaleBias<Point2> sb = ScaleBias<Point2>(constant(1.0)).withScale(2.0).withBias(0.5);
    for (const Point2& p : samplePoints()) {
        EXPECT_DOUBLE_EQ(sb.evaluate(p), 2.5);
    }
}

TEST(ModifierTest, ScaleBiasDefaultsAreIdentity) {
    auto perlin = share<Point2>(Perlin(1));
    ScaleBias<Point2> sb(perlin);
    for (const Point2& p : samplePoints()) {
        EXPECT_DOUBLE_EQ(sb.evaluate(p), perlin->evaluate(p));
    }
}

TEST(ModifierTest, ClampSaturates) {
    Clamp<Point2> clamp = Clamp<Point2>(constant(5.0)).withBounds(-1.0, 1.0);
    EXPECT_DOUBLE_EQ(clamp.evaluate(Point2(0.0, 0.0)), 1.0);

    Clamp<Point2> low = Clamp<Point2>(constant(-5.0));
    EXPECT_DOUBLE_EQ(low.evaluate(Point2(0.0, 0.0)), -1.0);
}

TEST(ModifierTest, ClampIdempotent) {
    auto loud = share<Point2>(ScaleBias<Point2>(share<Point2>(Perlin(6))).withScale(4.0));
    auto once = share<Point2>(Clamp<Point2>(loud).withBounds(-0.5, 0.5));
    Clamp<Point2> twice = Clamp<Point2>(once).withBounds(-0.5, 0.5);

    for (const Point2& p : samplePoints()) {
        EXPECT_DOUBLE_EQ(twice.evaluate(p), once->evaluate(p));
    }
}

TEST(ModifierTest, ClampInvertedBoundsYieldsABound) {
    Point2 p(0.0, 0.0);
    auto inverted = [&](double value) {
        return Clamp<Point2>(constant(value)).withLowerBound(1.0).withUpperBound(-1.0).evaluate(p);
    };
    EXPECT_DOUBLE_EQ(inverted(0.0), 1.0);
    EXPECT_DOUBLE_EQ(inverted(5.0), -1.0);
    EXPECT_DOUBLE_EQ(inverted(-5.0), 1.0);
}

TEST(ModifierTest, Exponent) {
    Point2 p(0.0, 0.0);
    EXPECT_DOUBLE_EQ(Exponent<Point2>(constant(0.0)).withExponent(2.0).evaluate(p), -0.5);
    EXPECT_DOUBLE_EQ(Exponent<Point2>(constant(1.0)).withExponent(3.0).evaluate(p), 1.0);
    EXPECT_DOUBLE_EQ(Exponent<Point2>(constant(-1.0)).withExponent(3.0).evaluate(p), -1.0);
    EXPECT_NEAR(Exponent<Point2>(constant(0.3)).evaluate(p), 0.3, 1e-12);
}

// ============================================================================
// Selectors
// ============================================================================

TEST(BlendTest, InterpolatesAndExtrapolates) {
    Point2 p(0.0, 0.0);
    auto a = constant(-1.0);
    auto b = constant(1.0);
    EXPECT_DOUBLE_EQ(Blend<Point2>(a, b, constant(0.0)).evaluate(p), -1.0);
    EXPECT_DOUBLE_EQ(Blend<Point2>(a, b, constant(0.5)).evaluate(p), 0.0);
    EXPECT_DOUBLE_EQ(Blend<Point2>(a, b, constant(1.0)).evaluate(p), 1.0);
    EXPECT_DOUBLE_EQ(Blend<Point2>(a, b, constant(2.0)).evaluate(p), 3.0);
}

TEST(BlendTest, ExposesChildren) {
    auto a = constant(-1.0);
    auto b = constant(1.0);
    auto control = constant(0.25);
    Blend<Point2> blend(a, b, control);
    EXPECT_EQ(blend.source1(), a);
    EXPECT_EQ(blend.source2(), b);
    EXPECT_EQ(blend.control(), control);

    Select<Point2> select(a, b, control);
    EXPECT_EQ(select.source1(), a);
    EXPECT_EQ(select.source2(), b);
    EXPECT_EQ(select.control(), control);
}

TEST(SelectTest, HardSwitch) {
    Point2 p(0.0, 0.0);
    auto select = [&](double control) {
        return Select<Point2>(constant(-1.0), constant(1.0), constant(control)).evaluate(p);
    };
    EXPECT_DOUBLE_EQ(select(-0.5), -1.0);
    EXPECT_DOUBLE_EQ(select(0.0), 1.0);
    EXPECT_DOUBLE_EQ(select(0.5), 1.0);
    EXPECT_DOUBLE_EQ(select(1.0), 1.0);
    EXPECT_DOUBLE_EQ(select(1.5), -1.0);
}

TEST(SelectTest, CustomBounds) {
    Point2 p(0.0, 0.0);
    Select<Point2> select = Select<Point2>(constant(10.0), constant(20.0), constant(-0.75))
                                .withBounds(-1.0, -0.5);
    EXPECT_DOUBLE_EQ(select.evaluate(p), 20.0);
    EXPECT_DOUBLE_EQ(select.lowerBound(), -1.0);
    EXPECT_DOUBLE_EQ(select.upperBound(), -0.5);
}

TEST(SelectTest, FalloffEasesAcrossBounds) {
    Point2 p(0.0, 0.0);
    auto select = [&](double control) {
        return Select<Point2>(constant(-1.0), constant(1.0), constant(control))
            .withBounds(0.0, 1.0)
            .withFalloff(0.25)
            .evaluate(p);
    };
    EXPECT_DOUBLE_EQ(select(-0.5), -1.0);
    EXPECT_DOUBLE_EQ(select(-0.25), -1.0);
    EXPECT_DOUBLE_EQ(select(0.0), 0.0);
    EXPECT_DOUBLE_EQ(select(0.5), 1.0);
    EXPECT_DOUBLE_EQ(select(1.0), 0.0);
    EXPECT_DOUBLE_EQ(select(1.5), -1.0);

    // Monotonic through the lower transition
    EXPECT_LT(select(-0.1), select(0.1));
}

TEST(SelectTest, NullControlThrows) {
    EXPECT_THROW(Select<Point2>(constant(0.0), constant(1.0), nullptr), std::invalid_argument);
}

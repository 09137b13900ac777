/**
 * @file test_transformers.cpp
 * @brief Unit tests for point transformers and turbulence
 */

#include "finenoise/generators.hpp"
#include "finenoise/transformers.hpp"
#include "finenoise/turbulence.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace finenoise;

namespace {

/// Reports one coordinate of the point it receives
template<typename P>
class AxisReader : public NoiseSource<P> {
public:
    explicit AxisReader(glm::length_t axis) : axis_(axis) {}

    [[nodiscard]] double evaluate(const P& point) const override { return point[axis_]; }

private:
    glm::length_t axis_;
};

template<typename P>
SourcePtr<P> axisSource(glm::length_t axis) {
    return std::make_shared<const AxisReader<P>>(axis);
}

}  // namespace

// ============================================================================
// ScalePoint / TranslatePoint
// ============================================================================

TEST(ScalePointTest, UniformScale) {
    auto perlin = share<Point3>(Perlin(4));
    ScalePoint<Point3> scaled = ScalePoint<Point3>(perlin).withScale(2.0);

    Point3 p(0.3, -1.2, 4.4);
    EXPECT_DOUBLE_EQ(scaled.evaluate(p), perlin->evaluate(p * 2.0));
}

TEST(ScalePointTest, PerAxis) {
    ScalePoint<Point2> x = ScalePoint<Point2>(axisSource<Point2>(0)).withXScale(3.0);
    ScalePoint<Point2> y = ScalePoint<Point2>(axisSource<Point2>(1)).withXScale(3.0);
    EXPECT_DOUBLE_EQ(x.evaluate(Point2(2.0, 5.0)), 6.0);
    EXPECT_DOUBLE_EQ(y.evaluate(Point2(2.0, 5.0)), 5.0);

    ScalePoint<Point4> u = ScalePoint<Point4>(axisSource<Point4>(3)).withScales(1.0, 1.0, 1.0, -2.0);
    EXPECT_DOUBLE_EQ(u.evaluate(Point4(1.0, 1.0, 1.0, 4.0)), -8.0);
}

TEST(TranslatePointTest, Offsets) {
    TranslatePoint<Point3> moved = TranslatePoint<Point3>(axisSource<Point3>(2)).withZTranslation(0.5);
    EXPECT_DOUBLE_EQ(moved.evaluate(Point3(0.0, 0.0, 1.0)), 1.5);

    auto perlin = share<Point2>(Perlin(2));
    TranslatePoint<Point2> all = TranslatePoint<Point2>(perlin).withTranslation(0.25);
    Point2 p(1.0, 2.0);
    EXPECT_DOUBLE_EQ(all.evaluate(p), perlin->evaluate(p + 0.25));
}

// ============================================================================
// RotatePoint
// ============================================================================

TEST(RotatePointTest, ZeroAnglesIdentity) {
    RotatePoint<Point3> rotated = RotatePoint<Point3>(axisSource<Point3>(1)).withAngles(0.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(rotated.evaluate(Point3(1.0, 2.0, 3.0)), 2.0);
}

TEST(RotatePointTest, QuarterTurnAroundZ) {
    auto x = RotatePoint<Point3>(axisSource<Point3>(0)).withZAngle(90.0);
    auto y = RotatePoint<Point3>(axisSource<Point3>(1)).withZAngle(90.0);
    auto z = RotatePoint<Point3>(axisSource<Point3>(2)).withZAngle(90.0);

    Point3 p(1.0, 0.0, 0.5);
    EXPECT_NEAR(x.evaluate(p), 0.0, 1e-12);
    EXPECT_NEAR(y.evaluate(p), -1.0, 1e-12);
    EXPECT_NEAR(z.evaluate(p), 0.5, 1e-12);
}

TEST(RotatePointTest, PreservesLength) {
    std::vector<SourcePtr<Point3>> axes = {axisSource<Point3>(0), axisSource<Point3>(1), axisSource<Point3>(2)};
    Point3 p(0.3, -2.0, 1.7);
    Point3 r;
    for (glm::length_t i = 0; i < 3; ++i) {
        r[i] = RotatePoint<Point3>(axes[static_cast<size_t>(i)]).withAngles(30.0, 45.0, 60.0).evaluate(p);
    }
    EXPECT_NEAR(glm::length(r), glm::length(p), 1e-12);
}

TEST(RotatePointTest, TwoDimensionalRotatesInPlane) {
    auto y = RotatePoint<Point2>(axisSource<Point2>(1)).withZAngle(90.0);
    EXPECT_NEAR(y.evaluate(Point2(1.0, 0.0)), -1.0, 1e-12);
}

TEST(RotatePointTest, FourthAxisPassesThrough) {
    auto u = RotatePoint<Point4>(axisSource<Point4>(3)).withAngles(10.0, 20.0, 30.0);
    EXPECT_DOUBLE_EQ(u.evaluate(Point4(1.0, 2.0, 3.0, 7.0)), 7.0);
    EXPECT_DOUBLE_EQ(u.angles().y, 20.0);
}

// ============================================================================
// Transformed
// ============================================================================

namespace {

/// Shifts every axis by a fixed amount
struct Shift {
    double amount = 0.0;

    template<typename P>
    P apply(const P& point) const { return point + amount; }
};

}  // namespace

TEST(TransformedTest, ScaledSamplesScaledPoint) {
    auto noise = scaled<Point3>(Perlin(12), 2.5);
    Point3 p(0.3, -1.1, 0.8);
    EXPECT_DOUBLE_EQ(noise.evaluate(p), Perlin(12).evaluate(p * 2.5));
    EXPECT_DOUBLE_EQ(noise.transform().scale(), 2.5);
}

TEST(TransformedTest, CustomTransform) {
    auto noise = transformed<Point2>(OpenSimplex(4), Shift{0.75});
    Point2 p(1.2, 3.4);
    EXPECT_DOUBLE_EQ(noise.evaluate(p), OpenSimplex(4).evaluate(p + 0.75));
}

TEST(TransformedTest, WithSeedForwardsToSource) {
    auto noise = scaled<Point2>(Perlin(1), 3.0).withSeed(99);
    EXPECT_EQ(noise.seed(), 99u);
    EXPECT_EQ(noise.source().seed(), 99u);
    EXPECT_DOUBLE_EQ(noise.transform().scale(), 3.0);

    Point2 p(0.4, 0.9);
    EXPECT_DOUBLE_EQ(noise.evaluate(p), Perlin(99).evaluate(p * 3.0));
}

TEST(TransformedTest, UsableAsSharedSource) {
    SourcePtr<Point2> noise = share<Point2>(scaled<Point2>(Value(2), 0.5));
    EXPECT_DOUBLE_EQ(noise->evaluate(Point2(3.0, 1.0)), Value(2).evaluate(Point2(1.5, 0.5)));
}

// ============================================================================
// Displace
// ============================================================================

TEST(DisplaceTest, OffsetsEachAxis) {
    std::array<SourcePtr<Point2>, 2> offsets = {share<Point2>(Constant(1.0)), share<Point2>(Constant(2.0))};
    Displace<Point2> x(axisSource<Point2>(0), offsets);
    Displace<Point2> y(axisSource<Point2>(1), offsets);

    EXPECT_DOUBLE_EQ(x.evaluate(Point2(0.5, 0.5)), 1.5);
    EXPECT_DOUBLE_EQ(y.evaluate(Point2(0.5, 0.5)), 2.5);
}

TEST(DisplaceTest, NullDisplacementThrows) {
    std::array<SourcePtr<Point2>, 2> offsets = {share<Point2>(Constant(1.0)), nullptr};
    EXPECT_THROW((void)Displace<Point2>(axisSource<Point2>(0), offsets), std::invalid_argument);
}

// ============================================================================
// Turbulence
// ============================================================================

TEST(TurbulenceTest, ZeroPowerIsIdentity) {
    auto perlin2 = share<Point2>(Perlin(10));
    auto perlin3 = share<Point3>(Perlin(10));
    auto perlin4 = share<Point4>(Perlin(10));
    Turbulence<Point2> t2 = Turbulence<Point2>(perlin2).withPower(0.0);
    Turbulence<Point3> t3 = Turbulence<Point3>(perlin3).withPower(0.0);
    Turbulence<Point4> t4 = Turbulence<Point4>(perlin4).withPower(0.0);

    for (double x = -3.0; x < 3.0; x += 0.77) {
        EXPECT_DOUBLE_EQ(t2.evaluate(Point2(x, 0.3)), perlin2->evaluate(Point2(x, 0.3)));
        EXPECT_DOUBLE_EQ(t3.evaluate(Point3(x, 0.3, -x)), perlin3->evaluate(Point3(x, 0.3, -x)));
        EXPECT_DOUBLE_EQ(t4.evaluate(Point4(x, 0.3, -x, 1.1)), perlin4->evaluate(Point4(x, 0.3, -x, 1.1)));
    }
}

TEST(TurbulenceTest, DisplacesPoint) {
    Turbulence<Point2> turbulence = Turbulence<Point2>(axisSource<Point2>(0)).withPower(0.5);
    int moved = 0;
    for (double x = 0.1; x < 5.0; x += 0.5) {
        if (turbulence.evaluate(Point2(x, 0.7)) != x) ++moved;
    }
    EXPECT_GT(moved, 0);
}

TEST(TurbulenceTest, Deterministic) {
    auto perlin = share<Point3>(Perlin(1));
    Turbulence<Point3> a = Turbulence<Point3>(perlin).withSeed(5);
    Turbulence<Point3> b = Turbulence<Point3>(perlin).withSeed(5);
    Point3 p(0.4, 1.9, -0.2);
    EXPECT_DOUBLE_EQ(a.evaluate(p), b.evaluate(p));
}

TEST(TurbulenceTest, FieldsUseDistinctSeeds) {
    Turbulence<Point2> turbulence = Turbulence<Point2>(axisSource<Point2>(0)).withSeed(77);
    EXPECT_NE(turbulence.field(0).seed(), turbulence.field(1).seed());
    EXPECT_EQ(turbulence.field(0).seed(), SeedSequence(77).next());
}

TEST(TurbulenceTest, RoughnessSetsFieldLayers) {
    Turbulence<Point2> turbulence = Turbulence<Point2>(axisSource<Point2>(0)).withRoughness(5);
    EXPECT_EQ(turbulence.roughness(), 5u);
    for (size_t i = 0; i < Turbulence<Point2>::FIELD_COUNT; ++i) {
        EXPECT_EQ(turbulence.field(i).source().layerCount(), 5u);
    }
    EXPECT_EQ(Turbulence<Point2>(axisSource<Point2>(0)).field(0).source().layerCount(), Turbulence<Point2>::DEFAULT_ROUGHNESS);
}

TEST(TurbulenceTest, ReseedKeepsRoughness) {
    Turbulence<Point2> turbulence = Turbulence<Point2>(axisSource<Point2>(0)).withRoughness(2).withSeed(9);
    EXPECT_EQ(turbulence.field(3).source().layerCount(), 2u);
}

TEST(TurbulenceTest, InvalidRoughnessThrows) {
    Turbulence<Point2> turbulence(axisSource<Point2>(0));
    EXPECT_THROW((void)turbulence.withRoughness(0), std::invalid_argument);
    EXPECT_THROW((void)turbulence.withRoughness(33), std::invalid_argument);
}

TEST(TurbulenceTest, FrequencyScalesFieldSamples) {
    Turbulence<Point2> turbulence = Turbulence<Point2>(axisSource<Point2>(0)).withFrequency(4.0);
    EXPECT_DOUBLE_EQ(turbulence.frequency(), 4.0);
    for (size_t i = 0; i < Turbulence<Point2>::FIELD_COUNT; ++i) {
        EXPECT_DOUBLE_EQ(turbulence.field(i).transform().scale(), 4.0);
    }
    EXPECT_DOUBLE_EQ(turbulence.withSeed(3).field(0).transform().scale(), 4.0);
}

#include <gtest/gtest.h>

#include "partforge/cad/FeatureGenerators.hpp"

using namespace partforge;
using namespace partforge::cad;

namespace {

BoundingBox box(Vector3 min, Vector3 max) {
    BoundingBox b;
    b.min = min;
    b.max = max;
    return b;
}

} // namespace

TEST(FeatureGenerators, LegsSitAtInsetCornersBelowTheBody) {
    AddLegsParams params;
    params.inset = 10;
    params.height = 700;
    params.radius = 25;

    auto legs = legCylinders(box({0, 0, 0}, {100, 50, 20}), params);
    ASSERT_EQ(legs.size(), 4u);

    EXPECT_EQ(legs[0].base, Vector3(10, 10, -700));
    EXPECT_EQ(legs[1].base, Vector3(90, 10, -700));
    EXPECT_EQ(legs[2].base, Vector3(90, 40, -700));
    EXPECT_EQ(legs[3].base, Vector3(10, 40, -700));

    for (const auto& leg : legs) {
        EXPECT_DOUBLE_EQ(leg.height, 700);
        EXPECT_DOUBLE_EQ(leg.radius, 25);
        EXPECT_EQ(leg.axis, Vector3(0, 0, 1));
    }
}

TEST(FeatureGenerators, LegCountOtherThanFourPlacesNothing) {
    AddLegsParams params;
    params.count = 3;
    EXPECT_TRUE(legCylinders(box({0, 0, 0}, {100, 100, 10}), params).empty());
}

TEST(FeatureGenerators, SupportsAreEvenlySpacedAlongY) {
    AddSupportsParams params;
    params.count = 3;
    params.thickness = 4;
    params.height = 30;

    auto supports = supportBoxes(box({-50, 0, 5}, {50, 80, 25}), params);
    ASSERT_EQ(supports.size(), 3u);

    for (size_t i = 0; i < supports.size(); ++i) {
        double y = 20.0 * static_cast<double>(i + 1);
        EXPECT_EQ(supports[i].corner, Vector3(-50, y - 2, 5));
        EXPECT_EQ(supports[i].size, Vector3(100, 4, 30));
    }
}

TEST(FeatureGenerators, HoleRisesFromItsPosition) {
    AddHolesParams params;
    params.diameter = 6;
    params.depth = 12;

    CylinderParams hole = holeCylinder(Vector3(5, 7, -1), params);
    EXPECT_EQ(hole.base, Vector3(5, 7, -1));
    EXPECT_DOUBLE_EQ(hole.radius, 3);
    EXPECT_DOUBLE_EQ(hole.height, 12);
    EXPECT_EQ(hole.axis, Vector3(0, 0, 1));
}

TEST(FeatureGenerators, LinearOffsetsScaleWithIndex) {
    LinearPatternParams params;
    params.direction = Vector3(0, 1, 0);
    params.spacing = 15;
    params.count = 4;

    auto offsets = linearPatternOffsets(params);
    ASSERT_EQ(offsets.size(), 3u);
    EXPECT_EQ(offsets[0], Vector3(0, 15, 0));
    EXPECT_EQ(offsets[1], Vector3(0, 30, 0));
    EXPECT_EQ(offsets[2], Vector3(0, 45, 0));
}

TEST(FeatureGenerators, CountOfOneMakesNoCopies) {
    LinearPatternParams linear;
    linear.count = 1;
    EXPECT_TRUE(linearPatternOffsets(linear).empty());

    CircularPatternParams circular;
    circular.count = 1;
    EXPECT_TRUE(circularPatternAngles(circular).empty());
}

TEST(FeatureGenerators, SixCircularCopiesStepBySixtyDegrees) {
    CircularPatternParams params;
    params.count = 6;

    auto angles = circularPatternAngles(params);
    ASSERT_EQ(angles.size(), 5u);
    for (size_t i = 0; i < angles.size(); ++i) {
        EXPECT_NEAR(angles[i], degreesToRadians(60.0 * static_cast<double>(i + 1)), 1e-12);
    }
}

/**
 * @file test_types.cpp
 * @brief Unit tests for Core types, constants and enum names
 */

#include <QiBlast/Core/Constants.h>
#include <QiBlast/Core/PatternResult.h>
#include <QiBlast/Core/Types.h>
#include <QiBlast/QiBlast.h>

#include <gtest/gtest.h>

#include <cstring>
#include <string>

using namespace Qi::Blast;

class Point2dTest : public ::testing::Test {
protected:
    void SetUp() override {}
};

TEST_F(Point2dTest, Arithmetic) {
    Point2d a(1.0, 2.0);
    Point2d b(4.0, 6.0);

    Point2d sum = a + b;
    EXPECT_DOUBLE_EQ(sum.x, 5.0);
    EXPECT_DOUBLE_EQ(sum.y, 8.0);

    Point2d diff = b - a;
    EXPECT_DOUBLE_EQ(diff.x, 3.0);
    EXPECT_DOUBLE_EQ(diff.y, 4.0);
    EXPECT_DOUBLE_EQ(diff.Norm(), 5.0);
    EXPECT_DOUBLE_EQ(a.DistanceTo(b), 5.0);

    EXPECT_DOUBLE_EQ(a.Dot(b), 16.0);
    EXPECT_DOUBLE_EQ(a.Cross(b), -2.0);
}

TEST_F(Point2dTest, NormalizedAndPerpendicular) {
    Point2d v(3.0, 4.0);
    Point2d u = v.Normalized();
    EXPECT_NEAR(u.Norm(), 1.0, 1e-12);

    Point2d p = v.Perpendicular();
    EXPECT_DOUBLE_EQ(p.x, -4.0);
    EXPECT_DOUBLE_EQ(p.y, 3.0);
    EXPECT_DOUBLE_EQ(p.Dot(v), 0.0);

    Point2d zero;
    EXPECT_EQ(zero.Normalized(), Point2d(0.0, 0.0));
}

TEST_F(Point2dTest, LineSignedDistance) {
    // y = 2  ->  0x + 1y - 2 = 0
    Line2d line(0.0, 1.0, -2.0);
    EXPECT_DOUBLE_EQ(line.SignedDistance(Point2d(5.0, 3.0)), 1.0);
    EXPECT_DOUBLE_EQ(line.Distance(Point2d(5.0, 0.0)), 2.0);
}

TEST_F(Point2dTest, HolePointPlanCoordinates) {
    HolePoint hole("H1", 10.0, 20.0, 305.5, "17");
    EXPECT_EQ(hole.XY(), Point2d(10.0, 20.0));
    EXPECT_EQ(hole.sequenceToken, "17");
}

// =============================================================================
// Constants
// =============================================================================

TEST(ConstantsTest, BearingNormalization) {
    EXPECT_DOUBLE_EQ(NormalizeBearing(370.0), 10.0);
    EXPECT_DOUBLE_EQ(NormalizeBearing(-90.0), 270.0);
    EXPECT_DOUBLE_EQ(NormalizeAxial(190.0), 10.0);
    EXPECT_DOUBLE_EQ(NormalizeAxial(-10.0), 170.0);
}

TEST(ConstantsTest, BearingDifference) {
    EXPECT_DOUBLE_EQ(BearingDifference(350.0, 10.0), 20.0);
    EXPECT_DOUBLE_EQ(BearingDifference(90.0, 270.0), 180.0);
    EXPECT_DOUBLE_EQ(AxialDifference(5.0, 175.0), 10.0);
    EXPECT_DOUBLE_EQ(AxialDifference(0.0, 90.0), 90.0);
}

TEST(ConstantsTest, Clamp) {
    EXPECT_DOUBLE_EQ(Clamp(1.5, 0.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(Clamp(-0.5, 0.0, 1.0), 0.0);
    EXPECT_EQ(Clamp(3, 1, 5), 3);
}

// =============================================================================
// Enum names
// =============================================================================

TEST(EnumNamesTest, PatternAndStrategyNames) {
    EXPECT_STREQ(ToString(PatternType::Straight), "straight");
    EXPECT_STREQ(ToString(PatternType::MultiPattern), "multi-pattern");
    EXPECT_STREQ(ToString(SubPatternRole::Batter), "batter");
    EXPECT_STREQ(ToString(OrderingDirection::Serpentine), "serpentine");
    EXPECT_STREQ(ToString(RowShape::Curved), "curved");
    EXPECT_STREQ(ToString(StrategyKind::PcaLoessBinning), "pca-loess-binning");
    EXPECT_STREQ(ToString(StrategyKind::SingleRow), "single-row");
    EXPECT_STREQ(ToString(LayoutStyle::Staggered), "staggered");
}

TEST(PatternResultTest, DefaultsAreEmpty) {
    PatternResult result;
    EXPECT_EQ(result.RowCount(), 0);
    EXPECT_EQ(result.SubPatternCount(), 0);
    EXPECT_EQ(result.patternType, PatternType::Unknown);
    EXPECT_FALSE(result.serpentine);

    PointLabel label;
    EXPECT_FALSE(label.IsAssigned());

    Row row;
    EXPECT_TRUE(row.Empty());
    EXPECT_EQ(row.firstPosition, 1);
}

TEST(VersionTest, StringMatchesNumbers) {
    int major = -1, minor = -1, patch = -1;
    GetVersion(major, minor, patch);
    std::string expected = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    EXPECT_EQ(expected, GetVersion());
}

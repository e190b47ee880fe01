/**
 * @file test_sub_pattern_separator.cpp
 * @brief Unit tests for sub-pattern separation and role tagging
 */

#include <QiBlast/Classify/SubPatternSeparator.h>
#include <QiBlast/Core/Constants.h>

#include <gtest/gtest.h>

#include <vector>

using namespace Qi::Blast;
using namespace Qi::Blast::Classify;

namespace {

/// Twelve holes east-west from the origin
std::vector<Point2d> MainLine() {
    std::vector<Point2d> points;
    for (int i = 0; i < 12; ++i) points.emplace_back(i * 3.0, 0.0);
    return points;
}

/// Append count holes north-south starting at (x, y0)
void AppendColumn(std::vector<Point2d>& points, double x, double y0, int count) {
    for (int i = 0; i < count; ++i) points.emplace_back(x, y0 + i * 3.0);
}

std::vector<int> Range(int begin, int end) {
    std::vector<int> out;
    for (int i = begin; i < end; ++i) out.push_back(i);
    return out;
}

} // anonymous namespace

class SubPatternSeparatorTest : public ::testing::Test {
protected:
    DetectionConfig config_;
};

// =============================================================================
// Role Tagging
// =============================================================================

TEST_F(SubPatternSeparatorTest, PerpendicularBeyondEndIsBatter) {
    auto points = MainLine();
    AppendColumn(points, 45.0, 5.0, 8);

    SubPatternRole role = TagSubPatternRole(points, Range(0, 12), 90.0, Range(12, 20), 0.0, 15.0);
    EXPECT_EQ(role, SubPatternRole::Batter);
}

TEST_F(SubPatternSeparatorTest, PerpendicularAlongsideIsBuffer) {
    auto points = MainLine();
    AppendColumn(points, 15.0, 10.0, 8);

    SubPatternRole role = TagSubPatternRole(points, Range(0, 12), 90.0, Range(12, 20), 0.0, 15.0);
    EXPECT_EQ(role, SubPatternRole::Buffer);
}

TEST_F(SubPatternSeparatorTest, ObliqueIsSecondary) {
    auto points = MainLine();
    AppendColumn(points, 45.0, 5.0, 8);

    SubPatternRole role = TagSubPatternRole(points, Range(0, 12), 90.0, Range(12, 20), 45.0, 15.0);
    EXPECT_EQ(role, SubPatternRole::Secondary);

    // 80 degrees off is perpendicular within a 15 degree tolerance
    role = TagSubPatternRole(points, Range(0, 12), 90.0, Range(12, 20), 170.0, 15.0);
    EXPECT_EQ(role, SubPatternRole::Batter);
}

// =============================================================================
// Separation
// =============================================================================

TEST_F(SubPatternSeparatorTest, SeparatesPerpendicularLines) {
    auto points = MainLine();
    AppendColumn(points, 45.0, 5.0, 8);

    Classification classification = ClassifyPattern(points, config_);
    ASSERT_TRUE(classification.IsMultiPattern());

    std::vector<Classification> local;
    std::vector<SubPattern> subs = SeparateSubPatterns(points, classification, config_, 0, &local);

    ASSERT_EQ(subs.size(), 2u);
    ASSERT_EQ(local.size(), 2u);

    EXPECT_EQ(subs[0].index, 0);
    EXPECT_EQ(subs[0].role, SubPatternRole::Main);
    EXPECT_EQ(subs[0].points, Range(0, 12));
    EXPECT_EQ(subs[0].type, PatternType::Straight);
    EXPECT_EQ(subs[0].depth, 1);

    EXPECT_EQ(subs[1].index, 1);
    EXPECT_EQ(subs[1].role, SubPatternRole::Batter);
    EXPECT_EQ(subs[1].points, Range(12, 20));
    EXPECT_EQ(subs[1].type, PatternType::Straight);
    EXPECT_LT(AxialDifference(subs[1].orientationDeg, 0.0), 1e-6);
}

TEST_F(SubPatternSeparatorTest, DisconnectedPartsOfOneClusterSplit) {
    // One orientation cluster holding two collinear runs far apart
    std::vector<Point2d> points;
    for (int i = 0; i < 6; ++i) points.emplace_back(i * 3.0, 0.0);
    for (int i = 0; i < 4; ++i) points.emplace_back(100.0 + i * 3.0, 0.0);

    Classification classification;
    classification.spacing = 3.0;
    classification.orientations.assign(points.size(), 90.0);
    OrientationCluster all;
    all.points = Range(0, 10);
    all.coreSize = 10;
    all.orientationDeg = 90.0;
    classification.clusters.push_back(all);

    std::vector<SubPattern> subs = SeparateSubPatterns(points, classification, config_, 2);

    ASSERT_EQ(subs.size(), 2u);
    EXPECT_EQ(subs[0].points, Range(0, 6));
    EXPECT_EQ(subs[1].points, Range(6, 10));
    EXPECT_EQ(subs[1].role, SubPatternRole::Secondary);
    EXPECT_EQ(subs[1].depth, 3);
}

TEST_F(SubPatternSeparatorTest, SmallComponentMergesIntoNearest) {
    std::vector<Point2d> points;
    for (int i = 0; i < 6; ++i) points.emplace_back(i * 3.0, 0.0);
    for (int i = 0; i < 5; ++i) points.emplace_back(100.0 + i * 3.0, 0.0);
    points.emplace_back(30.0, 0.0);  // stray hole past the first run

    Classification classification;
    classification.spacing = 3.0;
    classification.orientations.assign(points.size(), 90.0);
    OrientationCluster all;
    all.points = Range(0, 12);
    all.coreSize = 12;
    all.orientationDeg = 90.0;
    classification.clusters.push_back(all);

    std::vector<SubPattern> subs = SeparateSubPatterns(points, classification, config_, 0);

    ASSERT_EQ(subs.size(), 2u);
    std::vector<int> expected = Range(0, 6);
    expected.push_back(11);
    EXPECT_EQ(subs[0].points, expected);
    EXPECT_EQ(subs[1].points, Range(6, 11));
}

TEST_F(SubPatternSeparatorTest, EmptyInput) {
    Classification classification;
    EXPECT_TRUE(SeparateSubPatterns({}, classification, config_, 0).empty());
}

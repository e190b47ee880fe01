/**
 * @file test_smoothing.cpp
 * @brief Unit tests for Internal/Smoothing (LOESS, B-spline, Douglas-Peucker)
 */

#include <QiBlast/Internal/Smoothing.h>

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace Qi::Blast;
using namespace Qi::Blast::Internal;

// =============================================================================
// LOESS
// =============================================================================

class LoessTest : public ::testing::Test {};

TEST_F(LoessTest, TricubeWeight) {
    EXPECT_DOUBLE_EQ(TricubeWeight(0.0), 1.0);
    EXPECT_DOUBLE_EQ(TricubeWeight(1.0), 0.0);
    EXPECT_DOUBLE_EQ(TricubeWeight(-1.5), 0.0);
    EXPECT_NEAR(TricubeWeight(0.5), std::pow(1.0 - 0.125, 3), 1e-12);
}

TEST_F(LoessTest, ReproducesLinearData) {
    std::vector<double> x, y;
    for (int i = 0; i < 20; ++i) {
        x.push_back(i);
        y.push_back(3.0 * i - 7.0);
    }
    std::vector<double> fitted = Loess(x, y, 0.3, x);

    ASSERT_EQ(fitted.size(), x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        EXPECT_NEAR(fitted[i], y[i], 1e-9);
    }
}

TEST_F(LoessTest, SmoothsAlternatingNoise) {
    std::vector<double> x, y;
    for (int i = 0; i < 30; ++i) {
        x.push_back(i);
        y.push_back(i % 2 == 0 ? 1.0 : -1.0);
    }
    std::vector<double> fitted = Loess(x, y, 0.5, {15.0});

    ASSERT_EQ(fitted.size(), 1u);
    EXPECT_LT(std::abs(fitted[0]), 0.3);
}

TEST_F(LoessTest, ConstantAbscissaFallsBackToMean) {
    std::vector<double> x(5, 2.0);
    std::vector<double> y{1.0, 2.0, 3.0, 4.0, 5.0};
    std::vector<double> fitted = Loess(x, y, 1.0, {2.0});

    ASSERT_EQ(fitted.size(), 1u);
    EXPECT_NEAR(fitted[0], 3.0, 1e-9);
}

TEST_F(LoessTest, EmptyInput) {
    std::vector<double> fitted = Loess({}, {}, 0.3, {1.0, 2.0});
    ASSERT_EQ(fitted.size(), 2u);
    EXPECT_DOUBLE_EQ(fitted[0], 0.0);
}

// =============================================================================
// B-Spline
// =============================================================================

class BSplineTest : public ::testing::Test {};

TEST_F(BSplineTest, ClampedEndpoints) {
    std::vector<Point2d> control{Point2d(0.0, 0.0), Point2d(1.0, 2.0), Point2d(3.0, 2.0),
                                Point2d(4.0, 0.0), Point2d(6.0, -1.0)};
    CubicBSpline spline(control);

    EXPECT_EQ(spline.Degree(), 3);
    Point2d start = spline.Evaluate(0.0);
    Point2d end = spline.Evaluate(1.0);
    EXPECT_NEAR(start.x, 0.0, 1e-9);
    EXPECT_NEAR(start.y, 0.0, 1e-9);
    EXPECT_NEAR(end.x, 6.0, 1e-9);
    EXPECT_NEAR(end.y, -1.0, 1e-9);
}

TEST_F(BSplineTest, CollinearControlStaysOnLine) {
    std::vector<Point2d> control;
    for (int i = 0; i < 6; ++i) control.emplace_back(i * 2.0, i * 1.0);
    CubicBSpline spline(control);

    for (const auto& p : spline.Sample(8)) {
        EXPECT_NEAR(p.y, 0.5 * p.x, 1e-9);
    }
}

TEST_F(BSplineTest, DegreeDropsForFewControlPoints) {
    CubicBSpline spline({Point2d(0.0, 0.0), Point2d(10.0, 0.0)});
    EXPECT_EQ(spline.Degree(), 1);

    Point2d mid = spline.Evaluate(0.5);
    EXPECT_NEAR(mid.x, 5.0, 1e-9);
}

// =============================================================================
// Douglas-Peucker
// =============================================================================

class DouglasPeuckerTest : public ::testing::Test {};

TEST_F(DouglasPeuckerTest, StraightLineKeepsEnds) {
    std::vector<Point2d> line;
    for (int i = 0; i < 10; ++i) line.emplace_back(i, 0.0);

    std::vector<int> kept = DouglasPeucker(line, 0.1);
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept.front(), 0);
    EXPECT_EQ(kept.back(), 9);
}

TEST_F(DouglasPeuckerTest, KeepsCorner) {
    std::vector<Point2d> path;
    for (int i = 0; i <= 5; ++i) path.emplace_back(i, 0.0);
    for (int i = 1; i <= 5; ++i) path.emplace_back(5.0, i);

    std::vector<int> kept = DouglasPeucker(path, 0.2);
    ASSERT_EQ(kept.size(), 3u);
    EXPECT_EQ(kept[0], 0);
    EXPECT_EQ(kept[1], 5);
    EXPECT_EQ(kept[2], 10);
}

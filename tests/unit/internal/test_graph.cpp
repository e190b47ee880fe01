/**
 * @file test_graph.cpp
 * @brief Unit tests for Internal/Graph and Internal/Neighbors
 */

#include <QiBlast/Internal/Graph.h>
#include <QiBlast/Internal/Neighbors.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <vector>

using namespace Qi::Blast;
using namespace Qi::Blast::Internal;

namespace {

/// Horizontal line of count points, step apart, starting at origin
std::vector<Point2d> Line(const Point2d& origin, int count, double step) {
    std::vector<Point2d> points;
    for (int i = 0; i < count; ++i) points.emplace_back(origin.x + i * step, origin.y);
    return points;
}

} // anonymous namespace

// =============================================================================
// Union-Find
// =============================================================================

TEST(UnionFindTest, UniteAndFind) {
    UnionFind uf(5);
    EXPECT_TRUE(uf.Unite(0, 1));
    EXPECT_TRUE(uf.Unite(3, 4));
    EXPECT_FALSE(uf.Unite(1, 0));

    EXPECT_EQ(uf.Find(0), uf.Find(1));
    EXPECT_NE(uf.Find(1), uf.Find(3));
    EXPECT_EQ(uf.SetSize(4), 2);
    EXPECT_EQ(uf.SetSize(2), 1);
}

// =============================================================================
// MST and Components
// =============================================================================

class GraphTest : public ::testing::Test {};

TEST_F(GraphTest, MinimumSpanningTreeOfLine) {
    auto points = Line(Point2d(0.0, 0.0), 6, 2.0);
    std::vector<Edge> tree = MinimumSpanningTree(points);

    ASSERT_EQ(tree.size(), 5u);
    double total = 0.0;
    for (const auto& e : tree) {
        EXPECT_NEAR(e.weight, 2.0, 1e-12);
        EXPECT_EQ(std::abs(e.u - e.v), 1);
        total += e.weight;
    }
    EXPECT_NEAR(total, 10.0, 1e-12);
}

TEST_F(GraphTest, MinimumSpanningTreeTrivial) {
    EXPECT_TRUE(MinimumSpanningTree({Point2d(1.0, 1.0)}).empty());
}

TEST_F(GraphTest, ConnectedComponentsOrdering) {
    std::vector<Edge> edges{{3, 4, 1.0}, {0, 2, 1.0}};
    auto components = ConnectedComponents(5, edges);

    ASSERT_EQ(components.size(), 3u);
    EXPECT_EQ(components[0], (std::vector<int>{0, 2}));
    EXPECT_EQ(components[1], (std::vector<int>{1}));
    EXPECT_EQ(components[2], (std::vector<int>{3, 4}));
}

TEST_F(GraphTest, ComponentsWithinRadius) {
    auto points = Line(Point2d(0.0, 0.0), 3, 1.0);
    auto far = Line(Point2d(100.0, 0.0), 3, 1.0);
    points.insert(points.end(), far.begin(), far.end());

    std::vector<int> members{0, 1, 2, 3, 4, 5};
    auto components = ComponentsWithinRadius(points, members, 1.5);

    ASSERT_EQ(components.size(), 2u);
    EXPECT_EQ(components[0], (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(components[1], (std::vector<int>{3, 4, 5}));
}

// =============================================================================
// DBSCAN
// =============================================================================

TEST_F(GraphTest, DbscanTwoClustersAndNoise) {
    auto points = Line(Point2d(0.0, 0.0), 5, 1.0);
    auto second = Line(Point2d(50.0, 0.0), 5, 1.0);
    points.insert(points.end(), second.begin(), second.end());
    points.emplace_back(25.0, 25.0);

    std::vector<int> labels = Dbscan(points, 1.5, 3);

    ASSERT_EQ(labels.size(), 11u);
    for (int i = 0; i < 5; ++i) EXPECT_EQ(labels[i], 0);
    for (int i = 5; i < 10; ++i) EXPECT_EQ(labels[i], 1);
    EXPECT_EQ(labels[10], DBSCAN_NOISE);
}

TEST_F(GraphTest, DbscanAllNoise) {
    auto points = Line(Point2d(0.0, 0.0), 4, 10.0);
    std::vector<int> labels = Dbscan(points, 1.0, 2);
    EXPECT_TRUE(std::all_of(labels.begin(), labels.end(), [](int l) { return l == DBSCAN_NOISE; }));
}

// =============================================================================
// Neighbours
// =============================================================================

class NeighborsTest : public ::testing::Test {};

TEST_F(NeighborsTest, TableSortedByDistanceThenIndex) {
    // Point 1 has two neighbours at distance 1 (0 and 2), then 3 at distance 2
    auto points = Line(Point2d(0.0, 0.0), 4, 1.0);
    NeighborTable table(points, 3);

    ASSERT_EQ(table.Size(), 4u);
    EXPECT_EQ(table.K(), 3);
    const auto& nb = table.Of(1);
    ASSERT_EQ(nb.size(), 3u);
    EXPECT_EQ(nb[0].index, 0);
    EXPECT_EQ(nb[1].index, 2);
    EXPECT_EQ(nb[2].index, 3);
    EXPECT_NEAR(table.NearestDistance(1), 1.0, 1e-12);
}

TEST_F(NeighborsTest, KClampedToPointCount) {
    auto points = Line(Point2d(0.0, 0.0), 3, 1.0);
    NeighborTable table(points, 10);
    EXPECT_EQ(table.Of(0).size(), 2u);
}

TEST_F(NeighborsTest, EstimateSpacing) {
    auto points = Line(Point2d(0.0, 0.0), 5, 3.0);
    EXPECT_NEAR(EstimateSpacing(points), 3.0, 1e-12);

    // Duplicates are skipped
    points.push_back(points[2]);
    EXPECT_NEAR(EstimateSpacing(points), 3.0, 1e-12);
}

TEST_F(NeighborsTest, NearestNeighborChainWalksLine) {
    std::vector<Point2d> points{Point2d(2.0, 0.0), Point2d(0.0, 0.0), Point2d(3.0, 0.0),
                                Point2d(1.0, 0.0), Point2d(4.0, 0.0)};
    std::vector<int> chain = NearestNeighborChain(points);

    // Farthest from the centroid (x = 2): x = 0 (index 1) and x = 4 (index 4); lowest index wins
    EXPECT_EQ(chain, (std::vector<int>{1, 3, 0, 2, 4}));
}

TEST_F(NeighborsTest, SortedKDistances) {
    auto points = Line(Point2d(0.0, 0.0), 4, 1.0);
    std::vector<double> d = SortedKDistances(points, 2);

    ASSERT_EQ(d.size(), 4u);
    EXPECT_TRUE(std::is_sorted(d.begin(), d.end()));
    EXPECT_NEAR(d.front(), 1.0, 1e-12);
    EXPECT_NEAR(d.back(), 2.0, 1e-12);
}

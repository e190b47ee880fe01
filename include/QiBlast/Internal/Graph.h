#pragma once

/**
 * @file Graph.h
 * @brief Point-graph algorithms: union-find, Kruskal MST, components, DBSCAN
 */

#include <QiBlast/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Qi::Blast::Internal {

// =============================================================================
// Union-Find
// =============================================================================

/**
 * @brief Disjoint-set forest with path halving and union by size
 */
class UnionFind {
public:
    explicit UnionFind(int n);

    int Find(int x);

    /// Merge the sets of a and b; returns false if already joined
    bool Unite(int a, int b);

    int SetSize(int x) { return size_[Find(x)]; }

private:
    std::vector<int> parent_;
    std::vector<int> size_;
};

// =============================================================================
// Edges and Components
// =============================================================================

struct Edge {
    int u = -1;
    int v = -1;
    double weight = 0.0;
};

/**
 * @brief Kruskal minimum spanning tree over the complete Euclidean graph
 *
 * Edge ties are broken by (u, v), so the tree is deterministic.
 * @return n - 1 edges for n >= 1 points
 */
std::vector<Edge> MinimumSpanningTree(const std::vector<Point2d>& points);

/**
 * @brief Connected components of an edge list
 *
 * Components are ordered by their lowest member; members ascend.
 */
std::vector<std::vector<int>> ConnectedComponents(int n, const std::vector<Edge>& edges);

/**
 * @brief Components of the graph linking points closer than radius
 *
 * @param points Point set
 * @param members Subset of point indices to consider
 * @param radius Link radius
 * @return Components as lists of point indices (ascending, ordered by lowest member)
 */
std::vector<std::vector<int>> ComponentsWithinRadius(const std::vector<Point2d>& points,
                                                     const std::vector<int>& members,
                                                     double radius);

// =============================================================================
// DBSCAN
// =============================================================================

/// DBSCAN label of a noise point
constexpr int DBSCAN_NOISE = -1;

/**
 * @brief Density-based clustering (DBSCAN)
 *
 * Points are visited in index order, so cluster ids are deterministic.
 *
 * @param points Point set
 * @param eps Neighbourhood radius
 * @param minPts Minimum neighbourhood size (including the point itself) for a core point
 * @return Cluster label per point (0-based) or DBSCAN_NOISE
 */
std::vector<int> Dbscan(const std::vector<Point2d>& points, double eps, int32_t minPts);

} // namespace Qi::Blast::Internal

#pragma once

/**
 * @file Neighbors.h
 * @brief Brute-force k-nearest-neighbour table and neighbour-based orderings
 *
 * Hole layouts hold at most a few thousand points, so the table is built by
 * exhaustive search (parallelised with OpenMP). Neighbour lists are sorted by
 * distance with ties broken by index, which keeps every consumer deterministic.
 */

#include <QiBlast/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Qi::Blast::Internal {

/**
 * @brief One neighbour entry
 */
struct Neighbor {
    int index = -1;
    double distance = 0.0;
};

/**
 * @brief k nearest neighbours of every point
 */
class NeighborTable {
public:
    NeighborTable() = default;

    /**
     * @brief Build the table
     * @param points Point set
     * @param k Neighbours kept per point (clamped to n - 1)
     */
    NeighborTable(const std::vector<Point2d>& points, int32_t k);

    /// Neighbours of point i, nearest first
    const std::vector<Neighbor>& Of(int i) const { return neighbors_[i]; }

    /// Distance to the nearest neighbour of i (0 when i has none)
    double NearestDistance(int i) const {
        return neighbors_[i].empty() ? 0.0 : neighbors_[i].front().distance;
    }

    int32_t K() const { return k_; }
    size_t Size() const { return neighbors_.size(); }

private:
    std::vector<std::vector<Neighbor>> neighbors_;
    int32_t k_ = 0;
};

/**
 * @brief Median nearest-neighbour distance
 *
 * Coincident neighbours (distance 0) are skipped; returns 0 only when every
 * point coincides with another.
 */
double EstimateSpacing(const std::vector<Point2d>& points);

/**
 * @brief k-th nearest neighbour distance of every point, sorted ascending
 */
std::vector<double> SortedKDistances(const std::vector<Point2d>& points, int32_t k);

/**
 * @brief Greedy nearest-neighbour chain
 *
 * Starts at the point farthest from the centroid (lowest index on ties) and
 * repeatedly steps to the nearest unvisited point.
 *
 * @return Permutation of 0..n-1
 */
std::vector<int> NearestNeighborChain(const std::vector<Point2d>& points);

} // namespace Qi::Blast::Internal

/**
 * @file Neighbors.cpp
 * @brief k-nearest-neighbour table and neighbour orderings
 */

#include <QiBlast/Internal/Neighbors.h>
#include <QiBlast/Internal/Fitting.h>
#include <QiBlast/Internal/Statistics.h>
#include <QiBlast/Core/Constants.h>

#include <algorithm>
#include <limits>

namespace Qi::Blast::Internal {

namespace {

bool NeighborLess(const Neighbor& a, const Neighbor& b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    return a.index < b.index;
}

} // anonymous namespace

// =============================================================================
// NeighborTable
// =============================================================================

NeighborTable::NeighborTable(const std::vector<Point2d>& points, int32_t k) {
    int n = static_cast<int>(points.size());
    k_ = std::max(0, std::min(k, n - 1));
    neighbors_.assign(n, {});

    const int32_t keep = k_;

#pragma omp parallel for schedule(static)
    for (int i = 0; i < n; ++i) {
        std::vector<Neighbor> all;
        all.reserve(n > 0 ? n - 1 : 0);
        for (int j = 0; j < n; ++j) {
            if (j == i) continue;
            all.push_back({j, points[i].DistanceTo(points[j])});
        }
        if (keep < static_cast<int32_t>(all.size())) {
            std::partial_sort(all.begin(), all.begin() + keep, all.end(), NeighborLess);
            all.resize(keep);
        } else {
            std::sort(all.begin(), all.end(), NeighborLess);
        }
        neighbors_[i] = std::move(all);
    }
}

// =============================================================================
// Spacing / k-distance
// =============================================================================

double EstimateSpacing(const std::vector<Point2d>& points) {
    int n = static_cast<int>(points.size());
    if (n < 2) return 0.0;

    std::vector<double> nearest(n, 0.0);

#pragma omp parallel for schedule(static)
    for (int i = 0; i < n; ++i) {
        double best = std::numeric_limits<double>::max();
        for (int j = 0; j < n; ++j) {
            if (j == i) continue;
            double d = points[i].DistanceTo(points[j]);
            if (d > DISTANCE_EPSILON && d < best) best = d;
        }
        nearest[i] = best == std::numeric_limits<double>::max() ? 0.0 : best;
    }

    std::vector<double> positive;
    for (double d : nearest) {
        if (d > 0.0) positive.push_back(d);
    }
    return Median(positive);
}

std::vector<double> SortedKDistances(const std::vector<Point2d>& points, int32_t k) {
    NeighborTable table(points, k);
    std::vector<double> kd;
    kd.reserve(points.size());
    for (size_t i = 0; i < table.Size(); ++i) {
        const auto& nb = table.Of(static_cast<int>(i));
        if (!nb.empty()) kd.push_back(nb.back().distance);
    }
    std::sort(kd.begin(), kd.end());
    return kd;
}

// =============================================================================
// Nearest-neighbour chain
// =============================================================================

std::vector<int> NearestNeighborChain(const std::vector<Point2d>& points) {
    int n = static_cast<int>(points.size());
    std::vector<int> chain;
    if (n == 0) return chain;
    chain.reserve(n);

    Point2d centroid = ComputeCentroid(points);
    int start = 0;
    double farthest = -1.0;
    for (int i = 0; i < n; ++i) {
        double d = points[i].DistanceTo(centroid);
        if (d > farthest + EPSILON) {
            farthest = d;
            start = i;
        }
    }

    std::vector<bool> visited(n, false);
    int current = start;
    while (current >= 0) {
        chain.push_back(current);
        visited[current] = true;

        int next = -1;
        double nearest = std::numeric_limits<double>::max();
        for (int j = 0; j < n; ++j) {
            if (visited[j]) continue;
            double d = points[current].DistanceTo(points[j]);
            if (d < nearest) {
                nearest = d;
                next = j;
            }
        }
        current = next;
    }
    return chain;
}

} // namespace Qi::Blast::Internal

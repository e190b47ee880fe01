/**
 * @file DensityStrategies.cpp
 * @brief DBSCAN-based fallbacks and the terminal single-row strategy
 */

#include "StrategyImpl.h"

#include <QiBlast/Analysis/PointSetAnalyzer.h>
#include <QiBlast/Internal/Graph.h>
#include <QiBlast/Internal/Log.h>
#include <QiBlast/Internal/Smoothing.h>
#include <QiBlast/Internal/Statistics.h>

#include <algorithm>
#include <map>

namespace Qi::Blast::Detect {

namespace {

/// Epsilon growth for the single retry when everything is noise
constexpr double EPS_RETRY_FACTOR = 1.5;

/**
 * @brief DBSCAN clusters of the subset, each in nearest-neighbour chain order
 *
 * @return Clusters ordered by cluster id; empty when every point is noise
 */
std::vector<std::vector<int>> ChainedClusters(const DetectionInput& input, const DetectionConfig& config) {
    const auto& pts = input.points;

    double eps = config.dbscanEps > 0.0 ? config.dbscanEps : input.stats.suggestedEps;
    if (eps <= DISTANCE_EPSILON) eps = EPS_RETRY_FACTOR * input.spacing;
    int32_t minPts = config.dbscanMinPts > 0 ? config.dbscanMinPts : input.stats.suggestedMinPts;

    std::vector<int> labels;
    for (int attempt = 0; attempt < 2; ++attempt) {
        labels = Internal::Dbscan(pts, eps, minPts);
        bool anyCluster = std::any_of(labels.begin(), labels.end(),
                                      [](int l) { return l != Internal::DBSCAN_NOISE; });
        Internal::DebugLog(config, "Dbscan", "eps=%.3f minPts=%d clustered=%d", eps, minPts, anyCluster ? 1 : 0);
        if (anyCluster) break;
        eps *= EPS_RETRY_FACTOR;
    }

    std::map<int, std::vector<int>> byLabel;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i] != Internal::DBSCAN_NOISE) byLabel[labels[i]].push_back(static_cast<int>(i));
    }

    std::vector<std::vector<int>> clusters;
    for (const auto& entry : byLabel) {
        clusters.push_back(Detail::OrderByNeighborChain(pts, entry.second));
    }
    return clusters;
}

/// Mean distance between consecutive chain points
double MeanChainGap(const std::vector<Point2d>& chainPts) {
    std::vector<double> gaps;
    for (size_t k = 1; k < chainPts.size(); ++k) {
        gaps.push_back(chainPts[k - 1].DistanceTo(chainPts[k]));
    }
    return Internal::Mean(gaps);
}

/**
 * @brief Split a chain at its simplified corners
 *
 * Points between two kept vertices form one segment. A shared interior vertex
 * joins the adjacent segment with more points; empty segments dissolve.
 */
std::vector<std::vector<int>> SplitAtCorners(const std::vector<int>& chain, const std::vector<int>& kept) {
    size_t m = kept.size();
    if (m < 3) return {chain};

    // Interior counts of segment j = (kept[j], kept[j+1])
    std::vector<std::vector<int>> segments(m - 1);
    for (size_t j = 0; j + 1 < m; ++j) {
        for (int k = kept[j] + 1; k < kept[j + 1]; ++k) {
            segments[j].push_back(k);
        }
    }

    segments.front().insert(segments.front().begin(), kept.front());
    segments.back().push_back(kept.back());
    for (size_t j = 1; j + 1 < m; ++j) {
        auto& before = segments[j - 1];
        auto& after = segments[j];
        if (before.size() >= after.size()) {
            before.push_back(kept[j]);
        } else {
            after.insert(after.begin(), kept[j]);
        }
    }

    std::vector<std::vector<int>> rows;
    for (const auto& seg : segments) {
        if (seg.empty()) continue;
        std::vector<int> row;
        row.reserve(seg.size());
        for (int k : seg) row.push_back(chain[k]);
        rows.push_back(std::move(row));
    }
    return rows;
}

} // anonymous namespace

// =============================================================================
// DensityClustering
// =============================================================================

StrategyResult DensityClusteringStrategy::Detect(const DetectionInput& input,
                                                 const DetectionConfig& config) const {
    const auto kind = Kind();
    if (input.Size() < 3) {
        return StrategyResult::Failure(kind, "needs at least 3 points");
    }

    std::vector<std::vector<int>> rows = ChainedClusters(input, config);
    if (rows.empty()) {
        return StrategyResult::Failure(kind, "every point is noise");
    }

    StrategyResult result = Detail::Finish(kind, input, std::move(rows), input.spacing);
    result.message = std::to_string(result.rows.size()) + " clusters";
    return result;
}

// =============================================================================
// DensitySimplify
// =============================================================================

StrategyResult DensitySimplifyStrategy::Detect(const DetectionInput& input,
                                               const DetectionConfig& config) const {
    const auto kind = Kind();
    if (input.Size() < 3) {
        return StrategyResult::Failure(kind, "needs at least 3 points");
    }

    std::vector<std::vector<int>> clusters = ChainedClusters(input, config);
    if (clusters.empty()) {
        return StrategyResult::Failure(kind, "every point is noise");
    }

    std::vector<std::vector<int>> rows;
    for (const auto& cluster : clusters) {
        std::vector<Point2d> chainPts = Detail::Gather(input.points, cluster);
        double gap = MeanChainGap(chainPts);
        double epsilon = config.simplifyToleranceFactor * (gap > DISTANCE_EPSILON ? gap : input.spacing);
        std::vector<int> kept = Internal::DouglasPeucker(chainPts, epsilon);
        for (auto& row : SplitAtCorners(cluster, kept)) {
            rows.push_back(std::move(row));
        }
    }

    StrategyResult result = Detail::Finish(kind, input, std::move(rows), input.spacing);
    result.message = std::to_string(result.rows.size()) + " simplified segments";
    return result;
}

// =============================================================================
// SingleRow
// =============================================================================

StrategyResult SingleRowStrategy::Detect(const DetectionInput& input, const DetectionConfig&) const {
    const auto kind = Kind();
    if (input.Size() == 0) {
        return StrategyResult::Failure(kind, "empty subset");
    }

    std::vector<std::vector<int>> rows{Detail::OrderByNeighborChain(input.points, Detail::Iota(input.Size()))};
    StrategyResult result = Detail::Finish(kind, input, std::move(rows), input.spacing);
    result.message = "single chain";
    return result;
}

} // namespace Qi::Blast::Detect

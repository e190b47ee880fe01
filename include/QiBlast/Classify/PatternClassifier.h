#pragma once

/**
 * @file PatternClassifier.h
 * @brief Classify a point set as straight, curved or multi-pattern
 *
 * Pipeline:
 * 1. Local orientation per point from its nearest neighbour(s)
 * 2. Orientation clustering by region growing over spatial neighbours
 * 3. Provisional chains (neighbours agreeing on bearing)
 * 4. Variance ratio and local curvature measured along the chains
 * 5. Decision rules
 *
 * Measuring along chains instead of over the whole set keeps a wide grid of
 * straight rows from looking like a blob.
 */

#include <QiBlast/Core/DetectionConfig.h>
#include <QiBlast/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Qi::Blast::Classify {

/**
 * @brief One orientation cluster
 */
struct OrientationCluster {
    double orientationDeg = 0.0;    ///< Axial mean of the original members, [0, 180)
    std::vector<int> points;        ///< Members after merging, ascending
    int32_t coreSize = 0;           ///< Members before unpopulated clusters merged in
};

/**
 * @brief Classification of a point set
 */
struct Classification {
    PatternType type = PatternType::Unknown;
    double confidence = 0.0;

    double spacing = 0.0;                       ///< Median nearest-neighbour distance
    std::vector<double> orientations;           ///< Local axial orientation per point

    std::vector<OrientationCluster> clusters;   ///< Populated clusters (always >= 1 for n >= 1)
    std::vector<int> clusterOf;                 ///< Cluster index per point

    std::vector<std::vector<int>> chains;       ///< Provisional rows
    std::vector<int> chainOf;                   ///< Chain index per point

    double varianceRatio = 1.0;                 ///< Point-weighted median chain ratio
    std::vector<double> curvatures;             ///< Local curvature per point (1/m)
    double meanCurvature = 0.0;
    double curvatureVariance = 0.0;
    double maxChainResidual = 0.0;              ///< Largest chain line-fit residual

    int32_t PopulatedClusterCount() const { return static_cast<int32_t>(clusters.size()); }
    bool IsMultiPattern() const { return type == PatternType::MultiPattern; }

    /// Chains with at least minSize points
    std::vector<std::vector<int>> ChainsOfSize(size_t minSize) const;
};

// =============================================================================
// Classification
// =============================================================================

/**
 * @brief Classify a point set
 *
 * Sets with fewer than 3 points classify as Straight with confidence 0.5.
 *
 * @param points Plan points
 * @param config Thresholds
 */
Classification ClassifyPattern(const std::vector<Point2d>& points, const DetectionConfig& config);

// =============================================================================
// Building blocks
// =============================================================================

/**
 * @brief Local axial orientation of every point
 *
 * The bearing to the nearest neighbour. Neighbours within 5% of the nearest
 * distance are averaged axially; if they cancel out the strictly nearest one
 * decides.
 */
std::vector<double> ComputeLocalOrientations(const std::vector<Point2d>& points);

/**
 * @brief Orientation clusters by region growing
 *
 * @param points Plan points
 * @param orientations Local orientations
 * @param spacing Spacing estimate
 * @param config Tolerance, connectivity and population thresholds
 * @param clusterOf [out] Cluster index per point
 * @return Populated clusters, unpopulated ones merged in
 */
std::vector<OrientationCluster> ClusterOrientations(const std::vector<Point2d>& points,
                                                    const std::vector<double>& orientations,
                                                    double spacing,
                                                    const DetectionConfig& config,
                                                    std::vector<int>& clusterOf);

/**
 * @brief Provisional chains: neighbours whose bearing agrees with both orientations
 *
 * @return Connected components, each ascending, ordered by lowest member
 */
std::vector<std::vector<int>> BuildProvisionalChains(const std::vector<Point2d>& points,
                                                     const std::vector<double>& orientations,
                                                     const DetectionConfig& config);

/**
 * @brief Local curvature per point from a circle through its chain neighbours
 */
std::vector<double> ComputeLocalCurvatures(const std::vector<Point2d>& points,
                                           const std::vector<std::vector<int>>& chains,
                                           int32_t neighbors);

} // namespace Qi::Blast::Classify

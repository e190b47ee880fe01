#pragma once

/**
 * @file PointSetAnalyzer.h
 * @brief Pre-analysis of a hole set: extent, density, spacing, token reliability
 *
 * The statistics seed the downstream defaults: k for k-NN traversal, DBSCAN
 * epsilon and minPts, and every "x spacings" tolerance.
 *
 * Sequence tokens are the operator's hole numbers. Accepted forms:
 * - numeric: "17"
 * - alphanumeric: letter prefix + number, "B4" (prefix case-insensitive)
 */

#include <QiBlast/Core/DetectionConfig.h>
#include <QiBlast/Core/Types.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace Qi::Blast::Analysis {

// =============================================================================
// Sequence Tokens
// =============================================================================

/**
 * @brief Parsed sequence token
 */
struct SequenceToken {
    bool valid = false;             ///< Token parsed as numeric or alphanumeric
    std::string prefix;             ///< Uppercase letter prefix, empty for numeric
    int64_t number = 0;             ///< Numeric part

    bool HasPrefix() const { return !prefix.empty(); }

    /// Total order key: prefix rank first, then number; invalid tokens give (0, 0)
    std::pair<int64_t, int64_t> OrderKey() const;
};

/**
 * @brief Parse a sequence token ("12", "A7", " b7 ")
 */
SequenceToken ParseSequenceToken(const std::string& text);

/**
 * @brief Order indices by token
 *
 * Valid tokens ascend by OrderKey; indices with invalid tokens follow in
 * index order. The sort is stable.
 */
std::vector<int> OrderByToken(const std::vector<int>& indices, const std::vector<SequenceToken>& tokens);

/**
 * @brief Rank of a letter prefix in spreadsheet order (A=1, Z=26, AA=27)
 */
int64_t PrefixRank(const std::string& prefix);

// =============================================================================
// Point Set Statistics
// =============================================================================

/**
 * @brief Pre-analysis result
 */
struct PointSetStats {
    int32_t count = 0;                      ///< Number of points
    BoundingBox bounds;                     ///< Plan bounding box
    double extent = 0.0;                    ///< Bounding box diagonal
    Point2d centroid;                       ///< Plan centroid

    std::vector<double> nearestDistances;   ///< Per-point nearest-neighbour distance
    double spacing = 0.0;                   ///< Median nearest-neighbour distance
    double meanNearestDistance = 0.0;       ///< Mean nearest-neighbour distance
    double density = 0.0;                   ///< Points per square metre (0 for degenerate area)

    std::vector<SequenceToken> tokens;      ///< Parsed token per point
    double tokenReliability = 0.0;          ///< Share of parseable, unique tokens
    bool tokensReliable = false;            ///< tokenReliability >= config threshold
    double alphanumericShare = 0.0;         ///< Share of tokens with a letter prefix
    bool alphanumeric = false;              ///< alphanumericShare >= config threshold

    int32_t suggestedK = 2;                 ///< min(6, n/5), at least 2
    double suggestedEps = 0.0;              ///< DBSCAN epsilon from the k-distance elbow
    int32_t suggestedMinPts = 2;            ///< min(5, max(2, 5% of n))

    /// Plan extent is zero (all points coincident)
    bool IsDegenerate() const { return extent <= EPSILON_EXTENT; }

    static constexpr double EPSILON_EXTENT = 1e-9;
};

/**
 * @brief Analyze a caller point set
 *
 * @throws InputException for fewer than 2 points or zero spatial extent
 */
PointSetStats AnalyzePointSet(const std::vector<HolePoint>& points, const DetectionConfig& config);

/**
 * @brief Analyze a subset given as plan points and parsed tokens
 *
 * Never throws; callers decide what a small or degenerate subset means.
 */
PointSetStats AnalyzePlanPoints(const std::vector<Point2d>& points,
                                const std::vector<SequenceToken>& tokens,
                                const DetectionConfig& config);

/**
 * @brief DBSCAN epsilon from the k-distance elbow
 *
 * The elbow is the maximum second difference of the sorted k-distances,
 * clamped to [0.5, 3] x the median k-distance.
 */
double EstimateDbscanEps(const std::vector<Point2d>& points, int32_t k = 4);

/// Plan coordinates of the caller points
std::vector<Point2d> ToPlanPoints(const std::vector<HolePoint>& points);

} // namespace Qi::Blast::Analysis

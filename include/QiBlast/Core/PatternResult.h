#pragma once

/**
 * @file PatternResult.h
 * @brief Output types of row detection
 *
 * A PatternResult refers to the caller's points by index. Every input point is
 * either in exactly one Row or listed in orphanIndices.
 */

#include <QiBlast/Core/Types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Qi::Blast {

// =============================================================================
// Strategy identification
// =============================================================================

/**
 * @brief Row detection strategy variants, in no particular priority
 */
enum class StrategyKind {
    WindingSequence,        ///< Sequence-ordered winding path split at turn-backs
    SequenceLineFit,        ///< Sequence-ordered, split by line deviation
    SplineFit,              ///< Sequence-ordered, split against a cubic B-spline
    PrincipalCurve,         ///< Hastie-Stuetzle principal curve
    MstPathExtraction,      ///< Longest paths in the minimum spanning tree
    KnnBearingTraversal,    ///< Bearing-continuity walk over the k-NN graph
    PcaLoessBinning,        ///< Perpendicular bins around a LOESS spine
    DensityClustering,      ///< DBSCAN clusters as rows
    DensitySimplify,        ///< DBSCAN chains split at simplified corners
    SingleRow               ///< Everything in one nearest-neighbour chain
};

const char* ToString(StrategyKind kind);

// =============================================================================
// Rows and Sub-Patterns
// =============================================================================

/**
 * @brief One detected row
 */
struct Row {
    int32_t rowIndex = 0;               ///< 1-based row number
    std::vector<int> points;            ///< Point indices; element k is position firstPosition+k
    int32_t firstPosition = 1;          ///< Position number of points[0] (>= 1)
    RowShape shape = RowShape::Straight;
    std::vector<Point2d> backbone;      ///< Simplified centre line, first to last
    double bearingDeg = 0.0;            ///< Compass bearing first -> last point
    int32_t subPattern = 0;             ///< Index into PatternResult::subPatterns

    size_t Size() const { return points.size(); }
    bool Empty() const { return points.empty(); }
};

/**
 * @brief One orientation-homogeneous, connected group of points
 */
struct SubPattern {
    int32_t index = 0;
    std::vector<int> points;            ///< Point indices, ascending
    SubPatternRole role = SubPatternRole::Main;
    PatternType type = PatternType::Unknown;
    double orientationDeg = 0.0;        ///< Dominant axial orientation [0, 180)
    int32_t depth = 0;                  ///< Recursion depth that produced it
    StrategyKind strategy = StrategyKind::SingleRow;
    double confidence = 0.0;            ///< Confidence of the accepted strategy
};

/**
 * @brief Row / position label of one point (1-based, 0 = unassigned)
 */
struct PointLabel {
    int32_t rowIndex = 0;
    int32_t positionIndex = 0;

    bool IsAssigned() const { return rowIndex > 0; }
};

// =============================================================================
// Metrics
// =============================================================================

/**
 * @brief Layout style from the row-to-row offset ratio
 */
enum class LayoutStyle {
    Square,         ///< Offset ratio ~0
    Staggered,      ///< Offset ratio ~0.5
    Irregular,
    Unknown         ///< Fewer than 2 usable rows
};

const char* ToString(LayoutStyle style);

/**
 * @brief Burden and spacing metrics of a row set
 */
struct BurdenSpacingMetrics {
    double avgSpacing = 0.0;            ///< Mean in-row distance between neighbours
    double spacingStdDev = 0.0;
    double spacingCV = 0.0;
    double avgBurden = 0.0;             ///< Mean perpendicular distance between adjacent rows
    double burdenStdDev = 0.0;
    double burdenCV = 0.0;

    int32_t rowCount = 0;
    int32_t minRowSize = 0;
    int32_t maxRowSize = 0;
    double avgRowSize = 0.0;

    double offsetRatio = 0.0;           ///< Row-start offset in spacings, [0, 0.5]
    LayoutStyle layout = LayoutStyle::Unknown;

    std::vector<double> pointSpacing;   ///< Per input point (0 for orphans)
    std::vector<double> pointBurden;    ///< Per input point (0 for orphans)
};

// =============================================================================
// Result
// =============================================================================

/**
 * @brief Complete row detection result
 */
struct PatternResult {
    std::vector<Row> rows;                      ///< Rows ordered by rowIndex
    std::vector<PointLabel> labels;             ///< One label per input point

    PatternType patternType = PatternType::Unknown;
    std::vector<SubPattern> subPatterns;

    bool serpentine = false;
    OrderingDirection direction = OrderingDirection::Forward;
    double serpentineConfidence = 0.0;

    StrategyKind strategy = StrategyKind::SingleRow;    ///< Strategy of the largest sub-pattern
    double strategyConfidence = 0.0;            ///< Point-weighted strategy confidence
    double confidence = 0.0;                    ///< Overall confidence [0, 1]

    BurdenSpacingMetrics metrics;
    std::vector<std::string> warnings;

    std::vector<int> orphanIndices;             ///< Unassigned point indices, ascending
    std::vector<std::string> orphanPointIds;    ///< Ids of the unassigned points

    int32_t SubPatternCount() const { return static_cast<int32_t>(subPatterns.size()); }
    int32_t RowCount() const { return static_cast<int32_t>(rows.size()); }
};

} // namespace Qi::Blast

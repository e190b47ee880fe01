#pragma once

/**
 * @file RowValidator.h
 * @brief Quality checks and burden / spacing metrics of a row set
 *
 * Rows are lists of global point indices in position order. Labels carry the
 * 1-based row / position numbers the rows were published with.
 *
 * Confidence starts at 1.0 and loses:
 * - 0.1 x orphan ratio when points are unassigned
 * - 0.15 when spacing CV > 0.5
 * - 0.1 when burden CV > 0.5
 * - 0.1 when largest / smallest row > 3
 * - 0.05 when position numbers have gaps
 * - 0.2 when position numbers repeat (an issue, not a warning)
 */

#include <QiBlast/Core/PatternResult.h>
#include <QiBlast/Core/Types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Qi::Blast::Validate {

enum class ValidationStatus {
    Valid,
    Warning,    ///< Warnings only
    Invalid     ///< At least one issue
};

/// Pattern estimate from spacing and burden variation
enum class EstimatedPattern {
    Straight,
    Curved,
    Irregular,
    Unknown
};

const char* ToString(ValidationStatus status);
const char* ToString(EstimatedPattern pattern);

/**
 * @brief Validation outcome
 */
struct ValidationReport {
    ValidationStatus status = ValidationStatus::Valid;
    double confidence = 1.0;                    ///< [0, 1]
    EstimatedPattern pattern = EstimatedPattern::Unknown;
    StrategyKind strategy = StrategyKind::SingleRow;

    std::vector<std::string> issues;
    std::vector<std::string> warnings;

    BurdenSpacingMetrics metrics;
    int32_t orphanCount = 0;
    double sizeRatio = 0.0;                     ///< Largest / smallest row

    bool IsValid() const { return status != ValidationStatus::Invalid; }
};

/**
 * @brief Validate a row set
 *
 * @param points Plan points of every input point
 * @param rows Rows of global indices, position order
 * @param labels Label per point (row 0 = orphan)
 * @param strategyKind Strategy that produced the rows (recorded in the report)
 * @param rowGroups Sub-pattern of each row; empty treats all rows as one group
 */
ValidationReport ValidateRows(const std::vector<Point2d>& points,
                              const std::vector<std::vector<int>>& rows,
                              const std::vector<PointLabel>& labels,
                              StrategyKind strategyKind,
                              const std::vector<int32_t>& rowGroups = {});

/**
 * @brief Burden and spacing metrics
 *
 * Spacing of a point is the distance to the next point in its row; the last
 * point takes the row's mean. Burden is the distance between adjacent rows'
 * mean offsets along the row normal; first and last rows use their single
 * neighbour, middle rows the average of both. Only rows of the same group
 * are adjacent, and each group has its own row normal; rowGroups holds the
 * group of each row (empty: one group).
 *
 * @throws InvalidArgumentException if rowGroups is non-empty and its size
 *         differs from rows
 */
BurdenSpacingMetrics ComputeBurdenAndSpacing(const std::vector<Point2d>& points,
                                             const std::vector<std::vector<int>>& rows,
                                             const std::vector<int32_t>& rowGroups = {});

/**
 * @brief Row-start offset between adjacent rows, in spacings, folded into [0, 0.5]
 *
 * @param usablePairs [out] Optional number of row pairs that contributed
 */
double ComputeOffsetRatio(const std::vector<Point2d>& points,
                          const std::vector<std::vector<int>>& rows,
                          int32_t* usablePairs = nullptr);

/// Square below 0.15, staggered within 0.15 of 0.5, otherwise irregular
LayoutStyle ClassifyLayout(double offsetRatio);

/**
 * @brief Check that every point is in exactly one row or in the orphans
 *
 * @throws Exception naming the first unassigned, duplicated or out-of-range point
 */
void CheckAssignmentInvariant(size_t pointCount,
                              const std::vector<std::vector<int>>& rows,
                              const std::vector<int>& orphans);

/// Confidence bonus of a strategy: sequence strategies gain, fallbacks lose
double MethodConfidenceBonus(StrategyKind kind);

} // namespace Qi::Blast::Validate

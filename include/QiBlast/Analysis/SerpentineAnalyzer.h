#pragma once

/**
 * @file SerpentineAnalyzer.h
 * @brief Forward vs serpentine (boustrophedon) ordering of detected rows
 *
 * Rows are lists of point indices; row order and position order are taken as
 * given. A serpentine layout walks row i to its end and starts row i+1 close
 * to that end.
 */

#include <QiBlast/Analysis/PointSetAnalyzer.h>
#include <QiBlast/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Qi::Blast::Analysis {

/**
 * @brief Spatial serpentine verdict
 */
struct SerpentineReport {
    OrderingDirection direction = OrderingDirection::Forward;
    double confidence = 0.0;        ///< Share of row pairs agreeing with the verdict
    int32_t pairCount = 0;          ///< Adjacent pairs of non-empty rows
    int32_t linkedPairs = 0;        ///< Pairs whose end_i is closer to start_{i+1}

    bool IsSerpentine() const { return direction == OrderingDirection::Serpentine; }
};

/**
 * @brief Spatial serpentine analysis
 *
 * A pair of adjacent rows is linked when dist(end_i, start_{i+1}) is smaller
 * than dist(start_i, start_{i+1}). A majority of linked pairs is serpentine.
 * Fewer than 2 rows give Forward with confidence 0.
 */
SerpentineReport AnalyzeSerpentine(const std::vector<Point2d>& points,
                                   const std::vector<std::vector<int>>& rows);

/**
 * @brief Whether sequence tokens already number the rows serpentine-wise
 */
struct TokenEncoding {
    bool encoded = false;
    double score = 0.0;             ///< Average pair score in [0, 1]
};

/**
 * @brief Check whether tokens encode a serpentine walk
 *
 * Each row is sorted by token. Per adjacent pair (both rows >= 2 points):
 * - 1   when dist(last_i, first_{i+1}) < 0.7 x dist(first_i, first_{i+1})
 * - 0   when the reverse holds
 * - 0.5 otherwise
 * Encoded when the average exceeds 0.6. Requires every row point to carry a
 * valid token.
 */
TokenEncoding CheckTokensEncodeSerpentine(const std::vector<Point2d>& points,
                                          const std::vector<SequenceToken>& tokens,
                                          const std::vector<std::vector<int>>& rows);

/**
 * @brief Reversals in the token walk
 */
struct SequenceReversals {
    bool isSerpentine = false;
    std::vector<int> rowBreaks;     ///< Step indices where the walk turns back
    double confidence = 0.0;        ///< 1 - CV of the break intervals
    double avgPointsPerRow = 0.0;
};

/**
 * @brief Detect turn-backs (> reversalDeg) between consecutive token steps
 *
 * Serpentine when the reversals are regular (confidence > 0.5) or when there
 * is exactly one reversal. Needs at least 4 points with valid tokens.
 */
SequenceReversals DetectSequenceReversals(const std::vector<Point2d>& points,
                                          const std::vector<SequenceToken>& tokens,
                                          double reversalDeg = 150.0);

/**
 * @brief Reorder positions to a forced direction
 *
 * Forward: every row runs the same way as the first row.
 * Serpentine: every row runs opposite to the row before it.
 * Row order is kept; single-point rows are left alone.
 */
std::vector<std::vector<int>> ApplyDirection(const std::vector<Point2d>& points,
                                             const std::vector<std::vector<int>>& rows,
                                             OrderingDirection direction);

} // namespace Qi::Blast::Analysis

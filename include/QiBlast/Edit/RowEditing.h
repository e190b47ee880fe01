#pragma once

/**
 * @file RowEditing.h
 * @brief Post-detection row and position edits
 *
 * Every edit takes a PatternResult by const reference and returns the edited
 * copy. Labels, orphans and sub-pattern membership are re-derived so that
 * every point stays in exactly one row or in the orphans.
 *
 * Row indices are kept as given by the edits (a rename may leave gaps);
 * rows are always sorted by rowIndex.
 */

#include <QiBlast/Core/PatternResult.h>
#include <QiBlast/Core/Types.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace Qi::Blast::Edit {

// =============================================================================
// Row edits
// =============================================================================

/**
 * @brief Rename rows by an old -> new row index mapping
 *
 * Rows missing from the mapping keep their index. Rows landing on the same
 * index merge, in ascending old-index order.
 *
 * @throws InvalidArgumentException for an unknown old index or a new index < 1
 */
PatternResult RenameRows(const PatternResult& result, const std::map<int32_t, int32_t>& mapping);

/**
 * @brief Move points to a row, appended at its end
 *
 * The row is created when it does not exist. Rows left empty are removed.
 * Shape, backbone and bearing of the touched rows are left as detected.
 *
 * @throws InvalidArgumentException for no points, an out-of-range index or newRow < 1
 */
PatternResult AssignRowToPoints(const PatternResult& result, const std::vector<int>& indices, int32_t newRow);

/**
 * @brief Reverse row numbering: the k-th smallest index swaps with the k-th largest
 *
 * @param invertPositions Also reverse the positions within every row
 * @throws InvalidArgumentException for fewer than 2 rows
 */
PatternResult InvertRowOrder(const PatternResult& result, bool invertPositions = false);

/// Reverse the positions within every row
PatternResult InvertPositionsWithinRows(const PatternResult& result);

// =============================================================================
// Resequencing
// =============================================================================

/**
 * @brief How points are ordered within a row before renumbering
 */
enum class PositionOrder {
    Spatial,        ///< Projection onto the row's principal direction
    Existing        ///< Current position order
};

/**
 * @brief Resequencing parameters
 */
struct ResequenceOptions {
    OrderingDirection direction = OrderingDirection::Forward;
    int32_t startPosition = 1;                  ///< First position number (>= 1)
    PositionOrder orderBy = PositionOrder::Spatial;

    ResequenceOptions& SetDirection(OrderingDirection d) { direction = d; return *this; }
    ResequenceOptions& SetStartPosition(int32_t p) { startPosition = p; return *this; }
    ResequenceOptions& SetOrderBy(PositionOrder o) { orderBy = o; return *this; }
};

/**
 * @brief Renumber positions in every row
 *
 * Serpentine reverses every second row (in rowIndex order).
 *
 * @throws InvalidArgumentException for startPosition < 1 or a point count mismatch
 */
PatternResult ResequencePositions(const PatternResult& result,
                                  const std::vector<HolePoint>& points,
                                  const ResequenceOptions& options = ResequenceOptions());

// =============================================================================
// Renumbering
// =============================================================================

/**
 * @brief Next letter string in spreadsheet order: "A" -> "B", "Z" -> "AA", "AZ" -> "BA"
 *
 * @throws InvalidArgumentException for an empty string or non-uppercase letters
 */
std::string IncrementLetter(const std::string& letters);

/**
 * @brief New point ids in row / position order
 *
 * - numeric start ("1", "101"): a running number over all rows
 * - alphanumeric start ("A1"): a letter per row, a number per position
 *
 * Orphans keep their ids.
 *
 * @return One id per point
 * @throws InvalidArgumentException for an unparseable start, a number part of
 *         more than 15 digits, or a point count mismatch
 */
std::vector<std::string> RenumberPoints(const PatternResult& result,
                                        const std::vector<HolePoint>& points,
                                        const std::string& start);

} // namespace Qi::Blast::Edit

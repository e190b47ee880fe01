#pragma once

/**
 * @file RowDetector.h
 * @brief Row detection entry point
 *
 * DetectRows runs the full pipeline on a caller point set:
 * 1. Config validation and point set analysis
 * 2. Classification and recursive sub-pattern separation
 * 3. Strategy selection per subset (priority decision tree)
 * 4. Orphan attachment
 * 5. Row / position ordering, row shape and backbone
 * 6. Serpentine analysis and validation
 *
 * Example:
 * @code
 * std::vector<HolePoint> holes = LoadHoles();
 * DetectionConfig config;
 * config.SetDirectionMode(DirectionMode::Serpentine);
 *
 * PatternResult result = DetectRows(holes, config, [](double pct, const std::string& stage) {
 *     std::printf("%5.1f%% %s\n", pct, stage.c_str());
 * });
 * for (const auto& row : result.rows) { ... }
 * @endcode
 */

#include <QiBlast/Core/DetectionConfig.h>
#include <QiBlast/Core/PatternResult.h>
#include <QiBlast/Core/Types.h>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace Qi::Blast::Detect {

/// Progress callback: percent in [0, 100] and stage name
using ProgressCallback = std::function<void(double, const std::string&)>;

/**
 * @brief Detect rows, positions and ordering of a hole set
 *
 * @param points Caller points (never modified)
 * @param config Thresholds
 * @param progress Optional callback invoked at stage boundaries
 * @return Result where every point is in exactly one row or an orphan
 *
 * @throws ConfigurationException for an invalid config
 * @throws InputException for fewer than 2 points or zero extent
 */
PatternResult DetectRows(const std::vector<HolePoint>& points,
                         const DetectionConfig& config = DetectionConfig(),
                         const ProgressCallback& progress = ProgressCallback());

/**
 * @brief Attach orphans to rows
 *
 * Each orphan, in ascending index order, joins the row owning its nearest row
 * point when that point is within maxDistance. It is inserted at the position
 * where the row path grows least.
 *
 * @param points Plan points
 * @param rows [in/out] Rows of indices into points
 * @param orphans [in/out] Orphans; attached ones are removed
 * @return Number of attached orphans
 */
int32_t AttachOrphans(const std::vector<Point2d>& points,
                      std::vector<std::vector<int>>& rows,
                      std::vector<int>& orphans,
                      double maxDistance);

/// Curved when the row's line-fit max residual exceeds 0.5 x spacing
RowShape DetermineRowShape(const std::vector<Point2d>& points, const std::vector<int>& row, double spacing);

} // namespace Qi::Blast::Detect

#pragma once

/**
 * @file SubPatternSeparator.h
 * @brief Split a multi-pattern point set into orientation-homogeneous sub-patterns
 *
 * Role tags (MAIN, SECONDARY, BATTER, BUFFER) are advisory; they never change
 * how rows are detected inside a sub-pattern.
 */

#include <QiBlast/Classify/PatternClassifier.h>
#include <QiBlast/Core/DetectionConfig.h>
#include <QiBlast/Core/PatternResult.h>

#include <cstdint>
#include <vector>

namespace Qi::Blast::Classify {

/**
 * @brief Separate sub-patterns
 *
 * 1. Partition by orientation cluster
 * 2. Split clusters into connected components (connectivityFactor x spacing)
 * 3. Merge components smaller than minClusterSize into the sub-pattern owning
 *    the nearest point
 * 4. Tag roles relative to the largest sub-pattern (MAIN)
 * 5. Classify every sub-pattern on its own
 *
 * @param points Plan points of the set being separated
 * @param classification Classification of the same set
 * @param config Thresholds
 * @param depth Recursion depth of the set; sub-patterns get depth + 1
 * @param classifications [out] Optional classification per returned sub-pattern
 * @return Sub-patterns (point indices local to points), MAIN first, then by
 *         size descending, then by lowest member
 */
std::vector<SubPattern> SeparateSubPatterns(const std::vector<Point2d>& points,
                                            const Classification& classification,
                                            const DetectionConfig& config,
                                            int32_t depth,
                                            std::vector<Classification>* classifications = nullptr);

/**
 * @brief Role of a sub-pattern relative to MAIN
 *
 * Perpendicular (within tolerance of 90 degrees) sub-patterns are BATTER when
 * their centroid lies beyond MAIN's extent along MAIN's row axis, otherwise
 * BUFFER. Anything else is SECONDARY.
 */
SubPatternRole TagSubPatternRole(const std::vector<Point2d>& points,
                                 const std::vector<int>& mainPoints, double mainOrientationDeg,
                                 const std::vector<int>& candidate, double candidateOrientationDeg,
                                 double toleranceDeg);

} // namespace Qi::Blast::Classify

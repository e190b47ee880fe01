#pragma once

/**
 * @file DetectionConfig.h
 * @brief Thresholds and tuning parameters for row detection
 *
 * One DetectionConfig value travels by const reference through the whole
 * pipeline. Zero-valued "auto" fields (knnK, dbscanEps, dbscanMinPts) are
 * derived from the point set at run time.
 *
 * Example:
 * @code
 * DetectionConfig config;
 * config.SetSnakeAngle(80.0).SetOrientationTolerance(12.0).SetDebug(true);
 * PatternResult result = DetectRows(points, config);
 * @endcode
 */

#include <cstdint>

namespace Qi::Blast {

/**
 * @brief Forced position ordering mode
 */
enum class DirectionMode {
    Auto,           ///< Keep detected ordering, report direction
    Forward,        ///< Force every row to run the same way
    Serpentine      ///< Force alternate rows to reverse
};

/**
 * @brief Row detection configuration
 */
struct DetectionConfig {
    // --- Pattern classification ---
    double straightVarianceRatio = 5.0;     ///< Ratio above which rows are straight
    double curvedVarianceRatio = 3.0;       ///< Ratio below which rows are curved
    double straightCurvatureMax = 0.1;      ///< Mean curvature (1/m) allowed for straight
    double curvedCurvatureMin = 0.3;        ///< Mean curvature (1/m) forcing curved
    double orientationToleranceDeg = 15.0;  ///< Orientation clustering tolerance
    int32_t curvatureNeighbors = 5;         ///< Neighbours used by the local circle fit
    int32_t minClusterSize = 3;             ///< Smallest populated orientation cluster
    double minClusterFraction = 0.1;        ///< Populated cluster share of all points
    double connectivityFactor = 2.0;        ///< Spatial link radius in spacings
    int32_t maxRecursionDepth = 3;          ///< Sub-pattern recursion cap

    // --- Sequence tokens ---
    double sequenceReliability = 0.7;       ///< Parseable token share for reliability

    // --- Winding sequence ---
    double snakeAngleDeg = 90.0;            ///< Bearing change that ends a winding row [75, 105]
    int32_t windingWindow = 4;              ///< Look-back window in steps
    int32_t minPointsPerRow = 3;            ///< Minimum points between row breaks
    double windingMaxJumpFactor = 3.0;      ///< Largest step allowed, in median steps
    int32_t windingMaxTokenGap = 5;         ///< Largest token gap allowed

    // --- Row splitting ---
    double rowSplitDeviationFactor = 0.5;   ///< Perpendicular deviation in spacings
    double rowJumpFactor = 2.5;             ///< Gap that ends a row, in spacings
    double gentleTurnDeg = 30.0;            ///< Largest turn kept within a row
    double reversalDeg = 150.0;             ///< Turn treated as a serpentine reversal

    // --- Smoothing ---
    double loessBandwidth = 0.3;            ///< LOESS span as fraction of points
    int32_t principalCurveMaxIterations = 20;
    double principalCurveTolerance = 1e-3;  ///< Convergence movement in spacings

    // --- Neighbourhood / density (0 = auto) ---
    int32_t knnK = 0;
    double dbscanEps = 0.0;
    int32_t dbscanMinPts = 0;

    // --- Fallback and acceptance ---
    double simplifyToleranceFactor = 0.3;   ///< Douglas-Peucker epsilon in spacings
    double minStrategyConfidence = 0.5;     ///< Strategy acceptance threshold
    double orphanAttachFactor = 1.5;        ///< Orphan attach radius in spacings

    // --- Ordering ---
    DirectionMode directionMode = DirectionMode::Auto;
    bool detectSerpentine = true;

    // --- Diagnostics ---
    bool debug = false;                     ///< Print [Tag] diagnostics to stderr

    // Builder pattern
    DetectionConfig& SetVarianceRatios(double straight, double curved) {
        straightVarianceRatio = straight; curvedVarianceRatio = curved; return *this;
    }
    DetectionConfig& SetCurvatureLimits(double straightMax, double curvedMin) {
        straightCurvatureMax = straightMax; curvedCurvatureMin = curvedMin; return *this;
    }
    DetectionConfig& SetOrientationTolerance(double deg) { orientationToleranceDeg = deg; return *this; }
    DetectionConfig& SetMaxRecursionDepth(int32_t d) { maxRecursionDepth = d; return *this; }
    DetectionConfig& SetSnakeAngle(double deg) { snakeAngleDeg = deg; return *this; }
    DetectionConfig& SetKnnK(int32_t k) { knnK = k; return *this; }
    DetectionConfig& SetDbscan(double eps, int32_t minPts) {
        dbscanEps = eps; dbscanMinPts = minPts; return *this;
    }
    DetectionConfig& SetMinStrategyConfidence(double c) { minStrategyConfidence = c; return *this; }
    DetectionConfig& SetDirectionMode(DirectionMode m) { directionMode = m; return *this; }
    DetectionConfig& SetDetectSerpentine(bool on) { detectSerpentine = on; return *this; }
    DetectionConfig& SetDebug(bool on) { debug = on; return *this; }

    /**
     * @brief Check every threshold
     * @throws ConfigurationException naming the first invalid field
     */
    void Validate() const;
};

} // namespace Qi::Blast

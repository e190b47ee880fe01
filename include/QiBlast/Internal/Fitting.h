#pragma once

/**
 * @file Fitting.h
 * @brief Geometric fitting for hole layouts
 *
 * This module provides:
 * - Principal axes of a point set (2x2 covariance eigen-decomposition)
 * - Pooled principal axes over several groups (within-group scatter)
 * - Line fitting: total least squares
 * - Circle fitting: algebraic (Kasa)
 * - Residual computation and statistics
 *
 * Used by:
 * - PatternClassifier (variance ratio, local curvature)
 * - Row strategies (line splitting, PCA rotation, residual scores)
 * - RowValidator / DetectRows (row shape)
 *
 * All functions are pure.
 */

#include <QiBlast/Core/Types.h>

#include <vector>

namespace Qi::Blast::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Minimum points required for line fitting
constexpr int LINE_FIT_MIN_POINTS = 2;

/// Minimum points required for circle fitting
constexpr int CIRCLE_FIT_MIN_POINTS = 3;

/// Relative determinant below which the circle system is treated as singular
constexpr double CIRCLE_SINGULAR_TOLERANCE = 1e-12;

// =============================================================================
// Result Structures
// =============================================================================

/**
 * @brief Base class for all fitting results
 */
struct FitResultBase {
    bool success = false;           ///< Whether fitting succeeded

    int numPoints = 0;              ///< Total number of input points

    double residualMean = 0.0;      ///< Mean of absolute residuals
    double residualStd = 0.0;       ///< Standard deviation of residuals
    double residualMax = 0.0;       ///< Maximum absolute residual
    double residualRMS = 0.0;       ///< Root mean square of residuals

    std::vector<double> residuals;  ///< Per-point signed residuals
};

/**
 * @brief Line fitting result
 */
struct LineFitResult : public FitResultBase {
    Line2d line;                    ///< Fitted line (ax + by + c = 0, normalized)
    Point2d centroid;               ///< Centroid of the fitted points

    /// Unit direction along the line
    Point2d Direction() const { return line.Direction(); }
};

/**
 * @brief Circle fitting result
 */
struct CircleFitResult : public FitResultBase {
    Circle2d circle;                ///< Fitted circle (center, radius)

    Point2d Center() const { return circle.center; }
    double Radius() const { return circle.radius; }

    /// Curvature 1/r, 0 for a failed fit
    double Curvature() const { return success && circle.radius > 0.0 ? 1.0 / circle.radius : 0.0; }
};

/**
 * @brief Principal axes of a 2D point distribution
 */
struct PrincipalAxes {
    bool valid = false;
    Point2d centroid;
    Point2d major{1.0, 0.0};        ///< Unit eigenvector of the larger eigenvalue
    Point2d minor{0.0, 1.0};        ///< Unit eigenvector of the smaller eigenvalue
    double lambda1 = 0.0;           ///< Larger eigenvalue of the covariance
    double lambda2 = 0.0;           ///< Smaller eigenvalue of the covariance

    /// lambda1 / lambda2, capped at MAX_VARIANCE_RATIO
    double VarianceRatio() const;
};

// =============================================================================
// Principal Axes
// =============================================================================

/**
 * @brief Centroid of a point set
 */
Point2d ComputeCentroid(const std::vector<Point2d>& points);

/**
 * @brief Principal axes from the coordinate covariance matrix
 *
 * Needs at least 2 points; the result is invalid for fewer or for a
 * degenerate (all coincident) set.
 */
PrincipalAxes ComputePrincipalAxes(const std::vector<Point2d>& points);

/**
 * @brief Principal axes of the pooled within-group scatter
 *
 * Each group is centred on its own mean before its scatter is accumulated, so
 * parallel rows contribute their common along-row direction rather than the
 * across-row spread. Groups with fewer than 2 points are ignored.
 */
PrincipalAxes ComputePooledAxes(const std::vector<std::vector<Point2d>>& groups);

// =============================================================================
// Line Fitting
// =============================================================================

/**
 * @brief Fit line using total least squares (orthogonal regression)
 *
 * @param points Input points (>= 2)
 * @return Line fit result; residuals are signed distances
 */
LineFitResult FitLine(const std::vector<Point2d>& points);

/**
 * @brief Compute signed residuals for a line
 */
std::vector<double> ComputeLineResiduals(const std::vector<Point2d>& points, const Line2d& line);

// =============================================================================
// Circle Fitting
// =============================================================================

/**
 * @brief Fit circle using algebraic method (Kasa)
 *
 * Minimizes the algebraic distance on centred coordinates. Collinear or
 * near-collinear input fails (success = false) instead of returning a huge
 * circle.
 *
 * @param points Input points (>= 3)
 */
CircleFitResult FitCircleAlgebraic(const std::vector<Point2d>& points);

/**
 * @brief Compute signed residuals for a circle (distance to center - radius)
 */
std::vector<double> ComputeCircleResiduals(const std::vector<Point2d>& points,
                                           const Circle2d& circle);

} // namespace Qi::Blast::Internal

#pragma once

/**
 * @file Smoothing.h
 * @brief Curve smoothing and simplification
 *
 * This module provides:
 * - LOESS: local linear regression with tricube weights
 * - Cubic B-spline (clamped, uniform knots, Cox-de Boor basis)
 * - Douglas-Peucker polyline simplification
 */

#include <QiBlast/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Qi::Blast::Internal {

// =============================================================================
// LOESS
// =============================================================================

/// Minimum number of points in a LOESS neighbourhood
constexpr int LOESS_MIN_POINTS = 3;

/**
 * @brief Tricube weight (1 - |u|^3)^3 for |u| < 1, else 0
 */
double TricubeWeight(double u);

/**
 * @brief LOESS smoothing of y(x), evaluated at the given abscissae
 *
 * For each evaluation point the nearest ceil(span * n) samples (at least
 * LOESS_MIN_POINTS) are weighted by tricube distance and fitted with a
 * weighted line. Neighbourhoods without x-spread fall back to the weighted
 * mean.
 *
 * @param x Sample abscissae
 * @param y Sample values (same size as x)
 * @param span Fraction of samples in each neighbourhood, (0, 1]
 * @param evalAt Abscissae to evaluate
 * @return Smoothed values at evalAt
 */
std::vector<double> Loess(const std::vector<double>& x, const std::vector<double>& y,
                          double span, const std::vector<double>& evalAt);

// =============================================================================
// B-Spline
// =============================================================================

/**
 * @brief Clamped cubic B-spline with uniform interior knots
 *
 * With fewer than 4 control points the degree drops to (count - 1).
 * Parameter t runs over [0, 1]; the curve starts and ends on the first and
 * last control points.
 */
class CubicBSpline {
public:
    CubicBSpline() = default;
    explicit CubicBSpline(std::vector<Point2d> controlPoints);

    /// Point at parameter t in [0, 1]
    Point2d Evaluate(double t) const;

    /// Dense polyline with samplesPerSpan points per knot span
    std::vector<Point2d> Sample(int32_t samplesPerSpan) const;

    int32_t Degree() const { return degree_; }
    const std::vector<Point2d>& ControlPoints() const { return control_; }
    bool Empty() const { return control_.empty(); }

private:
    /// Cox-de Boor recursion for basis N_{i,p}(t)
    double Basis(int i, int p, double t) const;

    std::vector<Point2d> control_;
    std::vector<double> knots_;
    int32_t degree_ = 0;
};

// =============================================================================
// Douglas-Peucker
// =============================================================================

/**
 * @brief Ramer-Douglas-Peucker simplification
 *
 * @param polyline Ordered vertices
 * @param epsilon Maximum perpendicular deviation of dropped vertices
 * @return Indices of kept vertices, ascending, always including both ends
 */
std::vector<int> DouglasPeucker(const std::vector<Point2d>& polyline, double epsilon);

} // namespace Qi::Blast::Internal

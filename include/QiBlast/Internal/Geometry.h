#pragma once

/**
 * @file Geometry.h
 * @brief Plan geometry helpers: bearings, segments, polylines
 *
 * Bearings are compass degrees in [0, 360): 0 = north (+y), 90 = east (+x).
 * Orientations are axial bearings in [0, 180).
 */

#include <QiBlast/Core/Types.h>

#include <vector>

namespace Qi::Blast::Internal {

// =============================================================================
// Bearings
// =============================================================================

/// Compass bearing of the step from -> to
double CompassBearing(const Point2d& from, const Point2d& to);

/// Compass bearing of a direction vector
double DirectionBearing(const Point2d& direction);

/// Unit direction vector of a compass bearing
Point2d BearingDirection(double bearingDeg);

/// Axial orientation of the step from -> to, in [0, 180)
double AxialBearing(const Point2d& from, const Point2d& to);

/**
 * @brief Axial mean of orientations (doubled-angle averaging)
 *
 * @param orientationsDeg Axial orientations in degrees
 * @param resultant [out] Mean resultant length in [0, 1]; small values mean
 *                  the orientations cancel out
 * @return Mean orientation in [0, 180)
 */
double AxialMean(const std::vector<double>& orientationsDeg, double* resultant = nullptr);

/**
 * @brief Canonical orientation of an undirected axis
 *
 * Returns +d or -d such that x > 0, or y > 0 when x is ~0.
 */
Point2d CanonicalDirection(const Point2d& direction);

// =============================================================================
// Segments and Polylines
// =============================================================================

/**
 * @brief Distance from p to segment [a, b]
 * @param t [out] Clamped segment parameter of the foot point in [0, 1]
 */
double DistanceToSegment(const Point2d& p, const Point2d& a, const Point2d& b, double* t = nullptr);

/// Cumulative arc length at each polyline vertex (first is 0)
std::vector<double> CumulativeArcLength(const std::vector<Point2d>& polyline);

/**
 * @brief Projection of a point onto a polyline
 */
struct PolylineProjection {
    double arcLength = 0.0;     ///< Arc length of the foot point
    double offset = 0.0;        ///< Signed offset (left of travel is positive)
    double distance = 0.0;      ///< Unsigned distance to the polyline
    Point2d foot;               ///< Closest point on the polyline
    int segment = -1;           ///< Segment index of the foot point
};

/**
 * @brief Project a point onto a polyline (closest point; first segment wins ties)
 *
 * A single-vertex polyline projects everything onto that vertex.
 */
PolylineProjection ProjectOntoPolyline(const std::vector<Point2d>& polyline,
                                       const std::vector<double>& arcLength,
                                       const Point2d& p);

/// Axis-aligned bounding box of a point set
BoundingBox ComputeBoundingBox(const std::vector<Point2d>& points);

} // namespace Qi::Blast::Internal

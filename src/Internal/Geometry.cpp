/**
 * @file Geometry.cpp
 * @brief Plan geometry helpers
 */

#include <QiBlast/Internal/Geometry.h>
#include <QiBlast/Core/Constants.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Qi::Blast::Internal {

// =============================================================================
// Bearings
// =============================================================================

double CompassBearing(const Point2d& from, const Point2d& to) {
    return DirectionBearing(to - from);
}

double DirectionBearing(const Point2d& direction) {
    return NormalizeBearing(std::atan2(direction.x, direction.y) * RAD_TO_DEG);
}

Point2d BearingDirection(double bearingDeg) {
    double rad = bearingDeg * DEG_TO_RAD;
    return Point2d(std::sin(rad), std::cos(rad));
}

double AxialBearing(const Point2d& from, const Point2d& to) {
    return NormalizeAxial(CompassBearing(from, to));
}

double AxialMean(const std::vector<double>& orientationsDeg, double* resultant) {
    if (orientationsDeg.empty()) {
        if (resultant) *resultant = 0.0;
        return 0.0;
    }

    double sx = 0.0, sy = 0.0;
    for (double a : orientationsDeg) {
        double doubled = 2.0 * a * DEG_TO_RAD;
        sx += std::cos(doubled);
        sy += std::sin(doubled);
    }

    double n = static_cast<double>(orientationsDeg.size());
    if (resultant) {
        *resultant = std::sqrt(sx * sx + sy * sy) / n;
    }
    return NormalizeAxial(std::atan2(sy, sx) * RAD_TO_DEG / 2.0);
}

Point2d CanonicalDirection(const Point2d& direction) {
    Point2d d = direction.Normalized();
    if (d.x < -DISTANCE_EPSILON || (std::abs(d.x) <= DISTANCE_EPSILON && d.y < 0.0)) {
        return d * -1.0;
    }
    return d;
}

// =============================================================================
// Segments and Polylines
// =============================================================================

double DistanceToSegment(const Point2d& p, const Point2d& a, const Point2d& b, double* t) {
    Point2d ab = b - a;
    double len2 = ab.Dot(ab);
    double s = 0.0;
    if (len2 > EPSILON * EPSILON) {
        s = Clamp((p - a).Dot(ab) / len2, 0.0, 1.0);
    }
    if (t) *t = s;
    return p.DistanceTo(a + ab * s);
}

std::vector<double> CumulativeArcLength(const std::vector<Point2d>& polyline) {
    std::vector<double> arc(polyline.size(), 0.0);
    for (size_t i = 1; i < polyline.size(); ++i) {
        arc[i] = arc[i - 1] + polyline[i].DistanceTo(polyline[i - 1]);
    }
    return arc;
}

PolylineProjection ProjectOntoPolyline(const std::vector<Point2d>& polyline,
                                       const std::vector<double>& arcLength,
                                       const Point2d& p) {
    PolylineProjection best;
    if (polyline.empty()) {
        return best;
    }

    if (polyline.size() == 1) {
        best.foot = polyline[0];
        best.distance = p.DistanceTo(polyline[0]);
        best.segment = 0;
        return best;
    }

    best.distance = std::numeric_limits<double>::max();
    for (size_t i = 0; i + 1 < polyline.size(); ++i) {
        double t = 0.0;
        double d = DistanceToSegment(p, polyline[i], polyline[i + 1], &t);
        if (d < best.distance) {
            Point2d seg = polyline[i + 1] - polyline[i];
            best.distance = d;
            best.segment = static_cast<int>(i);
            best.foot = polyline[i] + seg * t;
            best.arcLength = arcLength[i] + seg.Norm() * t;
            double side = seg.Cross(p - polyline[i]);
            best.offset = side >= 0.0 ? d : -d;
        }
    }
    return best;
}

BoundingBox ComputeBoundingBox(const std::vector<Point2d>& points) {
    BoundingBox box;
    if (points.empty()) {
        return box;
    }

    box.minX = box.maxX = points[0].x;
    box.minY = box.maxY = points[0].y;
    for (const auto& p : points) {
        box.minX = std::min(box.minX, p.x);
        box.maxX = std::max(box.maxX, p.x);
        box.minY = std::min(box.minY, p.y);
        box.maxY = std::max(box.maxY, p.y);
    }
    return box;
}

} // namespace Qi::Blast::Internal

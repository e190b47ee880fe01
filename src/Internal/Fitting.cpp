/**
 * @file Fitting.cpp
 * @brief Implementation of geometric fitting algorithms
 */

#include <QiBlast/Internal/Fitting.h>
#include <QiBlast/Core/Constants.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace Qi::Blast::Internal {

// =============================================================================
// Helper Functions (anonymous namespace)
// =============================================================================

namespace {

using Mat3 = std::array<std::array<double, 3>, 3>;
using Vec3 = std::array<double, 3>;

double Det3(const Mat3& m) {
    return m[0][0] * (m[1][1] * m[2][2] - m[1][2] * m[2][1])
         - m[0][1] * (m[1][0] * m[2][2] - m[1][2] * m[2][0])
         + m[0][2] * (m[1][0] * m[2][1] - m[1][1] * m[2][0]);
}

/// Cramer's rule; returns false for a singular system
bool Solve3x3(const Mat3& m, const Vec3& rhs, double tolerance, Vec3& out) {
    double det = Det3(m);
    if (std::abs(det) < tolerance) {
        return false;
    }

    for (int col = 0; col < 3; ++col) {
        Mat3 mc = m;
        for (int row = 0; row < 3; ++row) {
            mc[row][col] = rhs[row];
        }
        out[col] = Det3(mc) / det;
    }
    return true;
}

/// Fill result statistics from signed residuals
void FillResidualStats(FitResultBase& result, const std::vector<double>& residuals) {
    result.numPoints = static_cast<int>(residuals.size());

    if (residuals.empty()) {
        return;
    }

    double sumAbs = 0.0;
    double sumSq = 0.0;
    double maxAbs = 0.0;

    for (double r : residuals) {
        double absR = std::abs(r);
        sumAbs += absR;
        sumSq += r * r;
        maxAbs = std::max(maxAbs, absR);
    }

    int n = static_cast<int>(residuals.size());
    result.residualMean = sumAbs / n;
    result.residualRMS = std::sqrt(sumSq / n);
    result.residualMax = maxAbs;

    double sumSqDev = 0.0;
    for (double r : residuals) {
        double dev = std::abs(r) - result.residualMean;
        sumSqDev += dev * dev;
    }
    result.residualStd = std::sqrt(sumSqDev / n);
    result.residuals = residuals;
}

/// Eigen-decomposition of the symmetric 2x2 scatter [[sxx, sxy], [sxy, syy]]
PrincipalAxes AxesFromScatter(const Point2d& centroid, double sxx, double sxy, double syy) {
    PrincipalAxes axes;
    axes.centroid = centroid;

    double trace = sxx + syy;
    if (trace <= EPSILON * EPSILON) {
        return axes;
    }

    double det = sxx * syy - sxy * sxy;
    double disc = trace * trace - 4.0 * det;
    if (disc < 0) disc = 0;
    double sqrtDisc = std::sqrt(disc);

    axes.lambda1 = (trace + sqrtDisc) / 2.0;
    axes.lambda2 = std::max(0.0, (trace - sqrtDisc) / 2.0);

    // Two algebraically equivalent eigenvector forms; keep the better conditioned one
    Point2d v1(axes.lambda1 - syy, sxy);
    Point2d v2(sxy, axes.lambda1 - sxx);
    Point2d major = v1.Norm() >= v2.Norm() ? v1 : v2;

    if (major.Norm() < 1e-15) {
        major = sxx >= syy ? Point2d(1.0, 0.0) : Point2d(0.0, 1.0);
    }

    axes.major = major.Normalized();
    axes.minor = Point2d(axes.major.y, -axes.major.x);
    axes.valid = true;
    return axes;
}

} // anonymous namespace

// =============================================================================
// Principal Axes
// =============================================================================

double PrincipalAxes::VarianceRatio() const {
    if (!valid || lambda1 <= 0.0) {
        return 1.0;
    }
    if (lambda2 <= lambda1 / MAX_VARIANCE_RATIO) {
        return MAX_VARIANCE_RATIO;
    }
    return std::min(MAX_VARIANCE_RATIO, lambda1 / lambda2);
}

Point2d ComputeCentroid(const std::vector<Point2d>& points) {
    if (points.empty()) {
        return Point2d(0.0, 0.0);
    }

    double sx = 0.0, sy = 0.0;
    for (const auto& p : points) {
        sx += p.x;
        sy += p.y;
    }

    int n = static_cast<int>(points.size());
    return Point2d(sx / n, sy / n);
}

PrincipalAxes ComputePrincipalAxes(const std::vector<Point2d>& points) {
    if (points.size() < 2) {
        PrincipalAxes axes;
        axes.centroid = ComputeCentroid(points);
        return axes;
    }

    Point2d centroid = ComputeCentroid(points);

    double sxx = 0.0, sxy = 0.0, syy = 0.0;
    for (const auto& p : points) {
        double dx = p.x - centroid.x;
        double dy = p.y - centroid.y;
        sxx += dx * dx;
        sxy += dx * dy;
        syy += dy * dy;
    }

    double n = static_cast<double>(points.size());
    return AxesFromScatter(centroid, sxx / n, sxy / n, syy / n);
}

PrincipalAxes ComputePooledAxes(const std::vector<std::vector<Point2d>>& groups) {
    double sxx = 0.0, sxy = 0.0, syy = 0.0;
    double total = 0.0;
    double cx = 0.0, cy = 0.0;

    for (const auto& group : groups) {
        if (group.size() < 2) continue;

        Point2d c = ComputeCentroid(group);
        for (const auto& p : group) {
            double dx = p.x - c.x;
            double dy = p.y - c.y;
            sxx += dx * dx;
            sxy += dx * dy;
            syy += dy * dy;
            cx += p.x;
            cy += p.y;
        }
        total += static_cast<double>(group.size());
    }

    if (total < 2.0) {
        return PrincipalAxes();
    }

    return AxesFromScatter(Point2d(cx / total, cy / total), sxx / total, sxy / total, syy / total);
}

// =============================================================================
// Line Fitting Implementation
// =============================================================================

std::vector<double> ComputeLineResiduals(const std::vector<Point2d>& points, const Line2d& line) {
    std::vector<double> residuals;
    residuals.reserve(points.size());
    for (const auto& p : points) {
        residuals.push_back(line.SignedDistance(p));
    }
    return residuals;
}

LineFitResult FitLine(const std::vector<Point2d>& points) {
    LineFitResult result;
    result.success = false;
    result.numPoints = static_cast<int>(points.size());

    if (points.size() < LINE_FIT_MIN_POINTS) {
        return result;
    }

    PrincipalAxes axes = ComputePrincipalAxes(points);
    if (!axes.valid) {
        return result;
    }

    // Normal is the minor axis; direction (-b, a) then equals the major axis
    double a = axes.minor.x;
    double b = axes.minor.y;
    double c = -(a * axes.centroid.x + b * axes.centroid.y);

    result.line = Line2d(a, b, c);
    result.centroid = axes.centroid;
    result.success = true;

    FillResidualStats(result, ComputeLineResiduals(points, result.line));
    return result;
}

// =============================================================================
// Circle Fitting Implementation
// =============================================================================

std::vector<double> ComputeCircleResiduals(const std::vector<Point2d>& points,
                                           const Circle2d& circle) {
    std::vector<double> residuals;
    residuals.reserve(points.size());
    for (const auto& p : points) {
        residuals.push_back(p.DistanceTo(circle.center) - circle.radius);
    }
    return residuals;
}

CircleFitResult FitCircleAlgebraic(const std::vector<Point2d>& points) {
    CircleFitResult result;
    result.success = false;
    result.numPoints = static_cast<int>(points.size());

    if (points.size() < CIRCLE_FIT_MIN_POINTS) {
        return result;
    }

    // Kasa method on normalized coordinates u = (p - c0) / s:
    // u^2 + v^2 + A*u + B*v + C = 0, center (-A/2, -B/2), r^2 = A^2/4 + B^2/4 - C

    Point2d c0 = ComputeCentroid(points);
    double sumSq = 0.0;
    for (const auto& p : points) {
        sumSq += (p - c0).Dot(p - c0);
    }
    double n = static_cast<double>(points.size());
    double scale = std::sqrt(sumSq / n);
    if (scale < EPSILON) {
        return result;
    }

    double suu = 0.0, suv = 0.0, su = 0.0;
    double svv = 0.0, sv = 0.0;
    double bu = 0.0, bv = 0.0, b1 = 0.0;

    for (const auto& p : points) {
        double u = (p.x - c0.x) / scale;
        double v = (p.y - c0.y) / scale;
        double rhs = -(u * u + v * v);

        suu += u * u;
        suv += u * v;
        su += u;
        svv += v * v;
        sv += v;

        bu += u * rhs;
        bv += v * rhs;
        b1 += rhs;
    }

    Mat3 M = {{{suu, suv, su}, {suv, svv, sv}, {su, sv, n}}};
    Vec3 rhs = {bu, bv, b1};
    Vec3 sol{};

    if (!Solve3x3(M, rhs, CIRCLE_SINGULAR_TOLERANCE * n * n * n, sol)) {
        return result;  // Collinear
    }

    double cu = -sol[0] / 2.0;
    double cv = -sol[1] / 2.0;
    double r2 = cu * cu + cv * cv - sol[2];

    if (r2 <= 0) {
        return result;  // Invalid circle
    }

    double radius = std::sqrt(r2) * scale;
    if (radius > MAX_CURVE_RADIUS) {
        return result;
    }

    result.circle = Circle2d(Point2d(c0.x + cu * scale, c0.y + cv * scale), radius);
    result.success = true;

    FillResidualStats(result, ComputeCircleResiduals(points, result.circle));
    return result;
}

} // namespace Qi::Blast::Internal

/**
 * @file CurveStrategies.cpp
 * @brief Smoothing-based strategies: principal curve and PCA + LOESS binning
 */

#include "StrategyImpl.h"

#include <QiBlast/Internal/Fitting.h>
#include <QiBlast/Internal/Geometry.h>
#include <QiBlast/Internal/Log.h>
#include <QiBlast/Internal/Smoothing.h>
#include <QiBlast/Internal/Statistics.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace Qi::Blast::Detect {

namespace {

/// Initial principal line extends this share of its range past the data
constexpr double INITIAL_LINE_MARGIN = 0.1;

/**
 * @brief Split values into bins where consecutive sorted values differ by more than maxGap
 *
 * @return Bins of indices into values, ordered by value
 */
std::vector<std::vector<int>> BinByGaps(const std::vector<double>& values, double maxGap) {
    std::vector<int> order(values.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) { return values[a] < values[b]; });

    std::vector<std::vector<int>> bins;
    for (size_t k = 0; k < order.size(); ++k) {
        if (k == 0 || values[order[k]] - values[order[k - 1]] > maxGap) {
            bins.emplace_back();
        }
        bins.back().push_back(order[k]);
    }
    return bins;
}

/**
 * @brief Common bow of the rows, evaluated at every u
 *
 * LOESS runs over chain points only, on their offset from their own chain's
 * mean. Non-curved sets and sets without chains of 3 get a flat spine.
 */
std::vector<double> ChainSpine(const std::vector<double>& u, const std::vector<double>& v,
                               const Classify::Classification& cls, double bandwidth) {
    std::vector<double> flat(u.size(), 0.0);
    if (cls.type != PatternType::Curved) return flat;

    std::vector<double> xs, ys;
    for (const auto& chain : cls.ChainsOfSize(3)) {
        double mean = 0.0;
        for (int i : chain) mean += v[i];
        mean /= static_cast<double>(chain.size());
        for (int i : chain) {
            xs.push_back(u[i]);
            ys.push_back(v[i] - mean);
        }
    }
    if (xs.size() < 3) return flat;
    return Internal::Loess(xs, ys, bandwidth, u);
}

/// Drop consecutive vertices closer than DISTANCE_EPSILON
std::vector<Point2d> DedupeVertices(const std::vector<Point2d>& vertices) {
    std::vector<Point2d> out;
    for (const auto& v : vertices) {
        if (out.empty() || out.back().DistanceTo(v) > DISTANCE_EPSILON) out.push_back(v);
    }
    return out;
}

/**
 * @brief Principal curve state for one iteration
 */
struct CurveFit {
    std::vector<Point2d> polyline;
    std::vector<double> arcLength;
    double residual = std::numeric_limits<double>::max();   ///< Mean distance of points to the curve
};

/// Project every point; returns per-point arc length and fills the residual
std::vector<double> ProjectAll(const std::vector<Point2d>& points, CurveFit& fit) {
    std::vector<double> lambda(points.size());
    double sum = 0.0;
    for (size_t i = 0; i < points.size(); ++i) {
        Internal::PolylineProjection proj = Internal::ProjectOntoPolyline(fit.polyline, fit.arcLength, points[i]);
        lambda[i] = proj.arcLength;
        sum += proj.distance;
    }
    fit.residual = points.empty() ? 0.0 : sum / points.size();
    return lambda;
}

} // anonymous namespace

// =============================================================================
// PrincipalCurve (Hastie-Stuetzle)
// =============================================================================

StrategyResult PrincipalCurveStrategy::Detect(const DetectionInput& input,
                                              const DetectionConfig& config) const {
    const auto kind = Kind();
    const auto& pts = input.points;
    int n = static_cast<int>(pts.size());
    if (n < 4) {
        return StrategyResult::Failure(kind, "needs at least 4 points");
    }

    Internal::PrincipalAxes axes = Internal::ComputePrincipalAxes(pts);
    if (!axes.valid) {
        return StrategyResult::Failure(kind, "degenerate point set");
    }

    // Initial curve: the first principal axis across the data
    double tMin = std::numeric_limits<double>::max();
    double tMax = std::numeric_limits<double>::lowest();
    for (const auto& p : pts) {
        double t = (p - axes.centroid).Dot(axes.major);
        tMin = std::min(tMin, t);
        tMax = std::max(tMax, t);
    }
    double margin = (tMax - tMin) * INITIAL_LINE_MARGIN;
    CurveFit current;
    current.polyline = {axes.centroid + axes.major * (tMin - margin),
                        axes.centroid + axes.major * (tMax + margin)};
    current.arcLength = Internal::CumulativeArcLength(current.polyline);

    std::vector<Point2d> previous(n);
    for (int i = 0; i < n; ++i) {
        previous[i] = Internal::ProjectOntoPolyline(current.polyline, current.arcLength, pts[i]).foot;
    }

    CurveFit best = current;
    ProjectAll(pts, best);
    double tolerance = config.principalCurveTolerance * input.spacing;
    bool converged = false;
    int iteration = 0;

    for (; iteration < config.principalCurveMaxIterations; ++iteration) {
        std::vector<double> lambda = ProjectAll(pts, current);
        if (current.residual < best.residual) best = current;

        std::vector<double> xs(n), ys(n);
        for (int i = 0; i < n; ++i) {
            xs[i] = pts[i].x;
            ys[i] = pts[i].y;
        }
        std::vector<double> sx = Internal::Loess(lambda, xs, config.loessBandwidth, lambda);
        std::vector<double> sy = Internal::Loess(lambda, ys, config.loessBandwidth, lambda);

        double movement = 0.0;
        std::vector<Point2d> smoothed(n);
        for (int i = 0; i < n; ++i) {
            smoothed[i] = Point2d(sx[i], sy[i]);
            movement = std::max(movement, smoothed[i].DistanceTo(previous[i]));
        }
        previous = smoothed;

        std::vector<int> order(n);
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](int a, int b) { return lambda[a] < lambda[b]; });
        std::vector<Point2d> vertices;
        vertices.reserve(n);
        for (int i : order) vertices.push_back(smoothed[i]);

        current.polyline = DedupeVertices(vertices);
        current.arcLength = Internal::CumulativeArcLength(current.polyline);

        if (movement < tolerance) {
            converged = true;
            ++iteration;
            break;
        }
    }

    ProjectAll(pts, current);
    if (current.residual < best.residual) best = current;

    Internal::DebugLog(config, "PrincipalCurve", "iterations=%d converged=%d residual=%.3f",
                       iteration, converged ? 1 : 0, best.residual);

    // Parallel rows by signed offset, ordered along the curve
    std::vector<double> offset(n), along(n);
    for (int i = 0; i < n; ++i) {
        Internal::PolylineProjection proj = Internal::ProjectOntoPolyline(best.polyline, best.arcLength, pts[i]);
        offset[i] = proj.offset;
        along[i] = proj.arcLength;
    }

    std::vector<std::vector<int>> rows = BinByGaps(offset, config.rowSplitDeviationFactor * input.spacing);
    for (auto& row : rows) {
        std::stable_sort(row.begin(), row.end(), [&](int a, int b) { return along[a] < along[b]; });
    }

    StrategyResult result = Detail::Finish(kind, input, std::move(rows), input.spacing);
    result.message = converged ? "converged" : "iteration cap reached";
    return result;
}

// =============================================================================
// PcaLoessBinning
// =============================================================================

StrategyResult PcaLoessBinningStrategy::Detect(const DetectionInput& input,
                                               const DetectionConfig& config) const {
    const auto kind = Kind();
    const auto& pts = input.points;
    int n = static_cast<int>(pts.size());
    if (n < 3) {
        return StrategyResult::Failure(kind, "needs at least 3 points");
    }

    // Row axis from the scatter within provisional rows, not across them
    std::vector<std::vector<Point2d>> groups;
    for (const auto& chain : input.classification.ChainsOfSize(2)) {
        groups.push_back(Detail::Gather(pts, chain));
    }
    Internal::PrincipalAxes axes = Internal::ComputePooledAxes(groups);
    if (!axes.valid) {
        axes = Internal::ComputePrincipalAxes(pts);
    }
    if (!axes.valid) {
        return StrategyResult::Failure(kind, "degenerate point set");
    }

    Point2d centroid = Internal::ComputeCentroid(pts);
    Point2d along = Internal::CanonicalDirection(axes.major);
    Point2d across = along.Perpendicular();

    std::vector<double> u(n), v(n);
    for (int i = 0; i < n; ++i) {
        Point2d d = pts[i] - centroid;
        u[i] = d.Dot(along);
        v[i] = d.Dot(across);
    }

    std::vector<double> spine = ChainSpine(u, v, input.classification, config.loessBandwidth);
    std::vector<double> residual(n);
    for (int i = 0; i < n; ++i) {
        residual[i] = v[i] - spine[i];
    }

    std::vector<std::vector<int>> rows = BinByGaps(residual, config.rowSplitDeviationFactor * input.spacing);
    for (auto& row : rows) {
        std::stable_sort(row.begin(), row.end(), [&](int a, int b) {
            if (u[a] != u[b]) return u[a] < u[b];
            return a < b;
        });
    }

    Internal::DebugLog(config, "PcaLoess", "axis=%.1f bins=%zu", Internal::DirectionBearing(along), rows.size());

    StrategyResult result = Detail::Finish(kind, input, std::move(rows), input.spacing);
    result.message = std::to_string(result.rows.size()) + " bins";
    return result;
}

} // namespace Qi::Blast::Detect

/**
 * @file SequenceStrategies.cpp
 * @brief Strategies that walk the points in sequence-token order
 *
 * - WindingSequence: one winding path cut where it turns back
 * - SequenceLineFit: rows grown while the next hole stays on the row's line
 * - SplineFit: runs cut where a link leaves a B-spline through the run
 */

#include "StrategyImpl.h"

#include <QiBlast/Internal/Fitting.h>
#include <QiBlast/Internal/Geometry.h>
#include <QiBlast/Internal/Log.h>
#include <QiBlast/Internal/Smoothing.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <string>

namespace Qi::Blast::Detect {

namespace {

/// Samples per spline span for distance queries
constexpr int32_t SPLINE_SAMPLES_PER_SPAN = 8;

/// Control point cap for long runs
constexpr size_t SPLINE_MAX_CONTROL_POINTS = 50;

/// Spline deviation, in spacings, above which a sharp link is cut
constexpr double SPLINE_DEVIATION_FACTOR = 0.2;

/// Indices with a valid token, in token order
std::vector<int> ValidTokenOrder(const DetectionInput& input) {
    std::vector<int> valid;
    for (size_t i = 0; i < input.Size(); ++i) {
        if (input.tokens[i].valid) valid.push_back(static_cast<int>(i));
    }
    return Analysis::OrderByToken(valid, input.tokens);
}

/// Evenly subsampled control points, first and last kept
std::vector<Point2d> ControlPoints(const std::vector<Point2d>& run) {
    if (run.size() <= SPLINE_MAX_CONTROL_POINTS) return run;
    std::vector<Point2d> control;
    control.reserve(SPLINE_MAX_CONTROL_POINTS);
    double step = static_cast<double>(run.size() - 1) / (SPLINE_MAX_CONTROL_POINTS - 1);
    for (size_t k = 0; k < SPLINE_MAX_CONTROL_POINTS; ++k) {
        control.push_back(run[static_cast<size_t>(std::lround(k * step))]);
    }
    return control;
}

/// Prefix sort: shorter first, then alphabetical (A..Z, AA..)
bool PrefixLess(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return a.size() < b.size();
    return a < b;
}

} // anonymous namespace

// =============================================================================
// WindingSequence
// =============================================================================

StrategyResult WindingSequenceStrategy::Detect(const DetectionInput& input,
                                               const DetectionConfig& config) const {
    const auto kind = Kind();
    int n = static_cast<int>(input.Size());
    if (n < 6) {
        return StrategyResult::Failure(kind, "needs at least 6 points");
    }
    for (const auto& token : input.tokens) {
        if (!token.valid || token.HasPrefix()) {
            return StrategyResult::Failure(kind, "tokens are not all numeric");
        }
    }

    std::vector<int> order = Analysis::OrderByToken(Detail::Iota(n), input.tokens);

    for (int k = 1; k < n; ++k) {
        int64_t gap = input.tokens[order[k]].number - input.tokens[order[k - 1]].number;
        if (gap > config.windingMaxTokenGap) {
            return StrategyResult::Failure(kind, "token gap of " + std::to_string(gap));
        }
    }

    const auto& pts = input.points;
    std::vector<double> bearings;
    std::vector<double> distances;
    for (int k = 1; k < n; ++k) {
        bearings.push_back(Internal::CompassBearing(pts[order[k - 1]], pts[order[k]]));
        distances.push_back(pts[order[k - 1]].DistanceTo(pts[order[k]]));
    }

    // A return jump means rows are numbered one way, not a winding path
    if (distances.size() > 2) {
        std::vector<double> sorted = distances;
        std::sort(sorted.begin(), sorted.end());
        double maxJump = config.windingMaxJumpFactor * sorted[sorted.size() / 2];
        for (double d : distances) {
            if (d > maxJump) {
                return StrategyResult::Failure(kind, "step jump exceeds " + std::to_string(maxJump));
            }
        }
    }

    int window = config.windingWindow;
    double threshold = config.snakeAngleDeg + BEARING_EPSILON;
    std::vector<int> breaks{0};
    int lastBreak = 0;
    double entryBearing = bearings.empty() ? 0.0 : bearings.front();
    for (int m = window; m < static_cast<int>(bearings.size()); ++m) {
        double windowChange = BearingDifference(bearings[m], bearings[m - window]);
        double entryChange = BearingDifference(bearings[m], entryBearing);
        if ((windowChange > threshold || entryChange > threshold) &&
            m - lastBreak >= config.minPointsPerRow) {
            breaks.push_back(m);
            lastBreak = m;
            entryBearing = bearings[m];
            Internal::DebugLog(config, "Winding", "break at step %d (window %.1f, entry %.1f)",
                               m, windowChange, entryChange);
        }
    }
    if (breaks.size() < 2) {
        return StrategyResult::Failure(kind, "no turn-backs found");
    }
    breaks.push_back(n);

    std::vector<std::vector<int>> rows;
    int smallRows = 0;
    for (size_t b = 1; b < breaks.size(); ++b) {
        rows.emplace_back(order.begin() + breaks[b - 1], order.begin() + breaks[b]);
        if (static_cast<int32_t>(rows.back().size()) < config.minPointsPerRow) ++smallRows;
    }
    if (2 * smallRows > static_cast<int>(rows.size())) {
        return StrategyResult::Failure(kind, "too many small rows");
    }

    StrategyResult result = Detail::Finish(kind, input, std::move(rows), input.spacing);
    result.confidence = 1.0 - 0.5 * static_cast<double>(smallRows) / result.rows.size();
    result.message = std::to_string(result.rows.size()) + " winding rows";
    return result;
}

// =============================================================================
// SequenceLineFit
// =============================================================================

StrategyResult SequenceLineFitStrategy::Detect(const DetectionInput& input,
                                               const DetectionConfig& config) const {
    const auto kind = Kind();
    if (input.Size() < 2) {
        return StrategyResult::Failure(kind, "needs at least 2 points");
    }

    // Alphanumeric mode: one row per prefix
    if (input.alphanumeric) {
        std::map<std::string, std::vector<int>> groups;
        for (size_t i = 0; i < input.Size(); ++i) {
            const auto& t = input.tokens[i];
            if (t.valid && t.HasPrefix()) groups[t.prefix].push_back(static_cast<int>(i));
        }
        if (groups.size() >= 2) {
            std::vector<std::string> prefixes;
            for (const auto& entry : groups) prefixes.push_back(entry.first);
            std::sort(prefixes.begin(), prefixes.end(), PrefixLess);

            std::vector<std::vector<int>> rows;
            for (const auto& prefix : prefixes) {
                std::vector<int> row = groups[prefix];
                std::stable_sort(row.begin(), row.end(), [&](int a, int b) {
                    return input.tokens[a].number < input.tokens[b].number;
                });
                rows.push_back(std::move(row));
            }
            StrategyResult result = Detail::Finish(kind, input, std::move(rows), input.spacing);
            result.message = "rows by prefix";
            return result;
        }
    }

    std::vector<int> order = ValidTokenOrder(input);
    if (order.size() < 2) {
        return StrategyResult::Failure(kind, "fewer than 2 valid tokens");
    }

    const auto& pts = input.points;
    double maxJump = config.rowJumpFactor * input.spacing;
    double maxDeviation = config.rowSplitDeviationFactor * input.spacing;

    std::vector<std::vector<int>> rows{{order.front()}};
    for (size_t k = 1; k < order.size(); ++k) {
        int p = order[k];
        auto& row = rows.back();
        const Point2d& prev = pts[row.back()];

        bool split = prev.DistanceTo(pts[p]) > maxJump;
        if (!split && row.size() >= 2) {
            Internal::LineFitResult fit = Internal::FitLine(Detail::Gather(pts, row));
            if (fit.success && fit.line.Distance(pts[p]) > maxDeviation) {
                split = true;
            }
            double rowBearing = Internal::CompassBearing(pts[row.front()], prev);
            double stepBearing = Internal::CompassBearing(prev, pts[p]);
            if (BearingDifference(rowBearing, stepBearing) > config.gentleTurnDeg + BEARING_EPSILON) {
                split = true;
            }
        }

        if (split) {
            rows.push_back({p});
        } else {
            row.push_back(p);
        }
    }

    StrategyResult result = Detail::Finish(kind, input, std::move(rows), input.spacing);
    result.message = std::to_string(result.rows.size()) + " rows from token order";
    return result;
}

// =============================================================================
// SplineFit
// =============================================================================

StrategyResult SplineFitStrategy::Detect(const DetectionInput& input,
                                         const DetectionConfig& config) const {
    const auto kind = Kind();
    std::vector<int> order = ValidTokenOrder(input);
    if (order.size() < 3) {
        return StrategyResult::Failure(kind, "fewer than 3 valid tokens");
    }

    const auto& pts = input.points;
    double maxDeviation = SPLINE_DEVIATION_FACTOR * input.spacing;
    double turnLimit = config.gentleTurnDeg + BEARING_EPSILON;

    std::vector<std::vector<int>> rows;
    for (const auto& run : Detail::SplitAtJumps(pts, order, config.rowJumpFactor * input.spacing)) {
        if (run.size() < 3) {
            rows.push_back(run);
            continue;
        }

        std::vector<Point2d> runPts = Detail::Gather(pts, run);
        Internal::CubicBSpline spline(ControlPoints(runPts));
        std::vector<Point2d> curve = spline.Sample(SPLINE_SAMPLES_PER_SPAN);
        std::vector<double> arc = Internal::CumulativeArcLength(curve);

        size_t m = run.size();
        std::vector<double> deviation(m);
        for (size_t k = 0; k < m; ++k) {
            deviation[k] = Internal::ProjectOntoPolyline(curve, arc, runPts[k]).distance;
        }

        std::vector<double> steps;
        for (size_t k = 0; k + 1 < m; ++k) {
            steps.push_back(Internal::CompassBearing(runPts[k], runPts[k + 1]));
        }

        std::vector<int> current{run[0]};
        for (size_t k = 0; k + 1 < m; ++k) {
            bool hasIn = k > 0;
            bool hasOut = k + 1 < steps.size();
            bool sharpIn = !hasIn || BearingDifference(steps[k], steps[k - 1]) > turnLimit;
            bool sharpOut = !hasOut || BearingDifference(steps[k], steps[k + 1]) > turnLimit;
            bool sharp = (hasIn || hasOut) && sharpIn && sharpOut;

            if (sharp && std::max(deviation[k], deviation[k + 1]) > maxDeviation) {
                rows.push_back(std::move(current));
                current.clear();
            }
            current.push_back(run[k + 1]);
        }
        rows.push_back(std::move(current));
    }

    StrategyResult result = Detail::Finish(kind, input, std::move(rows), input.spacing);
    result.message = std::to_string(result.rows.size()) + " rows along spline";
    return result;
}

} // namespace Qi::Blast::Detect

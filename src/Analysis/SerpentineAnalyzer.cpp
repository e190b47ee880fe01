/**
 * @file SerpentineAnalyzer.cpp
 * @brief Serpentine detection from row endpoints and token walks
 */

#include <QiBlast/Analysis/SerpentineAnalyzer.h>
#include <QiBlast/Core/Constants.h>
#include <QiBlast/Internal/Geometry.h>
#include <QiBlast/Internal/Statistics.h>

#include <algorithm>
#include <numeric>

namespace Qi::Blast::Analysis {

namespace {

constexpr double ENCODING_RATIO = 0.7;
constexpr double ENCODING_THRESHOLD = 0.6;
constexpr double REGULARITY_THRESHOLD = 0.5;

/// Direction of a row from its first to its last point
Point2d RowDirection(const std::vector<Point2d>& points, const std::vector<int>& row) {
    return points[row.back()] - points[row.front()];
}

} // anonymous namespace

// =============================================================================
// Spatial Analysis
// =============================================================================

SerpentineReport AnalyzeSerpentine(const std::vector<Point2d>& points,
                                   const std::vector<std::vector<int>>& rows) {
    SerpentineReport report;

    std::vector<const std::vector<int>*> nonEmpty;
    for (const auto& row : rows) {
        if (!row.empty()) nonEmpty.push_back(&row);
    }
    if (nonEmpty.size() < 2) return report;

    for (size_t i = 0; i + 1 < nonEmpty.size(); ++i) {
        const auto& a = *nonEmpty[i];
        const auto& b = *nonEmpty[i + 1];
        double endToStart = points[a.back()].DistanceTo(points[b.front()]);
        double startToStart = points[a.front()].DistanceTo(points[b.front()]);
        ++report.pairCount;
        if (endToStart < startToStart) ++report.linkedPairs;
    }

    bool serpentine = 2 * report.linkedPairs > report.pairCount;
    report.direction = serpentine ? OrderingDirection::Serpentine : OrderingDirection::Forward;
    int32_t agreeing = serpentine ? report.linkedPairs : report.pairCount - report.linkedPairs;
    report.confidence = static_cast<double>(agreeing) / report.pairCount;
    return report;
}

TokenEncoding CheckTokensEncodeSerpentine(const std::vector<Point2d>& points,
                                          const std::vector<SequenceToken>& tokens,
                                          const std::vector<std::vector<int>>& rows) {
    TokenEncoding encoding;
    if (rows.size() < 2) return encoding;

    for (const auto& row : rows) {
        for (int i : row) {
            if (!tokens[i].valid) return encoding;
        }
    }

    std::vector<double> scores;
    for (size_t r = 0; r + 1 < rows.size(); ++r) {
        if (rows[r].size() < 2 || rows[r + 1].size() < 2) continue;

        std::vector<int> a = OrderByToken(rows[r], tokens);
        std::vector<int> b = OrderByToken(rows[r + 1], tokens);

        double serpentineDist = points[a.back()].DistanceTo(points[b.front()]);
        double forwardDist = points[a.front()].DistanceTo(points[b.front()]);

        if (serpentineDist < forwardDist * ENCODING_RATIO) {
            scores.push_back(1.0);
        } else if (forwardDist < serpentineDist * ENCODING_RATIO) {
            scores.push_back(0.0);
        } else {
            scores.push_back(0.5);
        }
    }
    if (scores.empty()) return encoding;

    encoding.score = Internal::Mean(scores);
    encoding.encoded = encoding.score > ENCODING_THRESHOLD;
    return encoding;
}

// =============================================================================
// Token Walk
// =============================================================================

SequenceReversals DetectSequenceReversals(const std::vector<Point2d>& points,
                                          const std::vector<SequenceToken>& tokens,
                                          double reversalDeg) {
    SequenceReversals result;

    std::vector<int> valid;
    for (size_t i = 0; i < points.size() && i < tokens.size(); ++i) {
        if (tokens[i].valid) valid.push_back(static_cast<int>(i));
    }
    if (valid.size() < 4) return result;

    std::vector<int> order = OrderByToken(valid, tokens);

    std::vector<double> bearings;
    for (size_t i = 1; i < order.size(); ++i) {
        bearings.push_back(Internal::CompassBearing(points[order[i - 1]], points[order[i]]));
    }

    for (size_t j = 1; j < bearings.size(); ++j) {
        if (BearingDifference(bearings[j], bearings[j - 1]) > reversalDeg) {
            result.rowBreaks.push_back(static_cast<int>(j));
        }
    }

    if (result.rowBreaks.size() < 2) {
        result.isSerpentine = result.rowBreaks.size() == 1;
        result.confidence = result.rowBreaks.empty() ? 0.0 : 0.5;
        return result;
    }

    std::vector<double> intervals;
    for (size_t k = 1; k < result.rowBreaks.size(); ++k) {
        intervals.push_back(static_cast<double>(result.rowBreaks[k] - result.rowBreaks[k - 1]));
    }
    result.avgPointsPerRow = Internal::Mean(intervals);
    result.confidence = std::max(0.0, 1.0 - Internal::CoefficientOfVariation(intervals));
    result.isSerpentine = result.confidence > REGULARITY_THRESHOLD;
    return result;
}

// =============================================================================
// Forced Direction
// =============================================================================

std::vector<std::vector<int>> ApplyDirection(const std::vector<Point2d>& points,
                                             const std::vector<std::vector<int>>& rows,
                                             OrderingDirection direction) {
    std::vector<std::vector<int>> out = rows;

    Point2d reference;
    bool haveReference = false;
    for (auto& row : out) {
        if (row.size() < 2) continue;

        Point2d d = RowDirection(points, row);
        if (haveReference) {
            double dot = d.Dot(reference);
            bool reverse = direction == OrderingDirection::Forward ? dot < 0.0 : dot > 0.0;
            if (reverse) {
                std::reverse(row.begin(), row.end());
                d = d * -1.0;
            }
        }

        // Forward compares against the first row, serpentine against the previous one
        if (!haveReference || direction == OrderingDirection::Serpentine) {
            reference = d;
            haveReference = true;
        }
    }
    return out;
}

} // namespace Qi::Blast::Analysis

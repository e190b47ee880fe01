/**
 * @file RowStrategy.cpp
 * @brief Strategy factory, detection input and shared row scoring
 */

#include "StrategyImpl.h"

#include <QiBlast/Internal/Geometry.h>
#include <QiBlast/Internal/Neighbors.h>
#include <QiBlast/Internal/Statistics.h>

#include <algorithm>
#include <numeric>

namespace Qi::Blast::Detect {

// =============================================================================
// StrategyResult
// =============================================================================

size_t StrategyResult::AssignedCount() const {
    size_t count = 0;
    for (const auto& row : rows) count += row.size();
    return count;
}

StrategyResult StrategyResult::Failure(StrategyKind kind, std::string reason) {
    StrategyResult result;
    result.kind = kind;
    result.success = false;
    result.message = std::move(reason);
    return result;
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<RowStrategy> CreateStrategy(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::WindingSequence:     return std::make_unique<WindingSequenceStrategy>();
        case StrategyKind::SequenceLineFit:     return std::make_unique<SequenceLineFitStrategy>();
        case StrategyKind::SplineFit:           return std::make_unique<SplineFitStrategy>();
        case StrategyKind::PrincipalCurve:      return std::make_unique<PrincipalCurveStrategy>();
        case StrategyKind::MstPathExtraction:   return std::make_unique<MstPathExtractionStrategy>();
        case StrategyKind::KnnBearingTraversal: return std::make_unique<KnnBearingTraversalStrategy>();
        case StrategyKind::PcaLoessBinning:     return std::make_unique<PcaLoessBinningStrategy>();
        case StrategyKind::DensityClustering:   return std::make_unique<DensityClusteringStrategy>();
        case StrategyKind::DensitySimplify:     return std::make_unique<DensitySimplifyStrategy>();
        case StrategyKind::SingleRow:           return std::make_unique<SingleRowStrategy>();
    }
    return std::make_unique<SingleRowStrategy>();
}

DetectionInput MakeDetectionInput(std::vector<Point2d> points,
                                  std::vector<Analysis::SequenceToken> tokens,
                                  const DetectionConfig& config,
                                  int32_t depth) {
    DetectionInput input;
    tokens.resize(points.size());
    input.stats = Analysis::AnalyzePlanPoints(points, tokens, config);
    input.classification = Classify::ClassifyPattern(points, config);
    input.points = std::move(points);
    input.tokens = std::move(tokens);
    input.tokensReliable = input.stats.tokensReliable;
    input.alphanumeric = input.stats.alphanumeric;
    input.spacing = input.stats.spacing > DISTANCE_EPSILON ? input.stats.spacing : 1.0;
    input.depth = depth;
    return input;
}

// =============================================================================
// Detail
// =============================================================================

namespace Detail {

std::vector<Point2d> Gather(const std::vector<Point2d>& points, const std::vector<int>& indices) {
    std::vector<Point2d> out;
    out.reserve(indices.size());
    for (int i : indices) out.push_back(points[i]);
    return out;
}

std::vector<int> Iota(size_t n) {
    std::vector<int> out(n);
    std::iota(out.begin(), out.end(), 0);
    return out;
}

std::vector<int> OrderByNeighborChain(const std::vector<Point2d>& points, const std::vector<int>& indices) {
    std::vector<int> chain = Internal::NearestNeighborChain(Gather(points, indices));
    std::vector<int> out;
    out.reserve(chain.size());
    for (int k : chain) out.push_back(indices[k]);
    return out;
}

double MeanInteriorDeviation(const std::vector<Point2d>& points, const std::vector<std::vector<int>>& rows) {
    std::vector<double> deviations;
    for (const auto& row : rows) {
        for (size_t k = 1; k + 1 < row.size(); ++k) {
            deviations.push_back(
                Internal::DistanceToSegment(points[row[k]], points[row[k - 1]], points[row[k + 1]]));
        }
    }
    return Internal::Mean(deviations);
}

double GapCV(const std::vector<Point2d>& points, const std::vector<std::vector<int>>& rows) {
    std::vector<double> gaps;
    for (const auto& row : rows) {
        for (size_t k = 1; k < row.size(); ++k) {
            gaps.push_back(points[row[k - 1]].DistanceTo(points[row[k]]));
        }
    }
    if (gaps.size() < 2) return 0.0;
    return Internal::CoefficientOfVariation(gaps);
}

double SingletonShare(const std::vector<std::vector<int>>& rows) {
    if (rows.empty()) return 0.0;
    size_t singles = 0;
    for (const auto& row : rows) {
        if (row.size() == 1) ++singles;
    }
    return static_cast<double>(singles) / rows.size();
}

std::vector<int> MissingIndices(size_t n, const std::vector<std::vector<int>>& rows) {
    std::vector<bool> seen(n, false);
    for (const auto& row : rows) {
        for (int i : row) seen[i] = true;
    }
    std::vector<int> missing;
    for (size_t i = 0; i < n; ++i) {
        if (!seen[i]) missing.push_back(static_cast<int>(i));
    }
    return missing;
}

double RowSetConfidence(const std::vector<Point2d>& points,
                        const std::vector<std::vector<int>>& rows,
                        size_t orphanCount, double spacing) {
    if (rows.empty() || points.empty()) return 0.0;

    double orphanShare = static_cast<double>(orphanCount) / points.size();
    double deviation = spacing > 0.0 ? MeanInteriorDeviation(points, rows) / spacing : 0.0;

    double confidence = 1.0;
    confidence -= 0.5 * orphanShare;
    confidence -= 0.3 * SingletonShare(rows);
    confidence -= 0.2 * Clamp(GapCV(points, rows) - 0.2, 0.0, 1.0);
    confidence -= 0.2 * Clamp(deviation / 0.5, 0.0, 1.0);
    return Clamp(confidence, 0.0, 1.0);
}

double CurvedFitScore(const std::vector<Point2d>& points,
                      const std::vector<std::vector<int>>& rows,
                      size_t orphanCount, double spacing) {
    if (points.empty()) return 0.0;
    double deviation = spacing > 0.0 ? MeanInteriorDeviation(points, rows) / spacing : 0.0;
    return deviation + GapCV(points, rows) +
           static_cast<double>(orphanCount) / points.size() + SingletonShare(rows);
}

std::vector<std::vector<int>> SplitAtJumps(const std::vector<Point2d>& points,
                                           const std::vector<int>& order, double maxGap) {
    std::vector<std::vector<int>> runs;
    for (int i : order) {
        if (runs.empty() || points[runs.back().back()].DistanceTo(points[i]) > maxGap) {
            runs.emplace_back();
        }
        runs.back().push_back(i);
    }
    return runs;
}

StrategyResult Finish(StrategyKind kind, const DetectionInput& input,
                      std::vector<std::vector<int>> rows, double spacing) {
    StrategyResult result;
    result.kind = kind;
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [](const std::vector<int>& r) { return r.empty(); }),
               rows.end());
    result.orphans = MissingIndices(input.Size(), rows);
    result.rows = std::move(rows);
    result.success = !result.rows.empty();
    result.confidence = RowSetConfidence(input.points, result.rows, result.orphans.size(), spacing);
    result.residual = CurvedFitScore(input.points, result.rows, result.orphans.size(), spacing);
    if (!result.success) result.message = "no rows";
    return result;
}

} // namespace Detail

} // namespace Qi::Blast::Detect

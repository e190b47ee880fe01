/**
 * @file RowDetector.cpp
 * @brief DetectRows: strategy decision tree, orphan attachment, result assembly
 */

#include <QiBlast/Detect/RowDetector.h>
#include <QiBlast/Analysis/PointSetAnalyzer.h>
#include <QiBlast/Analysis/SerpentineAnalyzer.h>
#include <QiBlast/Classify/PatternClassifier.h>
#include <QiBlast/Classify/SubPatternSeparator.h>
#include <QiBlast/Core/Constants.h>
#include <QiBlast/Core/Exception.h>
#include <QiBlast/Detect/RowStrategy.h>
#include <QiBlast/Internal/Fitting.h>
#include <QiBlast/Internal/Geometry.h>
#include <QiBlast/Internal/Log.h>
#include <QiBlast/Internal/Smoothing.h>
#include <QiBlast/Validate/RowValidator.h>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <numeric>

namespace Qi::Blast::Detect {

namespace {

/// Line-fit max residual, in spacings, above which a row is curved
constexpr double CURVED_ROW_FACTOR = 0.5;

/**
 * @brief Rows detected in one leaf subset
 */
struct GroupRows {
    SubPattern sub;                         ///< Points as global indices
    std::vector<std::vector<int>> rows;     ///< Global indices, position order
    std::vector<int> orphans;               ///< Global indices
    double spacing = 1.0;
};

/**
 * @brief Read-only state shared by the recursion
 */
struct Context {
    const std::vector<Point2d>& points;
    const std::vector<Analysis::SequenceToken>& tokens;
    const DetectionConfig& config;
};

void Report(const ProgressCallback& progress, double percent, const char* stage) {
    if (progress) progress(percent, stage);
}

bool Accepted(const StrategyResult& result, const DetectionConfig& config) {
    return result.success && result.confidence >= config.minStrategyConfidence;
}

/// Run one strategy; an AlgorithmException becomes a failed result
StrategyResult RunStrategy(StrategyKind kind, const DetectionInput& input, const DetectionConfig& config) {
    std::unique_ptr<RowStrategy> strategy = CreateStrategy(kind);
    StrategyResult result;
    try {
        result = strategy->Detect(input, config);
    } catch (const AlgorithmException& e) {
        Internal::DebugLog(config, "Detect", "strategy %s threw: %s", strategy->Name(), e.what());
        return StrategyResult::Failure(kind, e.what());
    }

    if (!result.success) {
        Internal::DebugLog(config, "Detect", "strategy %s failed: %s", strategy->Name(), result.message.c_str());
    } else {
        Internal::DebugLog(config, "Detect", "strategy %s %s (conf=%.2f)", strategy->Name(),
                           Accepted(result, config) ? "accepted" : "rejected", result.confidence);
    }
    return result;
}

/// Token-driven strategies; only for reliable tokens
bool TrySequenceStrategies(const DetectionInput& input, const DetectionConfig& config, StrategyResult& chosen) {
    if (!input.tokensReliable) return false;

    StrategyResult winding = RunStrategy(StrategyKind::WindingSequence, input, config);
    if (Accepted(winding, config)) {
        chosen = std::move(winding);
        return true;
    }

    PatternType type = input.classification.type;
    if (type == PatternType::Straight || type == PatternType::Curved) {
        StrategyKind kind = type == PatternType::Straight ? StrategyKind::SequenceLineFit
                                                          : StrategyKind::SplineFit;
        StrategyResult result = RunStrategy(kind, input, config);
        if (Accepted(result, config)) {
            chosen = std::move(result);
            return true;
        }
    }
    return false;
}

/// Curve, traversal and binning strategies
bool TryGeometricStrategies(const DetectionInput& input, const DetectionConfig& config, StrategyResult& chosen) {
    if (input.classification.type == PatternType::Curved) {
        StrategyResult curve = RunStrategy(StrategyKind::PrincipalCurve, input, config);
        StrategyResult mst = RunStrategy(StrategyKind::MstPathExtraction, input, config);
        bool curveOk = Accepted(curve, config);
        bool mstOk = Accepted(mst, config);

        if (curveOk && mstOk) {
            Internal::DebugLog(config, "Detect", "curved cross-check: curve=%.3f mst=%.3f",
                               curve.residual, mst.residual);
            chosen = mst.residual < curve.residual ? std::move(mst) : std::move(curve);
            return true;
        }
        if (curveOk || mstOk) {
            chosen = curveOk ? std::move(curve) : std::move(mst);
            return true;
        }
    }

    if (config.detectSerpentine && input.tokensReliable) {
        Analysis::SequenceReversals reversals =
            Analysis::DetectSequenceReversals(input.points, input.tokens, config.reversalDeg);
        if (reversals.isSerpentine) {
            StrategyResult knn = RunStrategy(StrategyKind::KnnBearingTraversal, input, config);
            if (Accepted(knn, config)) {
                chosen = std::move(knn);
                return true;
            }
        }
    }

    StrategyResult binned = RunStrategy(StrategyKind::PcaLoessBinning, input, config);
    if (Accepted(binned, config)) {
        chosen = std::move(binned);
        return true;
    }
    return false;
}

/// Density fallbacks, then the single row that always succeeds
StrategyResult RunFallbacks(const DetectionInput& input, const DetectionConfig& config) {
    if (input.Size() >= 3) {
        for (StrategyKind kind : {StrategyKind::DensityClustering, StrategyKind::DensitySimplify}) {
            StrategyResult result = RunStrategy(kind, input, config);
            if (Accepted(result, config)) return result;
        }
    }
    return RunStrategy(StrategyKind::SingleRow, input, config);
}

/// Orientation of the most populated cluster
double DominantOrientation(const Classify::Classification& cls) {
    double orientation = 0.0;
    size_t best = 0;
    for (const auto& cluster : cls.clusters) {
        if (cluster.points.size() > best) {
            best = cluster.points.size();
            orientation = cluster.orientationDeg;
        }
    }
    return orientation;
}

/**
 * @brief Detect rows in a subset, recursing into separated sub-patterns
 *
 * @param global Global indices of the subset
 * @param meta Sub-pattern description (role, orientation, depth)
 * @param out [out] One entry per leaf subset
 */
void DetectSubset(const Context& ctx, const std::vector<int>& global, SubPattern meta,
                  std::vector<GroupRows>& out) {
    const DetectionConfig& config = ctx.config;

    std::vector<Point2d> localPoints;
    std::vector<Analysis::SequenceToken> localTokens;
    localPoints.reserve(global.size());
    localTokens.reserve(global.size());
    for (int g : global) {
        localPoints.push_back(ctx.points[g]);
        localTokens.push_back(ctx.tokens[g]);
    }

    DetectionInput input = MakeDetectionInput(std::move(localPoints), std::move(localTokens), config, meta.depth);
    const Classify::Classification& cls = input.classification;
    Internal::DebugLog(config, "Detect", "subset depth=%d n=%zu type=%s tokens=%d", meta.depth, input.Size(),
                       ToString(cls.type), input.tokensReliable ? 1 : 0);

    StrategyResult chosen;
    if (input.Size() < 3) {
        chosen = RunStrategy(StrategyKind::SingleRow, input, config);
    } else {
        bool found = TrySequenceStrategies(input, config, chosen);
        bool densityOnly = false;

        if (!found && cls.IsMultiPattern()) {
            if (meta.depth >= config.maxRecursionDepth) {
                Internal::DebugLog(config, "Detect", "recursion cap reached at depth %d", meta.depth);
                densityOnly = true;
            } else {
                std::vector<SubPattern> subs =
                    Classify::SeparateSubPatterns(input.points, cls, config, meta.depth);
                if (subs.size() >= 2) {
                    for (auto& sub : subs) {
                        std::vector<int> childGlobal;
                        childGlobal.reserve(sub.points.size());
                        for (int local : sub.points) childGlobal.push_back(global[local]);
                        sub.points = childGlobal;
                        if (meta.role != SubPatternRole::Main) sub.role = meta.role;
                        DetectSubset(ctx, childGlobal, sub, out);
                    }
                    return;
                }
            }
        }

        if (!found && !densityOnly) found = TryGeometricStrategies(input, config, chosen);
        if (!found) chosen = RunFallbacks(input, config);
    }

    GroupRows group;
    group.spacing = input.spacing;
    group.sub = std::move(meta);
    group.sub.points = global;
    group.sub.type = cls.type;
    group.sub.strategy = chosen.kind;
    group.sub.confidence = chosen.confidence;
    if (group.sub.depth == 0) group.sub.orientationDeg = DominantOrientation(cls);

    for (const auto& row : chosen.rows) {
        std::vector<int> mapped;
        mapped.reserve(row.size());
        for (int local : row) mapped.push_back(global[local]);
        group.rows.push_back(std::move(mapped));
    }
    for (int local : chosen.orphans) group.orphans.push_back(global[local]);

    out.push_back(std::move(group));
}

/// MAIN first, then larger, then lower first index
bool GroupLess(const GroupRows& a, const GroupRows& b) {
    bool aMain = a.sub.role == SubPatternRole::Main;
    bool bMain = b.sub.role == SubPatternRole::Main;
    if (aMain != bMain) return aMain;
    if (a.sub.points.size() != b.sub.points.size()) return a.sub.points.size() > b.sub.points.size();
    int aFirst = *std::min_element(a.sub.points.begin(), a.sub.points.end());
    int bFirst = *std::min_element(b.sub.points.begin(), b.sub.points.end());
    return aFirst < bFirst;
}

/// Rows of group g from the flattened row list
std::vector<std::vector<int>> RowsOfGroup(const std::vector<std::vector<int>>& rows,
                                          const std::vector<int>& rowGroup, int g) {
    std::vector<std::vector<int>> selected;
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rowGroup[r] == g) selected.push_back(rows[r]);
    }
    return selected;
}

/// Straight or Curved from the shapes of the rows in group g
PatternType ShapeOfGroup(const std::vector<Row>& rows, int32_t g) {
    for (const auto& row : rows) {
        if (row.subPattern == g && row.shape == RowShape::Curved) return PatternType::Curved;
    }
    return PatternType::Straight;
}

Row BuildRow(const std::vector<Point2d>& points, std::vector<int> indices, int32_t rowIndex,
             int32_t subPattern, double spacing, const DetectionConfig& config) {
    Row row;
    row.rowIndex = rowIndex;
    row.subPattern = subPattern;
    row.points = std::move(indices);
    row.shape = DetermineRowShape(points, row.points, spacing);

    std::vector<Point2d> path;
    path.reserve(row.points.size());
    for (int i : row.points) path.push_back(points[i]);
    if (path.size() >= 2) {
        for (int k : Internal::DouglasPeucker(path, config.simplifyToleranceFactor * spacing)) {
            row.backbone.push_back(path[k]);
        }
        row.bearingDeg = Internal::CompassBearing(path.front(), path.back());
    } else {
        row.backbone = path;
    }
    return row;
}

} // anonymous namespace

// =============================================================================
// Building blocks
// =============================================================================

int32_t AttachOrphans(const std::vector<Point2d>& points,
                      std::vector<std::vector<int>>& rows,
                      std::vector<int>& orphans,
                      double maxDistance) {
    if (rows.empty() || orphans.empty()) return 0;

    std::vector<int> pending = orphans;
    std::sort(pending.begin(), pending.end());
    std::vector<int> remaining;
    int32_t attached = 0;

    for (int o : pending) {
        const Point2d& p = points[o];
        int bestRow = -1;
        double bestDist = std::numeric_limits<double>::max();
        for (size_t r = 0; r < rows.size(); ++r) {
            for (int i : rows[r]) {
                double d = p.DistanceTo(points[i]);
                if (d < bestDist) {
                    bestDist = d;
                    bestRow = static_cast<int>(r);
                }
            }
        }
        if (bestRow < 0 || bestDist > maxDistance) {
            remaining.push_back(o);
            continue;
        }

        auto& row = rows[bestRow];
        size_t bestPos = 0;
        double bestGrowth = std::numeric_limits<double>::max();
        for (size_t pos = 0; pos <= row.size(); ++pos) {
            double growth;
            if (pos == 0) {
                growth = p.DistanceTo(points[row.front()]);
            } else if (pos == row.size()) {
                growth = points[row.back()].DistanceTo(p);
            } else {
                const Point2d& a = points[row[pos - 1]];
                const Point2d& b = points[row[pos]];
                growth = a.DistanceTo(p) + p.DistanceTo(b) - a.DistanceTo(b);
            }
            if (growth < bestGrowth - EPSILON) {
                bestGrowth = growth;
                bestPos = pos;
            }
        }
        row.insert(row.begin() + static_cast<std::ptrdiff_t>(bestPos), o);
        ++attached;
    }

    orphans = std::move(remaining);
    return attached;
}

RowShape DetermineRowShape(const std::vector<Point2d>& points, const std::vector<int>& row, double spacing) {
    if (row.size() < 3) return RowShape::Straight;

    std::vector<Point2d> rowPoints;
    rowPoints.reserve(row.size());
    for (int i : row) rowPoints.push_back(points[i]);
    Internal::LineFitResult fit = Internal::FitLine(rowPoints);
    if (!fit.success) return RowShape::Straight;
    return fit.residualMax > CURVED_ROW_FACTOR * spacing ? RowShape::Curved : RowShape::Straight;
}

// =============================================================================
// DetectRows
// =============================================================================

PatternResult DetectRows(const std::vector<HolePoint>& points,
                         const DetectionConfig& config,
                         const ProgressCallback& progress) {
    config.Validate();

    Report(progress, 0.0, "analyze");
    Analysis::PointSetStats stats = Analysis::AnalyzePointSet(points, config);
    std::vector<Point2d> plan = Analysis::ToPlanPoints(points);
    const size_t n = plan.size();
    Internal::DebugLog(config, "Detect", "n=%zu spacing=%.3f tokens=%.2f", n, stats.spacing,
                       stats.tokenReliability);

    // --- Detection per sub-pattern ---
    Report(progress, 10.0, "detect");
    Context ctx{plan, stats.tokens, config};
    std::vector<GroupRows> groups;
    SubPattern top;
    top.role = SubPatternRole::Main;
    top.depth = 0;
    std::vector<int> all(n);
    std::iota(all.begin(), all.end(), 0);
    DetectSubset(ctx, all, top, groups);
    std::stable_sort(groups.begin(), groups.end(), GroupLess);

    // --- Flatten and attach orphans ---
    Report(progress, 60.0, "attach");
    std::vector<std::vector<int>> rows;
    std::vector<int> rowGroup;
    for (size_t g = 0; g < groups.size(); ++g) {
        for (auto& row : groups[g].rows) {
            rows.push_back(std::move(row));
            rowGroup.push_back(static_cast<int>(g));
        }
        groups[g].rows.clear();
    }
    int32_t attached = 0;
    for (auto& group : groups) {
        attached += AttachOrphans(plan, rows, group.orphans, config.orphanAttachFactor * group.spacing);
    }
    Internal::DebugLog(config, "Detect", "groups=%zu rows=%zu attached=%d", groups.size(), rows.size(), attached);

    // --- Positions and direction ---
    Report(progress, 70.0, "order");
    if (stats.tokensReliable) {
        Analysis::TokenEncoding encoding = Analysis::CheckTokensEncodeSerpentine(plan, stats.tokens, rows);
        if (encoding.encoded) {
            for (auto& row : rows) row = Analysis::OrderByToken(row, stats.tokens);
            Internal::DebugLog(config, "Detect", "positions follow tokens (score=%.2f)", encoding.score);
        }
    }

    PatternResult result;
    if (config.directionMode != DirectionMode::Auto) {
        OrderingDirection forced = config.directionMode == DirectionMode::Serpentine
                                       ? OrderingDirection::Serpentine
                                       : OrderingDirection::Forward;
        for (size_t g = 0; g < groups.size(); ++g) {
            auto directed = Analysis::ApplyDirection(plan, RowsOfGroup(rows, rowGroup, static_cast<int>(g)), forced);
            size_t k = 0;
            for (size_t r = 0; r < rows.size(); ++r) {
                if (rowGroup[r] == static_cast<int>(g)) rows[r] = std::move(directed[k++]);
            }
        }
        result.direction = forced;
        result.serpentine = forced == OrderingDirection::Serpentine;
        result.serpentineConfidence = 1.0;
    } else if (config.detectSerpentine) {
        Report(progress, 75.0, "serpentine");
        int32_t pairs = 0;
        int32_t linked = 0;
        for (size_t g = 0; g < groups.size(); ++g) {
            Analysis::SerpentineReport report =
                Analysis::AnalyzeSerpentine(plan, RowsOfGroup(rows, rowGroup, static_cast<int>(g)));
            pairs += report.pairCount;
            linked += report.linkedPairs;
        }
        if (pairs > 0) {
            result.serpentine = 2 * linked > pairs;
            result.direction = result.serpentine ? OrderingDirection::Serpentine : OrderingDirection::Forward;
            result.serpentineConfidence =
                static_cast<double>(result.serpentine ? linked : pairs - linked) / pairs;
        }
    }

    // --- Assemble rows, labels and orphans ---
    Report(progress, 80.0, "assemble");
    result.labels.assign(n, PointLabel());
    for (size_t r = 0; r < rows.size(); ++r) {
        int g = rowGroup[r];
        Row row = BuildRow(plan, rows[r], static_cast<int32_t>(r + 1), g, groups[g].spacing, config);
        for (size_t k = 0; k < row.points.size(); ++k) {
            result.labels[row.points[k]] = PointLabel{row.rowIndex, static_cast<int32_t>(k + 1)};
        }
        result.rows.push_back(std::move(row));
    }

    for (const auto& group : groups) {
        result.orphanIndices.insert(result.orphanIndices.end(), group.orphans.begin(), group.orphans.end());
    }
    std::sort(result.orphanIndices.begin(), result.orphanIndices.end());
    for (int i : result.orphanIndices) result.orphanPointIds.push_back(points[i].id);

    Validate::CheckAssignmentInvariant(n, rows, result.orphanIndices);

    // Sub-pattern membership after orphan attachment
    double weighted = 0.0;
    for (size_t g = 0; g < groups.size(); ++g) {
        SubPattern sub = groups[g].sub;
        sub.index = static_cast<int32_t>(g);
        if (sub.type == PatternType::MultiPattern || sub.type == PatternType::Unknown) {
            sub.type = ShapeOfGroup(result.rows, sub.index);
        }
        sub.points = groups[g].orphans;
        for (size_t r = 0; r < rows.size(); ++r) {
            if (rowGroup[r] == static_cast<int>(g)) sub.points.insert(sub.points.end(), rows[r].begin(), rows[r].end());
        }
        std::sort(sub.points.begin(), sub.points.end());
        weighted += sub.confidence * static_cast<double>(sub.points.size());
        result.subPatterns.push_back(std::move(sub));
    }

    result.patternType = groups.size() >= 2 ? PatternType::MultiPattern : result.subPatterns.front().type;
    result.strategy = groups.front().sub.strategy;
    result.strategyConfidence = weighted / static_cast<double>(n);

    // --- Validation and confidence ---
    Report(progress, 90.0, "validate");
    std::vector<int32_t> rowSubPattern(rowGroup.begin(), rowGroup.end());
    Validate::ValidationReport report =
        Validate::ValidateRows(plan, rows, result.labels, result.strategy, rowSubPattern);
    result.metrics = report.metrics;
    result.warnings = report.issues;
    result.warnings.insert(result.warnings.end(), report.warnings.begin(), report.warnings.end());
    result.confidence = Clamp(0.5 * result.strategyConfidence + 0.5 * report.confidence +
                                  Validate::MethodConfidenceBonus(result.strategy),
                              0.0, 1.0);

    Internal::DebugLog(config, "Detect", "type=%s rows=%d strategy=%s conf=%.2f serpentine=%d",
                       ToString(result.patternType), result.RowCount(), ToString(result.strategy),
                       result.confidence, result.serpentine ? 1 : 0);

    Report(progress, 100.0, "done");
    return result;
}

} // namespace Qi::Blast::Detect

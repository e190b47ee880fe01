/**
 * @file RowValidator.cpp
 * @brief Row set validation, burden / spacing metrics and assignment checks
 */

#include <QiBlast/Validate/RowValidator.h>
#include <QiBlast/Core/Constants.h>
#include <QiBlast/Core/Exception.h>
#include <QiBlast/Internal/Fitting.h>
#include <QiBlast/Internal/Statistics.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace Qi::Blast::Validate {

namespace {

constexpr double HIGH_CV = 0.5;
constexpr double MODERATE_CV = 0.3;
constexpr double LOW_CV = 0.15;
constexpr double MAX_SIZE_RATIO = 3.0;
constexpr double GAP_FACTOR = 2.0;
constexpr double OVERLAP_FACTOR = 0.25;
constexpr double LAYOUT_TOLERANCE = 0.15;

std::string Format(const char* fmt, double value) {
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer), fmt, value);
    return buffer;
}

/// Row normal from the pooled within-row scatter
Point2d RowNormal(const std::vector<Point2d>& points, const std::vector<std::vector<int>>& rows) {
    std::vector<std::vector<Point2d>> groups;
    for (const auto& row : rows) {
        if (row.size() < 2) continue;
        std::vector<Point2d> g;
        for (int i : row) g.push_back(points[i]);
        groups.push_back(std::move(g));
    }
    Internal::PrincipalAxes axes = Internal::ComputePooledAxes(groups);
    if (!axes.valid) return Point2d(0.0, 1.0);
    return axes.major.Perpendicular();
}

/// Row indices per group, groups in order of first appearance
std::vector<std::vector<size_t>> GroupMembers(size_t rowCount, const std::vector<int32_t>& rowGroups) {
    if (rowGroups.empty()) {
        std::vector<size_t> all(rowCount);
        for (size_t r = 0; r < rowCount; ++r) all[r] = r;
        return {all};
    }
    if (rowGroups.size() != rowCount) {
        throw InvalidArgumentException("ComputeBurdenAndSpacing: " + std::to_string(rowGroups.size()) +
                                       " row groups for " + std::to_string(rowCount) + " rows");
    }
    std::vector<int32_t> ids;
    std::vector<std::vector<size_t>> members;
    for (size_t r = 0; r < rowCount; ++r) {
        auto it = std::find(ids.begin(), ids.end(), rowGroups[r]);
        if (it == ids.end()) {
            ids.push_back(rowGroups[r]);
            members.emplace_back();
            it = ids.end() - 1;
        }
        members[static_cast<size_t>(it - ids.begin())].push_back(r);
    }
    return members;
}

EstimatedPattern EstimatePattern(double spacingCV, double burdenCV) {
    if (spacingCV > MODERATE_CV || burdenCV > MODERATE_CV) {
        return (spacingCV > HIGH_CV || burdenCV > HIGH_CV) ? EstimatedPattern::Irregular
                                                          : EstimatedPattern::Curved;
    }
    if (spacingCV < LOW_CV && burdenCV < LOW_CV) {
        return EstimatedPattern::Straight;
    }
    return EstimatedPattern::Unknown;
}

} // anonymous namespace

const char* ToString(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::Valid:   return "valid";
        case ValidationStatus::Warning: return "warning";
        case ValidationStatus::Invalid: return "invalid";
    }
    return "invalid";
}

const char* ToString(EstimatedPattern pattern) {
    switch (pattern) {
        case EstimatedPattern::Straight:  return "straight";
        case EstimatedPattern::Curved:    return "curved";
        case EstimatedPattern::Irregular: return "irregular";
        case EstimatedPattern::Unknown:   return "unknown";
    }
    return "unknown";
}

// =============================================================================
// Metrics
// =============================================================================

double ComputeOffsetRatio(const std::vector<Point2d>& points,
                          const std::vector<std::vector<int>>& rows,
                          int32_t* usablePairs) {
    std::vector<double> offsets;
    for (size_t r = 0; r + 1 < rows.size(); ++r) {
        const auto& a = rows[r];
        const auto& b = rows[r + 1];
        if (a.size() < 2 || b.size() < 2) continue;

        const Point2d& first = points[a[0]];
        Point2d dir = points[a[1]] - first;
        double spacing = dir.Norm();
        if (spacing <= DISTANCE_EPSILON) continue;

        double projection = (points[b[0]] - first).Dot(dir / spacing);
        double offset = std::abs(std::fmod(projection, spacing)) / spacing;
        if (offset > 0.5) offset = 1.0 - offset;
        offsets.push_back(offset);
    }
    if (usablePairs) *usablePairs = static_cast<int32_t>(offsets.size());
    return Internal::Mean(offsets);
}

LayoutStyle ClassifyLayout(double offsetRatio) {
    if (std::abs(offsetRatio) < LAYOUT_TOLERANCE) return LayoutStyle::Square;
    if (std::abs(offsetRatio - 0.5) < LAYOUT_TOLERANCE) return LayoutStyle::Staggered;
    return LayoutStyle::Irregular;
}

BurdenSpacingMetrics ComputeBurdenAndSpacing(const std::vector<Point2d>& points,
                                             const std::vector<std::vector<int>>& rows,
                                             const std::vector<int32_t>& rowGroups) {
    BurdenSpacingMetrics m;
    m.pointSpacing.assign(points.size(), 0.0);
    m.pointBurden.assign(points.size(), 0.0);
    m.rowCount = static_cast<int32_t>(rows.size());
    if (rows.empty()) return m;

    // Spacing
    std::vector<double> spacings;
    for (const auto& row : rows) {
        std::vector<double> rowGaps;
        for (size_t k = 0; k + 1 < row.size(); ++k) {
            double d = points[row[k]].DistanceTo(points[row[k + 1]]);
            m.pointSpacing[row[k]] = d;
            rowGaps.push_back(d);
        }
        if (!row.empty()) {
            m.pointSpacing[row.back()] = Internal::Mean(rowGaps);
        }
        spacings.insert(spacings.end(), rowGaps.begin(), rowGaps.end());
    }
    m.avgSpacing = Internal::Mean(spacings);
    m.spacingStdDev = Internal::StandardDeviation(spacings);
    m.spacingCV = m.avgSpacing > 0.0 ? m.spacingStdDev / m.avgSpacing : 0.0;

    // Burden along each group's row normal; rows of different groups are never adjacent
    std::vector<double> burdens;
    double offsetSum = 0.0;
    int32_t pairs = 0;
    for (const auto& members : GroupMembers(rows.size(), rowGroups)) {
        std::vector<std::vector<int>> groupRows;
        for (size_t r : members) groupRows.push_back(rows[r]);

        Point2d normal = RowNormal(points, groupRows);
        std::vector<double> rowOffset(groupRows.size(), 0.0);
        for (size_t r = 0; r < groupRows.size(); ++r) {
            std::vector<double> proj;
            for (int i : groupRows[r]) proj.push_back(points[i].Dot(normal));
            rowOffset[r] = Internal::Mean(proj);
        }
        std::vector<double> local;
        for (size_t r = 0; r + 1 < groupRows.size(); ++r) {
            local.push_back(std::abs(rowOffset[r + 1] - rowOffset[r]));
        }
        for (size_t r = 0; r < groupRows.size() && groupRows.size() >= 2; ++r) {
            double value;
            if (r == 0) {
                value = local.front();
            } else if (r + 1 == groupRows.size()) {
                value = local.back();
            } else {
                value = 0.5 * (local[r - 1] + local[r]);
            }
            for (int i : groupRows[r]) m.pointBurden[i] = value;
        }
        burdens.insert(burdens.end(), local.begin(), local.end());

        int32_t usable = 0;
        double ratio = ComputeOffsetRatio(points, groupRows, &usable);
        offsetSum += ratio * usable;
        pairs += usable;
    }
    m.avgBurden = Internal::Mean(burdens);
    m.burdenStdDev = Internal::StandardDeviation(burdens);
    m.burdenCV = m.avgBurden > 0.0 ? m.burdenStdDev / m.avgBurden : 0.0;

    // Row sizes
    std::vector<double> sizes;
    m.minRowSize = static_cast<int32_t>(rows.front().size());
    m.maxRowSize = m.minRowSize;
    for (const auto& row : rows) {
        int32_t s = static_cast<int32_t>(row.size());
        m.minRowSize = std::min(m.minRowSize, s);
        m.maxRowSize = std::max(m.maxRowSize, s);
        sizes.push_back(static_cast<double>(s));
    }
    m.avgRowSize = Internal::Mean(sizes);

    m.offsetRatio = pairs > 0 ? offsetSum / pairs : 0.0;
    m.layout = pairs > 0 ? ClassifyLayout(m.offsetRatio) : LayoutStyle::Unknown;
    return m;
}

// =============================================================================
// Validation
// =============================================================================

ValidationReport ValidateRows(const std::vector<Point2d>& points,
                              const std::vector<std::vector<int>>& rows,
                              const std::vector<PointLabel>& labels,
                              StrategyKind strategyKind,
                              const std::vector<int32_t>& rowGroups) {
    ValidationReport report;
    report.strategy = strategyKind;

    if (points.empty() || rows.empty()) {
        report.status = ValidationStatus::Invalid;
        report.confidence = 0.0;
        report.issues.push_back(points.empty() ? "No points provided" : "No rows detected");
        return report;
    }

    report.metrics = ComputeBurdenAndSpacing(points, rows, rowGroups);
    const auto& m = report.metrics;

    // Orphans
    for (const auto& label : labels) {
        if (!label.IsAssigned()) ++report.orphanCount;
    }
    if (report.orphanCount > 0) {
        double ratio = static_cast<double>(report.orphanCount) / points.size();
        report.warnings.push_back("Found " + std::to_string(report.orphanCount) +
                                  " points without row assignment");
        report.confidence -= 0.1 * std::min(ratio, 1.0);
    }

    if (m.spacingCV > HIGH_CV) {
        report.warnings.push_back(Format("High spacing variation (CV=%.2f)", m.spacingCV));
        report.confidence -= 0.15;
    }
    if (m.burdenCV > HIGH_CV) {
        report.warnings.push_back(Format("High burden variation (CV=%.2f)", m.burdenCV));
        report.confidence -= 0.1;
    }

    report.sizeRatio = m.minRowSize > 0 ? static_cast<double>(m.maxRowSize) / m.minRowSize : 0.0;
    if (report.sizeRatio > MAX_SIZE_RATIO) {
        report.warnings.push_back(Format("Large row size imbalance (ratio=%.1f)", report.sizeRatio));
        report.confidence -= 0.1;
    }

    // Position numbering
    int rowsWithGaps = 0;
    int rowsWithDuplicates = 0;
    for (const auto& row : rows) {
        std::vector<int32_t> positions;
        for (int i : row) {
            if (i >= 0 && static_cast<size_t>(i) < labels.size()) positions.push_back(labels[i].positionIndex);
        }
        std::sort(positions.begin(), positions.end());
        bool duplicate = std::adjacent_find(positions.begin(), positions.end()) != positions.end();
        positions.erase(std::unique(positions.begin(), positions.end()), positions.end());
        bool gap = false;
        for (size_t k = 1; k < positions.size(); ++k) {
            if (positions[k] - positions[k - 1] > 1) gap = true;
        }
        if (duplicate) ++rowsWithDuplicates;
        if (gap) ++rowsWithGaps;
    }
    if (rowsWithGaps > 0) {
        report.warnings.push_back("Position sequence has gaps in " + std::to_string(rowsWithGaps) + " rows");
        report.confidence -= 0.05;
    }
    if (rowsWithDuplicates > 0) {
        report.issues.push_back("Duplicate positions found in " + std::to_string(rowsWithDuplicates) + " rows");
        report.confidence -= 0.2;
    }

    // Contiguity within rows
    std::vector<double> gaps;
    for (const auto& row : rows) {
        for (size_t k = 0; k + 1 < row.size(); ++k) {
            gaps.push_back(points[row[k]].DistanceTo(points[row[k + 1]]));
        }
    }
    double median = Internal::Median(gaps);
    if (median > DISTANCE_EPSILON) {
        for (size_t r = 0; r < rows.size(); ++r) {
            bool wide = false;
            bool overlap = false;
            for (size_t k = 0; k + 1 < rows[r].size(); ++k) {
                double d = points[rows[r][k]].DistanceTo(points[rows[r][k + 1]]);
                wide = wide || d > GAP_FACTOR * median;
                overlap = overlap || d < OVERLAP_FACTOR * median;
            }
            if (wide) {
                report.warnings.push_back("Row " + std::to_string(r + 1) + " has a gap wider than " +
                                          Format("%.2f m", GAP_FACTOR * median));
            }
            if (overlap) {
                report.warnings.push_back("Row " + std::to_string(r + 1) + " has overlapping points");
            }
        }
    }

    report.pattern = EstimatePattern(m.spacingCV, m.burdenCV);
    report.confidence = Clamp(report.confidence, 0.0, 1.0);

    if (!report.issues.empty()) {
        report.status = ValidationStatus::Invalid;
    } else if (!report.warnings.empty()) {
        report.status = ValidationStatus::Warning;
    }
    return report;
}

// =============================================================================
// Invariant and bonus
// =============================================================================

void CheckAssignmentInvariant(size_t pointCount,
                              const std::vector<std::vector<int>>& rows,
                              const std::vector<int>& orphans) {
    std::vector<int> seen(pointCount, 0);
    auto mark = [&](int i) {
        if (i < 0 || static_cast<size_t>(i) >= pointCount) {
            throw Exception("CheckAssignmentInvariant: index " + std::to_string(i) + " out of range");
        }
        if (++seen[i] > 1) {
            throw Exception("CheckAssignmentInvariant: point " + std::to_string(i) + " assigned twice");
        }
    };

    for (const auto& row : rows) {
        for (int i : row) mark(i);
    }
    for (int i : orphans) mark(i);

    for (size_t i = 0; i < pointCount; ++i) {
        if (seen[i] == 0) {
            throw Exception("CheckAssignmentInvariant: point " + std::to_string(i) +
                            " is neither in a row nor an orphan");
        }
    }
}

double MethodConfidenceBonus(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::SequenceLineFit:   return 0.1;
        case StrategyKind::WindingSequence:   return 0.1;
        case StrategyKind::SplineFit:         return 0.05;
        case StrategyKind::DensityClustering: return -0.05;
        case StrategyKind::DensitySimplify:   return -0.1;
        case StrategyKind::SingleRow:         return -0.3;
        default:                              return 0.0;
    }
}

} // namespace Qi::Blast::Validate

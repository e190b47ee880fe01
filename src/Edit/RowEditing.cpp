/**
 * @file RowEditing.cpp
 * @brief Post-detection row and position edits
 */

#include <QiBlast/Edit/RowEditing.h>
#include <QiBlast/Core/Constants.h>
#include <QiBlast/Core/Exception.h>
#include <QiBlast/Internal/Fitting.h>
#include <QiBlast/Internal/Geometry.h>

#include <algorithm>
#include <cctype>
#include <set>

namespace Qi::Blast::Edit {

namespace {

bool RowIndexLess(const Row& a, const Row& b) {
    return a.rowIndex < b.rowIndex;
}

/// Drop empty rows, sort by rowIndex and rebuild the labels
void Refresh(PatternResult& result) {
    result.rows.erase(std::remove_if(result.rows.begin(), result.rows.end(),
                                     [](const Row& r) { return r.Empty(); }),
                      result.rows.end());
    std::stable_sort(result.rows.begin(), result.rows.end(), RowIndexLess);

    std::fill(result.labels.begin(), result.labels.end(), PointLabel());
    for (const auto& row : result.rows) {
        for (size_t k = 0; k < row.points.size(); ++k) {
            result.labels[row.points[k]] = PointLabel{row.rowIndex, row.firstPosition + static_cast<int32_t>(k)};
        }
    }
}

/// Reverse a row's positions together with its backbone and bearing
void ReverseRow(Row& row) {
    std::reverse(row.points.begin(), row.points.end());
    std::reverse(row.backbone.begin(), row.backbone.end());
    if (row.points.size() >= 2) row.bearingDeg = NormalizeBearing(row.bearingDeg + 180.0);
}

/// Row with the given index, or nullptr
const Row* FindRow(const PatternResult& result, int32_t rowIndex) {
    for (const auto& row : result.rows) {
        if (row.rowIndex == rowIndex) return &row;
    }
    return nullptr;
}

void CheckPointCount(const PatternResult& result, const std::vector<HolePoint>& points, const char* func) {
    if (points.size() != result.labels.size()) {
        throw InvalidArgumentException(std::string(func) + ": expected " + std::to_string(result.labels.size()) +
                                       " points, got " + std::to_string(points.size()));
    }
}

bool IsDigits(const std::string& s, size_t from) {
    if (from >= s.size()) return false;
    for (size_t i = from; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

/// Longest digit run accepted as a starting number
constexpr size_t MAX_START_DIGITS = 15;

long long StartNumber(const std::string& start, size_t from) {
    if (start.size() - from > MAX_START_DIGITS) {
        throw InvalidArgumentException("RenumberPoints: start number too long \"" + start + "\"");
    }
    return std::stoll(start.substr(from));
}

} // anonymous namespace

// =============================================================================
// Row edits
// =============================================================================

PatternResult RenameRows(const PatternResult& result, const std::map<int32_t, int32_t>& mapping) {
    for (const auto& [from, to] : mapping) {
        if (!FindRow(result, from)) {
            throw InvalidArgumentException("RenameRows: unknown row " + std::to_string(from));
        }
        if (to < 1) {
            throw InvalidArgumentException("RenameRows: row index must be >= 1, got " + std::to_string(to));
        }
    }

    PatternResult out = result;
    std::stable_sort(out.rows.begin(), out.rows.end(), RowIndexLess);
    for (auto& row : out.rows) {
        auto it = mapping.find(row.rowIndex);
        if (it != mapping.end()) row.rowIndex = it->second;
    }
    std::stable_sort(out.rows.begin(), out.rows.end(), RowIndexLess);

    // Merge rows sharing an index
    std::vector<Row> merged;
    for (auto& row : out.rows) {
        if (!merged.empty() && merged.back().rowIndex == row.rowIndex) {
            auto& target = merged.back().points;
            target.insert(target.end(), row.points.begin(), row.points.end());
            continue;
        }
        merged.push_back(std::move(row));
    }
    out.rows = std::move(merged);

    Refresh(out);
    return out;
}

PatternResult AssignRowToPoints(const PatternResult& result, const std::vector<int>& indices, int32_t newRow) {
    if (indices.empty()) {
        throw InvalidArgumentException("AssignRowToPoints: no points selected");
    }
    if (newRow < 1) {
        throw InvalidArgumentException("AssignRowToPoints: row index must be >= 1, got " + std::to_string(newRow));
    }
    const size_t n = result.labels.size();
    for (int i : indices) {
        if (i < 0 || static_cast<size_t>(i) >= n) {
            throw InvalidArgumentException("AssignRowToPoints: point index " + std::to_string(i) + " out of range");
        }
    }

    // Unique, in selection order
    std::vector<int> moving;
    std::set<int> movingSet;
    for (int i : indices) {
        if (movingSet.insert(i).second) moving.push_back(i);
    }

    PatternResult out = result;

    int32_t subPattern = 0;
    if (const Row* existing = FindRow(out, newRow)) {
        subPattern = existing->subPattern;
    } else {
        int32_t firstRow = out.labels[moving.front()].rowIndex;
        if (const Row* source = FindRow(out, firstRow)) subPattern = source->subPattern;
    }

    for (auto& row : out.rows) {
        row.points.erase(std::remove_if(row.points.begin(), row.points.end(),
                                        [&](int i) { return movingSet.count(i) > 0; }),
                         row.points.end());
    }

    std::vector<int> orphans;
    std::vector<std::string> orphanIds;
    for (size_t k = 0; k < out.orphanIndices.size(); ++k) {
        if (movingSet.count(out.orphanIndices[k])) continue;
        orphans.push_back(out.orphanIndices[k]);
        if (k < out.orphanPointIds.size()) orphanIds.push_back(out.orphanPointIds[k]);
    }
    out.orphanIndices = std::move(orphans);
    out.orphanPointIds = std::move(orphanIds);

    auto target = std::find_if(out.rows.begin(), out.rows.end(),
                               [&](const Row& r) { return r.rowIndex == newRow; });
    if (target == out.rows.end()) {
        Row row;
        row.rowIndex = newRow;
        row.subPattern = subPattern;
        out.rows.push_back(std::move(row));
        target = out.rows.end() - 1;
    }
    target->points.insert(target->points.end(), moving.begin(), moving.end());

    for (auto& sub : out.subPatterns) {
        sub.points.erase(std::remove_if(sub.points.begin(), sub.points.end(),
                                        [&](int i) { return movingSet.count(i) > 0; }),
                         sub.points.end());
        if (sub.index == subPattern) {
            sub.points.insert(sub.points.end(), moving.begin(), moving.end());
            std::sort(sub.points.begin(), sub.points.end());
        }
    }

    Refresh(out);
    return out;
}

PatternResult InvertRowOrder(const PatternResult& result, bool invertPositions) {
    std::vector<int32_t> indices;
    for (const auto& row : result.rows) indices.push_back(row.rowIndex);
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    if (indices.size() < 2) {
        throw InvalidArgumentException("InvertRowOrder: needs at least 2 rows");
    }

    std::map<int32_t, int32_t> mapping;
    for (size_t k = 0; k < indices.size(); ++k) {
        mapping[indices[k]] = indices[indices.size() - 1 - k];
    }

    PatternResult out = result;
    for (auto& row : out.rows) {
        row.rowIndex = mapping[row.rowIndex];
        if (invertPositions) ReverseRow(row);
    }

    Refresh(out);
    return out;
}

PatternResult InvertPositionsWithinRows(const PatternResult& result) {
    PatternResult out = result;
    for (auto& row : out.rows) ReverseRow(row);
    Refresh(out);
    return out;
}

// =============================================================================
// Resequencing
// =============================================================================

PatternResult ResequencePositions(const PatternResult& result,
                                  const std::vector<HolePoint>& points,
                                  const ResequenceOptions& options) {
    if (options.startPosition < 1) {
        throw InvalidArgumentException("ResequencePositions: start position must be >= 1, got " +
                                       std::to_string(options.startPosition));
    }
    CheckPointCount(result, points, "ResequencePositions");

    PatternResult out = result;
    std::stable_sort(out.rows.begin(), out.rows.end(), RowIndexLess);

    for (size_t r = 0; r < out.rows.size(); ++r) {
        Row& row = out.rows[r];

        if (options.orderBy == PositionOrder::Spatial && row.points.size() >= 2) {
            std::vector<Point2d> rowPoints;
            for (int i : row.points) rowPoints.push_back(points[i].XY());
            Internal::PrincipalAxes axes = Internal::ComputePrincipalAxes(rowPoints);
            Point2d dir = axes.valid ? Internal::CanonicalDirection(axes.major) : Point2d(1.0, 0.0);
            std::stable_sort(row.points.begin(), row.points.end(), [&](int a, int b) {
                return points[a].XY().Dot(dir) < points[b].XY().Dot(dir);
            });
        }
        if (options.direction == OrderingDirection::Serpentine && r % 2 == 1) {
            std::reverse(row.points.begin(), row.points.end());
        }
        row.firstPosition = options.startPosition;

        if (row.points.size() >= 2) {
            const Point2d first = points[row.points.front()].XY();
            const Point2d last = points[row.points.back()].XY();
            row.bearingDeg = Internal::CompassBearing(first, last);
            if (row.backbone.size() >= 2 &&
                row.backbone.front().DistanceTo(first) > row.backbone.back().DistanceTo(first)) {
                std::reverse(row.backbone.begin(), row.backbone.end());
            }
        }
    }

    out.direction = options.direction;
    out.serpentine = options.direction == OrderingDirection::Serpentine;
    Refresh(out);
    return out;
}

// =============================================================================
// Renumbering
// =============================================================================

std::string IncrementLetter(const std::string& letters) {
    if (letters.empty()) {
        throw InvalidArgumentException("IncrementLetter: empty string");
    }
    for (char c : letters) {
        if (c < 'A' || c > 'Z') {
            throw InvalidArgumentException("IncrementLetter: not an uppercase letter string: " + letters);
        }
    }

    std::string next = letters;
    for (size_t i = next.size(); i-- > 0;) {
        if (next[i] != 'Z') {
            ++next[i];
            return next;
        }
        next[i] = 'A';
    }
    return "A" + next;
}

std::vector<std::string> RenumberPoints(const PatternResult& result,
                                        const std::vector<HolePoint>& points,
                                        const std::string& start) {
    CheckPointCount(result, points, "RenumberPoints");

    std::vector<std::string> ids;
    ids.reserve(points.size());
    for (const auto& p : points) ids.push_back(p.id);

    std::vector<const Row*> ordered;
    for (const auto& row : result.rows) ordered.push_back(&row);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Row* a, const Row* b) { return a->rowIndex < b->rowIndex; });

    if (IsDigits(start, 0)) {
        long long number = StartNumber(start, 0);
        for (const Row* row : ordered) {
            for (int i : row->points) ids[i] = std::to_string(number++);
        }
        return ids;
    }

    size_t split = 0;
    while (split < start.size() && start[split] >= 'A' && start[split] <= 'Z') ++split;
    if (split == 0 || !IsDigits(start, split)) {
        throw InvalidArgumentException("RenumberPoints: invalid start \"" + start + "\"");
    }

    std::string letter = start.substr(0, split);
    long long first = StartNumber(start, split);
    for (const Row* row : ordered) {
        for (size_t k = 0; k < row->points.size(); ++k) {
            ids[row->points[k]] = letter + std::to_string(first + static_cast<long long>(k));
        }
        letter = IncrementLetter(letter);
    }
    return ids;
}

} // namespace Qi::Blast::Edit

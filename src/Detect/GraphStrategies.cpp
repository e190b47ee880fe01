/**
 * @file GraphStrategies.cpp
 * @brief Graph-based strategies: MST path extraction and k-NN bearing traversal
 */

#include "StrategyImpl.h"

#include <QiBlast/Internal/Geometry.h>
#include <QiBlast/Internal/Graph.h>
#include <QiBlast/Internal/Log.h>
#include <QiBlast/Internal/Neighbors.h>
#include <QiBlast/Internal/Statistics.h>

#include <algorithm>
#include <cstddef>
#include <deque>
#include <limits>
#include <set>

namespace Qi::Blast::Detect {

namespace {

/// Gap CV above which an extracted path is not a row
constexpr double MAX_PATH_GAP_CV = 0.5;

/// Score multiplier for a step turning more than the gentle-turn limit
constexpr double SHARP_TURN_PENALTY = 0.1;

using Adjacency = std::vector<std::vector<std::pair<int, double>>>;

/**
 * @brief Farthest alive node from start along tree edges
 *
 * @param parent [out] BFS parent of every reached node
 */
int FarthestNode(const Adjacency& adj, const std::vector<bool>& alive, int start,
                 std::vector<int>& parent) {
    std::vector<double> dist(adj.size(), -1.0);
    parent.assign(adj.size(), -1);
    dist[start] = 0.0;
    std::deque<int> queue{start};
    int farthest = start;
    while (!queue.empty()) {
        int u = queue.front();
        queue.pop_front();
        if (dist[u] > dist[farthest] || (dist[u] == dist[farthest] && u < farthest)) {
            farthest = u;
        }
        for (const auto& [v, w] : adj[u]) {
            if (!alive[v] || dist[v] >= 0.0) continue;
            dist[v] = dist[u] + w;
            parent[v] = u;
            queue.push_back(v);
        }
    }
    return farthest;
}

/// Alive components, each ascending, ordered by lowest member
std::vector<std::vector<int>> AliveComponents(const Adjacency& adj, const std::vector<bool>& alive) {
    int n = static_cast<int>(adj.size());
    std::vector<bool> seen(n, false);
    std::vector<std::vector<int>> components;
    for (int s = 0; s < n; ++s) {
        if (!alive[s] || seen[s]) continue;
        components.emplace_back();
        std::deque<int> queue{s};
        seen[s] = true;
        while (!queue.empty()) {
            int u = queue.front();
            queue.pop_front();
            components.back().push_back(u);
            for (const auto& [v, w] : adj[u]) {
                if (alive[v] && !seen[v]) {
                    seen[v] = true;
                    queue.push_back(v);
                }
            }
        }
        std::sort(components.back().begin(), components.back().end());
    }
    return components;
}

/// Split a path where consecutive step bearings differ by more than limit
std::vector<std::vector<int>> SplitAtTurns(const std::vector<Point2d>& pts, const std::vector<int>& path,
                                           double limit) {
    std::vector<std::vector<int>> segments{{path.front()}};
    for (size_t k = 1; k < path.size(); ++k) {
        auto& seg = segments.back();
        if (seg.size() >= 2) {
            double before = Internal::CompassBearing(pts[seg[seg.size() - 2]], pts[seg.back()]);
            double step = Internal::CompassBearing(pts[seg.back()], pts[path[k]]);
            if (BearingDifference(before, step) > limit) {
                segments.push_back({path[k]});
                continue;
            }
        }
        seg.push_back(path[k]);
    }
    return segments;
}

/// Whether b can continue a (a's last point joins b's first point)
bool CanContinue(const std::vector<Point2d>& pts, const std::vector<int>& a, const std::vector<int>& b,
                 double maxGap, double limit) {
    const Point2d& end = pts[a.back()];
    const Point2d& start = pts[b.front()];
    if (end.DistanceTo(start) > maxGap) return false;

    double link = Internal::CompassBearing(end, start);
    if (a.size() >= 2 &&
        BearingDifference(Internal::CompassBearing(pts[a[a.size() - 2]], end), link) > limit) {
        return false;
    }
    if (b.size() >= 2 && BearingDifference(Internal::CompassBearing(start, pts[b[1]]), link) > limit) {
        return false;
    }
    return true;
}

/// Merge collinear paths whose endpoints meet; returns true when a merge happened
bool MergeOnce(const std::vector<Point2d>& pts, std::vector<std::vector<int>>& rows,
               double maxGap, double limit) {
    for (size_t i = 0; i < rows.size(); ++i) {
        for (size_t j = i + 1; j < rows.size(); ++j) {
            for (int flip = 0; flip < 4; ++flip) {
                std::vector<int> a = rows[i];
                std::vector<int> b = rows[j];
                if (flip & 1) std::reverse(a.begin(), a.end());
                if (flip & 2) std::reverse(b.begin(), b.end());
                if (!CanContinue(pts, a, b, maxGap, limit)) continue;

                a.insert(a.end(), b.begin(), b.end());
                rows[i] = std::move(a);
                rows.erase(rows.begin() + static_cast<std::ptrdiff_t>(j));
                return true;
            }
        }
    }
    return false;
}

} // anonymous namespace

// =============================================================================
// MstPathExtraction
// =============================================================================

StrategyResult MstPathExtractionStrategy::Detect(const DetectionInput& input,
                                                 const DetectionConfig& config) const {
    const auto kind = Kind();
    const auto& pts = input.points;
    int n = static_cast<int>(pts.size());
    if (n < 3) {
        return StrategyResult::Failure(kind, "needs at least 3 points");
    }

    Adjacency adj(n);
    for (const auto& e : Internal::MinimumSpanningTree(pts)) {
        adj[e.u].emplace_back(e.v, e.weight);
        adj[e.v].emplace_back(e.u, e.weight);
    }

    double turnLimit = config.gentleTurnDeg + BEARING_EPSILON;
    std::vector<bool> alive(n, true);
    std::vector<std::vector<int>> rows;
    int rejected = 0;

    // Every round retires at least one node per component
    for (int round = 0; round < n; ++round) {
        auto components = AliveComponents(adj, alive);
        if (components.empty()) break;

        for (const auto& comp : components) {
            if (comp.size() == 1) {
                alive[comp.front()] = false;
                continue;
            }

            std::vector<int> parent;
            int a = FarthestNode(adj, alive, comp.front(), parent);
            int b = FarthestNode(adj, alive, a, parent);
            std::vector<int> path;
            for (int v = b; v >= 0; v = parent[v]) path.push_back(v);

            auto segments = SplitAtTurns(pts, path, turnLimit);
            size_t longest = 0;
            for (size_t s = 1; s < segments.size(); ++s) {
                if (segments[s].size() > segments[longest].size()) longest = s;
            }
            const auto& segment = segments[longest];
            for (int v : segment) alive[v] = false;

            if (segment.size() >= 3 && Detail::GapCV(pts, {segment}) > MAX_PATH_GAP_CV) {
                ++rejected;
                continue;
            }
            rows.push_back(segment);
        }
    }

    double maxGap = config.orphanAttachFactor * input.spacing;
    int merges = 0;
    while (merges < n && MergeOnce(pts, rows, maxGap, turnLimit)) {
        ++merges;
    }

    Internal::DebugLog(config, "MstPath", "paths=%zu rejected=%d merges=%d", rows.size(), rejected, merges);

    StrategyResult result = Detail::Finish(kind, input, std::move(rows), input.spacing);
    result.message = std::to_string(result.rows.size()) + " tree paths";
    return result;
}

// =============================================================================
// KnnBearingTraversal
// =============================================================================

StrategyResult KnnBearingTraversalStrategy::Detect(const DetectionInput& input,
                                                   const DetectionConfig& config) const {
    const auto kind = Kind();
    const auto& pts = input.points;
    int n = static_cast<int>(pts.size());
    if (n < 3) {
        return StrategyResult::Failure(kind, "needs at least 3 points");
    }

    int32_t k = config.knnK > 0 ? config.knnK : input.stats.suggestedK;
    k = std::max(1, std::min(k, n - 1));
    Internal::NeighborTable table(pts, k);

    // Undirected degree of the k-NN graph
    std::vector<std::set<int>> links(n);
    for (int i = 0; i < n; ++i) {
        for (const auto& nb : table.Of(i)) {
            links[i].insert(nb.index);
            links[nb.index].insert(i);
        }
    }

    std::vector<int> starts;
    for (int i = 0; i < n; ++i) {
        if (links[i].size() <= 2) starts.push_back(i);
    }
    if (starts.size() < 2) {
        int minX = 0, maxX = 0, minY = 0, maxY = 0;
        for (int i = 1; i < n; ++i) {
            if (pts[i].x < pts[minX].x) minX = i;
            if (pts[i].x > pts[maxX].x) maxX = i;
            if (pts[i].y < pts[minY].y) minY = i;
            if (pts[i].y > pts[maxY].y) maxY = i;
        }
        starts.clear();
        for (int e : {minX, maxX, minY, maxY}) {
            if (std::find(starts.begin(), starts.end(), e) == starts.end()) starts.push_back(e);
        }
    }

    double gentle = config.gentleTurnDeg;
    std::vector<bool> visited(n, false);
    std::vector<std::vector<int>> rows;

    for (int start : starts) {
        if (visited[start]) continue;

        std::vector<int> path{start};
        visited[start] = true;
        int current = start;
        bool hasBearing = false;
        double prevBearing = 0.0;

        while (true) {
            int best = -1;
            double bestScore = -std::numeric_limits<double>::max();
            for (const auto& nb : table.Of(current)) {
                if (visited[nb.index]) continue;
                double bearing = Internal::CompassBearing(pts[current], pts[nb.index]);
                double score = nb.distance > DISTANCE_EPSILON ? 1.0 / nb.distance
                                                              : 1.0 / DISTANCE_EPSILON;
                if (hasBearing) {
                    double diff = BearingDifference(bearing, prevBearing);
                    if (diff > config.reversalDeg) continue;
                    if (diff > gentle) {
                        score *= SHARP_TURN_PENALTY;
                    } else {
                        score *= 1.0 + (gentle - diff) / gentle;
                    }
                }
                if (score > bestScore) {
                    bestScore = score;
                    best = nb.index;
                }
            }
            if (best < 0) break;

            prevBearing = Internal::CompassBearing(pts[current], pts[best]);
            hasBearing = true;
            visited[best] = true;
            path.push_back(best);
            current = best;
        }

        if (path.size() >= 2) rows.push_back(std::move(path));
    }

    Internal::DebugLog(config, "KnnTraversal", "k=%d starts=%zu rows=%zu", k, starts.size(), rows.size());

    StrategyResult result = Detail::Finish(kind, input, std::move(rows), input.spacing);
    result.message = std::to_string(result.rows.size()) + " traced rows";
    return result;
}

} // namespace Qi::Blast::Detect

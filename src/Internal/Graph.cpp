/**
 * @file Graph.cpp
 * @brief Union-find, Kruskal MST, connected components and DBSCAN
 */

#include <QiBlast/Internal/Graph.h>

#include <algorithm>
#include <deque>
#include <map>
#include <numeric>

namespace Qi::Blast::Internal {

// =============================================================================
// UnionFind
// =============================================================================

UnionFind::UnionFind(int n) : parent_(n), size_(n, 1) {
    std::iota(parent_.begin(), parent_.end(), 0);
}

int UnionFind::Find(int x) {
    while (parent_[x] != x) {
        parent_[x] = parent_[parent_[x]];
        x = parent_[x];
    }
    return x;
}

bool UnionFind::Unite(int a, int b) {
    int ra = Find(a);
    int rb = Find(b);
    if (ra == rb) return false;
    if (size_[ra] < size_[rb] || (size_[ra] == size_[rb] && rb < ra)) std::swap(ra, rb);
    parent_[rb] = ra;
    size_[ra] += size_[rb];
    return true;
}

// =============================================================================
// MST / Components
// =============================================================================

std::vector<Edge> MinimumSpanningTree(const std::vector<Point2d>& points) {
    int n = static_cast<int>(points.size());
    std::vector<Edge> edges;
    if (n < 2) return edges;

    edges.reserve(static_cast<size_t>(n) * (n - 1) / 2);
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            edges.push_back({i, j, points[i].DistanceTo(points[j])});
        }
    }

    std::sort(edges.begin(), edges.end(), [](const Edge& a, const Edge& b) {
        if (a.weight != b.weight) return a.weight < b.weight;
        if (a.u != b.u) return a.u < b.u;
        return a.v < b.v;
    });

    UnionFind uf(n);
    std::vector<Edge> tree;
    tree.reserve(n - 1);
    for (const auto& e : edges) {
        if (uf.Unite(e.u, e.v)) {
            tree.push_back(e);
            if (static_cast<int>(tree.size()) == n - 1) break;
        }
    }
    return tree;
}

std::vector<std::vector<int>> ConnectedComponents(int n, const std::vector<Edge>& edges) {
    UnionFind uf(n);
    for (const auto& e : edges) {
        uf.Unite(e.u, e.v);
    }

    // Keyed by first-seen member so components come out ordered by lowest index
    std::map<int, size_t> rootToSlot;
    std::vector<std::vector<int>> components;
    for (int i = 0; i < n; ++i) {
        int root = uf.Find(i);
        auto it = rootToSlot.find(root);
        if (it == rootToSlot.end()) {
            rootToSlot[root] = components.size();
            components.push_back({i});
        } else {
            components[it->second].push_back(i);
        }
    }
    return components;
}

std::vector<std::vector<int>> ComponentsWithinRadius(const std::vector<Point2d>& points,
                                                     const std::vector<int>& members,
                                                     double radius) {
    int m = static_cast<int>(members.size());
    std::vector<Edge> edges;
    for (int a = 0; a < m; ++a) {
        for (int b = a + 1; b < m; ++b) {
            double d = points[members[a]].DistanceTo(points[members[b]]);
            if (d <= radius) {
                edges.push_back({a, b, d});
            }
        }
    }

    auto local = ConnectedComponents(m, edges);
    std::vector<std::vector<int>> components;
    components.reserve(local.size());
    for (const auto& comp : local) {
        std::vector<int> mapped;
        mapped.reserve(comp.size());
        for (int idx : comp) mapped.push_back(members[idx]);
        std::sort(mapped.begin(), mapped.end());
        components.push_back(std::move(mapped));
    }
    std::sort(components.begin(), components.end(),
              [](const std::vector<int>& a, const std::vector<int>& b) { return a.front() < b.front(); });
    return components;
}

// =============================================================================
// DBSCAN
// =============================================================================

std::vector<int> Dbscan(const std::vector<Point2d>& points, double eps, int32_t minPts) {
    int n = static_cast<int>(points.size());
    std::vector<int> labels(n, DBSCAN_NOISE);
    std::vector<bool> visited(n, false);

    auto regionQuery = [&](int i) {
        std::vector<int> region;
        for (int j = 0; j < n; ++j) {
            if (points[i].DistanceTo(points[j]) <= eps) {
                region.push_back(j);
            }
        }
        return region;
    };

    int cluster = 0;
    for (int i = 0; i < n; ++i) {
        if (visited[i]) continue;
        visited[i] = true;

        std::vector<int> seeds = regionQuery(i);
        if (static_cast<int32_t>(seeds.size()) < minPts) {
            continue;  // Noise unless claimed later as a border point
        }

        labels[i] = cluster;
        std::deque<int> queue(seeds.begin(), seeds.end());
        while (!queue.empty()) {
            int q = queue.front();
            queue.pop_front();

            if (labels[q] == DBSCAN_NOISE) {
                labels[q] = cluster;
            }
            if (visited[q]) continue;
            visited[q] = true;

            std::vector<int> region = regionQuery(q);
            if (static_cast<int32_t>(region.size()) >= minPts) {
                for (int r : region) {
                    if (!visited[r] || labels[r] == DBSCAN_NOISE) {
                        queue.push_back(r);
                    }
                }
            }
        }
        ++cluster;
    }
    return labels;
}

} // namespace Qi::Blast::Internal

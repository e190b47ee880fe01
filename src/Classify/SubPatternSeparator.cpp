/**
 * @file SubPatternSeparator.cpp
 * @brief Sub-pattern separation and role tagging
 */

#include <QiBlast/Classify/SubPatternSeparator.h>
#include <QiBlast/Core/Constants.h>
#include <QiBlast/Internal/Fitting.h>
#include <QiBlast/Internal/Geometry.h>
#include <QiBlast/Internal/Graph.h>
#include <QiBlast/Internal/Log.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Qi::Blast::Classify {

namespace {

std::vector<Point2d> Gather(const std::vector<Point2d>& points, const std::vector<int>& indices) {
    std::vector<Point2d> out;
    out.reserve(indices.size());
    for (int i : indices) out.push_back(points[i]);
    return out;
}

double GroupOrientation(const std::vector<double>& orientations, const std::vector<int>& group) {
    std::vector<double> members;
    members.reserve(group.size());
    for (int i : group) members.push_back(orientations[i]);
    return Internal::AxialMean(members);
}

} // anonymous namespace

SubPatternRole TagSubPatternRole(const std::vector<Point2d>& points,
                                 const std::vector<int>& mainPoints, double mainOrientationDeg,
                                 const std::vector<int>& candidate, double candidateOrientationDeg,
                                 double toleranceDeg) {
    double diff = AxialDifference(mainOrientationDeg, candidateOrientationDeg);
    if (std::abs(diff - 90.0) > toleranceDeg + BEARING_EPSILON) {
        return SubPatternRole::Secondary;
    }

    Point2d axis = Internal::BearingDirection(mainOrientationDeg);
    double minU = std::numeric_limits<double>::max();
    double maxU = std::numeric_limits<double>::lowest();
    for (int i : mainPoints) {
        double u = points[i].Dot(axis);
        minU = std::min(minU, u);
        maxU = std::max(maxU, u);
    }

    double cu = Internal::ComputeCentroid(Gather(points, candidate)).Dot(axis);
    return (cu < minU || cu > maxU) ? SubPatternRole::Batter : SubPatternRole::Buffer;
}

std::vector<SubPattern> SeparateSubPatterns(const std::vector<Point2d>& points,
                                            const Classification& classification,
                                            const DetectionConfig& config,
                                            int32_t depth,
                                            std::vector<Classification>* classifications) {
    std::vector<SubPattern> result;
    if (points.empty()) return result;

    double radius = std::max(config.connectivityFactor * classification.spacing, DISTANCE_EPSILON);

    // Components of every orientation cluster
    std::vector<std::vector<int>> groups;
    for (const auto& cluster : classification.clusters) {
        auto components = Internal::ComponentsWithinRadius(points, cluster.points, radius);
        for (auto& comp : components) groups.push_back(std::move(comp));
    }

    std::vector<bool> large(groups.size(), false);
    bool any = false;
    for (size_t g = 0; g < groups.size(); ++g) {
        large[g] = static_cast<int32_t>(groups[g].size()) >= config.minClusterSize;
        any = any || large[g];
    }
    if (!any) {
        size_t biggest = 0;
        for (size_t g = 1; g < groups.size(); ++g) {
            if (groups[g].size() > groups[biggest].size()) biggest = g;
        }
        large[biggest] = true;
    }

    // Small components join the large group owning their nearest point
    std::vector<std::vector<int>> merged(groups.size());
    for (size_t g = 0; g < groups.size(); ++g) {
        if (large[g]) merged[g] = groups[g];
    }
    for (size_t g = 0; g < groups.size(); ++g) {
        if (large[g]) continue;
        double best = std::numeric_limits<double>::max();
        size_t target = g;
        for (int i : groups[g]) {
            for (size_t h = 0; h < groups.size(); ++h) {
                if (!large[h]) continue;
                for (int j : groups[h]) {
                    double d = points[i].DistanceTo(points[j]);
                    if (d < best) {
                        best = d;
                        target = h;
                    }
                }
            }
        }
        merged[target].insert(merged[target].end(), groups[g].begin(), groups[g].end());
    }

    std::vector<std::vector<int>> subsets;
    for (size_t g = 0; g < groups.size(); ++g) {
        if (!large[g]) continue;
        std::sort(merged[g].begin(), merged[g].end());
        subsets.push_back(std::move(merged[g]));
    }

    // MAIN first, then by size, then by lowest member
    std::sort(subsets.begin(), subsets.end(), [](const std::vector<int>& a, const std::vector<int>& b) {
        if (a.size() != b.size()) return a.size() > b.size();
        return a.front() < b.front();
    });

    const std::vector<int>& mainPoints = subsets.front();
    double mainOrientation = GroupOrientation(classification.orientations, mainPoints);

    if (classifications) classifications->clear();
    for (size_t s = 0; s < subsets.size(); ++s) {
        SubPattern sub;
        sub.index = static_cast<int32_t>(s);
        sub.points = subsets[s];
        sub.depth = depth + 1;
        sub.orientationDeg = GroupOrientation(classification.orientations, sub.points);
        sub.role = s == 0 ? SubPatternRole::Main
                          : TagSubPatternRole(points, mainPoints, mainOrientation, sub.points,
                                              sub.orientationDeg, config.orientationToleranceDeg);

        Classification local = ClassifyPattern(Gather(points, sub.points), config);
        sub.type = local.type;
        if (classifications) classifications->push_back(std::move(local));

        Internal::DebugLog(config, "Separate", "depth=%d sub=%zu size=%zu role=%s type=%s orient=%.1f",
                           depth + 1, s, sub.points.size(), ToString(sub.role), ToString(sub.type),
                           sub.orientationDeg);
        result.push_back(std::move(sub));
    }
    return result;
}

} // namespace Qi::Blast::Classify

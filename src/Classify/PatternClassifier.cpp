/**
 * @file PatternClassifier.cpp
 * @brief Orientation clustering, provisional chains and pattern decision
 */

#include <QiBlast/Classify/PatternClassifier.h>
#include <QiBlast/Core/Constants.h>
#include <QiBlast/Internal/Fitting.h>
#include <QiBlast/Internal/Geometry.h>
#include <QiBlast/Internal/Graph.h>
#include <QiBlast/Internal/Log.h>
#include <QiBlast/Internal/Neighbors.h>
#include <QiBlast/Internal/Statistics.h>

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <numeric>

namespace Qi::Blast::Classify {

namespace {

/// Neighbours closer than (1 + NEAR_TIE) x nearest count as ties
constexpr double NEAR_TIE = 0.05;

/// Mean resultant below which tied bearings are treated as cancelling out
constexpr double MIN_RESULTANT = 0.5;

/// Chain link radius in nearest-neighbour distances
constexpr double CHAIN_LINK_FACTOR = 1.5;

/// Neighbours examined per point for orientation and chaining
constexpr int32_t LOCAL_K = 12;

/// Distance to the first non-coincident neighbour (0 if none)
double NearestNonZero(const std::vector<Internal::Neighbor>& nbrs) {
    for (const auto& nb : nbrs) {
        if (nb.distance > DISTANCE_EPSILON) return nb.distance;
    }
    return 0.0;
}

std::vector<Point2d> Gather(const std::vector<Point2d>& points, const std::vector<int>& indices) {
    std::vector<Point2d> out;
    out.reserve(indices.size());
    for (int i : indices) out.push_back(points[i]);
    return out;
}

double ScoreStraight(double ratio, double kappa, const DetectionConfig& config) {
    double ratioScore = Clamp((ratio - config.straightVarianceRatio) / config.straightVarianceRatio, 0.0, 1.0);
    double kappaScore = config.straightCurvatureMax > 0.0
                            ? Clamp(1.0 - kappa / config.straightCurvatureMax, 0.0, 1.0)
                            : 1.0;
    return 0.6 + 0.4 * ratioScore * kappaScore;
}

double ScoreCurved(double ratio, double kappa, const DetectionConfig& config) {
    double ratioScore = config.curvedVarianceRatio > 0.0
                            ? Clamp((config.curvedVarianceRatio - ratio) / config.curvedVarianceRatio, 0.0, 1.0)
                            : 0.0;
    double kappaScore = config.curvedCurvatureMin > 0.0
                            ? Clamp((kappa - config.curvedCurvatureMin) / config.curvedCurvatureMin, 0.0, 1.0)
                            : 0.0;
    return 0.6 + 0.4 * std::max(ratioScore, kappaScore);
}

} // anonymous namespace

std::vector<std::vector<int>> Classification::ChainsOfSize(size_t minSize) const {
    std::vector<std::vector<int>> out;
    for (const auto& chain : chains) {
        if (chain.size() >= minSize) out.push_back(chain);
    }
    return out;
}

// =============================================================================
// Local Orientation
// =============================================================================

std::vector<double> ComputeLocalOrientations(const std::vector<Point2d>& points) {
    int n = static_cast<int>(points.size());
    std::vector<double> orientations(n, 0.0);
    if (n < 2) return orientations;

    Internal::NeighborTable table(points, std::min(LOCAL_K, n - 1));

    // Tied bearings per point; an empty list marks a settled orientation
    std::vector<std::vector<double>> cancelled(n);

#pragma omp parallel for schedule(static)
    for (int i = 0; i < n; ++i) {
        const auto& nbrs = table.Of(i);
        double d0 = NearestNonZero(nbrs);
        if (d0 <= 0.0) continue;

        std::vector<double> tied;
        for (const auto& nb : nbrs) {
            if (nb.distance <= DISTANCE_EPSILON) continue;
            if (nb.distance > d0 * (1.0 + NEAR_TIE)) break;
            tied.push_back(Internal::AxialBearing(points[i], points[nb.index]));
        }

        double resultant = 1.0;
        double mean = Internal::AxialMean(tied, &resultant);
        if (resultant >= MIN_RESULTANT) {
            orientations[i] = mean;
        } else {
            cancelled[i] = std::move(tied);
        }
    }

    // Cancelled points follow the settled neighbours around them, else the
    // major axis of the whole set; the lower bearing wins an exact tie
    Internal::PrincipalAxes global = Internal::ComputePrincipalAxes(points);
    bool globalUsable = global.valid && global.lambda1 > global.lambda2 * (1.0 + NEAR_TIE);
    double globalAxis = globalUsable ? NormalizeAxial(Internal::DirectionBearing(global.major)) : 0.0;

    std::vector<double> settled = orientations;
#pragma omp parallel for schedule(static)
    for (int i = 0; i < n; ++i) {
        if (cancelled[i].empty()) continue;

        std::vector<double> votes;
        for (const auto& nb : table.Of(i)) {
            if (cancelled[nb.index].empty() && nb.distance > DISTANCE_EPSILON) {
                votes.push_back(settled[nb.index]);
            }
        }
        double resultant = 0.0;
        double local = votes.empty() ? 0.0 : Internal::AxialMean(votes, &resultant);
        bool haveReference = resultant >= MIN_RESULTANT || globalUsable;
        double reference = resultant >= MIN_RESULTANT ? local : globalAxis;

        double best = NormalizeAxial(cancelled[i].front());
        double bestGap = haveReference ? AxialDifference(best, reference) : 0.0;
        for (double bearing : cancelled[i]) {
            double b = NormalizeAxial(bearing);
            double gap = haveReference ? AxialDifference(b, reference) : 0.0;
            if (gap < bestGap - BEARING_EPSILON ||
                (std::abs(gap - bestGap) <= BEARING_EPSILON && b < best - BEARING_EPSILON)) {
                best = b;
                bestGap = gap;
            }
        }
        orientations[i] = best;
    }
    return orientations;
}

// =============================================================================
// Orientation Clustering
// =============================================================================

std::vector<OrientationCluster> ClusterOrientations(const std::vector<Point2d>& points,
                                                    const std::vector<double>& orientations,
                                                    double spacing,
                                                    const DetectionConfig& config,
                                                    std::vector<int>& clusterOf) {
    int n = static_cast<int>(points.size());
    clusterOf.assign(n, -1);
    std::vector<OrientationCluster> clusters;
    if (n == 0) return clusters;

    double radius = std::max(config.connectivityFactor * spacing, DISTANCE_EPSILON);
    double tolerance = config.orientationToleranceDeg + BEARING_EPSILON;

    // Region growing in index order
    std::vector<std::vector<int>> raw;
    std::vector<int> rawOf(n, -1);
    for (int seed = 0; seed < n; ++seed) {
        if (rawOf[seed] >= 0) continue;
        int id = static_cast<int>(raw.size());
        raw.emplace_back();
        std::deque<int> queue{seed};
        rawOf[seed] = id;
        while (!queue.empty()) {
            int i = queue.front();
            queue.pop_front();
            raw[id].push_back(i);
            for (int j = 0; j < n; ++j) {
                if (rawOf[j] >= 0) continue;
                if (points[i].DistanceTo(points[j]) > radius) continue;
                if (AxialDifference(orientations[i], orientations[j]) > tolerance) continue;
                rawOf[j] = id;
                queue.push_back(j);
            }
        }
        std::sort(raw[id].begin(), raw[id].end());
    }

    double threshold = std::max(static_cast<double>(config.minClusterSize),
                                config.minClusterFraction * n);
    std::vector<bool> populated(raw.size(), false);
    bool any = false;
    for (size_t c = 0; c < raw.size(); ++c) {
        populated[c] = static_cast<double>(raw[c].size()) >= threshold - EPSILON;
        any = any || populated[c];
    }
    if (!any) {
        size_t largest = 0;
        for (size_t c = 1; c < raw.size(); ++c) {
            if (raw[c].size() > raw[largest].size()) largest = c;
        }
        populated[largest] = true;
    }

    std::vector<int> finalOf(raw.size(), -1);
    for (size_t c = 0; c < raw.size(); ++c) {
        if (!populated[c]) continue;
        finalOf[c] = static_cast<int>(clusters.size());
        OrientationCluster cluster;
        cluster.points = raw[c];
        cluster.coreSize = static_cast<int32_t>(raw[c].size());
        std::vector<double> members;
        for (int i : raw[c]) members.push_back(orientations[i]);
        cluster.orientationDeg = Internal::AxialMean(members);
        clusters.push_back(std::move(cluster));
    }

    // Each unpopulated cluster joins the populated cluster owning its nearest point
    for (size_t c = 0; c < raw.size(); ++c) {
        if (populated[c]) continue;
        double best = std::numeric_limits<double>::max();
        int target = -1;
        for (int i : raw[c]) {
            for (int j = 0; j < n; ++j) {
                if (!populated[rawOf[j]]) continue;
                double d = points[i].DistanceTo(points[j]);
                if (d < best) {
                    best = d;
                    target = finalOf[rawOf[j]];
                }
            }
        }
        auto& dst = clusters[target].points;
        dst.insert(dst.end(), raw[c].begin(), raw[c].end());
    }

    for (size_t c = 0; c < clusters.size(); ++c) {
        std::sort(clusters[c].points.begin(), clusters[c].points.end());
        for (int i : clusters[c].points) {
            clusterOf[i] = static_cast<int>(c);
        }
    }
    return clusters;
}

// =============================================================================
// Provisional Chains
// =============================================================================

std::vector<std::vector<int>> BuildProvisionalChains(const std::vector<Point2d>& points,
                                                     const std::vector<double>& orientations,
                                                     const DetectionConfig& config) {
    int n = static_cast<int>(points.size());
    if (n < 2) {
        return n == 1 ? std::vector<std::vector<int>>{{0}} : std::vector<std::vector<int>>{};
    }

    Internal::NeighborTable table(points, std::min(LOCAL_K, n - 1));
    double tolerance = 2.0 * config.orientationToleranceDeg + BEARING_EPSILON;

    std::vector<Internal::Edge> edges;
    for (int i = 0; i < n; ++i) {
        const auto& nbrs = table.Of(i);
        double limit = CHAIN_LINK_FACTOR * NearestNonZero(nbrs) + DISTANCE_EPSILON;
        for (const auto& nb : nbrs) {
            if (nb.distance > limit) break;
            int j = nb.index;
            if (nb.distance > DISTANCE_EPSILON) {
                double bearing = Internal::AxialBearing(points[i], points[j]);
                if (AxialDifference(bearing, orientations[i]) > tolerance) continue;
                if (AxialDifference(bearing, orientations[j]) > tolerance) continue;
            }
            edges.push_back({i, j, nb.distance});
        }
    }
    return Internal::ConnectedComponents(n, edges);
}

// =============================================================================
// Local Curvature
// =============================================================================

std::vector<double> ComputeLocalCurvatures(const std::vector<Point2d>& points,
                                           const std::vector<std::vector<int>>& chains,
                                           int32_t neighbors) {
    int n = static_cast<int>(points.size());
    std::vector<double> curvatures(n, 0.0);
    std::vector<int> chainOf(n, -1);
    for (size_t c = 0; c < chains.size(); ++c) {
        for (int i : chains[c]) chainOf[i] = static_cast<int>(c);
    }

#pragma omp parallel for schedule(static)
    for (int i = 0; i < n; ++i) {
        if (chainOf[i] < 0) continue;
        const auto& chain = chains[chainOf[i]];
        if (static_cast<int>(chain.size()) < Internal::CIRCLE_FIT_MIN_POINTS) continue;

        std::vector<std::pair<double, int>> byDistance;
        for (int j : chain) {
            if (j != i) byDistance.emplace_back(points[i].DistanceTo(points[j]), j);
        }
        std::sort(byDistance.begin(), byDistance.end());

        std::vector<Point2d> local{points[i]};
        for (size_t k = 0; k < byDistance.size() && static_cast<int32_t>(k) < neighbors; ++k) {
            local.push_back(points[byDistance[k].second]);
        }
        curvatures[i] = Internal::FitCircleAlgebraic(local).Curvature();
    }
    return curvatures;
}

// =============================================================================
// ClassifyPattern
// =============================================================================

Classification ClassifyPattern(const std::vector<Point2d>& points, const DetectionConfig& config) {
    Classification result;
    int n = static_cast<int>(points.size());
    result.spacing = Internal::EstimateSpacing(points);
    result.orientations = ComputeLocalOrientations(points);
    result.curvatures.assign(n, 0.0);

    if (n < 3) {
        OrientationCluster all;
        all.points.resize(n);
        std::iota(all.points.begin(), all.points.end(), 0);
        all.coreSize = n;
        all.orientationDeg = Internal::AxialMean(result.orientations);
        result.clusters.push_back(all);
        result.clusterOf.assign(n, 0);
        if (n > 0) result.chains.push_back(all.points);
        result.chainOf.assign(n, 0);
        result.type = PatternType::Straight;
        result.confidence = 0.5;
        return result;
    }

    result.clusters = ClusterOrientations(points, result.orientations, result.spacing, config,
                                          result.clusterOf);

    result.chains = BuildProvisionalChains(points, result.orientations, config);
    result.chainOf.assign(n, -1);
    for (size_t c = 0; c < result.chains.size(); ++c) {
        for (int i : result.chains[c]) result.chainOf[i] = static_cast<int>(c);
    }

    // Variance ratio and straightness along chains
    std::vector<double> ratios;
    std::vector<double> weights;
    for (const auto& chain : result.chains) {
        if (chain.size() < 3) continue;
        std::vector<Point2d> pts = Gather(points, chain);
        Internal::PrincipalAxes axes = Internal::ComputePrincipalAxes(pts);
        if (axes.valid) {
            ratios.push_back(axes.VarianceRatio());
            weights.push_back(static_cast<double>(chain.size()));
        }
        Internal::LineFitResult fit = Internal::FitLine(pts);
        if (fit.success) {
            result.maxChainResidual = std::max(result.maxChainResidual, fit.residualMax);
        }
    }
    if (ratios.empty()) {
        result.varianceRatio = Internal::ComputePrincipalAxes(points).VarianceRatio();
        result.maxChainResidual = Internal::FitLine(points).residualMax;
    } else {
        result.varianceRatio = Internal::WeightedMedian(ratios, weights);
    }
    result.varianceRatio = std::min(result.varianceRatio, MAX_VARIANCE_RATIO);

    result.curvatures = ComputeLocalCurvatures(points, result.chains, config.curvatureNeighbors);
    std::vector<double> measured;
    for (int i = 0; i < n; ++i) {
        if (result.chains[result.chainOf[i]].size() >= 3) measured.push_back(result.curvatures[i]);
    }
    result.meanCurvature = Internal::Mean(measured);
    double sd = Internal::StandardDeviation(measured);
    result.curvatureVariance = sd * sd;

    // Decision
    double ratio = result.varianceRatio;
    double kappa = result.meanCurvature;
    if (result.PopulatedClusterCount() >= 2) {
        int32_t core = 0;
        for (const auto& c : result.clusters) core += c.coreSize;
        result.type = PatternType::MultiPattern;
        result.confidence = 0.5 + 0.5 * static_cast<double>(core) / n;
    } else if (ratio > config.straightVarianceRatio && kappa < config.straightCurvatureMax) {
        result.type = PatternType::Straight;
        result.confidence = ScoreStraight(ratio, kappa, config);
    } else if (ratio < config.curvedVarianceRatio || kappa > config.curvedCurvatureMin) {
        result.type = PatternType::Curved;
        result.confidence = ScoreCurved(ratio, kappa, config);
    } else if (result.maxChainResidual > config.rowSplitDeviationFactor * result.spacing) {
        result.type = PatternType::Curved;
        result.confidence = 0.5;
    } else {
        result.type = PatternType::Straight;
        result.confidence = 0.5;
    }

    Internal::DebugLog(config, "Classify",
                       "n=%d type=%s ratio=%.3f kappa=%.4f clusters=%d chains=%zu conf=%.2f",
                       n, ToString(result.type), ratio, kappa, result.PopulatedClusterCount(),
                       result.chains.size(), result.confidence);
    return result;
}

} // namespace Qi::Blast::Classify

/**
 * @file PointSetAnalyzer.cpp
 * @brief Point set pre-analysis and sequence token parsing
 */

#include <QiBlast/Analysis/PointSetAnalyzer.h>
#include <QiBlast/Core/Constants.h>
#include <QiBlast/Core/Exception.h>
#include <QiBlast/Internal/Fitting.h>
#include <QiBlast/Internal/Geometry.h>
#include <QiBlast/Internal/Neighbors.h>
#include <QiBlast/Internal/Statistics.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <string>

namespace Qi::Blast::Analysis {

namespace {

constexpr int ELBOW_K = 4;

std::string Trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // anonymous namespace

// =============================================================================
// Sequence Tokens
// =============================================================================

std::pair<int64_t, int64_t> SequenceToken::OrderKey() const {
    if (!valid) return {0, 0};
    return {PrefixRank(prefix), number};
}

int64_t PrefixRank(const std::string& prefix) {
    int64_t rank = 0;
    for (char c : prefix) {
        rank = rank * 26 + (std::toupper(static_cast<unsigned char>(c)) - 'A' + 1);
    }
    return rank;
}

SequenceToken ParseSequenceToken(const std::string& text) {
    SequenceToken token;
    std::string s = Trim(text);
    if (s.empty()) return token;

    size_t i = 0;
    while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]))) ++i;
    size_t digitsBegin = i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    // Letters then at least one digit, nothing after; keep numbers in int64 range
    size_t digitCount = i - digitsBegin;
    if (i != s.size() || digitCount == 0 || digitCount > 15 || digitsBegin > 3) {
        return token;
    }

    token.prefix = s.substr(0, digitsBegin);
    for (auto& c : token.prefix) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    token.number = std::stoll(s.substr(digitsBegin));
    token.valid = true;
    return token;
}

std::vector<int> OrderByToken(const std::vector<int>& indices, const std::vector<SequenceToken>& tokens) {
    std::vector<int> order = indices;
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
        const SequenceToken& ta = tokens[a];
        const SequenceToken& tb = tokens[b];
        if (ta.valid != tb.valid) return ta.valid;
        if (!ta.valid) return a < b;
        return ta.OrderKey() < tb.OrderKey();
    });
    return order;
}

// =============================================================================
// Analysis
// =============================================================================

std::vector<Point2d> ToPlanPoints(const std::vector<HolePoint>& points) {
    std::vector<Point2d> plan;
    plan.reserve(points.size());
    for (const auto& p : points) {
        plan.push_back(p.XY());
    }
    return plan;
}

double EstimateDbscanEps(const std::vector<Point2d>& points, int32_t k) {
    int n = static_cast<int>(points.size());
    if (n < 2) return 0.0;

    std::vector<double> kd = Internal::SortedKDistances(points, std::min(k, n - 1));
    double median = Internal::Median(kd);
    if (kd.size() < 3) return median;

    size_t elbow = kd.size() / 2;
    double bestCurvature = -1.0;
    for (size_t i = 1; i + 1 < kd.size(); ++i) {
        double curvature = kd[i + 1] - 2.0 * kd[i] + kd[i - 1];
        if (curvature > bestCurvature) {
            bestCurvature = curvature;
            elbow = i;
        }
    }

    return Clamp(kd[elbow], 0.5 * median, 3.0 * median);
}

PointSetStats AnalyzePlanPoints(const std::vector<Point2d>& points,
                                const std::vector<SequenceToken>& tokens,
                                const DetectionConfig& config) {
    PointSetStats stats;
    int n = static_cast<int>(points.size());
    stats.count = n;
    if (n == 0) return stats;

    stats.bounds = Internal::ComputeBoundingBox(points);
    stats.extent = stats.bounds.Diagonal();
    stats.centroid = Internal::ComputeCentroid(points);

    if (n >= 2) {
        Internal::NeighborTable table(points, 1);
        stats.nearestDistances.resize(n);
        for (int i = 0; i < n; ++i) {
            stats.nearestDistances[i] = table.NearestDistance(i);
        }
        stats.spacing = Internal::EstimateSpacing(points);
        stats.meanNearestDistance = Internal::Mean(stats.nearestDistances);
    }

    double area = stats.bounds.Area();
    stats.density = area > EPSILON ? n / area : 0.0;

    // Token reliability: parseable and unique
    stats.tokens = tokens;
    stats.tokens.resize(n);
    std::multiset<std::pair<int64_t, int64_t>> keys;
    int withPrefix = 0;
    for (const auto& t : stats.tokens) {
        if (!t.valid) continue;
        keys.insert(t.OrderKey());
        if (t.HasPrefix()) ++withPrefix;
    }
    int reliable = 0;
    for (const auto& t : stats.tokens) {
        if (t.valid && keys.count(t.OrderKey()) == 1) ++reliable;
    }
    stats.tokenReliability = static_cast<double>(reliable) / n;
    stats.tokensReliable = stats.tokenReliability >= config.sequenceReliability - EPSILON;
    stats.alphanumericShare = static_cast<double>(withPrefix) / n;
    stats.alphanumeric = stats.alphanumericShare >= config.sequenceReliability - EPSILON;

    stats.suggestedK = std::max(2, std::min(6, n / 5));
    stats.suggestedMinPts = std::min(5, std::max(2, static_cast<int>(std::floor(0.05 * n))));
    stats.suggestedEps = EstimateDbscanEps(points, ELBOW_K);

    return stats;
}

PointSetStats AnalyzePointSet(const std::vector<HolePoint>& points, const DetectionConfig& config) {
    if (points.size() < 2) {
        throw InputException("AnalyzePointSet: at least 2 points required, got " +
                             std::to_string(points.size()));
    }

    std::vector<SequenceToken> tokens;
    tokens.reserve(points.size());
    for (const auto& p : points) {
        tokens.push_back(ParseSequenceToken(p.sequenceToken));
    }

    PointSetStats stats = AnalyzePlanPoints(ToPlanPoints(points), tokens, config);
    if (stats.IsDegenerate()) {
        throw InputException("AnalyzePointSet: points have zero spatial extent");
    }
    return stats;
}

} // namespace Qi::Blast::Analysis

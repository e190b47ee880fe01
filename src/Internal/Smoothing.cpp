/**
 * @file Smoothing.cpp
 * @brief LOESS, cubic B-spline and Douglas-Peucker
 */

#include <QiBlast/Internal/Smoothing.h>
#include <QiBlast/Internal/Geometry.h>
#include <QiBlast/Core/Constants.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace Qi::Blast::Internal {

// =============================================================================
// LOESS
// =============================================================================

double TricubeWeight(double u) {
    double a = std::abs(u);
    if (a >= 1.0) return 0.0;
    double t = 1.0 - a * a * a;
    return t * t * t;
}

std::vector<double> Loess(const std::vector<double>& x, const std::vector<double>& y,
                          double span, const std::vector<double>& evalAt) {
    std::vector<double> out(evalAt.size(), 0.0);
    int n = static_cast<int>(std::min(x.size(), y.size()));
    if (n == 0) return out;

    int q = static_cast<int>(std::ceil(Clamp(span, 0.0, 1.0) * n));
    q = std::min(n, std::max(q, LOESS_MIN_POINTS));

    std::vector<int> order(n);
    std::vector<double> dist(n);
    std::vector<double> w(n);

    for (size_t e = 0; e < evalAt.size(); ++e) {
        double u = evalAt[e];
        for (int i = 0; i < n; ++i) {
            dist[i] = std::abs(x[i] - u);
        }
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&](int a, int b) { return dist[a] < dist[b]; });

        double h = dist[order[q - 1]];
        double sumW = 0.0;
        for (int k = 0; k < q; ++k) {
            int i = order[k];
            w[i] = h > EPSILON ? TricubeWeight(dist[i] / h) : 1.0;
            sumW += w[i];
        }
        if (sumW < 1e-12) {
            for (int k = 0; k < q; ++k) w[order[k]] = 1.0;
            sumW = static_cast<double>(q);
        }

        double mx = 0.0, my = 0.0;
        for (int k = 0; k < q; ++k) {
            int i = order[k];
            mx += w[i] * x[i];
            my += w[i] * y[i];
        }
        mx /= sumW;
        my /= sumW;

        double sxx = 0.0, sxy = 0.0;
        for (int k = 0; k < q; ++k) {
            int i = order[k];
            sxx += w[i] * (x[i] - mx) * (x[i] - mx);
            sxy += w[i] * (x[i] - mx) * (y[i] - my);
        }

        double scale = std::max(h, 1.0);
        if (sxx < 1e-12 * scale * scale * sumW) {
            out[e] = my;
        } else {
            out[e] = my + (sxy / sxx) * (u - mx);
        }
    }
    return out;
}

// =============================================================================
// CubicBSpline
// =============================================================================

CubicBSpline::CubicBSpline(std::vector<Point2d> controlPoints)
    : control_(std::move(controlPoints)) {
    int m = static_cast<int>(control_.size());
    if (m == 0) return;

    degree_ = std::min(3, m - 1);
    int p = degree_;

    // Clamped knot vector: p+1 zeros, uniform interior, p+1 ones
    int numKnots = m + p + 1;
    knots_.assign(numKnots, 0.0);
    int interior = m - p - 1;
    for (int k = 0; k < interior; ++k) {
        knots_[p + 1 + k] = static_cast<double>(k + 1) / (interior + 1);
    }
    for (int k = numKnots - p - 1; k < numKnots; ++k) {
        knots_[k] = 1.0;
    }
}

double CubicBSpline::Basis(int i, int p, double t) const {
    if (p == 0) {
        return (knots_[i] <= t && t < knots_[i + 1]) ? 1.0 : 0.0;
    }

    double left = 0.0;
    double denomL = knots_[i + p] - knots_[i];
    if (denomL > 0.0) {
        left = (t - knots_[i]) / denomL * Basis(i, p - 1, t);
    }

    double right = 0.0;
    double denomR = knots_[i + p + 1] - knots_[i + 1];
    if (denomR > 0.0) {
        right = (knots_[i + p + 1] - t) / denomR * Basis(i + 1, p - 1, t);
    }
    return left + right;
}

Point2d CubicBSpline::Evaluate(double t) const {
    if (control_.empty()) return Point2d();
    if (control_.size() == 1) return control_[0];

    t = Clamp(t, 0.0, 1.0);
    if (t >= 1.0) {
        return control_.back();
    }

    Point2d p;
    for (size_t i = 0; i < control_.size(); ++i) {
        double b = Basis(static_cast<int>(i), degree_, t);
        if (b != 0.0) {
            p += control_[i] * b;
        }
    }
    return p;
}

std::vector<Point2d> CubicBSpline::Sample(int32_t samplesPerSpan) const {
    std::vector<Point2d> samples;
    if (control_.empty()) return samples;
    if (control_.size() == 1) return control_;

    int spans = std::max(1, static_cast<int>(control_.size()) - degree_);
    int count = spans * std::max(1, samplesPerSpan) + 1;
    samples.reserve(count);
    for (int k = 0; k < count; ++k) {
        samples.push_back(Evaluate(static_cast<double>(k) / (count - 1)));
    }
    return samples;
}

// =============================================================================
// Douglas-Peucker
// =============================================================================

std::vector<int> DouglasPeucker(const std::vector<Point2d>& polyline, double epsilon) {
    int n = static_cast<int>(polyline.size());
    std::vector<int> kept;
    if (n == 0) return kept;
    if (n < 3) {
        kept.resize(n);
        std::iota(kept.begin(), kept.end(), 0);
        return kept;
    }

    std::vector<bool> keep(n, false);
    keep[0] = true;
    keep[n - 1] = true;

    std::vector<std::pair<int, int>> stack;
    stack.emplace_back(0, n - 1);
    while (!stack.empty()) {
        auto [first, last] = stack.back();
        stack.pop_back();
        if (last - first < 2) continue;

        double maxDist = -1.0;
        int index = -1;
        for (int i = first + 1; i < last; ++i) {
            double d = DistanceToSegment(polyline[i], polyline[first], polyline[last]);
            if (d > maxDist) {
                maxDist = d;
                index = i;
            }
        }

        if (maxDist > epsilon) {
            keep[index] = true;
            stack.emplace_back(first, index);
            stack.emplace_back(index, last);
        }
    }

    for (int i = 0; i < n; ++i) {
        if (keep[i]) kept.push_back(i);
    }
    return kept;
}

} // namespace Qi::Blast::Internal

/**
 * @file Statistics.cpp
 * @brief Descriptive statistics helpers
 */

#include <QiBlast/Internal/Statistics.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace Qi::Blast::Internal {

double Mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double Median(std::vector<double> values) {
    if (values.empty()) return 0.0;

    size_t n = values.size();
    size_t mid = n / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());

    if (n % 2 == 0) {
        double upper = values[mid];
        std::nth_element(values.begin(), values.begin() + mid - 1, values.end());
        return (values[mid - 1] + upper) / 2.0;
    }
    return values[mid];
}

double StandardDeviation(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    double mean = Mean(values);
    double sumSq = 0.0;
    for (double v : values) {
        sumSq += (v - mean) * (v - mean);
    }
    return std::sqrt(sumSq / static_cast<double>(values.size()));
}

double CoefficientOfVariation(const std::vector<double>& values) {
    double mean = Mean(values);
    if (std::abs(mean) < 1e-12) return 0.0;
    return StandardDeviation(values) / std::abs(mean);
}

double WeightedMedian(const std::vector<double>& values, const std::vector<double>& weights) {
    if (values.empty() || values.size() != weights.size()) return 0.0;

    std::vector<size_t> order(values.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return values[a] < values[b]; });

    double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (total <= 0.0) return Median(values);

    double cumulative = 0.0;
    for (size_t idx : order) {
        cumulative += weights[idx];
        if (cumulative >= total / 2.0) {
            return values[idx];
        }
    }
    return values[order.back()];
}

} // namespace Qi::Blast::Internal

#pragma once

/**
 * @file Statistics.h
 * @brief Small descriptive statistics helpers
 */

#include <vector>

namespace Qi::Blast::Internal {

/// Arithmetic mean (0 for empty input)
double Mean(const std::vector<double>& values);

/// Median (0 for empty input); even counts average the two middle values
double Median(std::vector<double> values);

/// Population standard deviation
double StandardDeviation(const std::vector<double>& values);

/// Standard deviation over mean (0 when the mean is ~0)
double CoefficientOfVariation(const std::vector<double>& values);

/**
 * @brief Weighted median
 *
 * Smallest value whose cumulative weight reaches half of the total.
 * Sizes of values and weights must match.
 */
double WeightedMedian(const std::vector<double>& values, const std::vector<double>& weights);

} // namespace Qi::Blast::Internal

#pragma once

/**
 * @file Constants.h
 * @brief Mathematical and precision constants for QiBlast
 */

#include <cmath>
#include <cstdint>
#include <limits>

namespace Qi::Blast {

// =============================================================================
// Mathematical Constants
// =============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

// =============================================================================
// Precision Constants
// =============================================================================

/// Tolerance for floating point comparison
constexpr double EPSILON = 1e-9;

/// Tolerance for coordinate comparisons (metres)
constexpr double DISTANCE_EPSILON = 1e-6;

/// Tolerance for bearing threshold comparisons (degrees)
constexpr double BEARING_EPSILON = 1e-6;

// =============================================================================
// Algorithm Limits
// =============================================================================

/// Cap applied to variance ratios when the minor eigenvalue vanishes
constexpr double MAX_VARIANCE_RATIO = 1e6;

/// Radius above which a fitted circle is treated as a straight line
constexpr double MAX_CURVE_RADIUS = 1e6;

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * @brief Clamp value to range
 */
template<typename T>
inline T Clamp(T value, T minVal, T maxVal) {
    return value < minVal ? minVal : (value > maxVal ? maxVal : value);
}

/**
 * @brief Normalize a compass bearing to [0, 360)
 */
inline double NormalizeBearing(double degrees) {
    double b = std::fmod(degrees, 360.0);
    if (b < 0.0) b += 360.0;
    return b;
}

/**
 * @brief Normalize an axial orientation to [0, 180)
 */
inline double NormalizeAxial(double degrees) {
    double a = std::fmod(degrees, 180.0);
    if (a < 0.0) a += 180.0;
    return a;
}

/**
 * @brief Smallest difference between two bearings, in [0, 180]
 */
inline double BearingDifference(double a, double b) {
    double d = std::abs(NormalizeBearing(a) - NormalizeBearing(b));
    return d > 180.0 ? 360.0 - d : d;
}

/**
 * @brief Smallest difference between two axial orientations, in [0, 90]
 */
inline double AxialDifference(double a, double b) {
    double d = std::abs(NormalizeAxial(a) - NormalizeAxial(b));
    return d > 90.0 ? 180.0 - d : d;
}

/**
 * @brief Square of a value
 */
template<typename T>
inline T Square(T x) {
    return x * x;
}

} // namespace Qi::Blast

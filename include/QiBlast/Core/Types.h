#pragma once

/**
 * @file Types.h
 * @brief Basic geometric and domain types for QiBlast
 */

#include <cmath>
#include <string>
#include <utility>

namespace Qi::Blast {

// =============================================================================
// Geometry
// =============================================================================

/**
 * @brief 2D point / vector in plan coordinates (x east, y north)
 */
struct Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    Point2d operator+(const Point2d& o) const { return {x + o.x, y + o.y}; }
    Point2d operator-(const Point2d& o) const { return {x - o.x, y - o.y}; }
    Point2d operator*(double s) const { return {x * s, y * s}; }
    Point2d operator/(double s) const { return {x / s, y / s}; }
    Point2d& operator+=(const Point2d& o) { x += o.x; y += o.y; return *this; }

    bool operator==(const Point2d& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point2d& o) const { return !(*this == o); }

    double Dot(const Point2d& o) const { return x * o.x + y * o.y; }
    double Cross(const Point2d& o) const { return x * o.y - y * o.x; }
    double Norm() const { return std::sqrt(x * x + y * y); }
    double DistanceTo(const Point2d& o) const { return (*this - o).Norm(); }

    /// Unit vector in the same direction, or (0,0) for a null vector
    Point2d Normalized() const {
        double n = Norm();
        return n > 0.0 ? Point2d(x / n, y / n) : Point2d();
    }

    /// Left-hand perpendicular (-y, x)
    Point2d Perpendicular() const { return {-y, x}; }
};

/**
 * @brief 2D line in normalized form: a*x + b*y + c = 0 (a^2 + b^2 = 1)
 */
struct Line2d {
    double a = 0.0;
    double b = 1.0;
    double c = 0.0;

    Line2d() = default;
    Line2d(double a_, double b_, double c_) : a(a_), b(b_), c(c_) {}

    /// Signed distance from a point to the line
    double SignedDistance(const Point2d& p) const { return a * p.x + b * p.y + c; }

    /// Absolute distance from a point to the line
    double Distance(const Point2d& p) const { return std::abs(SignedDistance(p)); }

    /// Unit direction along the line
    Point2d Direction() const { return {-b, a}; }
};

/**
 * @brief Circle (center, radius)
 */
struct Circle2d {
    Point2d center;
    double radius = 0.0;

    Circle2d() = default;
    Circle2d(const Point2d& c, double r) : center(c), radius(r) {}
};

/**
 * @brief Axis-aligned bounding box
 */
struct BoundingBox {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;

    double Width() const { return maxX - minX; }
    double Height() const { return maxY - minY; }
    double Area() const { return Width() * Height(); }
    double Diagonal() const { return std::sqrt(Width() * Width() + Height() * Height()); }
};

// =============================================================================
// Blast Holes
// =============================================================================

/**
 * @brief A caller-owned blast hole
 *
 * Only x and y take part in row geometry. The sequence token is the operator's
 * ordering hint (hole number such as "17" or "B4") and may be empty.
 */
struct HolePoint {
    std::string id;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    std::string sequenceToken;

    HolePoint() = default;
    HolePoint(std::string id_, double x_, double y_, double z_ = 0.0,
              std::string token = std::string())
        : id(std::move(id_)), x(x_), y(y_), z(z_), sequenceToken(std::move(token)) {}

    Point2d XY() const { return {x, y}; }
};

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Geometric classification of a point set
 */
enum class PatternType {
    Straight,       ///< Parallel straight rows
    Curved,         ///< Curved or winding rows
    MultiPattern,   ///< Several orientation-distinct sub-patterns
    Unknown         ///< Not classified
};

/**
 * @brief Shape of a single detected row
 */
enum class RowShape {
    Straight,
    Curved
};

/**
 * @brief Role of a sub-pattern relative to the main pattern
 */
enum class SubPatternRole {
    Main,           ///< Largest group
    Secondary,      ///< Other orientation, not perpendicular to main
    Batter,         ///< Perpendicular, beyond the end of the main rows
    Buffer          ///< Perpendicular, alongside the main rows
};

/**
 * @brief Position ordering direction across rows
 */
enum class OrderingDirection {
    Forward,        ///< Every row numbered the same way
    Serpentine      ///< Alternate rows reverse direction
};

const char* ToString(PatternType type);
const char* ToString(RowShape shape);
const char* ToString(SubPatternRole role);
const char* ToString(OrderingDirection direction);

} // namespace Qi::Blast

/**
 * @file RowDetectionAccuracyTest.cpp
 * @brief Recovery-rate tests for DetectRows on synthetic blast patterns
 *
 * Test methodology:
 * 1. Generate synthetic hole patterns with known ground-truth rows
 * 2. Rotate the pattern and jitter the collars (uniform, fixed seed)
 * 3. Run DetectRows
 * 4. Count trials whose rows match the ground truth exactly (as sets)
 * 5. Verify the recovery rate meets the requirement
 *
 * Test conditions:
 * - Ideal: no jitter, every orientation
 * - Square: spacing equal to burden, rows along the longer side
 * - Standard: jitter <= 5% of the spacing
 *
 * Every trial also checks that no point is lost or duplicated.
 */

#include <QiBlast/Detect/RowDetector.h>
#include <QiBlast/Core/Constants.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace Qi::Blast::Detect {
namespace {

// =============================================================================
// Constants
// =============================================================================

constexpr int NUM_TRIALS_STANDARD = 36;

constexpr double SPACING = 3.0;
constexpr double BURDEN = 4.0;

/// Share of trials that must recover every row exactly
constexpr double RECOVERY_REQUIREMENT = 0.9;

// =============================================================================
// Pattern Generation
// =============================================================================

/**
 * @brief Synthetic pattern with its ground truth
 */
struct SyntheticPattern {
    std::vector<HolePoint> points;
    std::vector<std::vector<int>> rows;     ///< Ground-truth rows
};

/// rows x cols grid rotated by angleDeg about the origin, collars jittered by up to jitter
SyntheticPattern MakeGrid(int rowCount, int cols, double angleDeg, double jitter, std::mt19937& rng,
                          double burden = BURDEN) {
    std::uniform_real_distribution<double> noise(-jitter, jitter);
    const double c = std::cos(angleDeg * DEG_TO_RAD);
    const double s = std::sin(angleDeg * DEG_TO_RAD);

    SyntheticPattern pattern;
    for (int r = 0; r < rowCount; ++r) {
        std::vector<int> row;
        for (int k = 0; k < cols; ++k) {
            double x = k * SPACING + (jitter > 0.0 ? noise(rng) : 0.0);
            double y = r * burden + (jitter > 0.0 ? noise(rng) : 0.0);
            row.push_back(static_cast<int>(pattern.points.size()));
            pattern.points.emplace_back(std::to_string(pattern.points.size() + 1), x * c - y * s, x * s + y * c);
        }
        pattern.rows.push_back(row);
    }
    return pattern;
}

/// 20-hole, 240 degree arc of radius 50 starting at startDeg
SyntheticPattern MakeArc(double startDeg) {
    SyntheticPattern pattern;
    std::vector<int> row;
    for (int i = 0; i < 20; ++i) {
        double a = (startDeg + 12.0 * i) * DEG_TO_RAD;
        row.push_back(i);
        pattern.points.emplace_back("A" + std::to_string(i + 1), 50.0 * std::cos(a), 50.0 * std::sin(a));
    }
    pattern.rows.push_back(row);
    return pattern;
}

// =============================================================================
// Scoring
// =============================================================================

using RowSets = std::set<std::set<int>>;

RowSets ToSets(const std::vector<std::vector<int>>& rows) {
    RowSets sets;
    for (const auto& row : rows) sets.insert(std::set<int>(row.begin(), row.end()));
    return sets;
}

RowSets ToSets(const PatternResult& result) {
    RowSets sets;
    for (const auto& row : result.rows) sets.insert(std::set<int>(row.points.begin(), row.points.end()));
    return sets;
}

/// Every point in exactly one row or in the orphans
bool NoPointLost(const PatternResult& result, size_t pointCount) {
    std::vector<int> seen(pointCount, 0);
    for (const auto& row : result.rows) {
        for (int i : row.points) {
            if (i < 0 || static_cast<size_t>(i) >= pointCount) return false;
            ++seen[i];
        }
    }
    for (int i : result.orphanIndices) {
        if (i < 0 || static_cast<size_t>(i) >= pointCount) return false;
        ++seen[i];
    }
    return std::all_of(seen.begin(), seen.end(), [](int n) { return n == 1; });
}

/// Positions follow the generation order of each row (either way)
bool PositionsMonotonic(const PatternResult& result) {
    for (const auto& row : result.rows) {
        std::vector<int> order = row.points;
        if (order.size() >= 2 && order.front() > order.back()) std::reverse(order.begin(), order.end());
        if (!std::is_sorted(order.begin(), order.end())) return false;
    }
    return true;
}

void PrintRate(const std::string& label, int recovered, int trials) {
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "  " << label << ": " << recovered << "/" << trials << " ("
              << static_cast<double>(recovered) / trials << ")\n";
}

} // anonymous namespace

// =============================================================================
// Test Fixture
// =============================================================================

class RowDetectionAccuracyTest : public ::testing::Test {
protected:
    void SetUp() override { rng_.seed(20240517u); }

    std::mt19937 rng_;
    DetectionConfig config_;
};

// =============================================================================
// Straight Patterns
// =============================================================================

TEST_F(RowDetectionAccuracyTest, GridRecovery_NoNoise) {
    std::cout << "\n=== Grid Row Recovery (No Noise) ===" << std::endl;

    int recovered = 0;
    for (int t = 0; t < NUM_TRIALS_STANDARD; ++t) {
        double angle = 5.0 * t;
        SyntheticPattern pattern = MakeGrid(5, 8, angle, 0.0, rng_);
        PatternResult result = DetectRows(pattern.points, config_);

        ASSERT_TRUE(NoPointLost(result, pattern.points.size())) << "angle " << angle;
        if (ToSets(result) == ToSets(pattern.rows) && PositionsMonotonic(result)) {
            ++recovered;
        }
    }

    PrintRate("Recovered", recovered, NUM_TRIALS_STANDARD);
    EXPECT_GE(static_cast<double>(recovered) / NUM_TRIALS_STANDARD, RECOVERY_REQUIREMENT);
}

TEST_F(RowDetectionAccuracyTest, GridRecovery_StandardJitter) {
    std::cout << "\n=== Grid Row Recovery (Jitter 0.15 m) ===" << std::endl;

    int recovered = 0;
    for (int t = 0; t < NUM_TRIALS_STANDARD; ++t) {
        double angle = 5.0 * t;
        SyntheticPattern pattern = MakeGrid(5, 8, angle, 0.05 * SPACING, rng_);
        PatternResult result = DetectRows(pattern.points, config_);

        ASSERT_TRUE(NoPointLost(result, pattern.points.size())) << "angle " << angle;
        if (ToSets(result) == ToSets(pattern.rows)) ++recovered;
    }

    PrintRate("Recovered", recovered, NUM_TRIALS_STANDARD);
    EXPECT_GE(static_cast<double>(recovered) / NUM_TRIALS_STANDARD, RECOVERY_REQUIREMENT);
}

TEST_F(RowDetectionAccuracyTest, SquareGridRecovery) {
    std::cout << "\n=== Square Grid Row Recovery ===" << std::endl;

    int recovered = 0;
    for (int t = 0; t < NUM_TRIALS_STANDARD; ++t) {
        double angle = 5.0 * t;
        SyntheticPattern pattern = MakeGrid(5, 8, angle, 0.0, rng_, SPACING);
        PatternResult result = DetectRows(pattern.points, config_);

        ASSERT_TRUE(NoPointLost(result, pattern.points.size())) << "angle " << angle;
        EXPECT_NE(result.patternType, PatternType::MultiPattern) << "angle " << angle;
        if (ToSets(result) == ToSets(pattern.rows)) ++recovered;
    }

    PrintRate("Recovered", recovered, NUM_TRIALS_STANDARD);
    EXPECT_GE(static_cast<double>(recovered) / NUM_TRIALS_STANDARD, RECOVERY_REQUIREMENT);
}

TEST_F(RowDetectionAccuracyTest, SequencedGridRecovery) {
    std::cout << "\n=== Sequenced Grid Row Recovery ===" << std::endl;

    int recovered = 0;
    int serpentine = 0;
    for (int t = 0; t < NUM_TRIALS_STANDARD; ++t) {
        SyntheticPattern pattern = MakeGrid(5, 8, 5.0 * t, 0.0, rng_);
        // Boustrophedon drill order
        for (size_t r = 0; r < pattern.rows.size(); ++r) {
            for (size_t k = 0; k < pattern.rows[r].size(); ++k) {
                size_t drilled = (r % 2 == 0) ? k : pattern.rows[r].size() - 1 - k;
                pattern.points[pattern.rows[r][k]].sequenceToken =
                    std::to_string(r * pattern.rows[r].size() + drilled + 1);
            }
        }
        PatternResult result = DetectRows(pattern.points, config_);

        ASSERT_TRUE(NoPointLost(result, pattern.points.size()));
        if (ToSets(result) == ToSets(pattern.rows)) ++recovered;
        if (result.serpentine) ++serpentine;
    }

    PrintRate("Recovered", recovered, NUM_TRIALS_STANDARD);
    PrintRate("Serpentine", serpentine, NUM_TRIALS_STANDARD);
    EXPECT_GE(static_cast<double>(recovered) / NUM_TRIALS_STANDARD, RECOVERY_REQUIREMENT);
    EXPECT_GE(static_cast<double>(serpentine) / NUM_TRIALS_STANDARD, RECOVERY_REQUIREMENT);
}

// =============================================================================
// Curved Patterns
// =============================================================================

TEST_F(RowDetectionAccuracyTest, ArcRecovery) {
    std::cout << "\n=== Arc Row Recovery ===" << std::endl;

    const int trials = 12;
    int recovered = 0;
    for (int t = 0; t < trials; ++t) {
        SyntheticPattern pattern = MakeArc(30.0 * t);
        PatternResult result = DetectRows(pattern.points, config_);

        ASSERT_TRUE(NoPointLost(result, pattern.points.size()));
        if (ToSets(result) == ToSets(pattern.rows) && PositionsMonotonic(result)) ++recovered;
    }

    PrintRate("Recovered", recovered, trials);
    EXPECT_GE(static_cast<double>(recovered) / trials, RECOVERY_REQUIREMENT);
}

// =============================================================================
// Robustness
// =============================================================================

TEST_F(RowDetectionAccuracyTest, Deterministic) {
    SyntheticPattern pattern = MakeGrid(6, 9, 23.0, 0.2, rng_);

    PatternResult first = DetectRows(pattern.points, config_);
    PatternResult second = DetectRows(pattern.points, config_);

    ASSERT_EQ(first.RowCount(), second.RowCount());
    for (size_t r = 0; r < first.rows.size(); ++r) {
        EXPECT_EQ(first.rows[r].points, second.rows[r].points);
    }
    EXPECT_EQ(first.orphanIndices, second.orphanIndices);
    EXPECT_EQ(first.strategy, second.strategy);
    EXPECT_DOUBLE_EQ(first.confidence, second.confidence);
}

TEST_F(RowDetectionAccuracyTest, ScatterNeverLosesPoints) {
    std::cout << "\n=== Random Scatter Assignment ===" << std::endl;

    std::uniform_real_distribution<double> coord(0.0, 40.0);
    int orphans = 0;
    for (int t = 0; t < 20; ++t) {
        std::vector<HolePoint> points;
        for (int i = 0; i < 60; ++i) {
            points.emplace_back(std::to_string(i + 1), coord(rng_), coord(rng_));
        }
        PatternResult result = DetectRows(points, config_);

        ASSERT_TRUE(NoPointLost(result, points.size())) << "trial " << t;
        EXPECT_GE(result.confidence, 0.0);
        EXPECT_LE(result.confidence, 1.0);
        orphans += static_cast<int>(result.orphanIndices.size());
    }
    std::cout << "  Orphans over 20 trials: " << orphans << "\n";
}

} // namespace Qi::Blast::Detect

/**
 * @file test_row_validator.cpp
 * @brief Unit tests for row validation, burden / spacing metrics and the assignment check
 */

#include <QiBlast/Validate/RowValidator.h>
#include <QiBlast/Core/Exception.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace Qi::Blast;
using namespace Qi::Blast::Validate;

namespace {

/**
 * @brief Points with their rows (global indices, position order)
 */
struct RowSet {
    std::vector<Point2d> points;
    std::vector<std::vector<int>> rows;
};

/// rows x cols grid; odd rows shifted by stagger along x
RowSet MakeGrid(int rowCount, int cols, double spacing, double burden, double stagger = 0.0) {
    RowSet set;
    for (int r = 0; r < rowCount; ++r) {
        std::vector<int> row;
        for (int c = 0; c < cols; ++c) {
            row.push_back(static_cast<int>(set.points.size()));
            set.points.emplace_back(c * spacing + (r % 2) * stagger, r * burden);
        }
        set.rows.push_back(row);
    }
    return set;
}

/// Labels numbering positions 1..n in row order
std::vector<PointLabel> LabelsOf(size_t count, const std::vector<std::vector<int>>& rows) {
    std::vector<PointLabel> labels(count);
    for (size_t r = 0; r < rows.size(); ++r) {
        for (size_t k = 0; k < rows[r].size(); ++k) {
            labels[rows[r][k]] = PointLabel{static_cast<int32_t>(r + 1), static_cast<int32_t>(k + 1)};
        }
    }
    return labels;
}

bool Contains(const std::vector<std::string>& messages, const std::string& fragment) {
    for (const auto& m : messages) {
        if (m.find(fragment) != std::string::npos) return true;
    }
    return false;
}

} // anonymous namespace

// =============================================================================
// Metrics
// =============================================================================

class BurdenSpacingTest : public ::testing::Test {};

TEST_F(BurdenSpacingTest, RegularGrid) {
    RowSet set = MakeGrid(4, 5, 3.0, 4.0);
    BurdenSpacingMetrics m = ComputeBurdenAndSpacing(set.points, set.rows);

    EXPECT_NEAR(m.avgSpacing, 3.0, 1e-9);
    EXPECT_NEAR(m.spacingCV, 0.0, 1e-9);
    EXPECT_NEAR(m.avgBurden, 4.0, 1e-9);
    EXPECT_NEAR(m.burdenCV, 0.0, 1e-9);
    EXPECT_EQ(m.rowCount, 4);
    EXPECT_EQ(m.minRowSize, 5);
    EXPECT_EQ(m.maxRowSize, 5);
    EXPECT_DOUBLE_EQ(m.avgRowSize, 5.0);
    EXPECT_NEAR(m.offsetRatio, 0.0, 1e-9);
    EXPECT_EQ(m.layout, LayoutStyle::Square);

    ASSERT_EQ(m.pointSpacing.size(), 20u);
    EXPECT_NEAR(m.pointSpacing[4], 3.0, 1e-9);     // last in row takes the row mean
    EXPECT_NEAR(m.pointBurden[0], 4.0, 1e-9);
    EXPECT_NEAR(m.pointBurden[7], 4.0, 1e-9);
}

TEST_F(BurdenSpacingTest, BurdenIgnoresRowStagger) {
    RowSet set = MakeGrid(4, 5, 3.0, 4.0, 1.5);
    BurdenSpacingMetrics m = ComputeBurdenAndSpacing(set.points, set.rows);

    EXPECT_NEAR(m.avgBurden, 4.0, 1e-9);
    EXPECT_NEAR(m.offsetRatio, 0.5, 1e-9);
    EXPECT_EQ(m.layout, LayoutStyle::Staggered);
}

TEST_F(BurdenSpacingTest, MiddleRowsAverageBothNeighbours) {
    // Rows at y = 0, 4, 10
    std::vector<Point2d> points{Point2d(0, 0), Point2d(3, 0), Point2d(0, 4), Point2d(3, 4),
                                Point2d(0, 10), Point2d(3, 10)};
    std::vector<std::vector<int>> rows{{0, 1}, {2, 3}, {4, 5}};
    BurdenSpacingMetrics m = ComputeBurdenAndSpacing(points, rows);

    EXPECT_NEAR(m.pointBurden[0], 4.0, 1e-9);
    EXPECT_NEAR(m.pointBurden[2], 5.0, 1e-9);
    EXPECT_NEAR(m.pointBurden[4], 6.0, 1e-9);
    EXPECT_NEAR(m.avgBurden, 5.0, 1e-9);
}

TEST_F(BurdenSpacingTest, BurdenStaysWithinRowGroups) {
    // Four 8-hole rows 4 m apart, then a 5-hole buffer row running across them
    RowSet set = MakeGrid(4, 8, 3.0, 4.0);
    std::vector<int> buffer;
    for (int k = 0; k < 5; ++k) {
        buffer.push_back(static_cast<int>(set.points.size()));
        set.points.emplace_back(30.0, k * 3.0);
    }
    set.rows.push_back(buffer);
    std::vector<int32_t> groups{0, 0, 0, 0, 1};

    BurdenSpacingMetrics m = ComputeBurdenAndSpacing(set.points, set.rows, groups);
    EXPECT_NEAR(m.avgBurden, 4.0, 1e-9);
    EXPECT_NEAR(m.burdenCV, 0.0, 1e-9);
    EXPECT_NEAR(m.pointBurden[0], 4.0, 1e-9);
    EXPECT_DOUBLE_EQ(m.pointBurden[buffer.front()], 0.0);
    EXPECT_EQ(m.rowCount, 5);

    // Without groups the buffer counts as a fifth parallel row
    BurdenSpacingMetrics pooled = ComputeBurdenAndSpacing(set.points, set.rows);
    EXPECT_GT(pooled.burdenCV, 0.0);
}

TEST_F(BurdenSpacingTest, RowGroupsMustMatchRows) {
    RowSet set = MakeGrid(3, 4, 3.0, 4.0);
    EXPECT_THROW(ComputeBurdenAndSpacing(set.points, set.rows, {0, 1}), InvalidArgumentException);
}

TEST_F(BurdenSpacingTest, LayoutUnknownWithoutUsablePairs) {
    std::vector<Point2d> points{Point2d(0, 0), Point2d(0, 4), Point2d(3, 4)};
    std::vector<std::vector<int>> rows{{0}, {1, 2}};

    int32_t pairs = -1;
    ComputeOffsetRatio(points, rows, &pairs);
    EXPECT_EQ(pairs, 0);
    EXPECT_EQ(ComputeBurdenAndSpacing(points, rows).layout, LayoutStyle::Unknown);
}

TEST_F(BurdenSpacingTest, ClassifyLayoutBands) {
    EXPECT_EQ(ClassifyLayout(0.0), LayoutStyle::Square);
    EXPECT_EQ(ClassifyLayout(0.1), LayoutStyle::Square);
    EXPECT_EQ(ClassifyLayout(0.45), LayoutStyle::Staggered);
    EXPECT_EQ(ClassifyLayout(0.25), LayoutStyle::Irregular);
}

// =============================================================================
// Validation
// =============================================================================

class RowValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_ = MakeGrid(4, 5, 3.0, 4.0);
        labels_ = LabelsOf(set_.points.size(), set_.rows);
    }

    RowSet set_;
    std::vector<PointLabel> labels_;
};

TEST_F(RowValidatorTest, CleanGridIsValid) {
    ValidationReport report = ValidateRows(set_.points, set_.rows, labels_, StrategyKind::PcaLoessBinning);

    EXPECT_EQ(report.status, ValidationStatus::Valid);
    EXPECT_TRUE(report.IsValid());
    EXPECT_DOUBLE_EQ(report.confidence, 1.0);
    EXPECT_EQ(report.pattern, EstimatedPattern::Straight);
    EXPECT_EQ(report.strategy, StrategyKind::PcaLoessBinning);
    EXPECT_TRUE(report.issues.empty());
    EXPECT_TRUE(report.warnings.empty());
    EXPECT_DOUBLE_EQ(report.sizeRatio, 1.0);
}

TEST_F(RowValidatorTest, OrphanLowersConfidence) {
    // One extra point that no row holds
    set_.points.emplace_back(50.0, 50.0);
    labels_.emplace_back();

    ValidationReport report = ValidateRows(set_.points, set_.rows, labels_, StrategyKind::PcaLoessBinning);
    EXPECT_EQ(report.orphanCount, 1);
    EXPECT_EQ(report.status, ValidationStatus::Warning);
    EXPECT_NEAR(report.confidence, 1.0 - 0.1 / 21.0, 1e-12);
    EXPECT_TRUE(Contains(report.warnings, "without row assignment"));
}

TEST_F(RowValidatorTest, DuplicatePositionsAreIssues) {
    labels_[0].positionIndex = 2;

    ValidationReport report = ValidateRows(set_.points, set_.rows, labels_, StrategyKind::PcaLoessBinning);
    EXPECT_EQ(report.status, ValidationStatus::Invalid);
    EXPECT_FALSE(report.IsValid());
    EXPECT_TRUE(Contains(report.issues, "Duplicate positions"));
    EXPECT_NEAR(report.confidence, 0.8, 1e-12);
}

TEST_F(RowValidatorTest, PositionGapsAreWarnings) {
    labels_[4].positionIndex = 9;

    ValidationReport report = ValidateRows(set_.points, set_.rows, labels_, StrategyKind::PcaLoessBinning);
    EXPECT_EQ(report.status, ValidationStatus::Warning);
    EXPECT_TRUE(Contains(report.warnings, "gaps in 1 rows"));
    EXPECT_NEAR(report.confidence, 0.95, 1e-12);
}

TEST_F(RowValidatorTest, RowSizeImbalance) {
    std::vector<Point2d> points;
    for (int i = 0; i < 10; ++i) points.emplace_back(i * 3.0, 0.0);
    points.emplace_back(0.0, 4.0);
    points.emplace_back(3.0, 4.0);
    std::vector<std::vector<int>> rows{{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, {10, 11}};

    ValidationReport report = ValidateRows(points, rows, LabelsOf(points.size(), rows),
                                           StrategyKind::MstPathExtraction);
    EXPECT_DOUBLE_EQ(report.sizeRatio, 5.0);
    EXPECT_TRUE(Contains(report.warnings, "row size imbalance"));
    EXPECT_NEAR(report.confidence, 0.9, 1e-12);
}

TEST_F(RowValidatorTest, WideGapAndOverlapFlagged) {
    std::vector<Point2d> points{Point2d(0, 0), Point2d(3, 0), Point2d(6, 0), Point2d(9, 0),
                                Point2d(18, 0), Point2d(0, 4), Point2d(3, 4), Point2d(3.2, 4),
                                Point2d(6, 4), Point2d(9, 4)};
    std::vector<std::vector<int>> rows{{0, 1, 2, 3, 4}, {5, 6, 7, 8, 9}};

    ValidationReport report = ValidateRows(points, rows, LabelsOf(points.size(), rows),
                                           StrategyKind::PcaLoessBinning);
    EXPECT_TRUE(Contains(report.warnings, "Row 1 has a gap wider than"));
    EXPECT_TRUE(Contains(report.warnings, "Row 2 has overlapping points"));
    EXPECT_EQ(report.status, ValidationStatus::Warning);
}

TEST_F(RowValidatorTest, NoRowsIsInvalid) {
    ValidationReport report = ValidateRows(set_.points, {}, labels_, StrategyKind::SingleRow);
    EXPECT_EQ(report.status, ValidationStatus::Invalid);
    EXPECT_DOUBLE_EQ(report.confidence, 0.0);
    EXPECT_TRUE(Contains(report.issues, "No rows detected"));

    report = ValidateRows({}, set_.rows, labels_, StrategyKind::SingleRow);
    EXPECT_TRUE(Contains(report.issues, "No points provided"));
}

TEST_F(RowValidatorTest, StatusNames) {
    EXPECT_STREQ(ToString(ValidationStatus::Warning), "warning");
    EXPECT_STREQ(ToString(EstimatedPattern::Irregular), "irregular");
}

// =============================================================================
// Assignment invariant and bonus
// =============================================================================

TEST(AssignmentInvariantTest, AcceptsPartition) {
    EXPECT_NO_THROW(CheckAssignmentInvariant(5, {{0, 1}, {3}}, {2, 4}));
}

TEST(AssignmentInvariantTest, RejectsDuplicates) {
    EXPECT_THROW(CheckAssignmentInvariant(3, {{0, 1}, {1, 2}}, {}), Exception);
    EXPECT_THROW(CheckAssignmentInvariant(3, {{0, 1}}, {1, 2}), Exception);
}

TEST(AssignmentInvariantTest, RejectsMissingAndOutOfRange) {
    try {
        CheckAssignmentInvariant(3, {{0, 1}}, {});
        FAIL() << "expected Exception";
    } catch (const Exception& e) {
        EXPECT_NE(std::string(e.what()).find("point 2"), std::string::npos);
    }
    EXPECT_THROW(CheckAssignmentInvariant(2, {{0, 1, 2}}, {}), Exception);
    EXPECT_THROW(CheckAssignmentInvariant(2, {{0, 1}}, {-1}), Exception);
}

TEST(MethodBonusTest, SequenceGainsFallbackLoses) {
    EXPECT_DOUBLE_EQ(MethodConfidenceBonus(StrategyKind::SequenceLineFit), 0.1);
    EXPECT_DOUBLE_EQ(MethodConfidenceBonus(StrategyKind::WindingSequence), 0.1);
    EXPECT_DOUBLE_EQ(MethodConfidenceBonus(StrategyKind::SplineFit), 0.05);
    EXPECT_DOUBLE_EQ(MethodConfidenceBonus(StrategyKind::PcaLoessBinning), 0.0);
    EXPECT_DOUBLE_EQ(MethodConfidenceBonus(StrategyKind::DensityClustering), -0.05);
    EXPECT_DOUBLE_EQ(MethodConfidenceBonus(StrategyKind::DensitySimplify), -0.1);
    EXPECT_DOUBLE_EQ(MethodConfidenceBonus(StrategyKind::SingleRow), -0.3);
}

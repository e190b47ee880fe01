/**
 * @file StrategyImpl.h
 * @brief Concrete row strategies and helpers shared by their sources
 *
 * This file contains:
 * - One RowStrategy subclass per StrategyKind
 * - Detail: subset gathering, row scoring and chain ordering helpers
 */

#pragma once

#include <QiBlast/Detect/RowStrategy.h>
#include <QiBlast/Core/Constants.h>
#include <QiBlast/Core/Types.h>

#include <vector>

namespace Qi::Blast::Detect {

// =============================================================================
// Shared helpers
// =============================================================================

namespace Detail {

/// Points at the given local indices
std::vector<Point2d> Gather(const std::vector<Point2d>& points, const std::vector<int>& indices);

/// 0..n-1
std::vector<int> Iota(size_t n);

/// Indices ordered by nearest-neighbour chain, starting farthest from their centroid
std::vector<int> OrderByNeighborChain(const std::vector<Point2d>& points, const std::vector<int>& indices);

/// Mean |offset| of interior points from the segment joining their row neighbours
double MeanInteriorDeviation(const std::vector<Point2d>& points, const std::vector<std::vector<int>>& rows);

/// Coefficient of variation of consecutive in-row gaps
double GapCV(const std::vector<Point2d>& points, const std::vector<std::vector<int>>& rows);

/// Share of rows with a single point
double SingletonShare(const std::vector<std::vector<int>>& rows);

/// Local indices not present in any row, ascending
std::vector<int> MissingIndices(size_t n, const std::vector<std::vector<int>>& rows);

/**
 * @brief Generic confidence of a row set
 *
 * 1 minus penalties for orphans, singleton rows, irregular gaps and
 * deviation from the rows' local paths.
 */
double RowSetConfidence(const std::vector<Point2d>& points,
                        const std::vector<std::vector<int>>& rows,
                        size_t orphanCount, double spacing);

/**
 * @brief Curved cross-check score (lower is better)
 *
 * Interior deviation (in spacings) + gap CV + orphan share + singleton share.
 */
double CurvedFitScore(const std::vector<Point2d>& points,
                      const std::vector<std::vector<int>>& rows,
                      size_t orphanCount, double spacing);

/// Split an ordered sequence where consecutive points are farther apart than maxGap
std::vector<std::vector<int>> SplitAtJumps(const std::vector<Point2d>& points,
                                           const std::vector<int>& order, double maxGap);

/// Fill success, orphans, confidence and residual from rows
StrategyResult Finish(StrategyKind kind, const DetectionInput& input,
                      std::vector<std::vector<int>> rows, double spacing);

} // namespace Detail

// =============================================================================
// Sequence-driven strategies
// =============================================================================

class WindingSequenceStrategy : public RowStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::WindingSequence; }
    StrategyResult Detect(const DetectionInput& input, const DetectionConfig& config) const override;
};

class SequenceLineFitStrategy : public RowStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::SequenceLineFit; }
    StrategyResult Detect(const DetectionInput& input, const DetectionConfig& config) const override;
};

class SplineFitStrategy : public RowStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::SplineFit; }
    StrategyResult Detect(const DetectionInput& input, const DetectionConfig& config) const override;
};

// =============================================================================
// Curve strategies
// =============================================================================

class PrincipalCurveStrategy : public RowStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::PrincipalCurve; }
    StrategyResult Detect(const DetectionInput& input, const DetectionConfig& config) const override;
};

class PcaLoessBinningStrategy : public RowStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::PcaLoessBinning; }
    StrategyResult Detect(const DetectionInput& input, const DetectionConfig& config) const override;
};

// =============================================================================
// Graph strategies
// =============================================================================

class MstPathExtractionStrategy : public RowStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::MstPathExtraction; }
    StrategyResult Detect(const DetectionInput& input, const DetectionConfig& config) const override;
};

class KnnBearingTraversalStrategy : public RowStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::KnnBearingTraversal; }
    StrategyResult Detect(const DetectionInput& input, const DetectionConfig& config) const override;
};

// =============================================================================
// Density and terminal strategies
// =============================================================================

class DensityClusteringStrategy : public RowStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::DensityClustering; }
    StrategyResult Detect(const DetectionInput& input, const DetectionConfig& config) const override;
};

class DensitySimplifyStrategy : public RowStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::DensitySimplify; }
    StrategyResult Detect(const DetectionInput& input, const DetectionConfig& config) const override;
};

class SingleRowStrategy : public RowStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::SingleRow; }
    StrategyResult Detect(const DetectionInput& input, const DetectionConfig& config) const override;
};

} // namespace Qi::Blast::Detect

#pragma once

/**
 * @file RowStrategy.h
 * @brief Row detection strategy interface
 *
 * Strategies work on a local point subset (a sub-pattern or the whole set) and
 * return rows as local indices. They never throw for "not applicable" input;
 * they return a failed StrategyResult instead. AlgorithmException signals an
 * internal failure and is caught by DetectRows.
 *
 * Usage:
 * @code
 * auto strategy = CreateStrategy(StrategyKind::PcaLoessBinning);
 * StrategyResult r = strategy->Detect(input, config);
 * if (r.success && r.confidence >= config.minStrategyConfidence) { ... }
 * @endcode
 */

#include <QiBlast/Analysis/PointSetAnalyzer.h>
#include <QiBlast/Classify/PatternClassifier.h>
#include <QiBlast/Core/DetectionConfig.h>
#include <QiBlast/Core/PatternResult.h>

#include <memory>
#include <string>
#include <vector>

namespace Qi::Blast::Detect {

/**
 * @brief Everything a strategy sees about its subset
 */
struct DetectionInput {
    std::vector<Point2d> points;                    ///< Local plan points
    std::vector<Analysis::SequenceToken> tokens;    ///< Parsed token per local point
    bool tokensReliable = false;
    bool alphanumeric = false;
    double spacing = 0.0;                           ///< Median nearest-neighbour distance (> 0)
    Analysis::PointSetStats stats;                  ///< Pre-analysis of the subset
    Classify::Classification classification;        ///< Classification of the subset
    int32_t depth = 0;                              ///< Recursion depth of the subset

    size_t Size() const { return points.size(); }
};

/**
 * @brief Outcome of one strategy run
 */
struct StrategyResult {
    bool success = false;
    StrategyKind kind = StrategyKind::SingleRow;
    std::vector<std::vector<int>> rows;     ///< Local indices, position order
    std::vector<int> orphans;               ///< Local indices left out of every row
    double confidence = 0.0;                ///< [0, 1]
    double residual = 0.0;                  ///< Fit score, lower is better
    std::string message;                    ///< Reason for failure or a short summary

    size_t AssignedCount() const;

    static StrategyResult Failure(StrategyKind kind, std::string reason);
};

/**
 * @brief Abstract row detection strategy
 */
class RowStrategy {
public:
    virtual ~RowStrategy() = default;

    virtual StrategyKind Kind() const = 0;

    const char* Name() const { return ToString(Kind()); }

    /**
     * @brief Detect rows in a subset
     *
     * @throws AlgorithmException on internal numerical failure
     */
    virtual StrategyResult Detect(const DetectionInput& input, const DetectionConfig& config) const = 0;
};

/**
 * @brief Create the strategy of the given kind
 */
std::unique_ptr<RowStrategy> CreateStrategy(StrategyKind kind);

/**
 * @brief Build the input of a subset
 *
 * @param points Local plan points
 * @param tokens Parsed tokens of the same points
 * @param config Thresholds
 * @param depth Recursion depth
 */
DetectionInput MakeDetectionInput(std::vector<Point2d> points,
                                  std::vector<Analysis::SequenceToken> tokens,
                                  const DetectionConfig& config,
                                  int32_t depth = 0);

} // namespace Qi::Blast::Detect

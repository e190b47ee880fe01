/**
 * @file Types.cpp
 * @brief String conversion for QiBlast enumerations
 */

#include <QiBlast/Core/PatternResult.h>
#include <QiBlast/Core/Types.h>

namespace Qi::Blast {

const char* ToString(PatternType type) {
    switch (type) {
        case PatternType::Straight:     return "straight";
        case PatternType::Curved:       return "curved";
        case PatternType::MultiPattern: return "multi-pattern";
        case PatternType::Unknown:      return "unknown";
    }
    return "unknown";
}

const char* ToString(RowShape shape) {
    return shape == RowShape::Curved ? "curved" : "straight";
}

const char* ToString(SubPatternRole role) {
    switch (role) {
        case SubPatternRole::Main:      return "main";
        case SubPatternRole::Secondary: return "secondary";
        case SubPatternRole::Batter:    return "batter";
        case SubPatternRole::Buffer:    return "buffer";
    }
    return "secondary";
}

const char* ToString(OrderingDirection direction) {
    return direction == OrderingDirection::Serpentine ? "serpentine" : "forward";
}

const char* ToString(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::WindingSequence:     return "winding-sequence";
        case StrategyKind::SequenceLineFit:     return "sequence-line-fit";
        case StrategyKind::SplineFit:           return "spline-fit";
        case StrategyKind::PrincipalCurve:      return "principal-curve";
        case StrategyKind::MstPathExtraction:   return "mst-path-extraction";
        case StrategyKind::KnnBearingTraversal: return "knn-bearing-traversal";
        case StrategyKind::PcaLoessBinning:     return "pca-loess-binning";
        case StrategyKind::DensityClustering:   return "density-clustering";
        case StrategyKind::DensitySimplify:     return "density-simplify";
        case StrategyKind::SingleRow:           return "single-row";
    }
    return "single-row";
}

const char* ToString(LayoutStyle style) {
    switch (style) {
        case LayoutStyle::Square:    return "square";
        case LayoutStyle::Staggered: return "staggered";
        case LayoutStyle::Irregular: return "irregular";
        case LayoutStyle::Unknown:   return "unknown";
    }
    return "unknown";
}

} // namespace Qi::Blast

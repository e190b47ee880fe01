/**
 * @file DetectionConfig.cpp
 * @brief Configuration range checks
 */

#include <QiBlast/Core/DetectionConfig.h>
#include <QiBlast/Core/Exception.h>

#include <cmath>
#include <string>

namespace Qi::Blast {

namespace {

void Require(bool condition, const char* field, const std::string& rule) {
    if (!condition) {
        throw ConfigurationException(std::string("DetectionConfig: ") + field + " " + rule);
    }
}

bool Positive(double v) { return std::isfinite(v) && v > 0.0; }

bool NonNegative(double v) { return std::isfinite(v) && v >= 0.0; }

} // anonymous namespace

void DetectionConfig::Validate() const {
    Require(Positive(straightVarianceRatio), "straightVarianceRatio", "must be > 0");
    Require(Positive(curvedVarianceRatio), "curvedVarianceRatio", "must be > 0");
    Require(curvedVarianceRatio <= straightVarianceRatio, "curvedVarianceRatio",
            "must not exceed straightVarianceRatio");
    Require(NonNegative(straightCurvatureMax), "straightCurvatureMax", "must be >= 0");
    Require(NonNegative(curvedCurvatureMin), "curvedCurvatureMin", "must be >= 0");
    Require(straightCurvatureMax <= curvedCurvatureMin, "straightCurvatureMax",
            "must not exceed curvedCurvatureMin");
    Require(Positive(orientationToleranceDeg) && orientationToleranceDeg < 45.0,
            "orientationToleranceDeg", "must be in (0, 45)");
    Require(curvatureNeighbors >= 2, "curvatureNeighbors", "must be >= 2");
    Require(minClusterSize >= 1, "minClusterSize", "must be >= 1");
    Require(NonNegative(minClusterFraction) && minClusterFraction < 1.0,
            "minClusterFraction", "must be in [0, 1)");
    Require(Positive(connectivityFactor), "connectivityFactor", "must be > 0");
    Require(maxRecursionDepth >= 0, "maxRecursionDepth", "must be >= 0");

    Require(std::isfinite(sequenceReliability) && sequenceReliability > 0.0 &&
            sequenceReliability <= 1.0, "sequenceReliability", "must be in (0, 1]");

    Require(std::isfinite(snakeAngleDeg) && snakeAngleDeg >= 75.0 && snakeAngleDeg <= 105.0,
            "snakeAngleDeg", "must be in [75, 105]");
    Require(windingWindow >= 1, "windingWindow", "must be >= 1");
    Require(minPointsPerRow >= 1, "minPointsPerRow", "must be >= 1");
    Require(Positive(windingMaxJumpFactor), "windingMaxJumpFactor", "must be > 0");
    Require(windingMaxTokenGap >= 1, "windingMaxTokenGap", "must be >= 1");

    Require(Positive(rowSplitDeviationFactor), "rowSplitDeviationFactor", "must be > 0");
    Require(Positive(rowJumpFactor), "rowJumpFactor", "must be > 0");
    Require(Positive(gentleTurnDeg) && gentleTurnDeg < 180.0, "gentleTurnDeg",
            "must be in (0, 180)");
    Require(reversalDeg > gentleTurnDeg && reversalDeg <= 180.0, "reversalDeg",
            "must be in (gentleTurnDeg, 180]");

    Require(std::isfinite(loessBandwidth) && loessBandwidth > 0.0 && loessBandwidth <= 1.0,
            "loessBandwidth", "must be in (0, 1]");
    Require(principalCurveMaxIterations >= 1, "principalCurveMaxIterations", "must be >= 1");
    Require(Positive(principalCurveTolerance), "principalCurveTolerance", "must be > 0");

    Require(knnK >= 0, "knnK", "must be >= 0 (0 = auto)");
    Require(NonNegative(dbscanEps), "dbscanEps", "must be >= 0 (0 = auto)");
    Require(dbscanMinPts >= 0, "dbscanMinPts", "must be >= 0 (0 = auto)");

    Require(Positive(simplifyToleranceFactor), "simplifyToleranceFactor", "must be > 0");
    Require(std::isfinite(minStrategyConfidence) && minStrategyConfidence >= 0.0 &&
            minStrategyConfidence <= 1.0, "minStrategyConfidence", "must be in [0, 1]");
    Require(NonNegative(orphanAttachFactor), "orphanAttachFactor", "must be >= 0");
}

} // namespace Qi::Blast

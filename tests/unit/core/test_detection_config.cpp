/**
 * @file test_detection_config.cpp
 * @brief Unit tests for DetectionConfig defaults, builders and range checks
 */

#include <QiBlast/Core/DetectionConfig.h>
#include <QiBlast/Core/Exception.h>

#include <gtest/gtest.h>

#include <string>

using namespace Qi::Blast;

class DetectionConfigTest : public ::testing::Test {
protected:
    DetectionConfig config_;
};

TEST_F(DetectionConfigTest, DefaultValues) {
    EXPECT_DOUBLE_EQ(config_.straightVarianceRatio, 5.0);
    EXPECT_DOUBLE_EQ(config_.curvedVarianceRatio, 3.0);
    EXPECT_DOUBLE_EQ(config_.orientationToleranceDeg, 15.0);
    EXPECT_DOUBLE_EQ(config_.snakeAngleDeg, 90.0);
    EXPECT_DOUBLE_EQ(config_.minStrategyConfidence, 0.5);
    EXPECT_DOUBLE_EQ(config_.orphanAttachFactor, 1.5);
    EXPECT_EQ(config_.maxRecursionDepth, 3);
    EXPECT_EQ(config_.knnK, 0);
    EXPECT_EQ(config_.directionMode, DirectionMode::Auto);
    EXPECT_TRUE(config_.detectSerpentine);
    EXPECT_FALSE(config_.debug);

    EXPECT_NO_THROW(config_.Validate());
}

TEST_F(DetectionConfigTest, BuilderPattern) {
    config_.SetSnakeAngle(80.0)
           .SetOrientationTolerance(12.0)
           .SetKnnK(4)
           .SetDbscan(5.0, 3)
           .SetDirectionMode(DirectionMode::Serpentine)
           .SetDebug(true);

    EXPECT_DOUBLE_EQ(config_.snakeAngleDeg, 80.0);
    EXPECT_DOUBLE_EQ(config_.orientationToleranceDeg, 12.0);
    EXPECT_EQ(config_.knnK, 4);
    EXPECT_DOUBLE_EQ(config_.dbscanEps, 5.0);
    EXPECT_EQ(config_.dbscanMinPts, 3);
    EXPECT_EQ(config_.directionMode, DirectionMode::Serpentine);
    EXPECT_TRUE(config_.debug);
    EXPECT_NO_THROW(config_.Validate());
}

TEST_F(DetectionConfigTest, SnakeAngleOutOfRange) {
    config_.SetSnakeAngle(60.0);
    EXPECT_THROW(config_.Validate(), ConfigurationException);

    config_.SetSnakeAngle(110.0);
    EXPECT_THROW(config_.Validate(), ConfigurationException);

    config_.SetSnakeAngle(105.0);
    EXPECT_NO_THROW(config_.Validate());
}

TEST_F(DetectionConfigTest, ConfidenceOutOfRange) {
    config_.SetMinStrategyConfidence(1.5);
    EXPECT_THROW(config_.Validate(), ConfigurationException);

    config_.SetMinStrategyConfidence(-0.1);
    EXPECT_THROW(config_.Validate(), ConfigurationException);
}

TEST_F(DetectionConfigTest, NonPositiveTolerance) {
    config_.SetOrientationTolerance(0.0);
    EXPECT_THROW(config_.Validate(), ConfigurationException);
}

TEST_F(DetectionConfigTest, InconsistentRatios) {
    config_.SetVarianceRatios(2.0, 3.0);
    EXPECT_THROW(config_.Validate(), ConfigurationException);
}

TEST_F(DetectionConfigTest, ReversalMustExceedGentleTurn) {
    config_.reversalDeg = 20.0;
    EXPECT_THROW(config_.Validate(), ConfigurationException);
}

TEST_F(DetectionConfigTest, MessageNamesField) {
    config_.loessBandwidth = 0.0;
    try {
        config_.Validate();
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("DetectionConfig:"), std::string::npos);
        EXPECT_NE(message.find("loessBandwidth"), std::string::npos);
    }
}

TEST_F(DetectionConfigTest, ExceptionHierarchy) {
    config_.SetSnakeAngle(10.0);
    EXPECT_THROW(config_.Validate(), Exception);
    EXPECT_THROW(config_.Validate(), std::runtime_error);
}

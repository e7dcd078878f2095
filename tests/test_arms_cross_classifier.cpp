/**
 * @file test_arms_cross_classifier.cpp
 * @brief Unit tests for ArmsCrossClassifier
 *
 * Validates:
 * - Decision order CORRECT -> ABOVE -> BELOW -> INCORRECT
 * - Inclusive boundaries at shoulder.y * (1 +/- t), one ulp either side
 * - Band factors applied in double precision
 * - Tolerance taken from ClassificationConfig
 * - Tracking states are ignored
 * - Repeated calls give identical results
 */

#include <gtest/gtest.h>
#include <posecheck/pose/ArmsCrossClassifier.hpp>
#include <posecheck/pose/TolerancePolicy.hpp>
#include <cmath>
#include <limits>
#include <vector>

using namespace posecheck;
using namespace posecheck::pose;
using posecheck::skeleton::JointSnapshot;
using posecheck::skeleton::JointType;

class ArmsCrossClassifierTest : public ::testing::Test {
protected:
    /**
     * @brief Snapshot with the given shoulder and arm joint heights
     */
    static JointSnapshot makeArms(float shoulder_left, float elbow_left, float wrist_left,
                                  float shoulder_right, float elbow_right, float wrist_right) {
        JointSnapshot snapshot;
        snapshot.setJoint(JointType::SHOULDER_LEFT, core::Point3f(-0.2f, shoulder_left, 2.0f));
        snapshot.setJoint(JointType::ELBOW_LEFT, core::Point3f(-0.45f, elbow_left, 2.0f));
        snapshot.setJoint(JointType::WRIST_LEFT, core::Point3f(-0.7f, wrist_left, 2.0f));
        snapshot.setJoint(JointType::SHOULDER_RIGHT, core::Point3f(0.2f, shoulder_right, 2.0f));
        snapshot.setJoint(JointType::ELBOW_RIGHT, core::Point3f(0.45f, elbow_right, 2.0f));
        snapshot.setJoint(JointType::WRIST_RIGHT, core::Point3f(0.7f, wrist_right, 2.0f));
        return snapshot;
    }

    ArmsCrossClassifier classifier_;
};

TEST_F(ArmsCrossClassifierTest, JointsAboveShoulderAtZeroAreCorrect) {
    auto snapshot = makeArms(0.0f, 1.0f, 1.0f, 0.0f, 1.0f, 1.0f);
    EXPECT_EQ(classifier_.classify(snapshot), RegionCode::CORRECT);
}

TEST_F(ArmsCrossClassifierTest, PositiveShoulderHeightsAlwaysSatisfyOutsideBand) {
    // For shoulder.y >= 0 every height is <= s*(1+t) or >= s*(1-t)
    EXPECT_EQ(classifier_.classify(makeArms(0.42f, 0.43f, 0.44f, 0.42f, 0.43f, 0.44f)), RegionCode::CORRECT);
    EXPECT_EQ(classifier_.classify(makeArms(0.42f, -0.30f, -0.50f, 0.42f, 1.2f, 0.0f)), RegionCode::CORRECT);
}

TEST_F(ArmsCrossClassifierTest, JointsInsideBandAreAbove) {
    // s = -1: band is (-1.05, -0.95), every joint inside and >= -1.05
    auto snapshot = makeArms(-1.0f, -1.0f, -1.0f, -1.0f, -0.98f, -1.02f);
    EXPECT_EQ(classifier_.classify(snapshot), RegionCode::ABOVE);
}

TEST_F(ArmsCrossClassifierTest, MixedInsideAndBelowIsIncorrect) {
    // Left elbow inside the band, left wrist well under it
    auto snapshot = makeArms(-1.0f, -1.0f, -2.0f, -1.0f, -1.0f, -1.0f);
    EXPECT_EQ(classifier_.classify(snapshot), RegionCode::INCORRECT);
}

TEST_F(ArmsCrossClassifierTest, InclusiveUpperBoundary) {
    // t = 0.5 keeps both band edges exactly representable: (-3, -1) for s = -2
    const ArmsCrossClassifier half(0.5);
    const float shoulder = -2.0f;
    const float boundary = -3.0f;
    const float one_ulp_above = std::nextafter(boundary, std::numeric_limits<float>::infinity());
    const float one_ulp_below = std::nextafter(boundary, -std::numeric_limits<float>::infinity());

    // Remaining joints at 0 are outside the band (0 >= s*(1-t))
    EXPECT_EQ(half.classify(makeArms(shoulder, boundary, 0.0f, shoulder, 0.0f, 0.0f)),
              RegionCode::CORRECT);
    EXPECT_EQ(half.classify(makeArms(shoulder, one_ulp_below, 0.0f, shoulder, 0.0f, 0.0f)),
              RegionCode::CORRECT);
    // Just inside the band: not outside, but every joint is >= s*(1+t)
    EXPECT_EQ(half.classify(makeArms(shoulder, one_ulp_above, 0.0f, shoulder, 0.0f, 0.0f)),
              RegionCode::ABOVE);
}

TEST_F(ArmsCrossClassifierTest, InclusiveLowerBoundary) {
    const ArmsCrossClassifier half(0.5);
    const float shoulder = -2.0f;
    const float boundary = -1.0f;
    const float one_ulp_below = std::nextafter(boundary, -std::numeric_limits<float>::infinity());

    EXPECT_EQ(half.classify(makeArms(shoulder, boundary, 0.0f, shoulder, 0.0f, 0.0f)),
              RegionCode::CORRECT);
    EXPECT_EQ(half.classify(makeArms(shoulder, one_ulp_below, 0.0f, shoulder, 0.0f, 0.0f)),
              RegionCode::ABOVE);
}

TEST_F(ArmsCrossClassifierTest, DefaultBandUsesExactFactors) {
    // -20 * 1.05 is exactly -21 in double
    ASSERT_EQ(upperBound(-20.0, kDefaultToleranceFactor), -21.0);
    EXPECT_EQ(classifier_.classify(makeArms(-20.0f, -21.0f, 0.0f, -20.0f, 0.0f, 0.0f)),
              RegionCode::CORRECT);
    const float inside = std::nextafter(-21.0f, 0.0f);
    EXPECT_EQ(classifier_.classify(makeArms(-20.0f, inside, 0.0f, -20.0f, 0.0f, 0.0f)),
              RegionCode::ABOVE);
}

TEST_F(ArmsCrossClassifierTest, ElbowJustAboveScaledShoulderIsInsideBand) {
    // -1.05f rounds to -1.04999995, which is above -1.0 * 1.05 and so inside
    // the band. A float product 1.0f + 0.05f would put the edge on the joint.
    auto snapshot = makeArms(-1.0f, -1.05f, 0.0f, -1.0f, 0.0f, 0.0f);
    EXPECT_EQ(classifier_.classify(snapshot), RegionCode::ABOVE);

    ClassificationConfig config;
    EXPECT_EQ(classifier_.classify(snapshot, config), RegionCode::ABOVE);
}

TEST_F(ArmsCrossClassifierTest, ToleranceComesFromConfig) {
    auto snapshot = makeArms(-2.0f, -2.0f, -2.0f, -2.0f, -2.0f, -2.0f);

    ClassificationConfig wide;
    wide.tolerance_factor = 0.5;    // band (-3, -1)
    EXPECT_EQ(classifier_.classify(snapshot, wide), RegionCode::ABOVE);

    ClassificationConfig exact;
    exact.tolerance_factor = 0.0;   // band collapses onto the shoulder height
    EXPECT_EQ(classifier_.classify(snapshot, exact), RegionCode::CORRECT);

    ArmsCrossClassifier wide_classifier(0.5);
    EXPECT_DOUBLE_EQ(wide_classifier.tolerance(), 0.5);
    EXPECT_EQ(wide_classifier.classify(snapshot), RegionCode::ABOVE);
}

TEST_F(ArmsCrossClassifierTest, TrackingStateIsIgnored) {
    // Default snapshot: every joint NOT_TRACKED at the origin
    JointSnapshot untracked;
    EXPECT_EQ(classifier_.classify(untracked), RegionCode::CORRECT);

    auto snapshot = makeArms(-1.0f, -1.0f, -2.0f, -1.0f, -1.0f, -1.0f);
    snapshot.setJoint(JointType::WRIST_LEFT, core::Point3f(-0.7f, -2.0f, 2.0f),
                      skeleton::TrackingState::INFERRED);
    EXPECT_EQ(classifier_.classify(snapshot), RegionCode::INCORRECT);
}

TEST_F(ArmsCrossClassifierTest, NeverInvalidAndNeverBelow) {
    // Every joint at or below s*(1+t) is already outside the band, so BELOW
    // cannot follow a failed CORRECT check.
    const std::vector<float> shoulders = {-1.0f, -0.4f, 0.0f, 0.4f};
    const std::vector<float> offsets = {-1.0f, -0.1f, -0.03f, 0.0f, 0.03f, 0.1f, 1.0f};

    for (float shoulder : shoulders) {
        for (float a : offsets) {
            for (float b : offsets) {
                for (float c : offsets) {
                    auto snapshot = makeArms(shoulder, shoulder + a, shoulder + b,
                                             shoulder, shoulder + c, shoulder);
                    RegionCode code = classifier_.classify(snapshot);
                    EXPECT_NE(code, RegionCode::INVALID);
                    EXPECT_NE(code, RegionCode::BELOW);
                }
            }
        }
    }
}

TEST_F(ArmsCrossClassifierTest, RepeatedCallsAreIdentical) {
    auto snapshot = makeArms(-1.0f, -1.0f, -2.0f, -1.0f, -1.0f, -1.0f);
    const RegionCode first = classifier_.classify(snapshot);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(classifier_.classify(snapshot), first);
    }
}

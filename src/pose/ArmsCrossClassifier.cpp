/**
 * @file ArmsCrossClassifier.cpp
 * @brief Implementation of the arms "cross" classifier
 */

#include "posecheck/pose/ArmsCrossClassifier.hpp"
#include "posecheck/core/Logger.hpp"

#include <array>

namespace posecheck {
namespace pose {

using skeleton::JointType;

namespace {

struct ShoulderJointPair {
    JointType shoulder;
    JointType joint;
};

const std::array<ShoulderJointPair, 4> kArmPairs = {{
    {JointType::SHOULDER_LEFT, JointType::ELBOW_LEFT},
    {JointType::SHOULDER_LEFT, JointType::WRIST_LEFT},
    {JointType::SHOULDER_RIGHT, JointType::ELBOW_RIGHT},
    {JointType::SHOULDER_RIGHT, JointType::WRIST_RIGHT}
}};

} // namespace

ArmsCrossClassifier::ArmsCrossClassifier(double tolerance_factor)
    : tolerance_(tolerance_factor) {
}

RegionCode ArmsCrossClassifier::classify(const skeleton::JointSnapshot& snapshot) const {
    return classifyWithTolerance(snapshot, tolerance_);
}

RegionCode ArmsCrossClassifier::classify(const skeleton::JointSnapshot& snapshot,
                                         const ClassificationConfig& config) const {
    return classifyWithTolerance(snapshot, config.tolerance_factor);
}

RegionCode ArmsCrossClassifier::classifyWithTolerance(const skeleton::JointSnapshot& snapshot,
                                                      double tolerance) {
    bool all_outside_band = true;
    bool all_at_or_above = true;
    bool all_at_or_below = true;

    for (const auto& pair : kArmPairs) {
        const double shoulder_y = snapshot[pair.shoulder].position.y;
        const double joint_y = snapshot[pair.joint].position.y;
        const double upper = upperBound(shoulder_y, tolerance);
        const double lower = lowerBound(shoulder_y, tolerance);

        all_outside_band = all_outside_band && (joint_y <= upper || joint_y >= lower);
        all_at_or_above = all_at_or_above && joint_y >= upper;
        all_at_or_below = all_at_or_below && joint_y <= upper;
    }

    RegionCode code;
    if (all_outside_band) {
        code = RegionCode::CORRECT;
    } else if (all_at_or_above) {
        code = RegionCode::ABOVE;
    } else if (all_at_or_below) {
        code = RegionCode::BELOW;
    } else {
        code = RegionCode::INCORRECT;
    }

    LOG_TRACE("ArmsCrossClassifier: " + region_code_to_string(code) +
              " (shoulder_left.y=" + std::to_string(snapshot[JointType::SHOULDER_LEFT].position.y) +
              ", shoulder_right.y=" + std::to_string(snapshot[JointType::SHOULDER_RIGHT].position.y) + ")");
    return code;
}

} // namespace pose
} // namespace posecheck

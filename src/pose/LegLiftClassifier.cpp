/**
 * @file LegLiftClassifier.cpp
 * @brief Implementation of the lifted-leg classifier
 */

#include "posecheck/pose/LegLiftClassifier.hpp"
#include "posecheck/pose/TolerancePolicy.hpp"
#include "posecheck/utils/MathUtils.hpp"
#include "posecheck/core/Logger.hpp"

#include <cmath>

namespace posecheck {
namespace pose {

using skeleton::JointType;
using utils::MathUtils;

bool LegLiftClassifier::computeAngle(const skeleton::JointSnapshot& snapshot, double& angle_deg) const {
    const core::Point3f& knee = snapshot[JointType::KNEE_LEFT].position;
    const core::Point3f& ankle = snapshot[JointType::ANKLE_LEFT].position;

    const double adjacent = MathUtils::euclideanDistance(ankle.z, ankle.z, knee.y, ankle.y);
    const double opposite = MathUtils::euclideanDistance(ankle.z, knee.z, knee.y, knee.y);

    if (opposite == 0.0) {
        return false;
    }

    angle_deg = MathUtils::radiansToDegrees(std::atan(adjacent / opposite));
    return true;
}

RegionCode LegLiftClassifier::classify(const skeleton::JointSnapshot& snapshot,
                                       const ClassificationConfig& config) const {
    const double target = config.target_leg_angle_deg;
    if (!isTargetAngleValid(target)) {
        LOG_DEBUG("LegLiftClassifier: target angle " + std::to_string(target) +
                  " outside [0, 90], region invalid");
        return RegionCode::INVALID;
    }

    // The right leg is the supporting leg: reported for diagnostics, not scored
    const core::Point3f& knee_right = snapshot[JointType::KNEE_RIGHT].position;
    const core::Point3f& ankle_right = snapshot[JointType::ANKLE_RIGHT].position;
    LOG_TRACE("LegLiftClassifier: supporting leg knee (y=" + std::to_string(knee_right.y) +
              ", z=" + std::to_string(knee_right.z) + ") ankle (y=" + std::to_string(ankle_right.y) +
              ", z=" + std::to_string(ankle_right.z) + ")");

    double angle = 0.0;
    if (!computeAngle(snapshot, angle)) {
        LOG_DEBUG("LegLiftClassifier: knee and ankle share depth, angle undefined");
        return RegionCode::INCORRECT;
    }

    const double tolerance = config.tolerance_factor;
    const double lower = lowerBound(target, tolerance);
    const double upper = upperBound(target, tolerance);

    // angle == 0 is excluded from ABOVE and ends up INCORRECT
    RegionCode code;
    if (angle <= lower && angle != 0.0) {
        code = RegionCode::ABOVE;
    } else if (angle >= upper) {
        code = RegionCode::BELOW;
    } else if (angle >= upper && angle <= lower) {
        code = RegionCode::CORRECT;
    } else {
        code = RegionCode::INCORRECT;
    }

    LOG_TRACE("LegLiftClassifier: angle " + std::to_string(angle) + " deg, target " +
              std::to_string(target) + " deg -> " + region_code_to_string(code));
    return code;
}

} // namespace pose
} // namespace posecheck

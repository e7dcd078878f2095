/**
 * @file FrameClassifier.cpp
 * @brief Frame-level aggregation of region classifications
 */

#include "posecheck/pose/FrameClassifier.hpp"
#include "posecheck/pose/TolerancePolicy.hpp"
#include "posecheck/core/Logger.hpp"

namespace posecheck {
namespace pose {

using skeleton::JointSnapshot;
using skeleton::JointType;

namespace {

bool armsTracked(const JointSnapshot& snapshot) {
    return snapshot.hasPositions({
        JointType::SHOULDER_LEFT, JointType::ELBOW_LEFT, JointType::WRIST_LEFT,
        JointType::SHOULDER_RIGHT, JointType::ELBOW_RIGHT, JointType::WRIST_RIGHT
    });
}

bool legTracked(const JointSnapshot& snapshot) {
    return snapshot.hasPositions({JointType::KNEE_LEFT, JointType::ANKLE_LEFT});
}

RegionCode classifyArmsRegion(const ArmsCrossClassifier& arms,
                              const JointSnapshot& snapshot,
                              const ClassificationConfig& config) {
    if (config.require_tracked_joints && !armsTracked(snapshot)) {
        LOG_DEBUG("FrameClassifier: arm joint not tracked, arms region invalid");
        return RegionCode::INVALID;
    }
    return arms.classify(snapshot, config);
}

RegionCode classifyLegRegion(const LegLiftClassifier& leg,
                             const JointSnapshot& snapshot,
                             const ClassificationConfig& config) {
    if (config.require_tracked_joints && !legTracked(snapshot)) {
        LOG_DEBUG("FrameClassifier: leg joint not tracked, leg region invalid");
        return RegionCode::INVALID;
    }
    return leg.classify(snapshot, config);
}

} // namespace

FrameClassification classifyFrame(const JointSnapshot& snapshot, const ClassificationConfig& config) {
    const ArmsCrossClassifier arms(config.tolerance_factor);
    const LegLiftClassifier leg;

    FrameClassification result;
    result.arms_code = classifyArmsRegion(arms, snapshot, config);
    result.leg_code = classifyLegRegion(leg, snapshot, config);
    return result;
}

std::vector<FrameClassification> classifySkeletons(const std::vector<JointSnapshot>& snapshots,
                                                   const ClassificationConfig& config) {
    std::vector<FrameClassification> results;
    results.reserve(snapshots.size());
    for (const auto& snapshot : snapshots) {
        results.push_back(classifyFrame(snapshot, config));
    }
    return results;
}

FrameClassifier::FrameClassifier()
    : FrameClassifier(ClassificationConfig()) {
}

FrameClassifier::FrameClassifier(const ClassificationConfig& config)
    : arms_(config.tolerance_factor) {
    setConfig(config);
}

FrameClassification FrameClassifier::classify(const JointSnapshot& snapshot) const {
    FrameClassification result;
    result.arms_code = classifyArms(snapshot);
    result.leg_code = classifyLeg(snapshot);
    return result;
}

std::vector<FrameClassification> FrameClassifier::classify(const std::vector<JointSnapshot>& snapshots) const {
    std::vector<FrameClassification> results;
    results.reserve(snapshots.size());
    for (const auto& snapshot : snapshots) {
        results.push_back(classify(snapshot));
    }
    return results;
}

RegionCode FrameClassifier::classifyArms(const JointSnapshot& snapshot) const {
    return classifyArmsRegion(arms_, snapshot, config_);
}

RegionCode FrameClassifier::classifyLeg(const JointSnapshot& snapshot) const {
    return classifyLegRegion(leg_, snapshot, config_);
}

void FrameClassifier::setConfig(const ClassificationConfig& config) {
    if (!isTargetAngleValid(config.target_leg_angle_deg)) {
        LOG_WARNING("FrameClassifier: target leg angle " + std::to_string(config.target_leg_angle_deg) +
                    " deg outside [0, 90], leg region will report INVALID");
    }
    config_ = config;
    arms_ = ArmsCrossClassifier(config.tolerance_factor);
}

} // namespace pose
} // namespace posecheck

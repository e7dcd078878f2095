/**
 * @file OverlayStyle.cpp
 * @brief Overlay color mapping and bone visibility rules
 */

#include "posecheck/overlay/OverlayStyle.hpp"

namespace posecheck {
namespace overlay {

using pose::RegionCode;
using skeleton::JointType;
using skeleton::TrackingState;

std::optional<core::Color> regionColor(RegionCode code) {
    switch (code) {
        case RegionCode::INCORRECT: return core::Color(0, 0, 255);
        case RegionCode::CORRECT:   return core::Color(0, 128, 0);
        case RegionCode::BELOW:     return core::Color(0, 255, 255);
        case RegionCode::ABOVE:     return core::Color(255, 255, 0);
        case RegionCode::INVALID:
        default:
            return std::nullopt;
    }
}

std::string regionColorName(RegionCode code) {
    switch (code) {
        case RegionCode::INCORRECT: return "red";
        case RegionCode::CORRECT:   return "green";
        case RegionCode::BELOW:     return "yellow";
        case RegionCode::ABOVE:     return "cyan";
        case RegionCode::INVALID:
        default:
            return "none";
    }
}

std::optional<core::Color> jointMarkerColor(RegionCode code) {
    switch (code) {
        case RegionCode::INCORRECT:
            return core::Color(185, 218, 255);
        case RegionCode::CORRECT:
        case RegionCode::BELOW:
        case RegionCode::ABOVE:
            return core::Color(68, 192, 68);
        case RegionCode::INVALID:
        default:
            return std::nullopt;
    }
}

core::Color inferredBoneColor() {
    return core::Color(128, 128, 128);
}

core::Color inferredJointColor() {
    return core::Color(0, 255, 255);
}

DrawStyle boneStyle(const skeleton::Joint& joint0, const skeleton::Joint& joint1) {
    if (joint0.tracking_state == TrackingState::NOT_TRACKED ||
        joint1.tracking_state == TrackingState::NOT_TRACKED) {
        return DrawStyle::HIDDEN;
    }

    if (joint0.tracking_state == TrackingState::INFERRED &&
        joint1.tracking_state == TrackingState::INFERRED) {
        return DrawStyle::HIDDEN;
    }

    if (joint0.is_tracked() && joint1.is_tracked()) {
        return DrawStyle::TRACKED;
    }
    return DrawStyle::INFERRED;
}

DrawStyle jointStyle(const skeleton::Joint& joint) {
    switch (joint.tracking_state) {
        case TrackingState::TRACKED:  return DrawStyle::TRACKED;
        case TrackingState::INFERRED: return DrawStyle::INFERRED;
        case TrackingState::NOT_TRACKED:
        default:
            return DrawStyle::HIDDEN;
    }
}

std::optional<core::Color> regionBoneColor(RegionCode code,
                                           const skeleton::JointSnapshot& snapshot,
                                           const Bone& bone) {
    if (boneStyle(snapshot[bone.from], snapshot[bone.to]) != DrawStyle::TRACKED) {
        return std::nullopt;
    }
    return regionColor(code);
}

const std::vector<Bone>& armsCrossBones() {
    static const std::vector<Bone> bones = {
        {JointType::SHOULDER_CENTER, JointType::SHOULDER_LEFT},
        {JointType::SHOULDER_CENTER, JointType::SHOULDER_RIGHT},
        {JointType::SHOULDER_LEFT, JointType::ELBOW_LEFT},
        {JointType::ELBOW_LEFT, JointType::WRIST_LEFT},
        {JointType::WRIST_LEFT, JointType::HAND_LEFT},
        {JointType::SHOULDER_RIGHT, JointType::ELBOW_RIGHT},
        {JointType::ELBOW_RIGHT, JointType::WRIST_RIGHT},
        {JointType::WRIST_RIGHT, JointType::HAND_RIGHT}
    };
    return bones;
}

const std::vector<Bone>& liftedLegBones() {
    static const std::vector<Bone> bones = {
        {JointType::HIP_LEFT, JointType::KNEE_LEFT},
        {JointType::KNEE_LEFT, JointType::ANKLE_LEFT},
        {JointType::ANKLE_LEFT, JointType::FOOT_LEFT}
    };
    return bones;
}

const std::vector<Bone>& neutralBones() {
    static const std::vector<Bone> bones = {
        {JointType::HEAD, JointType::SHOULDER_CENTER},
        {JointType::SHOULDER_CENTER, JointType::SHOULDER_LEFT},
        {JointType::SHOULDER_CENTER, JointType::SHOULDER_RIGHT},
        {JointType::SHOULDER_CENTER, JointType::SPINE},
        {JointType::SPINE, JointType::HIP_CENTER},
        {JointType::HIP_CENTER, JointType::HIP_LEFT},
        {JointType::HIP_CENTER, JointType::HIP_RIGHT},
        {JointType::HIP_RIGHT, JointType::KNEE_RIGHT},
        {JointType::KNEE_RIGHT, JointType::ANKLE_RIGHT},
        {JointType::ANKLE_RIGHT, JointType::FOOT_RIGHT}
    };
    return bones;
}

} // namespace overlay
} // namespace posecheck

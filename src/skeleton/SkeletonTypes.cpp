/**
 * @file SkeletonTypes.cpp
 * @brief Joint snapshot storage and name conversions
 */

#include "posecheck/skeleton/SkeletonTypes.hpp"

namespace posecheck {
namespace skeleton {

namespace {

const std::array<const char*, kJointCount> kJointNames = {
    "HipCenter", "Spine", "ShoulderCenter", "Head",
    "ShoulderLeft", "ElbowLeft", "WristLeft", "HandLeft",
    "ShoulderRight", "ElbowRight", "WristRight", "HandRight",
    "HipLeft", "KneeLeft", "AnkleLeft", "FootLeft",
    "HipRight", "KneeRight", "AnkleRight", "FootRight"
};

} // namespace

JointSnapshot::JointSnapshot() {
    for (std::size_t i = 0; i < kJointCount; ++i) {
        joints_[i].type = static_cast<JointType>(i);
    }
}

void JointSnapshot::setJoint(JointType type, const core::Point3f& position, TrackingState state) {
    Joint& joint = joints_[static_cast<std::size_t>(type)];
    joint.position = position;
    joint.tracking_state = state;
}

bool JointSnapshot::hasPositions(std::initializer_list<JointType> types) const {
    for (JointType type : types) {
        if ((*this)[type].tracking_state == TrackingState::NOT_TRACKED) {
            return false;
        }
    }
    return true;
}

std::string jointTypeToString(JointType type) {
    auto index = static_cast<std::size_t>(type);
    if (index >= kJointCount) {
        return "Invalid";
    }
    return kJointNames[index];
}

bool jointTypeFromString(const std::string& name, JointType& type) {
    for (std::size_t i = 0; i < kJointCount; ++i) {
        if (name == kJointNames[i]) {
            type = static_cast<JointType>(i);
            return true;
        }
    }
    return false;
}

std::string trackingStateToString(TrackingState state) {
    switch (state) {
        case TrackingState::NOT_TRACKED: return "NotTracked";
        case TrackingState::INFERRED: return "Inferred";
        case TrackingState::TRACKED: return "Tracked";
        default: return "Invalid";
    }
}

bool trackingStateFromString(const std::string& name, TrackingState& state) {
    if (name == "Tracked") {
        state = TrackingState::TRACKED;
    } else if (name == "Inferred") {
        state = TrackingState::INFERRED;
    } else if (name == "NotTracked") {
        state = TrackingState::NOT_TRACKED;
    } else {
        return false;
    }
    return true;
}

} // namespace skeleton
} // namespace posecheck

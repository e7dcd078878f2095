/**
 * @file SkeletonTypes.hpp
 * @brief Joint and skeleton snapshot types delivered by the body tracker
 *
 * A JointSnapshot holds the 20 landmarks of one tracked body for one sensor
 * frame. Positions are in sensor space: y is vertical, z is depth.
 */

#ifndef POSECHECK_SKELETON_TYPES_HPP
#define POSECHECK_SKELETON_TYPES_HPP

#include "posecheck/core/types.hpp"

#include <array>
#include <cstddef>
#include <initializer_list>
#include <string>

namespace posecheck {
namespace skeleton {

/**
 * @brief Skeletal landmarks, in sensor order
 */
enum class JointType {
    HIP_CENTER = 0,
    SPINE,
    SHOULDER_CENTER,
    HEAD,
    SHOULDER_LEFT,
    ELBOW_LEFT,
    WRIST_LEFT,
    HAND_LEFT,
    SHOULDER_RIGHT,
    ELBOW_RIGHT,
    WRIST_RIGHT,
    HAND_RIGHT,
    HIP_LEFT,
    KNEE_LEFT,
    ANKLE_LEFT,
    FOOT_LEFT,
    HIP_RIGHT,
    KNEE_RIGHT,
    ANKLE_RIGHT,
    FOOT_RIGHT
};

/// Number of landmarks in a snapshot
constexpr std::size_t kJointCount = 20;

/**
 * @brief Per-joint tracking confidence reported by the tracker
 */
enum class TrackingState {
    NOT_TRACKED = 0,    ///< Position is meaningless
    INFERRED,           ///< Position estimated from neighbouring joints
    TRACKED             ///< Position observed directly
};

/**
 * @brief One tracked skeletal landmark
 */
struct Joint {
    JointType type = JointType::HIP_CENTER;
    core::Point3f position;
    TrackingState tracking_state = TrackingState::NOT_TRACKED;

    bool is_tracked() const { return tracking_state == TrackingState::TRACKED; }
};

/**
 * @brief All joints of one skeleton at one instant
 *
 * Every slot is always present; joints the tracker did not report stay
 * NOT_TRACKED at the origin.
 */
class JointSnapshot {
public:
    JointSnapshot();

    const Joint& operator[](JointType type) const {
        return joints_[static_cast<std::size_t>(type)];
    }

    const Joint& joint(JointType type) const { return (*this)[type]; }

    /**
     * @brief Replace one joint's position and tracking state
     */
    void setJoint(JointType type, const core::Point3f& position,
                  TrackingState state = TrackingState::TRACKED);

    /**
     * @brief True if none of the given joints is NOT_TRACKED
     */
    bool hasPositions(std::initializer_list<JointType> types) const;

    const std::array<Joint, kJointCount>& joints() const { return joints_; }

private:
    std::array<Joint, kJointCount> joints_;
};

/**
 * @brief Joint name as used in recordings ("ShoulderLeft", "KneeRight", ...)
 */
std::string jointTypeToString(JointType type);

/**
 * @brief Parse a joint name written by jointTypeToString
 * @return false if the name is unknown
 */
bool jointTypeFromString(const std::string& name, JointType& type);

std::string trackingStateToString(TrackingState state);

bool trackingStateFromString(const std::string& name, TrackingState& state);

} // namespace skeleton
} // namespace posecheck

#endif // POSECHECK_SKELETON_TYPES_HPP

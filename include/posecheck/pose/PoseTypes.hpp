/**
 * @file PoseTypes.hpp
 * @brief Result and configuration types for posture classification
 */

#ifndef POSECHECK_POSE_TYPES_HPP
#define POSECHECK_POSE_TYPES_HPP

#include <string>

namespace posecheck {
namespace pose {

/**
 * @brief How one body region compares with its target posture
 */
enum class RegionCode {
    INVALID = 0,    ///< Input or configuration out of valid range, skip rendering
    INCORRECT,      ///< None of the other conditions hold
    CORRECT,        ///< Within tolerance of the target
    BELOW,          ///< Below the target threshold
    ABOVE           ///< Above the target threshold
};

/**
 * @brief Per-frame result for one skeleton
 */
struct FrameClassification {
    RegionCode arms_code = RegionCode::INVALID;
    RegionCode leg_code = RegionCode::INVALID;

    bool operator==(const FrameClassification& other) const {
        return arms_code == other.arms_code && leg_code == other.leg_code;
    }

    bool operator!=(const FrameClassification& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Classification parameters, read-only during classification
 */
struct ClassificationConfig {
    /// Knee-ankle angle (degrees) that counts as a fully lifted leg, valid in [0, 90]
    float target_leg_angle_deg = 10.0f;

    /// Relative tolerance band around reference values (0.05 = +/-5%)
    double tolerance_factor = 0.05;

    /// Report INVALID for a region whose joints include a NOT_TRACKED one
    bool require_tracked_joints = false;
};

/**
 * @brief Convert RegionCode to string
 */
inline std::string region_code_to_string(RegionCode code) {
    switch (code) {
        case RegionCode::INVALID: return "INVALID";
        case RegionCode::INCORRECT: return "INCORRECT";
        case RegionCode::CORRECT: return "CORRECT";
        case RegionCode::BELOW: return "BELOW";
        case RegionCode::ABOVE: return "ABOVE";
        default: return "UNKNOWN";
    }
}

} // namespace pose
} // namespace posecheck

#endif // POSECHECK_POSE_TYPES_HPP

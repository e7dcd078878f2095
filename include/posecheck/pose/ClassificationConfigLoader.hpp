/**
 * @file ClassificationConfigLoader.hpp
 * @brief Builds a ClassificationConfig from the YAML configuration
 */

#ifndef POSECHECK_POSE_CLASSIFICATION_CONFIG_LOADER_HPP
#define POSECHECK_POSE_CLASSIFICATION_CONFIG_LOADER_HPP

#include "posecheck/core/Configuration.hpp"
#include "posecheck/pose/PoseTypes.hpp"

namespace posecheck {
namespace pose {

// Configuration keys
namespace config_keys {
    constexpr const char* TARGET_LEG_ANGLE_DEG = "classification.target_leg_angle_deg";
    constexpr const char* TOLERANCE_FACTOR = "classification.tolerance_factor";
    constexpr const char* REQUIRE_TRACKED_JOINTS = "classification.require_tracked_joints";
} // namespace config_keys

/**
 * @brief Read the classification section, missing keys keep their defaults
 *
 * Values are not clamped. A target angle outside [0, 90] is logged and
 * makes the leg region report INVALID.
 */
ClassificationConfig loadClassificationConfig(const core::Configuration& configuration);

} // namespace pose
} // namespace posecheck

#endif // POSECHECK_POSE_CLASSIFICATION_CONFIG_LOADER_HPP

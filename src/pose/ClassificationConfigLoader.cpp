#include "posecheck/pose/ClassificationConfigLoader.hpp"
#include "posecheck/pose/TolerancePolicy.hpp"
#include "posecheck/core/Logger.hpp"

namespace posecheck {
namespace pose {

ClassificationConfig loadClassificationConfig(const core::Configuration& configuration) {
    ClassificationConfig config;

    config.target_leg_angle_deg = configuration.get<float>(
        config_keys::TARGET_LEG_ANGLE_DEG, config.target_leg_angle_deg);
    config.tolerance_factor = configuration.get<double>(
        config_keys::TOLERANCE_FACTOR, config.tolerance_factor);
    config.require_tracked_joints = configuration.get<bool>(
        config_keys::REQUIRE_TRACKED_JOINTS, config.require_tracked_joints);

    if (!isTargetAngleValid(config.target_leg_angle_deg)) {
        LOG_WARNING("Classification config: target_leg_angle_deg " +
                    std::to_string(config.target_leg_angle_deg) + " outside [0, 90]");
    }
    if (config.tolerance_factor < 0.0 || config.tolerance_factor >= 1.0) {
        LOG_WARNING("Classification config: tolerance_factor " +
                    std::to_string(config.tolerance_factor) + " outside [0, 1)");
    }

    LOG_INFO("Classification config: target " + std::to_string(config.target_leg_angle_deg) +
             " deg, tolerance " + std::to_string(config.tolerance_factor) +
             ", require tracked joints " + (config.require_tracked_joints ? "yes" : "no"));
    return config;
}

} // namespace pose
} // namespace posecheck

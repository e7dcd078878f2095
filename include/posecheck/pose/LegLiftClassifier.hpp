/**
 * @file LegLiftClassifier.hpp
 * @brief Classifies the lifted leg against a configured knee-ankle angle
 */

#ifndef POSECHECK_POSE_LEG_LIFT_CLASSIFIER_HPP
#define POSECHECK_POSE_LEG_LIFT_CLASSIFIER_HPP

#include "posecheck/pose/PoseTypes.hpp"
#include "posecheck/skeleton/SkeletonTypes.hpp"

namespace posecheck {
namespace pose {

/**
 * @brief Leg region classifier
 *
 * The leg angle is built from two pseudo-cathetus lengths of the left leg:
 *   adjacent = euclideanDistance(ankle.z, ankle.z, knee.y, ankle.y)
 *   opposite = euclideanDistance(ankle.z, knee.z, knee.y, knee.y)
 *   angle    = degrees(atan(adjacent / opposite))
 * which mixes the depth and height axes. Results are compared with the
 * target angle scaled by (1 - t) and (1 + t):
 *
 * - target outside [0, 90]                  -> INVALID
 * - opposite == 0 (ratio undefined)         -> INCORRECT
 * - angle != 0 and angle <= target*(1-t)    -> ABOVE
 * - angle >= target*(1+t)                   -> BELOW
 * - angle >= target*(1+t) and angle <= target*(1-t) -> CORRECT
 * - otherwise                               -> INCORRECT
 *
 * The CORRECT condition cannot hold for a positive target; it is kept so the
 * decision table matches the deployed exercise feedback.
 */
class LegLiftClassifier {
public:
    LegLiftClassifier() = default;

    RegionCode classify(const skeleton::JointSnapshot& snapshot,
                        const ClassificationConfig& config = ClassificationConfig()) const;

    /**
     * @brief Compute the current leg angle in degrees
     * @param snapshot Joint snapshot
     * @param angle_deg Receives the angle when defined
     * @return false if the opposite cathetus is zero
     */
    bool computeAngle(const skeleton::JointSnapshot& snapshot, double& angle_deg) const;
};

} // namespace pose
} // namespace posecheck

#endif // POSECHECK_POSE_LEG_LIFT_CLASSIFIER_HPP

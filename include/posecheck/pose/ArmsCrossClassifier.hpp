/**
 * @file ArmsCrossClassifier.hpp
 * @brief Classifies the "cross" pose: both arms held out at shoulder height
 */

#ifndef POSECHECK_POSE_ARMS_CROSS_CLASSIFIER_HPP
#define POSECHECK_POSE_ARMS_CROSS_CLASSIFIER_HPP

#include "posecheck/pose/PoseTypes.hpp"
#include "posecheck/pose/TolerancePolicy.hpp"
#include "posecheck/skeleton/SkeletonTypes.hpp"

namespace posecheck {
namespace pose {

/**
 * @brief Arms region classifier
 *
 * Compares the heights of both elbows and wrists with the height of the
 * shoulder on the same side, using a relative band of +/- tolerance around
 * the shoulder height. Only the y coordinates are read and tracking states
 * are ignored.
 *
 * Decision order:
 * 1. every joint outside the band (y <= shoulder*(1+t) or y >= shoulder*(1-t)) -> CORRECT
 * 2. every joint at or above shoulder*(1+t) -> ABOVE
 * 3. every joint at or below shoulder*(1+t) -> BELOW
 * 4. otherwise -> INCORRECT
 *
 * Never returns INVALID.
 */
class ArmsCrossClassifier {
public:
    explicit ArmsCrossClassifier(double tolerance_factor = kDefaultToleranceFactor);

    /**
     * @brief Classify using the tolerance given at construction
     */
    RegionCode classify(const skeleton::JointSnapshot& snapshot) const;

    /**
     * @brief Classify using config.tolerance_factor
     */
    RegionCode classify(const skeleton::JointSnapshot& snapshot,
                        const ClassificationConfig& config) const;

    double tolerance() const { return tolerance_; }

private:
    static RegionCode classifyWithTolerance(const skeleton::JointSnapshot& snapshot,
                                            double tolerance);

    double tolerance_;
};

} // namespace pose
} // namespace posecheck

#endif // POSECHECK_POSE_ARMS_CROSS_CLASSIFIER_HPP

/**
 * @file FrameClassifier.hpp
 * @brief Combines the region classifiers into one result per skeleton
 */

#ifndef POSECHECK_POSE_FRAME_CLASSIFIER_HPP
#define POSECHECK_POSE_FRAME_CLASSIFIER_HPP

#include "posecheck/pose/ArmsCrossClassifier.hpp"
#include "posecheck/pose/LegLiftClassifier.hpp"
#include "posecheck/pose/PoseTypes.hpp"
#include "posecheck/skeleton/SkeletonTypes.hpp"

#include <vector>

namespace posecheck {
namespace pose {

/**
 * @brief Classify both regions of one skeleton
 *
 * Arms and leg are evaluated independently. With
 * config.require_tracked_joints set, a region whose joints include a
 * NOT_TRACKED one is reported INVALID without running its classifier.
 */
FrameClassification classifyFrame(const skeleton::JointSnapshot& snapshot,
                                  const ClassificationConfig& config = ClassificationConfig());

/**
 * @brief Classify every skeleton of a frame, results in input order
 */
std::vector<FrameClassification> classifySkeletons(const std::vector<skeleton::JointSnapshot>& snapshots,
                                                   const ClassificationConfig& config = ClassificationConfig());

/**
 * @brief Configured classifier object
 *
 * Holds a ClassificationConfig so frame callbacks only pass snapshots.
 * Classification is const; setConfig is not synchronized.
 */
class FrameClassifier {
public:
    FrameClassifier();

    explicit FrameClassifier(const ClassificationConfig& config);

    FrameClassification classify(const skeleton::JointSnapshot& snapshot) const;

    std::vector<FrameClassification> classify(const std::vector<skeleton::JointSnapshot>& snapshots) const;

    RegionCode classifyArms(const skeleton::JointSnapshot& snapshot) const;

    RegionCode classifyLeg(const skeleton::JointSnapshot& snapshot) const;

    void setConfig(const ClassificationConfig& config);

    const ClassificationConfig& getConfig() const { return config_; }

private:
    ClassificationConfig config_;
    ArmsCrossClassifier arms_;
    LegLiftClassifier leg_;
};

} // namespace pose
} // namespace posecheck

#endif // POSECHECK_POSE_FRAME_CLASSIFIER_HPP

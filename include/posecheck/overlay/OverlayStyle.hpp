/**
 * @file OverlayStyle.hpp
 * @brief Colors and visibility rules for the posture feedback overlay
 *
 * The renderer asks these functions for a color each time it draws; no
 * appearance state is kept between frames. Colors are BGR.
 */

#ifndef POSECHECK_OVERLAY_STYLE_HPP
#define POSECHECK_OVERLAY_STYLE_HPP

#include "posecheck/core/types.hpp"
#include "posecheck/pose/PoseTypes.hpp"
#include "posecheck/skeleton/SkeletonTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace posecheck {
namespace overlay {

/**
 * @brief Segment between two joints
 */
struct Bone {
    skeleton::JointType from;
    skeleton::JointType to;
};

/**
 * @brief How a bone or joint marker is drawn given tracking states
 */
enum class DrawStyle {
    HIDDEN = 0,     ///< Not drawn
    INFERRED,       ///< Drawn in the neutral inferred color
    TRACKED         ///< Drawn in the region color
};

constexpr int kTrackedBoneThickness = 6;
constexpr int kInferredBoneThickness = 1;
constexpr int kJointRadius = 3;

/**
 * @brief Region color: INCORRECT red, CORRECT green, BELOW yellow, ABOVE cyan
 * @return std::nullopt for INVALID (region not drawn this frame)
 */
std::optional<core::Color> regionColor(pose::RegionCode code);

/**
 * @brief Color name for logs ("red", "green", ..., "none")
 */
std::string regionColorName(pose::RegionCode code);

/**
 * @brief Marker color for tracked joints of a region
 *
 * INCORRECT keeps the neutral skin tone, other valid codes use the
 * highlight green, INVALID hides the markers.
 */
std::optional<core::Color> jointMarkerColor(pose::RegionCode code);

/**
 * @brief Neutral colors for inferred geometry
 */
core::Color inferredBoneColor();
core::Color inferredJointColor();

/**
 * @brief Bone style from the tracking states of its two joints
 *
 * HIDDEN if either joint is NOT_TRACKED or both are INFERRED,
 * TRACKED if both are TRACKED, INFERRED otherwise.
 */
DrawStyle boneStyle(const skeleton::Joint& joint0, const skeleton::Joint& joint1);

/**
 * @brief Joint marker style: TRACKED, INFERRED or HIDDEN for NOT_TRACKED
 */
DrawStyle jointStyle(const skeleton::Joint& joint);

/**
 * @brief Color of a region bone, or nullopt when it must not be drawn
 *
 * Region bones are only drawn when both joints are TRACKED and the region
 * code is valid.
 */
std::optional<core::Color> regionBoneColor(pose::RegionCode code,
                                           const skeleton::JointSnapshot& snapshot,
                                           const Bone& bone);

/// Shoulder line plus both arms down to the hands
const std::vector<Bone>& armsCrossBones();

/// Hip, knee, ankle and foot of the lifted (left) leg
const std::vector<Bone>& liftedLegBones();

/// Torso and supporting leg, drawn in the neutral style
const std::vector<Bone>& neutralBones();

} // namespace overlay
} // namespace posecheck

#endif // POSECHECK_OVERLAY_STYLE_HPP

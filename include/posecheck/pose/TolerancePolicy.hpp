/**
 * @file TolerancePolicy.hpp
 * @brief Tolerance band and angle limits shared by the region classifiers
 */

#ifndef POSECHECK_POSE_TOLERANCE_POLICY_HPP
#define POSECHECK_POSE_TOLERANCE_POLICY_HPP

namespace posecheck {
namespace pose {

constexpr double kDefaultToleranceFactor = 0.05;
constexpr float kDefaultTargetLegAngleDeg = 10.0f;
constexpr double kMinTargetAngleDeg = 0.0;
constexpr double kMaxTargetAngleDeg = 90.0;

/**
 * @brief reference * (1 + tolerance)
 *
 * Computed in double: joint coordinates are float, but the band factors
 * (1.05 and 0.95 by default) must not be rounded to float first.
 */
inline double upperBound(double reference, double tolerance) {
    return reference * (1.0 + tolerance);
}

/**
 * @brief reference * (1 - tolerance)
 */
inline double lowerBound(double reference, double tolerance) {
    return reference * (1.0 - tolerance);
}

/**
 * @brief True for 0 <= degrees <= 90. NaN is rejected.
 */
inline bool isTargetAngleValid(double degrees) {
    return degrees >= kMinTargetAngleDeg && degrees <= kMaxTargetAngleDeg;
}

} // namespace pose
} // namespace posecheck

#endif // POSECHECK_POSE_TOLERANCE_POLICY_HPP

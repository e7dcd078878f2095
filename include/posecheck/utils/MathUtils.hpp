#pragma once

namespace posecheck {
namespace utils {

/**
 * Scalar geometry helpers used by the pose classifiers
 */
class MathUtils {
public:
    /**
     * Distance between (ax, ay) and (bx, by).
     * Argument order is x pair first, then y pair.
     */
    static double euclideanDistance(double ax, double bx, double ay, double by);

    static double radiansToDegrees(double radians);

    static double degreesToRadians(double degrees);
};

} // namespace utils
} // namespace posecheck

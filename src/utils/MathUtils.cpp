#include "posecheck/utils/MathUtils.hpp"

#include <cmath>

namespace posecheck {
namespace utils {

double MathUtils::euclideanDistance(double ax, double bx, double ay, double by) {
    return std::sqrt(std::pow(bx - ax, 2) + std::pow(by - ay, 2));
}

double MathUtils::radiansToDegrees(double radians) {
    return radians * 180.0 / M_PI;
}

double MathUtils::degreesToRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

} // namespace utils
} // namespace posecheck

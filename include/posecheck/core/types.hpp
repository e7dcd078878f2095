/**
 * @file types.hpp
 * @brief Common type definitions for the posecheck library
 *
 * Result codes used by the exception system and a few OpenCV aliases shared
 * by the skeleton and overlay modules.
 */

#ifndef POSECHECK_CORE_TYPES_HPP
#define POSECHECK_CORE_TYPES_HPP

#include <opencv2/core.hpp>

namespace posecheck {
namespace core {

/**
 * @brief Result codes for library operations
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_GENERIC,
    ERROR_INVALID_PARAMETER,
    ERROR_NOT_INITIALIZED,
    ERROR_FILE_NOT_FOUND,
    ERROR_FILE_IO,
    ERROR_CONFIGURATION
};

/**
 * @brief 3D point in sensor space (meters, y up, z away from the sensor)
 */
using Point3f = cv::Point3f;

/**
 * @brief BGR color used by overlay helpers
 */
using Color = cv::Scalar;

} // namespace core
} // namespace posecheck

#endif // POSECHECK_CORE_TYPES_HPP

/**
 * @file SnapshotReader.hpp
 * @brief Loads recorded skeleton sessions from YAML
 *
 * Recording layout:
 * @code
 * frames:
 *   - timestamp_ms: 0
 *     skeletons:
 *       - ShoulderLeft: {x: -0.18, y: 0.42, z: 2.10}
 *         KneeLeft: {x: -0.10, y: -0.35, z: 2.05, state: Inferred}
 * @endcode
 * Joints missing from a skeleton stay NOT_TRACKED; "state" defaults to Tracked.
 */

#ifndef POSECHECK_SKELETON_SNAPSHOT_READER_HPP
#define POSECHECK_SKELETON_SNAPSHOT_READER_HPP

#include "posecheck/skeleton/SkeletonTypes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace posecheck {
namespace skeleton {

/**
 * @brief One sensor frame of a recording
 */
struct RecordedFrame {
    int64_t timestamp_ms = 0;
    std::vector<JointSnapshot> skeletons;
};

/**
 * @brief Load a recording file
 * @throws core::FileException ERROR_FILE_NOT_FOUND if the file cannot be opened,
 *         ERROR_FILE_IO for malformed YAML or layout,
 *         ERROR_INVALID_PARAMETER for unknown joint or state names
 */
std::vector<RecordedFrame> loadRecording(const std::string& path);

/**
 * @brief Parse recording YAML text, same errors as loadRecording
 */
std::vector<RecordedFrame> parseRecording(const std::string& yamlText);

} // namespace skeleton
} // namespace posecheck

#endif // POSECHECK_SKELETON_SNAPSHOT_READER_HPP

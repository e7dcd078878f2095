/**
 * @file SnapshotReader.cpp
 * @brief YAML recording parser
 */

#include "posecheck/skeleton/SnapshotReader.hpp"
#include "posecheck/core/exception.h"
#include "posecheck/core/Logger.hpp"

#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iterator>

namespace posecheck {
namespace skeleton {

using core::FileException;
using core::ResultCode;

namespace {

float readCoordinate(const YAML::Node& jointNode, const char* axis, const std::string& jointName) {
    const YAML::Node value = jointNode[axis];
    if (!value) {
        POSECHECK_THROW_CODE(FileException, ResultCode::ERROR_FILE_IO,
                             "Joint '" + jointName + "' has no '" + axis + "' coordinate");
    }
    try {
        return value.as<float>();
    } catch (const YAML::Exception& e) {
        POSECHECK_THROW_CODE(FileException, ResultCode::ERROR_FILE_IO,
                             "Joint '" + jointName + "' coordinate '" + axis + "' is not a number: " + e.what());
    }
}

JointSnapshot parseSkeleton(const YAML::Node& skeletonNode, size_t frameIndex) {
    if (!skeletonNode.IsMap()) {
        POSECHECK_THROW_CODE(FileException, ResultCode::ERROR_FILE_IO,
                             "Skeleton in frame " + std::to_string(frameIndex) + " is not a map of joints");
    }

    JointSnapshot snapshot;
    for (const auto& entry : skeletonNode) {
        const std::string name = entry.first.as<std::string>();
        JointType type;
        if (!jointTypeFromString(name, type)) {
            POSECHECK_THROW_CODE(FileException, ResultCode::ERROR_INVALID_PARAMETER,
                                 "Unknown joint '" + name + "' in frame " + std::to_string(frameIndex));
        }

        const YAML::Node& jointNode = entry.second;
        if (!jointNode.IsMap()) {
            POSECHECK_THROW_CODE(FileException, ResultCode::ERROR_FILE_IO,
                                 "Joint '" + name + "' in frame " + std::to_string(frameIndex) + " is not a map");
        }

        core::Point3f position(readCoordinate(jointNode, "x", name),
                               readCoordinate(jointNode, "y", name),
                               readCoordinate(jointNode, "z", name));

        TrackingState state = TrackingState::TRACKED;
        const YAML::Node stateNode = jointNode["state"];
        if (stateNode && !trackingStateFromString(stateNode.as<std::string>(), state)) {
            POSECHECK_THROW_CODE(FileException, ResultCode::ERROR_INVALID_PARAMETER,
                                 "Unknown tracking state '" + stateNode.as<std::string>() +
                                 "' for joint '" + name + "'");
        }

        snapshot.setJoint(type, position, state);
    }
    return snapshot;
}

std::vector<RecordedFrame> parseDocument(const YAML::Node& root) {
    const YAML::Node framesNode = root["frames"];
    if (!framesNode || !framesNode.IsSequence()) {
        POSECHECK_THROW_CODE(FileException, ResultCode::ERROR_FILE_IO,
                             "Recording has no 'frames' sequence");
    }

    std::vector<RecordedFrame> frames;
    frames.reserve(framesNode.size());

    for (size_t i = 0; i < framesNode.size(); ++i) {
        const YAML::Node frameNode = framesNode[i];
        RecordedFrame frame;

        const YAML::Node timestampNode = frameNode["timestamp_ms"];
        frame.timestamp_ms = timestampNode ? timestampNode.as<int64_t>() : static_cast<int64_t>(i);

        const YAML::Node skeletonsNode = frameNode["skeletons"];
        if (skeletonsNode) {
            if (!skeletonsNode.IsSequence()) {
                POSECHECK_THROW_CODE(FileException, ResultCode::ERROR_FILE_IO,
                                     "'skeletons' of frame " + std::to_string(i) + " is not a sequence");
            }
            for (const auto& skeletonNode : skeletonsNode) {
                frame.skeletons.push_back(parseSkeleton(skeletonNode, i));
            }
        }

        frames.push_back(std::move(frame));
    }
    return frames;
}

std::vector<RecordedFrame> parseWithYamlErrors(const std::string& yamlText, const std::string& source) {
    try {
        return parseDocument(YAML::Load(yamlText));
    } catch (const YAML::Exception& e) {
        POSECHECK_THROW_CODE(FileException, ResultCode::ERROR_FILE_IO,
                             "Malformed recording " + source + ": " + e.what());
    }
}

} // namespace

std::vector<RecordedFrame> loadRecording(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        POSECHECK_THROW_CODE(FileException, ResultCode::ERROR_FILE_NOT_FOUND,
                             "Cannot open recording " + path);
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    std::vector<RecordedFrame> frames = parseWithYamlErrors(text, path);
    LOG_INFO("Loaded " + std::to_string(frames.size()) + " frames from " + path);
    return frames;
}

std::vector<RecordedFrame> parseRecording(const std::string& yamlText) {
    return parseWithYamlErrors(yamlText, "<text>");
}

} // namespace skeleton
} // namespace posecheck

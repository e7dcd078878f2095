/**
 * @file test_snapshot_reader.cpp
 * @brief Unit tests for YAML skeleton recordings
 */

#include <gtest/gtest.h>
#include <posecheck/skeleton/SnapshotReader.hpp>
#include <posecheck/core/Logger.hpp>
#include <posecheck/core/exception.h>

#include <cstdio>
#include <fstream>
#include <string>

using namespace posecheck;
using namespace posecheck::skeleton;

namespace {

const char* kTwoFrameRecording =
    "frames:\n"
    "  - timestamp_ms: 1000\n"
    "    skeletons:\n"
    "      - ShoulderLeft: {x: -0.2, y: -1.0, z: 2.0}\n"
    "        ElbowLeft: {x: -0.45, y: -1.0, z: 2.0, state: Inferred}\n"
    "        KneeLeft: {x: -0.1, y: -1.4, z: 2.0}\n"
    "      - Head: {x: 0.0, y: 0.5, z: 2.5, state: Tracked}\n"
    "  - timestamp_ms: 1033\n"
    "    skeletons: []\n";

core::ResultCode parseErrorCode(const std::string& text) {
    try {
        parseRecording(text);
    } catch (const core::FileException& e) {
        return e.getResultCode();
    }
    return core::ResultCode::SUCCESS;
}

} // namespace

class SnapshotReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::CRITICAL);
    }
};

TEST_F(SnapshotReaderTest, ParsesFramesAndSkeletons) {
    std::vector<RecordedFrame> frames = parseRecording(kTwoFrameRecording);
    ASSERT_EQ(frames.size(), 2u);

    EXPECT_EQ(frames[0].timestamp_ms, 1000);
    ASSERT_EQ(frames[0].skeletons.size(), 2u);
    EXPECT_EQ(frames[1].timestamp_ms, 1033);
    EXPECT_TRUE(frames[1].skeletons.empty());

    const JointSnapshot& first = frames[0].skeletons[0];
    EXPECT_FLOAT_EQ(first[JointType::SHOULDER_LEFT].position.x, -0.2f);
    EXPECT_FLOAT_EQ(first[JointType::SHOULDER_LEFT].position.y, -1.0f);
    EXPECT_FLOAT_EQ(first[JointType::SHOULDER_LEFT].position.z, 2.0f);
    EXPECT_EQ(first[JointType::SHOULDER_LEFT].tracking_state, TrackingState::TRACKED);
    EXPECT_EQ(first[JointType::ELBOW_LEFT].tracking_state, TrackingState::INFERRED);
    EXPECT_EQ(first[JointType::KNEE_LEFT].type, JointType::KNEE_LEFT);

    EXPECT_EQ(frames[0].skeletons[1][JointType::HEAD].tracking_state, TrackingState::TRACKED);
}

TEST_F(SnapshotReaderTest, UnlistedJointsAreNotTracked) {
    std::vector<RecordedFrame> frames = parseRecording(kTwoFrameRecording);
    const JointSnapshot& first = frames[0].skeletons[0];

    const Joint& wrist = first[JointType::WRIST_RIGHT];
    EXPECT_EQ(wrist.tracking_state, TrackingState::NOT_TRACKED);
    EXPECT_FLOAT_EQ(wrist.position.x, 0.0f);
    EXPECT_FALSE(first.hasPositions({JointType::SHOULDER_LEFT, JointType::WRIST_RIGHT}));
    EXPECT_TRUE(first.hasPositions({JointType::SHOULDER_LEFT, JointType::ELBOW_LEFT}));
}

TEST_F(SnapshotReaderTest, MissingTimestampUsesFrameIndex) {
    std::vector<RecordedFrame> frames = parseRecording(
        "frames:\n"
        "  - skeletons: []\n"
        "  - skeletons: []\n");
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].timestamp_ms, 0);
    EXPECT_EQ(frames[1].timestamp_ms, 1);
}

TEST_F(SnapshotReaderTest, UnknownNamesAreInvalidParameters) {
    EXPECT_EQ(parseErrorCode(
                  "frames:\n"
                  "  - skeletons:\n"
                  "      - Tail: {x: 0, y: 0, z: 0}\n"),
              core::ResultCode::ERROR_INVALID_PARAMETER);
    EXPECT_EQ(parseErrorCode(
                  "frames:\n"
                  "  - skeletons:\n"
                  "      - Head: {x: 0, y: 0, z: 0, state: Guessed}\n"),
              core::ResultCode::ERROR_INVALID_PARAMETER);
}

TEST_F(SnapshotReaderTest, StructuralErrorsAreIoErrors) {
    EXPECT_EQ(parseErrorCode("skeletons: []\n"), core::ResultCode::ERROR_FILE_IO);
    EXPECT_EQ(parseErrorCode("frames: [unterminated\n"), core::ResultCode::ERROR_FILE_IO);
    EXPECT_EQ(parseErrorCode(
                  "frames:\n"
                  "  - skeletons:\n"
                  "      - Head: {x: 0, y: 0}\n"),
              core::ResultCode::ERROR_FILE_IO);
    EXPECT_EQ(parseErrorCode(
                  "frames:\n"
                  "  - skeletons:\n"
                  "      - Head: {x: 0, y: up, z: 1}\n"),
              core::ResultCode::ERROR_FILE_IO);
}

TEST_F(SnapshotReaderTest, MissingFileIsNotFound) {
    try {
        loadRecording("/nonexistent/posecheck/session.yaml");
        FAIL() << "loadRecording() did not throw";
    } catch (const core::FileException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_FILE_NOT_FOUND);
        EXPECT_NE(std::string(e.what()).find("[ERROR_FILE_NOT_FOUND]"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find(" at SnapshotReader.cpp:"), std::string::npos);
    }
}

TEST_F(SnapshotReaderTest, LoadsRecordingFromFile) {
    const std::string path = ::testing::TempDir() + "posecheck_recording_test.yaml";
    {
        std::ofstream out(path);
        out << kTwoFrameRecording;
    }

    std::vector<RecordedFrame> frames = loadRecording(path);
    std::remove(path.c_str());

    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].skeletons.size(), 2u);
}

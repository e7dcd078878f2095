/**
 * @file posture_replay_example.cpp
 * @brief Replays a recorded skeleton session through the posture classifier
 *
 * Reads a YAML recording (see SnapshotReader.hpp), classifies every skeleton
 * of every frame and prints the region codes with the overlay color each one
 * would be drawn in, followed by a per-region histogram.
 *
 * Usage: posture_replay_example <recording.yaml> [config.yaml] [--verbose]
 */

#include <posecheck/core/Configuration.hpp>
#include <posecheck/core/Logger.hpp>
#include <posecheck/core/exception.h>
#include <posecheck/overlay/OverlayStyle.hpp>
#include <posecheck/pose/ClassificationConfigLoader.hpp>
#include <posecheck/pose/FrameClassifier.hpp>
#include <posecheck/skeleton/SnapshotReader.hpp>

#include <iostream>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

using namespace posecheck;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <recording.yaml> [config.yaml] [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --verbose, -v            Log classifier decisions (TRACE level)" << std::endl;
    std::cout << "  --help, -h               Show this help message" << std::endl;
}

/**
 * @brief Apply the logging section of the configuration
 */
void configure_logging(const core::Configuration& configuration, bool verbose) {
    auto& logger = core::Logger::getInstance();

    core::LogLevel level = core::Logger::levelFromString(
        configuration.get<std::string>("logging.level", "INFO"));
    if (verbose) {
        level = core::LogLevel::TRACE;
    }

    const bool console = configuration.get<bool>("logging.console", true);
    const std::string file = configuration.get<std::string>("logging.file", "");
    const std::string directory = configuration.get<std::string>("logging.directory", "");

    if (!directory.empty()) {
        if (logger.initializeWithTimestamp(directory, level)) {
            logger.setConsoleOutput(console);
        } else {
            std::cerr << "WARNING: cannot create session log in " << directory
                      << ", logging to console only" << std::endl;
        }
    } else if (!logger.initialize(level, console, !file.empty(), file)) {
        std::cerr << "WARNING: cannot open log file " << file << ", logging to console only" << std::endl;
        logger.setConsoleOutput(true);
    }
}

void print_histogram(const std::string& title, const std::map<pose::RegionCode, int>& histogram) {
    std::cout << title << std::endl;
    for (const auto& entry : histogram) {
        std::cout << "  " << std::setw(10) << std::left
                  << pose::region_code_to_string(entry.first)
                  << ": " << entry.second << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string recording_path;
    std::string config_path;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (recording_path.empty()) {
            recording_path = arg;
        } else if (config_path.empty()) {
            config_path = arg;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (recording_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto& configuration = core::Configuration::getInstance();
    if (!config_path.empty() && !configuration.load(config_path)) {
        std::cerr << "ERROR: failed to load configuration " << config_path << std::endl;
        return 1;
    }
    configure_logging(configuration, verbose);

    const pose::ClassificationConfig classification_config = pose::loadClassificationConfig(configuration);
    const pose::FrameClassifier classifier(classification_config);

    std::vector<skeleton::RecordedFrame> frames;
    try {
        frames = skeleton::loadRecording(recording_path);
    } catch (const core::Exception& e) {
        LOG_ERROR(std::string("Failed to load recording: ") + e.what());
        return 1;
    }

    std::map<pose::RegionCode, int> arms_histogram;
    std::map<pose::RegionCode, int> leg_histogram;
    int skeleton_count = 0;

    for (size_t frame_index = 0; frame_index < frames.size(); ++frame_index) {
        const auto& frame = frames[frame_index];
        const auto results = classifier.classify(frame.skeletons);

        for (size_t s = 0; s < results.size(); ++s) {
            const pose::FrameClassification& result = results[s];
            std::cout << "frame " << frame_index << " (t=" << frame.timestamp_ms << " ms)"
                      << " skeleton " << s << ": arms="
                      << pose::region_code_to_string(result.arms_code)
                      << "(" << overlay::regionColorName(result.arms_code) << ")"
                      << " leg=" << pose::region_code_to_string(result.leg_code)
                      << "(" << overlay::regionColorName(result.leg_code) << ")" << std::endl;

            arms_histogram[result.arms_code]++;
            leg_histogram[result.leg_code]++;
            skeleton_count++;
        }
    }

    std::cout << "\n=======================================" << std::endl;
    std::cout << "Frames:    " << frames.size() << std::endl;
    std::cout << "Skeletons: " << skeleton_count << std::endl;
    std::cout << "=======================================" << std::endl;
    print_histogram("Arms:", arms_histogram);
    print_histogram("Leg:", leg_histogram);

    core::Logger::getInstance().flush();
    return 0;
}

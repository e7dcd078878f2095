#pragma once

#include "posecheck/core/Logger.hpp"
#include "posecheck/core/exception.h"

#include <yaml-cpp/yaml.h>
#include <string>
#include <mutex>

namespace posecheck {
namespace core {

/**
 * Configuration management class
 *
 * Holds one YAML document and gives thread-safe access to its values by
 * dotted key ("classification.target_leg_angle_deg" addresses the
 * target_leg_angle_deg entry of the classification map).
 */
class Configuration {
public:
    /**
     * Get singleton instance
     */
    static Configuration& getInstance();

    /**
     * Load configuration from a YAML file, replacing the current document
     * @return false if the file is missing or is not valid YAML
     */
    bool load(const std::string& filename);

    /**
     * Load configuration from YAML text, replacing the current document
     */
    bool loadFromString(const std::string& yamlText);

    /**
     * Reload the last file passed to load()
     */
    bool reload();

    /**
     * Clear all configuration
     */
    void clear();

    /**
     * Check if key exists and holds a non-null value
     */
    bool has(const std::string& key) const;

    /**
     * Get value, or defaultValue when the key is missing or has the wrong type
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Node node = lookup(key);
        if (!node.IsDefined() || node.IsNull()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception& e) {
            LOG_WARNING("Configuration: '" + key + "' has unexpected type (" + e.what() +
                        "), using default");
            return defaultValue;
        }
    }

    /**
     * Get value, throwing ConfigurationException when missing or mistyped
     */
    template<typename T>
    T require(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Node node = lookup(key);
        if (!node.IsDefined() || node.IsNull()) {
            POSECHECK_THROW(ConfigurationException, "Missing configuration key '" + key + "'");
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception& e) {
            POSECHECK_THROW(ConfigurationException,
                            "Configuration key '" + key + "' has unexpected type: " + e.what());
        }
    }

    /**
     * Get configuration filename (empty when loaded from a string)
     */
    std::string getFilename() const;

private:
    Configuration() = default;
    ~Configuration() = default;

    // Delete copy/move
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    // Caller holds mutex_
    YAML::Node lookup(const std::string& key) const;

    mutable std::mutex mutex_;
    YAML::Node root_;
    std::string currentFile_;
};

} // namespace core
} // namespace posecheck

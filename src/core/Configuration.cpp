#include "posecheck/core/Configuration.hpp"

#include <sstream>

namespace posecheck {
namespace core {

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::load(const std::string& filename) {
    YAML::Node loaded;
    try {
        loaded = YAML::LoadFile(filename);
    } catch (const YAML::BadFile&) {
        LOG_ERROR("Configuration: cannot open " + filename);
        return false;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Configuration: failed to parse " + filename + ": " + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_.reset(loaded);
    currentFile_ = filename;
    LOG_INFO("Configuration loaded from " + filename);
    return true;
}

bool Configuration::loadFromString(const std::string& yamlText) {
    YAML::Node loaded;
    try {
        loaded = YAML::Load(yamlText);
    } catch (const YAML::Exception& e) {
        LOG_ERROR(std::string("Configuration: failed to parse YAML text: ") + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_.reset(loaded);
    currentFile_.clear();
    return true;
}

bool Configuration::reload() {
    std::string filename = getFilename();
    if (filename.empty()) {
        LOG_WARNING("Configuration: reload requested but no file was loaded");
        return false;
    }
    return load(filename);
}

void Configuration::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    root_.reset(YAML::Node());
    currentFile_.clear();
}

bool Configuration::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    YAML::Node node = lookup(key);
    return node.IsDefined() && !node.IsNull();
}

std::string Configuration::getFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentFile_;
}

YAML::Node Configuration::lookup(const std::string& key) const {
    // Walk with reset(): assigning a Node would overwrite the referenced node
    YAML::Node current;
    current.reset(root_);

    std::istringstream parts(key);
    std::string part;
    while (std::getline(parts, part, '.')) {
        if (part.empty() || !current.IsMap()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        const YAML::Node& parent = current;
        YAML::Node next = parent[part];
        if (!next.IsDefined()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        current.reset(next);
    }
    return current;
}

} // namespace core
} // namespace posecheck

#pragma once
#include "wheel_config.hpp"
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

/**
 * @class ConfigLoader
 * @brief Reads the YAML configuration into an immutable WheelConfig value.
 *
 * Missing sections or keys keep their defaults. A missing file yields the
 * default configuration; a file that cannot be parsed throws std::runtime_error.
 */
class ConfigLoader {
public:
    static WheelConfig Load(const std::string& path);
    static WheelConfig FromString(const std::string& yaml_text);
    static WheelConfig FromNode(const YAML::Node& root);

    /// Resolves a dotted key path such as "postprocessing.min_confidence".
    template <typename T>
    static T GetValue(const YAML::Node& root, const std::string& key_path, const T& fallback);

private:
    static YAML::Node Find(const YAML::Node& root, const std::string& key_path);
};

template <typename T>
T ConfigLoader::GetValue(const YAML::Node& root, const std::string& key_path, const T& fallback) {
    YAML::Node node = Find(root, key_path);
    if (!node || !node.IsScalar()) return fallback;
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value for '" + key_path + "': " + e.what());
    }
}

#include "config_parser.hpp"
#include "logger.hpp"
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace webblock {

Config ConfigParser::loadFromFile(const std::string& filename) {
    try {
        // YAML::LoadFile throws YAML::BadFile when the file cannot be opened
        return fromNode(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error in " + filename + ": " + std::string(e.what()));
    }
}

Config ConfigParser::loadFromString(const std::string& yaml_content) {
    try {
        return fromNode(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    }
}

Config ConfigParser::loadOptional(const std::string& filename) {
    std::error_code ec;
    if (!std::filesystem::exists(filename, ec)) {
        Logger::debug("ConfigParser", "No configuration file at " + filename + ", using defaults");
        return Config{};
    }
    return loadFromFile(filename);
}

Config ConfigParser::fromNode(const YAML::Node& node) {
    // An empty document keeps every default
    Config config;
    if (!node.IsNull()) {
        // as<Config>() dispatches to YAML::convert<Config>::decode()
        config = node.as<Config>();
    }

    // Validation runs after decoding so every field is populated
    if (!config.isValid()) {
        throw std::runtime_error("Invalid configuration: " + config.getErrorMessage());
    }

    return config;
}

} // namespace webblock

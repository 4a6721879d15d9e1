/**
 * @file config_parser.hpp
 * @brief YAML configuration parsing for web-blocker
 * @author web-blocker Development Team
 * @date 2026
 *
 * This file contains the ConfigParser class responsible for reading YAML
 * configuration files into validated Config objects.
 */

#pragma once

#include "config.hpp"
#include <string>

namespace webblock {

/**
 * @class ConfigParser
 * @brief YAML configuration parser
 *
 * Loads configuration from files or strings using yaml-cpp and the
 * YAML::convert<Config> specialization, then validates the result.
 */
class ConfigParser {
public:
    /// Location used when no --config option is given
    static constexpr const char* kDefaultConfigPath = "/etc/web-blocker/config.yaml";

    /**
     * @brief Load configuration from a YAML file
     * @param filename Path to the YAML configuration file
     * @return Parsed and validated Config object
     * @throws std::runtime_error if the file cannot be read, is not valid
     *         YAML, or holds an invalid configuration
     */
    static Config loadFromFile(const std::string& filename);

    /**
     * @brief Load configuration from a YAML string
     * @param yaml_content YAML content as string
     * @return Parsed and validated Config object
     * @throws std::runtime_error if YAML is invalid or configuration is invalid
     */
    static Config loadFromString(const std::string& yaml_content);

    /**
     * @brief Load a configuration file that is allowed to be absent
     * @param filename Path to the YAML configuration file
     * @return Parsed configuration, or defaults if the file does not exist
     * @throws std::runtime_error under the same conditions as loadFromFile()
     */
    static Config loadOptional(const std::string& filename);

private:
    static Config fromNode(const YAML::Node& node);
};

} // namespace webblock

/**
 * @file config_parser.hpp
 * @brief YAML configuration parsing for portguard
 * @author portguard Development Team
 * @date 2024
 *
 * This file contains the ConfigParser class responsible for loading YAML
 * configuration files into validated Config objects.
 */

#pragma once

#include "config.hpp"
#include <string>

namespace portguard {

/**
 * @class ConfigParser
 * @brief YAML configuration parser and serializer
 *
 * Uses yaml-cpp with the template specializations declared in config.hpp.
 */
class ConfigParser {
public:
    /**
     * @brief Load configuration from a YAML file
     * @param filename Path to the YAML configuration file
     * @return Parsed and validated Configuration object
     * @throws std::runtime_error if the file cannot be read, is not valid
     *         YAML, or describes an invalid configuration
     */
    static Config loadFromFile(const std::string& filename);

    /**
     * @brief Load configuration from a YAML string
     * @param yaml_content YAML content as string
     * @return Parsed and validated Configuration object
     * @throws std::runtime_error if YAML is invalid or configuration is invalid
     */
    static Config loadFromString(const std::string& yaml_content);

    /**
     * @brief Render a configuration as YAML text
     * @param config Configuration object to render
     * @return YAML document that loadFromString() reads back
     */
    static std::string toYaml(const Config& config);

private:
    static Config decodeAndValidate(const YAML::Node& node);
};

} // namespace portguard

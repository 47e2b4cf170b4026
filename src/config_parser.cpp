#include "config_parser.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace portguard {

Config ConfigParser::loadFromFile(const std::string& filename) {
    try {
        // YAML::LoadFile throws YAML::BadFile when the file cannot be opened
        YAML::Node yamlNode = YAML::LoadFile(filename);
        return decodeAndValidate(yamlNode);
    } catch (const YAML::Exception& e) {
        // Syntax errors and type conversion failures carry line/column information
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    }
}

Config ConfigParser::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yamlNode = YAML::Load(yaml_content);
        return decodeAndValidate(yamlNode);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    }
}

std::string ConfigParser::toYaml(const Config& config) {
    YAML::Emitter emitter;
    emitter << YAML::convert<Config>::encode(config);
    return emitter.c_str();
}

Config ConfigParser::decodeAndValidate(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw std::runtime_error("Invalid configuration: top level must be a mapping with a 'block' list");
    }

    // Triggers YAML::convert<Config>::decode(), which recurses into every section
    Config config = node.as<Config>();

    // Validation runs after decoding so that every field is populated
    if (!config.isValid()) {
        throw std::runtime_error("Invalid configuration: " + config.getErrorMessage());
    }
    return config;
}

} // namespace portguard

#include "hostaddr/config.hpp"
#include <yaml-cpp/yaml.h>
#include <glog/logging.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace hostaddr {

QueryMode parse_query_mode(const std::string& value) {
    if (value == "one") return QueryMode::ONE;
    if (value == "all") return QueryMode::ALL;
    throw std::invalid_argument("Unknown query mode: " + value);
}

OutputFormat parse_output_format(const std::string& value) {
    if (value == "plain") return OutputFormat::PLAIN;
    if (value == "json") return OutputFormat::JSON;
    throw std::invalid_argument("Unknown output format: " + value);
}

Config Config::from_yaml(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse config YAML: " << e.what();
        throw std::runtime_error("Invalid config YAML: " + std::string(e.what()));
    }

    Config config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Invalid config YAML: top level must be a map");
    }

    try {
        if (root["mode"]) {
            config.mode = parse_query_mode(root["mode"].as<std::string>());
        }
        if (root["format"]) {
            config.format = parse_output_format(root["format"].as<std::string>());
        }
        if (root["bind"]) {
            config.bind_address = root["bind"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config YAML: " + std::string(e.what()));
    }

    return config;
}

Config Config::load_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_yaml(buffer.str());
}

} // namespace hostaddr

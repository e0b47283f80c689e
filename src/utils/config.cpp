#include "config.hpp"
#include "fairtoken/error.hpp"
#include <fstream>

namespace fairtoken::utils {

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError(ErrorCode::ConfigFileNotFound,
                                 "Failed to open config file: " + path);
    }

    Config config;
    try {
        file >> config.data_;
    } catch (const json::parse_error& e) {
        throw ConfigurationError(ErrorCode::ConfigParseFailed,
                                 "Failed to parse config file: " + std::string(e.what()));
    }
    if (!config.data_.is_object()) {
        throw ConfigurationError(ErrorCode::ConfigParseFailed,
                                 "Config file must contain a JSON object: " + path);
    }

    return config;
}

Config Config::load_from_json(const std::string& json_str) {
    Config config;
    try {
        config.data_ = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(ErrorCode::ConfigParseFailed,
                                 "Failed to parse JSON: " + std::string(e.what()));
    }
    if (!config.data_.is_object()) {
        throw ConfigurationError(ErrorCode::ConfigParseFailed,
                                 "Configuration must be a JSON object");
    }
    return config;
}

void Config::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError(ErrorCode::ConfigFileNotFound,
                                 "Failed to open file for writing: " + path);
    }

    file << data_.dump(2); // Pretty print with 2-space indent
}

} // namespace fairtoken::utils

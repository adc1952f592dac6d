// =============================================================================
// config.cpp - Manager configuration (JSON) and logging setup
// =============================================================================

#include "clamm/config.hpp"
#include "clamm/fees.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace clamm {

ManagerConfig ManagerConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

ManagerConfig ManagerConfig::from_json(std::string_view content) {
    ManagerConfig config;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content.begin(), content.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Invalid config JSON: expected an object");
    }

    try {
        if (j.contains("log_level")) config.log_level = j.at("log_level").get<std::string>();
        if (j.contains("log_pattern")) config.log_pattern = j.at("log_pattern").get<std::string>();
        if (j.contains("default_protocol_fee")) {
            config.default_protocol_fee = j.at("default_protocol_fee").get<uint32_t>();
        }
        if (j.contains("require_settlement")) {
            config.require_settlement = j.at("require_settlement").get<bool>();
        }
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    if (!protocol_fee::is_valid(config.default_protocol_fee)) {
        throw std::runtime_error("Invalid config value: default_protocol_fee " +
                                 std::to_string(config.default_protocol_fee));
    }
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        throw std::runtime_error("Invalid config value: log_level " + config.log_level);
    }

    return config;
}

std::string ManagerConfig::to_json() const {
    nlohmann::json j;
    j["log_level"] = log_level;
    j["log_pattern"] = log_pattern;
    j["default_protocol_fee"] = default_protocol_fee;
    j["require_settlement"] = require_settlement;
    return j.dump(2);
}

void init_logging(const ManagerConfig& config) {
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    if (!config.log_pattern.empty()) {
        spdlog::set_pattern(config.log_pattern);
    }
}

} // namespace clamm

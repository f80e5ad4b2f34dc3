// src/service_config.cpp
#include "service_config.hpp"

#include <fstream>
#include <stdexcept> // For std::runtime_error, std::invalid_argument

namespace fs = std::filesystem;

namespace PackageSync {
namespace Config {

void to_json(nlohmann::json& j, const ServiceConfig& config) {
    j = nlohmann::json{
        {"port", config.port},
        {"workspace_dir", config.workspaceDir.string()},
        {"remote_root", config.remoteRoot.string()},
        {"reader_threads", config.readerThreads}
    };
}

void from_json(const nlohmann::json& j, ServiceConfig& config) {
    if (!j.is_object()) {
        throw std::invalid_argument("Service configuration must be a JSON object");
    }
    ServiceConfig defaults;
    try {
        int port = j.value("port", static_cast<int>(defaults.port));
        if (port <= 0 || port > 65535) {
            throw std::invalid_argument("port out of range: " + std::to_string(port));
        }
        config.port = static_cast<uint16_t>(port);
        config.workspaceDir = j.value("workspace_dir", defaults.workspaceDir.string());
        config.remoteRoot = j.value("remote_root", defaults.remoteRoot.string());
        config.readerThreads = j.value("reader_threads", defaults.readerThreads);
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("Invalid service configuration: ") + e.what());
    }
    if (config.readerThreads == 0) {
        throw std::invalid_argument("reader_threads must be greater than zero");
    }
}

ServiceConfig ServiceConfig::fromJson(const nlohmann::json& j) {
    ServiceConfig config;
    j.get_to(config); // Uses the from_json helper function
    return config;
}

ServiceConfig ServiceConfig::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open configuration file: " + path.string());
    }

    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Error parsing configuration file " + path.string() + ": " + e.what());
    }
    return fromJson(j);
}

} // namespace Config
} // namespace PackageSync

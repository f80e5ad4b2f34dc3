// include/service_config.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace PackageSync {
namespace Config {

// Settings of the control service, read from an optional JSON file:
//   { "port": 8080, "workspace_dir": "...", "remote_root": "...", "reader_threads": 4 }
// Missing keys keep their defaults.
struct ServiceConfig {
    uint16_t port = 8080;
    std::filesystem::path workspaceDir = "package_sync_workspace"; // Default output dir for packages
    std::filesystem::path remoteRoot = "package_sync_remote";      // Root of the filesystem remote store
    size_t readerThreads = 4;

    static ServiceConfig fromJson(const nlohmann::json& j);
    static ServiceConfig load(const std::filesystem::path& path);
};

void to_json(nlohmann::json& j, const ServiceConfig& config);
void from_json(const nlohmann::json& j, ServiceConfig& config);

} // namespace Config
} // namespace PackageSync

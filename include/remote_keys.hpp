// include/remote_keys.hpp
#pragma once

#include <string>

namespace PackageSync
{
    namespace Remote
    {
        // Object key layout of a published package. Other tooling (the launcher
        // that downloads packages) reads these paths, so they must not change:
        //
        //   {buildType}/roleplayai_manifest.json             latest pointer for a track
        //   {buildType}/{version}/manifest.json              per-version manifest
        //   {buildType}/{version}/version.json               version descriptor
        //   {buildType}/{version}/chunks/{hash[0:2]}/{hash}  content-addressed chunk
        namespace Keys
        {
            extern const char *const LATEST_MANIFEST_NAME;
            extern const char *const VERSION_MANIFEST_NAME;
            extern const char *const VERSION_DESCRIPTOR_NAME;
            extern const char *const CHUNKS_DIR_NAME;

            std::string latestManifestKey(const std::string &build_type);
            std::string versionManifestKey(const std::string &build_type, const std::string &version);
            std::string versionDescriptorKey(const std::string &build_type, const std::string &version);

            // Throws std::invalid_argument for a hash too short to shard.
            std::string chunkKey(const std::string &build_type, const std::string &version, const std::string &hash);

            // Prefix under which every published version of a track lives.
            std::string versionsPrefix(const std::string &build_type);
        } // namespace Keys
    } // namespace Remote
} // namespace PackageSync

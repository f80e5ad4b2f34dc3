// src/remote_keys.cpp
#include "remote_keys.hpp"

#include <stdexcept>

namespace PackageSync
{
    namespace Remote
    {
        namespace Keys
        {
            const char *const LATEST_MANIFEST_NAME = "roleplayai_manifest.json";
            const char *const VERSION_MANIFEST_NAME = "manifest.json";
            const char *const VERSION_DESCRIPTOR_NAME = "version.json";
            const char *const CHUNKS_DIR_NAME = "chunks";

            std::string latestManifestKey(const std::string &build_type)
            {
                return build_type + "/" + LATEST_MANIFEST_NAME;
            }

            std::string versionManifestKey(const std::string &build_type, const std::string &version)
            {
                return build_type + "/" + version + "/" + VERSION_MANIFEST_NAME;
            }

            std::string versionDescriptorKey(const std::string &build_type, const std::string &version)
            {
                return build_type + "/" + version + "/" + VERSION_DESCRIPTOR_NAME;
            }

            std::string chunkKey(const std::string &build_type, const std::string &version, const std::string &hash)
            {
                if (hash.size() < 2)
                {
                    throw std::invalid_argument("Chunk hash too short for a remote key: '" + hash + "'");
                }
                return build_type + "/" + version + "/" + CHUNKS_DIR_NAME + "/" + hash.substr(0, 2) + "/" + hash;
            }

            std::string versionsPrefix(const std::string &build_type)
            {
                return build_type + "/";
            }
        } // namespace Keys
    } // namespace Remote
} // namespace PackageSync

// include/package_builder.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "chunk_config.hpp"
#include "manifest.hpp"
#include "progress.hpp"

namespace PackageSync
{
    namespace Package
    {

        struct PackageFilters
        {
            bool excludeDebugSymbols = true; // *.pdb
            bool excludeSaved = true;        // anything under a saved/ directory
        };

        struct PackageOptions
        {
            std::filesystem::path sourceDir;
            std::filesystem::path outputDir;
            std::string version;
            Manifest::BuildType buildType = Manifest::BuildType::Production;
            Config::ChunkConfig chunking;
            PackageFilters filters;
        };

        struct PackageStats
        {
            size_t filesProcessed = 0;
            size_t totalChunks = 0;
            size_t uniqueChunks = 0;
            uint64_t totalSize = 0;
            double deduplicationRatio = 1.0; // unique / total, 1.0 for an empty package
        };

        struct PackageResult
        {
            std::filesystem::path manifestPath;
            std::filesystem::path versionPath;
            std::filesystem::path chunksDir;
            Manifest::ChunkManifest manifest;
            PackageStats stats;
        };

        // Turns a build directory into a chunk-based package: every eligible file
        // is cut by the Gear chunker, its chunks land in outputDir/chunks and the
        // manifest plus version descriptor are written beside them.
        class PackageBuilder
        {
        public:
            // Filter on a slash-separated path relative to the source directory.
            static bool shouldIncludeFile(const std::string &relative_path, const PackageFilters &filters);

            // Output file name of the manifest, e.g. manifest_production_1.2.0.json
            static std::string manifestFileName(Manifest::BuildType build_type, const std::string &version);

            // Throws std::invalid_argument for a missing source directory or an
            // empty version, std::runtime_error when no file survives filtering
            // or any file cannot be read.
            static PackageResult build(const PackageOptions &options, const ProgressCallback &on_progress = nullptr);
        };

    } // namespace Package
} // namespace PackageSync

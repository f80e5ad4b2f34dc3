// src/package_builder.cpp
#include "package_builder.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream> // For logging
#include <stdexcept>
#include <unordered_set>
#include <vector>

#include "chunk_store.hpp"
#include "gear_chunker.hpp"

namespace fs = std::filesystem;

namespace PackageSync
{
    namespace Package
    {

        namespace
        {
            std::string toLower(std::string value)
            {
                std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                return value;
            }

            bool startsWith(const std::string &value, const std::string &prefix)
            {
                return value.compare(0, prefix.size(), prefix) == 0;
            }

            bool endsWith(const std::string &value, const std::string &suffix)
            {
                return value.size() >= suffix.size() &&
                       value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
            }

            // Launcher bookkeeping files that must never ship inside a package
            bool isReservedFile(const std::string &name)
            {
                static const std::unordered_set<std::string> reserved = {
                    "version.json", "manifest.json", "roleplayai_manifest.json", "roleplayai_launcher.exe",
                    "roleplayai.txt"};
                if (reserved.count(name) > 0)
                {
                    return true;
                }
                return startsWith(name, "manifest_") && (endsWith(name, ".txt") || endsWith(name, ".json"));
            }

            bool isUnder(const fs::path &path, const fs::path &dir)
            {
                auto rel = path.lexically_relative(dir);
                return !rel.empty() && *rel.begin() != "..";
            }
        } // namespace

        bool PackageBuilder::shouldIncludeFile(const std::string &relative_path, const PackageFilters &filters)
        {
            const std::string lowered = toLower(relative_path);
            const std::string name = toLower(fs::path(relative_path).filename().string());

            if (isReservedFile(name))
            {
                return false;
            }
            if (filters.excludeDebugSymbols && endsWith(name, ".pdb"))
            {
                return false;
            }
            if (filters.excludeSaved && (startsWith(lowered, "saved/") || lowered.find("/saved/") != std::string::npos))
            {
                return false;
            }
            return true;
        }

        std::string PackageBuilder::manifestFileName(Manifest::BuildType build_type, const std::string &version)
        {
            return "manifest_" + Manifest::toString(build_type) + "_" + version + ".json";
        }

        PackageResult PackageBuilder::build(const PackageOptions &options, const ProgressCallback &on_progress)
        {
            if (options.version.empty())
            {
                throw std::invalid_argument("Package version must not be empty");
            }
            if (!Manifest::isSafeVersion(options.version))
            {
                throw std::invalid_argument("Package version '" + options.version +
                                            "' must not contain '/', '\\' or \"..\"");
            }
            if (!fs::is_directory(options.sourceDir))
            {
                throw std::invalid_argument("Source directory not found: " + options.sourceDir.string());
            }

            ProgressReporter progress(on_progress);
            progress.report(0.0, "Scanning files...");

            const fs::path source_dir = fs::weakly_canonical(options.sourceDir);
            const fs::path output_dir = fs::weakly_canonical(options.outputDir);
            // Packaging in place only has to skip the chunk cache it creates
            const fs::path skip_dir =
                output_dir == source_dir ? output_dir / Config::ChunkConfig::CHUNKS_DIR_NAME : output_dir;

            // Sorted so the manifest lists files in a stable order
            std::vector<fs::path> files;
            for (const auto &entry : fs::recursive_directory_iterator(source_dir))
            {
                if (!entry.is_regular_file())
                {
                    continue;
                }
                const fs::path path = entry.path();
                if (isUnder(path, skip_dir))
                {
                    continue;
                }
                if (!shouldIncludeFile(path.lexically_relative(source_dir).generic_string(), options.filters))
                {
                    continue;
                }
                files.push_back(path);
            }
            std::sort(files.begin(), files.end());

            if (files.empty())
            {
                throw std::runtime_error("No files to process in " + source_dir.string());
            }

            std::cout << "Packaging " << files.size() << " files from " << source_dir << " as "
                      << Manifest::toString(options.buildType) << " " << options.version << std::endl;
            progress.report(5.0, "Found " + std::to_string(files.size()) + " files to process");

            PackageResult result;
            result.chunksDir = Config::ChunkConfig::ensureDirectoryExists(output_dir / Config::ChunkConfig::CHUNKS_DIR_NAME);
            Chunks::ChunkStore store(result.chunksDir, 1);

            Manifest::ChunkManifest &manifest = result.manifest;
            manifest.version = options.version;
            manifest.buildType = options.buildType;

            std::unordered_set<std::string> seen;
            for (size_t i = 0; i < files.size(); ++i)
            {
                const fs::path &path = files[i];
                const std::string filename = path.lexically_relative(source_dir).generic_string();

                std::ifstream ifs(path, std::ios::binary);
                if (!ifs.is_open())
                {
                    throw std::runtime_error("Failed to open input file: " + path.string());
                }

                Manifest::FileEntry entry;
                entry.filename = filename;

                Chunks::GearChunker chunker(ifs, options.chunking);
                Chunks::Chunk chunk;
                while (chunker.next(chunk))
                {
                    store.put(chunk.cid, chunk.data); // Deduplicated by the store
                    seen.insert(chunk.cid);
                    entry.chunks.push_back({chunk.cid, chunk.size(), chunk.offset, ""});
                }
                entry.totalSize = chunker.bytesConsumed();

                result.stats.totalChunks += entry.chunks.size();
                result.stats.totalSize += entry.totalSize;
                ++result.stats.filesProcessed;
                manifest.files.push_back(std::move(entry));

                progress.report(5.0 + (static_cast<double>(i + 1) / files.size()) * 85.0,
                                "Processed " + std::to_string(i + 1) + "/" + std::to_string(files.size()) + ": " +
                                    filename);
            }

            result.stats.uniqueChunks = seen.size();
            if (result.stats.totalChunks > 0)
            {
                result.stats.deduplicationRatio =
                    static_cast<double>(result.stats.uniqueChunks) / static_cast<double>(result.stats.totalChunks);
            }

            progress.report(90.0, "Writing manifest...");
            result.manifestPath = output_dir / manifestFileName(options.buildType, options.version);
            manifest.save(result.manifestPath);
            result.versionPath = output_dir / Config::ChunkConfig::VERSION_FILE_NAME;
            Manifest::saveVersionDescriptor(options.version, result.versionPath);

            std::cout << "Package written: " << result.stats.filesProcessed << " files, " << result.stats.totalChunks
                      << " chunks (" << result.stats.uniqueChunks << " unique)" << std::endl;
            progress.report(100.0, "Package complete! " + std::to_string(result.stats.uniqueChunks) + " unique chunks");
            return result;
        }

    } // namespace Package
} // namespace PackageSync

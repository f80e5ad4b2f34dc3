// src/chunk_config.cpp
#include "chunk_config.hpp"
#include <atomic>
#include <functional>
#include <iostream>  // For logging
#include <random>
#include <sstream>
#include <stdexcept> // For std::runtime_error, std::invalid_argument
#include <thread>

namespace fs = std::filesystem;

namespace PackageSync
{
    namespace Config
    {

        const std::string ChunkConfig::CHUNKS_DIR_NAME = "chunks";
        const std::string ChunkConfig::VERSION_FILE_NAME = "version.json";

        ChunkConfig::ChunkConfig()
            : ChunkConfig(DEFAULT_MIN_SIZE, DEFAULT_AVG_SIZE, DEFAULT_MAX_SIZE)
        {
        }

        ChunkConfig::ChunkConfig(size_t min_size, size_t avg_size, size_t max_size)
            : min_size(min_size), avg_size(avg_size), max_size(max_size)
        {
            if (min_size == 0)
            {
                throw std::invalid_argument("Minimum chunk size must be greater than zero.");
            }
            if (min_size > avg_size || avg_size > max_size)
            {
                throw std::invalid_argument("Chunk sizes must satisfy min <= avg <= max (got " +
                                            std::to_string(min_size) + ", " + std::to_string(avg_size) +
                                            ", " + std::to_string(max_size) + ").");
            }
            boundary_mask = calculateMask(avg_size);
        }

        uint64_t ChunkConfig::calculateMask(size_t avg_size)
        {
            // floor(log2(avg_size)) without going through floating point
            unsigned bits = 0;
            while ((static_cast<uint64_t>(avg_size) >> (bits + 1)) != 0)
            {
                ++bits;
            }
            return (uint64_t{1} << bits) - 1;
        }

        fs::path ChunkConfig::ensureDirectoryExists(const fs::path &dir_path, bool quiet)
        {
            try
            {
                if (!fs::exists(dir_path))
                {
                    if (fs::create_directories(dir_path))
                    {
                        if (!quiet)
                        {
                            std::cout << "Created directory: " << dir_path << std::endl;
                        }
                    }
                    else if (!fs::exists(dir_path))
                    {
                        // Another process may have created it in the meantime; only
                        // fail if it is still missing.
                        throw std::runtime_error("Failed to create directory: " + dir_path.string());
                    }
                }
                else if (!fs::is_directory(dir_path))
                {
                    throw std::runtime_error("Path exists but is not a directory: " + dir_path.string());
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw std::runtime_error("Filesystem error creating directory " + dir_path.string() + ": " + e.what());
            }
            return dir_path;
        }

        fs::path ChunkConfig::temporarySibling(const fs::path &target)
        {
            static const uint64_t process_token =
                (static_cast<uint64_t>(std::random_device{}()) << 32) ^ std::random_device{}();
            static std::atomic<uint64_t> counter{0};

            std::ostringstream name;
            name << target.filename().string() << ".tmp." << std::hex << process_token << '.'
                 << std::hash<std::thread::id>{}(std::this_thread::get_id()) << '.' << counter.fetch_add(1);
            return target.parent_path() / name.str();
        }

    } // namespace Config
} // namespace PackageSync

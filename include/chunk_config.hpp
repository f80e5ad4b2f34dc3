// include/chunk_config.hpp
#pragma once

#include <string>
#include <cstddef>    // For size_t
#include <cstdint>
#include <filesystem> // For std::filesystem::path

namespace PackageSync
{
    namespace Config
    {

        // Content-defined chunking bounds plus the directory names used by the
        // packaging pipeline.
        class ChunkConfig
        {
        public:
            // Defaults tuned for large binary game packages
            static constexpr size_t DEFAULT_MIN_SIZE = 5 * 1024 * 1024;  // 5MB
            static constexpr size_t DEFAULT_AVG_SIZE = 10 * 1024 * 1024; // 10MB
            static constexpr size_t DEFAULT_MAX_SIZE = 20 * 1024 * 1024; // 20MB

            // Names of the chunk cache directory and the version descriptor file
            static const std::string CHUNKS_DIR_NAME;
            static const std::string VERSION_FILE_NAME;

            ChunkConfig();

            // Throws std::invalid_argument unless 0 < min <= avg <= max
            ChunkConfig(size_t min_size, size_t avg_size, size_t max_size);

            size_t minSize() const { return min_size; }
            size_t avgSize() const { return avg_size; }
            size_t maxSize() const { return max_size; }

            // 2^floor(log2(avg)) - 1; hash & mask == 0 marks a candidate boundary
            uint64_t mask() const { return boundary_mask; }

            // Create the directory (and parents) if missing and return it.
            // Creation is logged unless quiet is set.
            static std::filesystem::path ensureDirectoryExists(const std::filesystem::path &dir_path,
                                                               bool quiet = false);

            // A fresh file name beside target, unique across threads and
            // processes, for write-then-rename commits.
            static std::filesystem::path temporarySibling(const std::filesystem::path &target);

        private:
            size_t min_size;
            size_t avg_size;
            size_t max_size;
            uint64_t boundary_mask;

            static uint64_t calculateMask(size_t avg_size);
        };

    } // namespace Config
} // namespace PackageSync

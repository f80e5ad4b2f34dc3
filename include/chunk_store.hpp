// include/chunk_store.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_set>
#include <vector>

#include "manifest.hpp"
#include "thread_pool.hpp"

namespace PackageSync {
namespace Chunks {

struct ReconstructProgress {
    size_t chunks_processed = 0;
    size_t total_chunks = 0;
    uint64_t bytes_written = 0;
    uint64_t total_bytes = 0;
};

// Content-addressed chunk cache on local disk.
//
// Chunks live at root/<first two hex chars>/<hash>. The store is append-only
// and safe to share between readers and writers: a write lands by rename and
// writing the same hash twice stores identical bytes.
class ChunkStore {
public:
    // Chunks read in parallel per reconstruction batch
    static constexpr size_t RECONSTRUCT_BATCH_SIZE = 50;
    // Reconstruction reports progress every this many chunks (and at the end)
    static constexpr size_t PROGRESS_INTERVAL = 100;

    explicit ChunkStore(std::filesystem::path root, size_t reader_threads = 4);

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    const std::filesystem::path& root() const { return root_dir; }

    // Full path of a chunk. Throws std::invalid_argument for a malformed hash.
    std::filesystem::path chunkPath(const std::string& hash) const;

    // Store bytes under hash. Returns true if newly written, false if the
    // chunk was already present (no-op).
    bool put(const std::string& hash, const std::vector<char>& bytes);

    // Read and verify a chunk. std::nullopt if it is not cached; throws
    // ChunkCorruptError if the bytes no longer hash to the requested name.
    std::optional<std::vector<char>> get(const std::string& hash) const;

    // Existence check without reading content.
    bool exists(const std::string& hash) const;

    // Write the chunks, in ascending offset order, to out. Chunks are read in
    // parallel batches but written strictly in order; they are not re-hashed
    // since they were verified on the way into the store. Throws if a chunk
    // is missing or the sink fails. Returns the number of bytes written.
    uint64_t reconstruct(std::vector<Manifest::ChunkRef> chunks, std::ostream& out,
                         const std::function<void(const ReconstructProgress&)>& on_progress = nullptr);

    // Same, into a file that is removed again if reconstruction fails.
    uint64_t reconstructToFile(std::vector<Manifest::ChunkRef> chunks, const std::filesystem::path& output_path,
                               const std::function<void(const ReconstructProgress&)>& on_progress = nullptr);

    // Delete cached chunks whose hash is not in keep. Returns how many were removed.
    size_t cleanup(const std::unordered_set<std::string>& keep);

private:
    std::filesystem::path root_dir;
    Concurrency::ThreadPool reader_pool;

    // Raw read with no digest check; nullopt if missing.
    std::optional<std::vector<char>> readChunkFile(const std::string& hash) const;
};

} // namespace Chunks
} // namespace PackageSync

// src/chunk_store.cpp
#include "chunk_store.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <future>
#include <iostream> // For logging
#include <stdexcept>
#include <system_error>

#include "chunk_config.hpp"
#include "cid_utility.hpp"
#include "errors.hpp"

namespace fs = std::filesystem;

namespace PackageSync
{
    namespace Chunks
    {

        ChunkStore::ChunkStore(fs::path root, size_t reader_threads)
            : root_dir(std::move(root)), reader_pool(reader_threads)
        {
            Config::ChunkConfig::ensureDirectoryExists(root_dir);
        }

        fs::path ChunkStore::chunkPath(const std::string &hash) const
        {
            if (!CID::CIDUtility::isValidCID(hash))
            {
                throw std::invalid_argument("Invalid chunk hash: '" + hash + "'");
            }
            // First two characters as a shard directory to bound per-directory fanout
            return root_dir / hash.substr(0, 2) / hash;
        }

        bool ChunkStore::put(const std::string &hash, const std::vector<char> &bytes)
        {
            fs::path chunk_path = chunkPath(hash);

            if (fs::exists(chunk_path))
            {
                // Chunk already exists (deduplication)
                return false;
            }

            Config::ChunkConfig::ensureDirectoryExists(chunk_path.parent_path(), true);

            // Write beside the final name and rename into place so a reader never
            // sees a partially written chunk. Every writer gets its own temp file.
            const fs::path temp_path = Config::ChunkConfig::temporarySibling(chunk_path);
            {
                std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
                if (!ofs.is_open())
                {
                    throw std::runtime_error("Failed to open file for writing chunk: " + temp_path.string());
                }
                ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
                if (!ofs.good())
                {
                    ofs.close();
                    std::error_code ignored;
                    fs::remove(temp_path, ignored);
                    throw std::runtime_error("Failed to write all data to chunk file: " + temp_path.string());
                }
            }

            std::error_code ec;
            fs::rename(temp_path, chunk_path, ec);
            if (ec)
            {
                const std::string reason = ec.message();
                std::error_code ignored;
                fs::remove(temp_path, ignored);
                if (fs::is_regular_file(chunk_path, ignored))
                {
                    // A concurrent writer committed the same content first
                    return false;
                }
                throw std::runtime_error("Failed to move chunk into place: " + chunk_path.string() + ": " + reason);
            }
            return true;
        }

        std::optional<std::vector<char>> ChunkStore::readChunkFile(const std::string &hash) const
        {
            fs::path chunk_path = chunkPath(hash);

            std::ifstream ifs(chunk_path, std::ios::binary | std::ios::ate);
            if (!ifs.is_open())
            {
                if (!fs::exists(chunk_path))
                {
                    return std::nullopt;
                }
                throw std::runtime_error("Failed to open chunk file for reading: " + chunk_path.string());
            }

            std::streamsize size = ifs.tellg();
            if (size == -1)
            {
                throw std::runtime_error("Failed to get size of chunk file: " + chunk_path.string());
            }
            ifs.seekg(0, std::ios::beg);

            std::vector<char> buffer(static_cast<size_t>(size));
            if (size > 0 && !ifs.read(buffer.data(), size))
            {
                throw std::runtime_error("Failed to read chunk data from file: " + chunk_path.string());
            }
            return buffer;
        }

        std::optional<std::vector<char>> ChunkStore::get(const std::string &hash) const
        {
            std::optional<std::vector<char>> data = readChunkFile(hash);
            if (!data)
            {
                return std::nullopt;
            }

            std::string actual = CID::CIDUtility::generateSHA256(*data);
            if (actual != hash)
            {
                throw ChunkCorruptError(hash, actual);
            }
            return data;
        }

        bool ChunkStore::exists(const std::string &hash) const
        {
            std::error_code ec;
            return fs::is_regular_file(chunkPath(hash), ec);
        }

        uint64_t ChunkStore::reconstruct(std::vector<Manifest::ChunkRef> chunks, std::ostream &out,
                                         const std::function<void(const ReconstructProgress &)> &on_progress)
        {
            std::stable_sort(chunks.begin(), chunks.end(),
                             [](const Manifest::ChunkRef &a, const Manifest::ChunkRef &b)
                             { return a.offset < b.offset; });

            ReconstructProgress progress;
            progress.total_chunks = chunks.size();
            for (const auto &chunk : chunks)
            {
                progress.total_bytes += chunk.size;
            }

            size_t index = 0;
            while (index < chunks.size())
            {
                const size_t batch_end = std::min(index + RECONSTRUCT_BATCH_SIZE, chunks.size());

                std::vector<std::future<std::optional<std::vector<char>>>> reads;
                reads.reserve(batch_end - index);
                for (size_t i = index; i < batch_end; ++i)
                {
                    const std::string hash = chunks[i].hash;
                    reads.push_back(reader_pool.enqueue([this, hash]()
                                                        { return readChunkFile(hash); }));
                }

                // Collect every future before acting on a failure so no task
                // still refers to this batch once we leave the loop.
                std::vector<std::optional<std::vector<char>>> batch;
                batch.reserve(reads.size());
                std::exception_ptr read_error;
                for (auto &read : reads)
                {
                    try
                    {
                        batch.push_back(read.get());
                    }
                    catch (const std::exception &)
                    {
                        if (!read_error)
                        {
                            read_error = std::current_exception();
                        }
                        batch.emplace_back();
                    }
                }
                if (read_error)
                {
                    std::rethrow_exception(read_error);
                }

                // Sequential writes keep byte order; the stream blocks while its buffer drains
                for (size_t i = 0; i < batch.size(); ++i)
                {
                    if (!batch[i])
                    {
                        throw std::runtime_error("Missing chunk: " + chunks[index + i].hash);
                    }
                    out.write(batch[i]->data(), static_cast<std::streamsize>(batch[i]->size()));
                    if (!out.good())
                    {
                        throw std::runtime_error("Failed to write chunk data during reconstruction.");
                    }
                    progress.bytes_written += batch[i]->size();
                }

                index = batch_end;
                progress.chunks_processed = index;

                if (on_progress && (index % PROGRESS_INTERVAL == 0 || index == chunks.size()))
                {
                    on_progress(progress);
                }
            }

            out.flush();
            if (!out.good())
            {
                throw std::runtime_error("Failed to flush reconstructed output.");
            }
            return progress.bytes_written;
        }

        uint64_t ChunkStore::reconstructToFile(std::vector<Manifest::ChunkRef> chunks, const fs::path &output_path,
                                               const std::function<void(const ReconstructProgress &)> &on_progress)
        {
            std::ofstream ofs(output_path, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw std::runtime_error("Failed to open output file for writing: " + output_path.string());
            }

            try
            {
                return reconstruct(std::move(chunks), ofs, on_progress);
            }
            catch (const std::exception &e)
            {
                std::cerr << "Error reconstructing '" << output_path.string() << "': " << e.what() << std::endl;
                ofs.close();
                // Clean up partially written file
                std::error_code ec;
                fs::remove(output_path, ec);
                throw;
            }
        }

        size_t ChunkStore::cleanup(const std::unordered_set<std::string> &keep)
        {
            size_t removed = 0;
            for (const auto &shard : fs::directory_iterator(root_dir))
            {
                if (!shard.is_directory())
                {
                    continue;
                }
                for (const auto &entry : fs::directory_iterator(shard.path()))
                {
                    const std::string name = entry.path().filename().string();
                    // In-flight temp files are not chunks
                    if (!entry.is_regular_file() || !CID::CIDUtility::isValidCID(name) || keep.count(name) > 0)
                    {
                        continue;
                    }
                    std::error_code ec;
                    if (fs::remove(entry.path(), ec))
                    {
                        ++removed;
                    }
                    else if (ec)
                    {
                        std::cerr << "Error deleting chunk file " << entry.path() << ": " << ec.message() << std::endl;
                    }
                }
            }
            if (removed > 0)
            {
                std::cout << "Removed " << removed << " unreferenced chunk(s) from " << root_dir << std::endl;
            }
            return removed;
        }

    } // namespace Chunks
} // namespace PackageSync

// src/gear_chunker.cpp
#include "gear_chunker.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept> // For std::runtime_error

namespace fs = std::filesystem;

namespace PackageSync
{
    namespace Chunks
    {

        namespace
        {
            // splitmix64; any fixed seed works as long as it never changes,
            // since the table decides where every boundary lands.
            std::array<uint64_t, 256> buildGearTable()
            {
                std::array<uint64_t, 256> table{};
                uint64_t state = 0;
                for (auto &entry : table)
                {
                    state += 0x9e3779b97f4a7c15ULL;
                    uint64_t z = state;
                    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
                    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
                    entry = z ^ (z >> 31);
                }
                return table;
            }
        } // namespace

        const std::array<uint64_t, 256> &GearChunker::gearTable()
        {
            static const std::array<uint64_t, 256> table = buildGearTable();
            return table;
        }

        GearChunker::GearChunker(std::istream &input, const Config::ChunkConfig &config)
            : input(input), config(config), read_buffer(READ_BUFFER_SIZE)
        {
        }

        bool GearChunker::fillBuffer()
        {
            if (exhausted)
            {
                return false;
            }
            input.read(read_buffer.data(), static_cast<std::streamsize>(read_buffer.size()));
            if (input.bad())
            {
                throw std::runtime_error("I/O error while reading chunker input at offset " +
                                         std::to_string(chunk_start));
            }
            read_pos = 0;
            read_len = static_cast<size_t>(input.gcount());
            if (read_len == 0)
            {
                exhausted = true;
                return false;
            }
            return true;
        }

        bool GearChunker::next(Chunk &out)
        {
            const size_t min_size = config.minSize();
            const size_t max_size = config.maxSize();
            const uint64_t mask = config.mask();

            std::vector<char> current;
            uint64_t hash = 0; // Reset for every chunk

            for (;;)
            {
                if (read_pos == read_len && !fillBuffer())
                {
                    break;
                }

                const size_t scan_start = read_pos;
                bool boundary = false;
                while (read_pos < read_len)
                {
                    hash = updateHash(hash, static_cast<unsigned char>(read_buffer[read_pos]));
                    ++read_pos;

                    const size_t length = current.size() + (read_pos - scan_start);
                    if (length >= max_size || (length >= min_size && (hash & mask) == 0))
                    {
                        boundary = true;
                        break;
                    }
                }
                current.insert(current.end(), read_buffer.begin() + scan_start, read_buffer.begin() + read_pos);

                if (boundary)
                {
                    break;
                }
            }

            if (current.empty())
            {
                return false;
            }

            // The tail of a stream becomes the final chunk whatever its size
            out = Chunk(std::move(current), chunk_start);
            chunk_start = out.end();
            return true;
        }

        std::vector<Chunk> GearChunker::chunkBuffer(const std::vector<char> &buffer,
                                                    const Config::ChunkConfig &config)
        {
            std::string bytes(buffer.begin(), buffer.end());
            std::istringstream iss(bytes, std::ios::binary);
            GearChunker chunker(iss, config);

            std::vector<Chunk> chunks;
            Chunk chunk;
            while (chunker.next(chunk))
            {
                chunks.push_back(std::move(chunk));
            }
            return chunks;
        }

        std::vector<Chunk> GearChunker::chunkFile(const fs::path &file_path,
                                                  const Config::ChunkConfig &config)
        {
            if (!fs::exists(file_path))
            {
                throw std::runtime_error("Input file not found: " + file_path.string());
            }

            std::ifstream ifs(file_path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw std::runtime_error("Failed to open input file: " + file_path.string());
            }

            GearChunker chunker(ifs, config);
            std::vector<Chunk> chunks;
            Chunk chunk;
            while (chunker.next(chunk))
            {
                chunks.push_back(std::move(chunk));
            }
            return chunks;
        }

    } // namespace Chunks
} // namespace PackageSync

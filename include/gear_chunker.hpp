// include/gear_chunker.hpp
#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <vector>

#include "chunk.hpp"
#include "chunk_config.hpp"

namespace PackageSync
{
    namespace Chunks
    {

        // Content-defined chunker driven by a Gear rolling hash.
        //
        // Boundaries depend only on the bytes near them, so inserting or
        // deleting data in the middle of a file only changes the chunks around
        // the edit. Chunks are produced lazily, one per call to next(), which
        // keeps at most one chunk (maxSize bytes) plus a read buffer in memory.
        class GearChunker
        {
        public:
            static constexpr size_t READ_BUFFER_SIZE = 64 * 1024;

            // The stream must outlive the chunker.
            GearChunker(std::istream &input, const Config::ChunkConfig &config);

            // Produce the next chunk. Returns false once the stream is exhausted.
            // Throws std::runtime_error if reading the stream fails.
            bool next(Chunk &out);

            // Total bytes consumed from the stream so far
            uint64_t bytesConsumed() const { return chunk_start; }

            // The fixed 256-entry table of pseudo-random 64-bit values.
            static const std::array<uint64_t, 256> &gearTable();

            // One step of the rolling hash.
            static uint64_t updateHash(uint64_t hash, unsigned char byte)
            {
                return (hash << 1) + gearTable()[byte];
            }

            // Chunk an in-memory buffer.
            static std::vector<Chunk> chunkBuffer(const std::vector<char> &buffer,
                                                  const Config::ChunkConfig &config);

            // Chunk a whole file. Holds every chunk's bytes, so meant for
            // callers that need them all at once; streaming callers use next().
            static std::vector<Chunk> chunkFile(const std::filesystem::path &file_path,
                                                const Config::ChunkConfig &config);

        private:
            std::istream &input;
            Config::ChunkConfig config;
            std::vector<char> read_buffer;
            size_t read_pos = 0;
            size_t read_len = 0;
            uint64_t chunk_start = 0; // Offset of the next chunk's first byte
            bool exhausted = false;

            // Refill read_buffer from the stream; false at end of stream.
            bool fillBuffer();
        };

    } // namespace Chunks
} // namespace PackageSync

// include/chunk.hpp
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "cid_utility.hpp"

namespace PackageSync {
namespace Chunks {

// A materialized chunk as produced by the chunker: its bytes, its content
// address and where it sits in the file it was cut from.
class Chunk {
public:
    std::vector<char> data; // The actual content of the chunk
    std::string cid;        // The Content Identifier (SHA-256 hash)
    uint64_t offset = 0;    // Position of the first byte within the source file

    // Create a chunk from data and generate its CID
    Chunk(std::vector<char> chunk_data, uint64_t chunk_offset)
        : data(std::move(chunk_data)), offset(chunk_offset) {
        cid = CID::CIDUtility::generateSHA256(data);
    }

    // Default constructor for loading
    Chunk() = default;

    uint64_t size() const { return data.size(); }

    // Offset one past the last byte of this chunk within the source file
    uint64_t end() const { return offset + data.size(); }
};

} // namespace Chunks
} // namespace PackageSync

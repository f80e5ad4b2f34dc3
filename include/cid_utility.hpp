// include/cid_utility.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace PackageSync
{
    namespace CID
    {

        class CIDUtility
        {
        public:
            // Generates SHA-256 hash of data and returns it as a lower-case hex string.
            // This string serves as the chunk's content address.
            static std::string generateSHA256(const std::vector<char> &data_buffer);
            static std::string generateSHA256(const char *data, size_t size);

            // True for a non-empty string of lower-case hex digits at least two
            // characters long (the store shards on the first two).
            static bool isValidCID(const std::string &cid);
        };

    } // namespace CID
} // namespace PackageSync

// src/cid_utility.cpp
#include "cid_utility.hpp"
#include <iomanip>   // For std::hex, std::setw, std::setfill
#include <sstream>   // For std::stringstream
#include <stdexcept> // For std::runtime_error

// OpenSSL headers for SHA256
#include <openssl/sha.h>

namespace PackageSync
{
    namespace CID
    {

        std::string CIDUtility::generateSHA256(const std::vector<char> &data_buffer)
        {
            return generateSHA256(data_buffer.data(), data_buffer.size());
        }

        std::string CIDUtility::generateSHA256(const char *data, size_t size)
        {
            unsigned char hash[SHA256_DIGEST_LENGTH];
            SHA256_CTX sha256;

            if (!SHA256_Init(&sha256))
            {
                throw std::runtime_error("Failed to initialize SHA256 context.");
            }
            // An empty range still finalizes to the well-known empty digest
            if (size > 0 && !SHA256_Update(&sha256, data, size))
            {
                throw std::runtime_error("Failed to update SHA256 context with data.");
            }
            if (!SHA256_Final(hash, &sha256))
            {
                throw std::runtime_error("Failed to finalize SHA256 hash calculation.");
            }

            std::stringstream ss;
            for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
            }
            return ss.str();
        }

        bool CIDUtility::isValidCID(const std::string &cid)
        {
            if (cid.size() < 2)
            {
                return false;
            }
            for (char c : cid)
            {
                bool is_digit = c >= '0' && c <= '9';
                bool is_hex_letter = c >= 'a' && c <= 'f';
                if (!is_digit && !is_hex_letter)
                {
                    return false;
                }
            }
            return true;
        }

    } // namespace CID
} // namespace PackageSync

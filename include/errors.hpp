// include/errors.hpp
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace PackageSync
{

    // Malformed manifest or a manifest of the wrong type for the operation.
    // field() names the first offending field.
    class ManifestError : public std::runtime_error
    {
    public:
        ManifestError(std::string field, const std::string &message)
            : std::runtime_error(message), field_name(std::move(field)) {}

        const std::string &field() const { return field_name; }

    private:
        std::string field_name;
    };

    // Two manifests from different deployment tracks were compared.
    class BuildTypeMismatchError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // A cached chunk whose content no longer hashes to its name.
    class ChunkCorruptError : public std::runtime_error
    {
    public:
        ChunkCorruptError(std::string hash, const std::string &actual)
            : std::runtime_error("Chunk hash mismatch for " + hash + " (content hashes to " + actual + ")"),
              chunk_hash(std::move(hash)) {}

        const std::string &hash() const { return chunk_hash; }

    private:
        std::string chunk_hash;
    };

    // Transport-level failure talking to the object store.
    class RemoteStoreError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class ObjectNotFoundError : public RemoteStoreError
    {
    public:
        explicit ObjectNotFoundError(const std::string &key)
            : RemoteStoreError("Object not found: " + key), object_key(key) {}

        const std::string &key() const { return object_key; }

    private:
        std::string object_key;
    };

    // Fatal to an upload session: the manifest or version descriptor could not be published.
    class UploadError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Refused to move the latest pointer at an incomplete version.
    class PromotionError : public std::runtime_error
    {
    public:
        PromotionError(const std::string &message, size_t missing)
            : std::runtime_error(message), missing(missing) {}

        size_t missingCount() const { return missing; }

    private:
        size_t missing;
    };

} // namespace PackageSync

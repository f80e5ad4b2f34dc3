// include/delta_detector.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "manifest.hpp"

namespace PackageSync {
namespace Delta {

// Derived counts for reporting only.
struct DeltaStats {
    size_t totalFiles = 0;
    size_t newFilesCount = 0;
    size_t changedFilesCount = 0;
    size_t deletedFilesCount = 0;
    size_t chunksToUploadCount = 0;
    size_t totalChunksInNew = 0;
};

struct ManifestDelta {
    std::vector<Manifest::FileEntry> newFiles;
    std::vector<Manifest::FileEntry> changedFiles;
    // Reported only; chunks already uploaded are never removed remotely
    std::vector<Manifest::FileEntry> deletedFiles;

    // Hashes introduced by new files / by changed files that no version of
    // the old manifest already carries
    std::vector<std::string> newChunks;
    std::vector<std::string> changedChunks;

    // Union of the two above, in first-appearance order in the new manifest
    std::vector<std::string> chunksToUpload;
    // One reference per hash in chunksToUpload, same order
    std::vector<Manifest::ChunkRef> chunksToUploadDetails;

    DeltaStats stats;

    // Bytes that have to travel
    uint64_t uploadBytes() const;

    // newFiles followed by changedFiles
    std::vector<Manifest::FileEntry> filesToUpload() const;
};

// A file is changed iff its total size, chunk count or ordered chunk hash
// sequence differs. Timestamps and other metadata play no part.
bool hasFileChanged(const Manifest::FileEntry& old_file, const Manifest::FileEntry& new_file);

// Diff two chunk-based manifests of the same build type. Throws
// BuildTypeMismatchError when the tracks differ.
ManifestDelta detectDelta(const Manifest::ChunkManifest& old_manifest,
                          const Manifest::ChunkManifest& new_manifest);

// Parse (lenient) both documents first; a file-based manifest on either side
// is rejected with ManifestError.
ManifestDelta detectDelta(const std::string& old_manifest_text, const std::string& new_manifest_text);

} // namespace Delta
} // namespace PackageSync

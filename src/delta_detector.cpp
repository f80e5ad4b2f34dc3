// src/delta_detector.cpp
#include "delta_detector.hpp"

#include <unordered_map>
#include <unordered_set>

#include "errors.hpp"

namespace PackageSync {
namespace Delta {

using Manifest::ChunkManifest;
using Manifest::ChunkRef;
using Manifest::FileEntry;

uint64_t ManifestDelta::uploadBytes() const {
    uint64_t total = 0;
    for (const auto& chunk : chunksToUploadDetails) {
        total += chunk.size;
    }
    return total;
}

std::vector<FileEntry> ManifestDelta::filesToUpload() const {
    std::vector<FileEntry> files(newFiles);
    files.insert(files.end(), changedFiles.begin(), changedFiles.end());
    return files;
}

bool hasFileChanged(const FileEntry& old_file, const FileEntry& new_file) {
    if (old_file.totalSize != new_file.totalSize) {
        return true;
    }
    if (old_file.chunks.size() != new_file.chunks.size()) {
        return true;
    }
    for (size_t i = 0; i < old_file.chunks.size(); ++i) {
        if (old_file.chunks[i].hash != new_file.chunks[i].hash) {
            return true;
        }
    }
    return false;
}

ManifestDelta detectDelta(const ChunkManifest& old_manifest, const ChunkManifest& new_manifest) {
    if (old_manifest.buildType != new_manifest.buildType) {
        throw BuildTypeMismatchError("Cannot compare manifests: old manifest is " +
                                     Manifest::toString(old_manifest.buildType) + " but new manifest is " +
                                     Manifest::toString(new_manifest.buildType) +
                                     ". Delta comparison only works within the same build type.");
    }

    std::unordered_map<std::string, const FileEntry*> old_files;
    for (const auto& file : old_manifest.files) {
        old_files.emplace(file.filename, &file);
    }
    std::unordered_set<std::string> new_filenames;
    for (const auto& file : new_manifest.files) {
        new_filenames.insert(file.filename);
    }

    ManifestDelta delta;
    for (const auto& file : new_manifest.files) {
        auto it = old_files.find(file.filename);
        if (it == old_files.end()) {
            delta.newFiles.push_back(file);
        } else if (hasFileChanged(*it->second, file)) {
            delta.changedFiles.push_back(file);
        }
    }
    for (const auto& file : old_manifest.files) {
        if (new_filenames.count(file.filename) == 0) {
            delta.deletedFiles.push_back(file);
        }
    }

    // Anything the old version already references is on the remote side,
    // whichever file it belonged to
    std::unordered_set<std::string> old_chunks;
    for (const auto& file : old_manifest.files) {
        for (const auto& chunk : file.chunks) {
            old_chunks.insert(chunk.hash);
        }
    }

    std::unordered_set<std::string> from_new_files;
    std::unordered_set<std::string> from_changed_files;
    for (const auto& file : delta.newFiles) {
        for (const auto& chunk : file.chunks) {
            if (old_chunks.count(chunk.hash) == 0 && from_new_files.insert(chunk.hash).second) {
                delta.newChunks.push_back(chunk.hash);
            }
        }
    }
    for (const auto& file : delta.changedFiles) {
        for (const auto& chunk : file.chunks) {
            if (old_chunks.count(chunk.hash) == 0 && from_changed_files.insert(chunk.hash).second) {
                delta.changedChunks.push_back(chunk.hash);
            }
        }
    }

    // Walk the new manifest once more so the worklist follows file order
    std::unordered_set<std::string> queued;
    size_t total_chunks = 0;
    for (const auto& file : new_manifest.files) {
        total_chunks += file.chunks.size();
        for (const auto& chunk : file.chunks) {
            bool wanted = from_new_files.count(chunk.hash) > 0 || from_changed_files.count(chunk.hash) > 0;
            if (wanted && queued.insert(chunk.hash).second) {
                delta.chunksToUpload.push_back(chunk.hash);
                delta.chunksToUploadDetails.push_back(chunk);
            }
        }
    }

    delta.stats.totalFiles = new_manifest.files.size();
    delta.stats.newFilesCount = delta.newFiles.size();
    delta.stats.changedFilesCount = delta.changedFiles.size();
    delta.stats.deletedFilesCount = delta.deletedFiles.size();
    delta.stats.chunksToUploadCount = delta.chunksToUpload.size();
    delta.stats.totalChunksInNew = total_chunks;
    return delta;
}

ManifestDelta detectDelta(const std::string& old_manifest_text, const std::string& new_manifest_text) {
    ChunkManifest old_manifest = Manifest::requireChunkBased(
        Manifest::parseManifest(old_manifest_text, Manifest::ValidationMode::Lenient), "delta detection");
    ChunkManifest new_manifest = Manifest::requireChunkBased(
        Manifest::parseManifest(new_manifest_text, Manifest::ValidationMode::Lenient), "delta detection");
    return detectDelta(old_manifest, new_manifest);
}

} // namespace Delta
} // namespace PackageSync

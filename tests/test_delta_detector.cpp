// tests/test_delta_detector.cpp
#include "delta_detector.hpp"

#include <gtest/gtest.h>

#include "errors.hpp"

namespace PackageSync {
namespace Delta {
namespace {

using Manifest::BuildType;
using Manifest::ChunkManifest;
using Manifest::ChunkRef;
using Manifest::FileEntry;

FileEntry file(const std::string& name, const std::vector<std::string>& hashes, uint64_t chunk_size = 10) {
    FileEntry entry;
    entry.filename = name;
    uint64_t offset = 0;
    for (const auto& hash : hashes) {
        entry.chunks.push_back({hash, chunk_size, offset, ""});
        offset += chunk_size;
    }
    entry.totalSize = offset;
    return entry;
}

ChunkManifest manifest(const std::string& version, std::vector<FileEntry> files,
                       BuildType build_type = BuildType::Production) {
    ChunkManifest m;
    m.version = version;
    m.buildType = build_type;
    m.files = std::move(files);
    return m;
}

std::vector<std::string> names(const std::vector<FileEntry>& files) {
    std::vector<std::string> out;
    for (const auto& f : files) {
        out.push_back(f.filename);
    }
    return out;
}

TEST(DeltaDetectorTest, NewAndChangedFilesContributeOnlyUnseenChunks) {
    ChunkManifest old_manifest = manifest("1.0.0", {file("a.bin", {"h1", "h2"})});
    ChunkManifest new_manifest = manifest("1.1.0", {file("a.bin", {"h1", "h3"}), file("b.bin", {"h4"})});

    ManifestDelta delta = detectDelta(old_manifest, new_manifest);

    EXPECT_EQ(names(delta.newFiles), std::vector<std::string>({"b.bin"}));
    EXPECT_EQ(names(delta.changedFiles), std::vector<std::string>({"a.bin"}));
    EXPECT_TRUE(delta.deletedFiles.empty());
    EXPECT_EQ(delta.chunksToUpload, std::vector<std::string>({"h3", "h4"}));
    EXPECT_EQ(delta.newChunks, std::vector<std::string>({"h4"}));
    EXPECT_EQ(delta.changedChunks, std::vector<std::string>({"h3"}));
    ASSERT_EQ(delta.chunksToUploadDetails.size(), 2u);
    EXPECT_EQ(delta.chunksToUploadDetails[0].offset, 10u);
    EXPECT_EQ(delta.uploadBytes(), 20u);

    EXPECT_EQ(delta.stats.totalFiles, 2u);
    EXPECT_EQ(delta.stats.newFilesCount, 1u);
    EXPECT_EQ(delta.stats.changedFilesCount, 1u);
    EXPECT_EQ(delta.stats.deletedFilesCount, 0u);
    EXPECT_EQ(delta.stats.chunksToUploadCount, 2u);
    EXPECT_EQ(delta.stats.totalChunksInNew, 3u);
    EXPECT_EQ(names(delta.filesToUpload()), std::vector<std::string>({"b.bin", "a.bin"}));
}

TEST(DeltaDetectorTest, IdenticalManifestsNeedNothing) {
    ChunkManifest m = manifest("1.0.0", {file("a.bin", {"h1", "h2"}), file("b.bin", {"h3"})});
    ManifestDelta delta = detectDelta(m, m);
    EXPECT_TRUE(delta.newFiles.empty());
    EXPECT_TRUE(delta.changedFiles.empty());
    EXPECT_TRUE(delta.chunksToUpload.empty());
    EXPECT_EQ(delta.uploadBytes(), 0u);
}

TEST(DeltaDetectorTest, DeletedFilesAreReportedOnly) {
    ChunkManifest old_manifest = manifest("1.0.0", {file("a.bin", {"h1"}), file("gone.bin", {"h2"})});
    ChunkManifest new_manifest = manifest("1.1.0", {file("a.bin", {"h1"})});

    ManifestDelta delta = detectDelta(old_manifest, new_manifest);
    EXPECT_EQ(names(delta.deletedFiles), std::vector<std::string>({"gone.bin"}));
    EXPECT_TRUE(delta.chunksToUpload.empty());
    EXPECT_EQ(delta.stats.deletedFilesCount, 1u);
}

TEST(DeltaDetectorTest, ChunksMovedBetweenFilesAreNotUploadedAgain) {
    ChunkManifest old_manifest = manifest("1.0.0", {file("a.bin", {"h1", "h2"})});
    // b.bin is new but its content already exists remotely as part of a.bin
    ChunkManifest new_manifest = manifest("1.1.0", {file("a.bin", {"h1", "h2"}), file("b.bin", {"h2", "h5"})});

    ManifestDelta delta = detectDelta(old_manifest, new_manifest);
    EXPECT_EQ(names(delta.newFiles), std::vector<std::string>({"b.bin"}));
    EXPECT_EQ(delta.chunksToUpload, std::vector<std::string>({"h5"}));
}

TEST(DeltaDetectorTest, SharedNewChunkIsQueuedOnce) {
    ChunkManifest old_manifest = manifest("1.0.0", {file("a.bin", {"h1"})});
    ChunkManifest new_manifest =
        manifest("1.1.0", {file("a.bin", {"h6", "h1"}), file("b.bin", {"h6"}), file("c.bin", {"h6", "h7"})});

    ManifestDelta delta = detectDelta(old_manifest, new_manifest);
    EXPECT_EQ(delta.chunksToUpload, std::vector<std::string>({"h6", "h7"}));
    EXPECT_EQ(delta.chunksToUploadDetails.size(), 2u);
}

TEST(DeltaDetectorTest, SizeChangeAloneMarksFileChanged) {
    FileEntry before = file("a.bin", {"h1"});
    FileEntry after = before;
    after.totalSize += 1;
    EXPECT_TRUE(hasFileChanged(before, after));
    EXPECT_FALSE(hasFileChanged(before, before));

    FileEntry reordered = file("a.bin", {"h2", "h1"});
    EXPECT_TRUE(hasFileChanged(file("a.bin", {"h1", "h2"}), reordered));
}

TEST(DeltaDetectorTest, RefusesToCompareAcrossBuildTypes) {
    ChunkManifest production = manifest("1.0.0", {file("a.bin", {"h1"})}, BuildType::Production);
    ChunkManifest staging = manifest("1.0.1", {file("a.bin", {"h2"})}, BuildType::Staging);
    EXPECT_THROW(detectDelta(production, staging), BuildTypeMismatchError);
}

TEST(DeltaDetectorTest, TextOverloadRejectsLegacyManifests) {
    const std::string chunked = manifest("1.0.0", {file("a.bin", {"ab"})}).serialize();
    const std::string legacy = R"({"version": "0.9", "manifestType": "file-based",
        "files": [{"path": "a.bin", "url": "https://cdn/a.bin"}]})";

    EXPECT_NO_THROW(detectDelta(chunked, chunked));
    EXPECT_THROW(detectDelta(legacy, chunked), ManifestError);
    EXPECT_THROW(detectDelta(chunked, legacy), ManifestError);
}

} // namespace
} // namespace Delta
} // namespace PackageSync

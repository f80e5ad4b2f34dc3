// tests/test_package_builder.cpp
#include "package_builder.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

#include "chunk_store.hpp"
#include "test_helpers.hpp"

namespace PackageSync {
namespace Package {
namespace {

namespace fs = std::filesystem;
using Testing::randomBytes;
using Testing::writeFile;

TEST(PackageFilterTest, SkipsLauncherBookkeepingFiles) {
    PackageFilters filters;
    EXPECT_FALSE(PackageBuilder::shouldIncludeFile("version.json", filters));
    EXPECT_FALSE(PackageBuilder::shouldIncludeFile("manifest_production_1.0.json", filters));
    EXPECT_FALSE(PackageBuilder::shouldIncludeFile("manifest_1.0.txt", filters));
    EXPECT_FALSE(PackageBuilder::shouldIncludeFile("manifest.json", filters));
    EXPECT_FALSE(PackageBuilder::shouldIncludeFile("roleplayai_manifest.json", filters));
    EXPECT_FALSE(PackageBuilder::shouldIncludeFile("roleplayai_launcher.exe", filters));
    EXPECT_FALSE(PackageBuilder::shouldIncludeFile("roleplayai.txt", filters));
    EXPECT_TRUE(PackageBuilder::shouldIncludeFile("Game/Content/version.json.bak", filters));
    EXPECT_TRUE(PackageBuilder::shouldIncludeFile("Game/Binaries/Game.exe", filters));
}

TEST(PackageFilterTest, OptionalFilters) {
    PackageFilters defaults;
    EXPECT_FALSE(PackageBuilder::shouldIncludeFile("Game/Binaries/Game.pdb", defaults));
    EXPECT_FALSE(PackageBuilder::shouldIncludeFile("Game/Binaries/Game.PDB", defaults));
    EXPECT_FALSE(PackageBuilder::shouldIncludeFile("Game/Saved/Config/user.ini", defaults));
    EXPECT_FALSE(PackageBuilder::shouldIncludeFile("saved/slot1.sav", defaults));
    EXPECT_TRUE(PackageBuilder::shouldIncludeFile("Game/UnsavedChanges/a.txt", defaults));

    PackageFilters keep_all{false, false};
    EXPECT_TRUE(PackageBuilder::shouldIncludeFile("Game/Binaries/Game.pdb", keep_all));
    EXPECT_TRUE(PackageBuilder::shouldIncludeFile("Game/Saved/Config/user.ini", keep_all));
}

TEST(PackageFilterTest, ManifestFileNameCarriesTrackAndVersion) {
    EXPECT_EQ(PackageBuilder::manifestFileName(Manifest::BuildType::Staging, "1.4.2"), "manifest_staging_1.4.2.json");
}

class PackageBuilderTest : public ::testing::Test {
protected:
    Testing::TempDir dir_;

    PackageOptions options(const std::string& version) const {
        PackageOptions opts;
        opts.sourceDir = dir_.path() / "build";
        opts.outputDir = dir_.path() / "out";
        opts.version = version;
        opts.buildType = Manifest::BuildType::Staging;
        opts.chunking = Config::ChunkConfig(64, 256, 1024);
        return opts;
    }
};

TEST_F(PackageBuilderTest, BuildsManifestChunksAndDescriptor) {
    const fs::path src = dir_.path() / "build";
    std::vector<char> binary = randomBytes(20 * 1024, 1);
    std::vector<char> asset = randomBytes(5 * 1024, 2);
    writeFile(src / "Game" / "Binaries" / "Game.exe", binary);
    writeFile(src / "Game" / "Content" / "asset.pak", asset);
    writeFile(src / "Game" / "Content" / "copy.pak", asset);
    writeFile(src / "Game" / "Binaries" / "Game.pdb", randomBytes(100, 3));
    writeFile(src / "Game" / "Saved" / "log.txt", std::string("log"));
    writeFile(src / "version.json", std::string("{\"version\": \"old\"}"));

    std::vector<ProgressEvent> events;
    PackageResult result =
        PackageBuilder::build(options("1.0.0"), [&events](const ProgressEvent& e) { events.push_back(e); });

    EXPECT_EQ(result.manifestPath, fs::weakly_canonical(dir_.path() / "out") / "manifest_staging_1.0.0.json");
    EXPECT_TRUE(fs::exists(result.manifestPath));
    EXPECT_TRUE(fs::exists(result.versionPath));
    EXPECT_EQ(Manifest::readTextFile(result.versionPath), Manifest::serializeVersionDescriptor("1.0.0"));

    const Manifest::ChunkManifest& manifest = result.manifest;
    EXPECT_EQ(manifest.version, "1.0.0");
    EXPECT_EQ(manifest.buildType, Manifest::BuildType::Staging);
    ASSERT_EQ(manifest.files.size(), 3u);
    // Sorted, slash-separated, relative to the source directory
    EXPECT_EQ(manifest.files[0].filename, "Game/Binaries/Game.exe");
    EXPECT_EQ(manifest.files[1].filename, "Game/Content/asset.pak");
    EXPECT_EQ(manifest.files[2].filename, "Game/Content/copy.pak");
    EXPECT_EQ(manifest.files[0].totalSize, binary.size());
    EXPECT_EQ(manifest.files[0].chunkBytes(), binary.size());

    EXPECT_EQ(result.stats.filesProcessed, 3u);
    EXPECT_EQ(result.stats.totalSize, binary.size() + 2 * asset.size());
    EXPECT_EQ(result.stats.totalChunks, manifest.flattenChunks().size());
    EXPECT_EQ(result.stats.uniqueChunks, manifest.uniqueChunks().size());
    EXPECT_LT(result.stats.uniqueChunks, result.stats.totalChunks);
    EXPECT_LT(result.stats.deduplicationRatio, 1.0);

    // What was written reloads and reconstructs byte for byte
    Manifest::ChunkManifest loaded = Manifest::ChunkManifest::load(result.manifestPath, Manifest::ValidationMode::Lenient);
    Chunks::ChunkStore store(result.chunksDir);
    const fs::path restored = dir_.path() / "restored.exe";
    store.reconstructToFile(loaded.findFile("Game/Binaries/Game.exe")->chunks, restored);
    EXPECT_EQ(Testing::readFile(restored), binary);

    ASSERT_FALSE(events.empty());
    EXPECT_DOUBLE_EQ(events.front().percentage, 0.0);
    EXPECT_DOUBLE_EQ(events.back().percentage, 100.0);
}

TEST_F(PackageBuilderTest, OutputInsideSourceIsNotPackaged) {
    const fs::path src = dir_.path() / "build";
    writeFile(src / "a.bin", randomBytes(2048, 4));

    PackageOptions opts = options("1.0.0");
    opts.outputDir = src / "package";
    PackageBuilder::build(opts);

    // A second run must not pick up the first run's chunks or manifest
    PackageResult again = PackageBuilder::build(opts);
    ASSERT_EQ(again.manifest.files.size(), 1u);
    EXPECT_EQ(again.manifest.files[0].filename, "a.bin");
}

TEST_F(PackageBuilderTest, RejectsBadInput) {
    PackageOptions opts = options("1.0.0");
    EXPECT_THROW(PackageBuilder::build(opts), std::invalid_argument); // source dir missing

    writeFile(dir_.path() / "build" / "Game.pdb", randomBytes(10, 5));
    EXPECT_THROW(PackageBuilder::build(opts), std::runtime_error); // nothing left after filtering

    EXPECT_THROW(PackageBuilder::build(options("")), std::invalid_argument);
}

TEST_F(PackageBuilderTest, RejectsVersionsThatAreNotOneKeySegment) {
    writeFile(dir_.path() / "build" / "a.bin", randomBytes(512, 6));
    EXPECT_THROW(PackageBuilder::build(options("1.0/2")), std::invalid_argument);
    EXPECT_THROW(PackageBuilder::build(options("../../escape")), std::invalid_argument);
    EXPECT_THROW(PackageBuilder::build(options("1.0\\2")), std::invalid_argument);
    EXPECT_FALSE(fs::exists(dir_.path() / "out"));
}

} // namespace
} // namespace Package
} // namespace PackageSync

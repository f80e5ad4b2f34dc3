// tests/test_manifest.cpp
#include "manifest.hpp"

#include <string>

#include <gtest/gtest.h>

#include "errors.hpp"
#include "test_helpers.hpp"

namespace PackageSync {
namespace Manifest {
namespace {

const std::string kHashA = "aa11111111111111111111111111111111111111111111111111111111111111";
const std::string kHashB = "bb22222222222222222222222222222222222222222222222222222222222222";

ChunkManifest sampleManifest() {
    ChunkManifest manifest;
    manifest.version = "1.2.0";
    manifest.buildType = BuildType::Staging;
    manifest.files.push_back({"bin/game.exe", 30, {{kHashA, 10, 0, ""}, {kHashB, 20, 10, ""}}});
    manifest.files.push_back({"data/shared.pak", 10, {{kHashA, 10, 0, ""}}});
    return manifest;
}

// Expects parsing to fail and returns the offending field
std::string failingField(const std::string& text, ValidationMode mode = ValidationMode::Lenient) {
    try {
        parseManifest(text, mode);
    } catch (const ManifestError& e) {
        return e.field();
    }
    ADD_FAILURE() << "manifest was accepted: " << text;
    return "";
}

TEST(BuildTypeTest, ParsesBothTracks) {
    EXPECT_EQ(parseBuildType("production"), BuildType::Production);
    EXPECT_EQ(parseBuildType("staging"), BuildType::Staging);
    EXPECT_EQ(toString(BuildType::Staging), "staging");
    EXPECT_THROW(parseBuildType("beta"), ManifestError);
}

TEST(ChunkManifestTest, SerializedFormCarriesTypeTagAndOmitsEmptyUrls) {
    nlohmann::json j = nlohmann::json::parse(sampleManifest().serialize());
    EXPECT_EQ(j["manifestType"], "chunk-based");
    EXPECT_EQ(j["buildType"], "staging");
    EXPECT_EQ(j["version"], "1.2.0");
    EXPECT_FALSE(j["files"][0]["chunks"][0].contains("url"));
    EXPECT_EQ(j["files"][0]["totalSize"], 30);
}

TEST(ChunkManifestTest, SaveAndLoadPreserveContent) {
    Testing::TempDir dir;
    ChunkManifest manifest = sampleManifest();
    manifest.save(dir.path() / "manifest.json");

    ChunkManifest loaded = ChunkManifest::load(dir.path() / "manifest.json", ValidationMode::Lenient);
    EXPECT_EQ(loaded.version, manifest.version);
    EXPECT_EQ(loaded.buildType, manifest.buildType);
    ASSERT_EQ(loaded.files.size(), 2u);
    EXPECT_EQ(loaded.files[0].filename, "bin/game.exe");
    EXPECT_EQ(loaded.files[0].chunks, manifest.files[0].chunks);
}

TEST(ChunkManifestTest, UniqueChunksKeepsFirstReferenceInFileOrder) {
    ChunkManifest manifest = sampleManifest();
    EXPECT_EQ(manifest.flattenChunks().size(), 3u);

    std::vector<ChunkRef> unique = manifest.uniqueChunks();
    ASSERT_EQ(unique.size(), 2u);
    EXPECT_EQ(unique[0].hash, kHashA);
    EXPECT_EQ(unique[1].hash, kHashB);
}

TEST(ChunkManifestTest, AssignRemoteUrlsUsesTrackVersionAndShard) {
    ChunkManifest manifest = sampleManifest();
    manifest.assignRemoteUrls();
    EXPECT_EQ(manifest.files[0].chunks[1].url, "staging/1.2.0/chunks/bb/" + kHashB);
    EXPECT_EQ(manifest.files[1].chunks[0].url, "staging/1.2.0/chunks/aa/" + kHashA);

    // A published manifest passes strict validation
    EXPECT_NO_THROW(parseChunkManifest(manifest.serialize(), ValidationMode::Strict));
}

TEST(ChunkManifestTest, InheritedUrlsPointAtTheEarlierVersion) {
    ChunkManifest manifest = sampleManifest();
    const std::string earlier = "staging/1.1.0/chunks/aa/" + kHashA;
    EXPECT_EQ(manifest.remoteKeyFor(manifest.files[0].chunks[0]), "staging/1.2.0/chunks/aa/" + kHashA);

    manifest.assignRemoteUrls({{kHashA, earlier}});
    EXPECT_EQ(manifest.files[0].chunks[0].url, earlier);
    EXPECT_EQ(manifest.files[1].chunks[0].url, earlier);
    EXPECT_EQ(manifest.files[0].chunks[1].url, "staging/1.2.0/chunks/bb/" + kHashB);
    EXPECT_EQ(manifest.remoteKeyFor(manifest.files[0].chunks[0]), earlier);

    std::map<std::string, std::string> urls = manifest.assignedUrls();
    ASSERT_EQ(urls.size(), 2u);
    EXPECT_EQ(urls[kHashA], earlier);
    EXPECT_TRUE(sampleManifest().assignedUrls().empty());
}

TEST(ChunkManifestTest, FindFile) {
    ChunkManifest manifest = sampleManifest();
    ASSERT_NE(manifest.findFile("data/shared.pak"), nullptr);
    EXPECT_EQ(manifest.findFile("data/shared.pak")->totalSize, 10u);
    EXPECT_EQ(manifest.findFile("missing"), nullptr);
}

TEST(ValidationTest, MissingBuildTypeDefaultsToProduction) {
    ChunkManifest manifest = parseChunkManifest(
        std::string(R"({"version": "1.0", "files": [{"filename": "a", "totalSize": 1,
                       "chunks": [{"hash": "ab", "size": 1, "offset": 0}]}]})"),
        ValidationMode::Lenient);
    EXPECT_EQ(manifest.buildType, BuildType::Production);
}

TEST(ValidationTest, ReportsFirstOffendingField) {
    EXPECT_EQ(failingField(R"({"manifestType": "chunk-based", "files": []})"), "version");
    EXPECT_EQ(failingField(R"({"version": "1", "manifestType": "chunk-based"})"), "files");
    EXPECT_EQ(failingField(R"({"version": "1", "buildType": "beta", "manifestType": "chunk-based", "files": []})"),
              "buildType");
    EXPECT_EQ(failingField(R"({"version": "1", "manifestType": "chunk-based",
                               "files": [{"chunks": []}]})"),
              "filename");
    EXPECT_EQ(failingField(R"({"version": "1", "manifestType": "chunk-based",
                               "files": [{"filename": "a"}]})"),
              "chunks");
    EXPECT_EQ(failingField(R"({"version": "1", "manifestType": "chunk-based",
                               "files": [{"filename": "a", "chunks": [{"size": 1, "offset": 0}]}]})"),
              "hash");
    EXPECT_EQ(failingField(R"({"version": "1", "manifestType": "chunk-based",
                               "files": [{"filename": "a", "chunks": [{"hash": "ab", "offset": 0}]}]})"),
              "size");
    EXPECT_EQ(failingField(R"({"version": "1", "manifestType": "chunk-based",
                               "files": [{"filename": "a", "chunks": [{"hash": "ab", "size": 1}]}]})"),
              "offset");
    EXPECT_EQ(failingField("not json"), "manifest");
}

TEST(ValidationTest, VersionMustBeASingleKeySegment) {
    EXPECT_EQ(failingField(R"({"version": "1.0/2", "manifestType": "chunk-based", "files": []})"), "version");
    EXPECT_EQ(failingField(R"({"version": "a/../../../x", "manifestType": "chunk-based", "files": []})"), "version");
    EXPECT_EQ(failingField(R"({"version": "1.0\\beta", "manifestType": "chunk-based", "files": []})"), "version");
    EXPECT_EQ(failingField(R"({"version": "..", "manifestType": "chunk-based", "files": []})"), "version");

    EXPECT_TRUE(isSafeVersion("1.0.0-rc.1"));
    EXPECT_FALSE(isSafeVersion(""));
    EXPECT_FALSE(isSafeVersion("1..0"));
}

TEST(ValidationTest, StrictModeRequiresUrls) {
    const std::string text = R"({"version": "1", "manifestType": "chunk-based",
        "files": [{"filename": "a", "totalSize": 1, "chunks": [{"hash": "ab", "size": 1, "offset": 0}]}]})";
    EXPECT_NO_THROW(parseManifest(text, ValidationMode::Lenient));
    EXPECT_EQ(failingField(text, ValidationMode::Strict), "url");
}

TEST(ValidationTest, DuplicateFilenamesAreRejected) {
    EXPECT_EQ(failingField(R"({"version": "1", "manifestType": "chunk-based", "files": [
        {"filename": "a", "chunks": []}, {"filename": "a", "chunks": []}]})"),
              "filename");
}

TEST(ValidationTest, TotalSizeMismatchIsOnlyAWarning) {
    std::vector<std::string> warnings;
    ParsedManifest parsed = parseManifest(std::string(R"({"version": "1", "manifestType": "chunk-based",
        "files": [{"filename": "a", "totalSize": 5, "chunks": [{"hash": "ab", "size": 3, "offset": 0}]}]})"),
                                          ValidationMode::Lenient, &warnings);
    ASSERT_TRUE(std::holds_alternative<ChunkManifest>(parsed));
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("totalSize"), std::string::npos);
    EXPECT_EQ(std::get<ChunkManifest>(parsed).files[0].totalSize, 5u);
}

TEST(ManifestTypeTest, UntaggedManifestsAreDetectedByShape) {
    EXPECT_EQ(detectManifestType(nlohmann::json::parse(R"({"version": "1",
        "files": [{"filename": "a", "chunks": []}]})")),
              ManifestType::ChunkBased);
    EXPECT_EQ(detectManifestType(nlohmann::json::parse(R"({"version": "1",
        "files": [{"path": "a", "url": "u"}]})")),
              ManifestType::LegacyFileBased);
}

TEST(ManifestTypeTest, AmbiguousManifestsAreRejected) {
    EXPECT_EQ(failingField(R"({"version": "1", "files": []})"), "manifestType");
    EXPECT_EQ(failingField(R"({"version": "1", "files": [
        {"filename": "a", "chunks": []}, {"path": "b", "url": "u"}]})"),
              "manifestType");
    EXPECT_EQ(failingField(R"({"version": "1", "manifestType": "zip", "files": []})"), "manifestType");
}

TEST(ManifestTypeTest, LegacyManifestParsesButIsRefusedForChunkOperations) {
    const std::string text = R"({"version": "0.9", "buildType": "staging", "manifestType": "file-based",
        "files": [{"path": "game.exe", "url": "https://cdn/game.exe", "size": 12, "hash": "abc"}]})";

    ParsedManifest parsed = parseManifest(text, ValidationMode::Lenient);
    ASSERT_TRUE(std::holds_alternative<LegacyManifest>(parsed));
    const LegacyManifest& legacy = std::get<LegacyManifest>(parsed);
    EXPECT_EQ(legacy.buildType, BuildType::Staging);
    ASSERT_EQ(legacy.files.size(), 1u);
    EXPECT_EQ(legacy.files[0].size, std::optional<uint64_t>(12));

    try {
        parseChunkManifest(text, ValidationMode::Lenient);
        FAIL() << "expected ManifestError";
    } catch (const ManifestError& e) {
        EXPECT_EQ(e.field(), "manifestType");
    }
}

TEST(ManifestTypeTest, LegacyEntriesNeedPathAndUrl) {
    EXPECT_EQ(failingField(R"({"version": "1", "manifestType": "file-based", "files": [{"url": "u"}]})"), "path");
    EXPECT_EQ(failingField(R"({"version": "1", "manifestType": "file-based", "files": [{"path": "a"}]})"), "url");
}

TEST(VersionDescriptorTest, WritesVersionObject) {
    Testing::TempDir dir;
    saveVersionDescriptor("2.0.1", dir.path() / "version.json");
    nlohmann::json j = nlohmann::json::parse(readTextFile(dir.path() / "version.json"));
    EXPECT_EQ(j, nlohmann::json({{"version", "2.0.1"}}));
}

} // namespace
} // namespace Manifest
} // namespace PackageSync

// include/manifest.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace PackageSync {
namespace Manifest {

// Deployment track. Each track owns its own top-level remote namespace.
enum class BuildType {
    Production,
    Staging
};

std::string toString(BuildType build_type);

// Accepts "production" or "staging"; anything else throws ManifestError("buildType").
BuildType parseBuildType(const std::string& value);

// A version names one remote key segment and appears in file names, so it
// must be non-empty and free of '/', '\\' and "..".
bool isSafeVersion(const std::string& version);

enum class ManifestType {
    ChunkBased,
    LegacyFileBased
};

std::string toString(ManifestType type);

// Lenient: chunk urls optional (freshly generated local manifests).
// Strict: chunk urls required (manifests expected to be fully published).
enum class ValidationMode {
    Lenient,
    Strict
};

struct ChunkRef {
    std::string hash;
    uint64_t size = 0;
    uint64_t offset = 0;
    std::string url; // Remote key once published, empty before
};

bool operator==(const ChunkRef& lhs, const ChunkRef& rhs);

struct FileEntry {
    std::string filename;  // Slash-separated path relative to the package root
    uint64_t totalSize = 0;
    std::vector<ChunkRef> chunks; // Ascending offset, i.e. reconstruction order

    // Sum of the chunk sizes; equals totalSize for a well-formed entry
    uint64_t chunkBytes() const;
};

class ChunkManifest {
public:
    std::string version;
    BuildType buildType = BuildType::Production;
    std::vector<FileEntry> files;

    nlohmann::json toJson() const;

    // Expects JSON that already passed validateChunkManifest().
    static ChunkManifest fromJson(const nlohmann::json& j);

    // Pretty-printed JSON text (two-space indent)
    std::string serialize() const;

    // Write to disk, replacing any existing file.
    void save(const std::filesystem::path& path) const;

    // Read, validate and parse; a legacy manifest is rejected.
    static ChunkManifest load(const std::filesystem::path& path, ValidationMode mode);

    const FileEntry* findFile(const std::string& filename) const;

    // Every chunk of every file, in file order. Shared chunks appear once per reference.
    std::vector<ChunkRef> flattenChunks() const;

    // First reference of each distinct hash, in file order.
    std::vector<ChunkRef> uniqueChunks() const;

    // Point every chunk url at its deterministic remote key for this
    // manifest's build type and version.
    void assignRemoteUrls();

    // Same, except chunks whose hash is in inherited (hash -> key) point at
    // that key, normally one under an earlier version that already holds the
    // chunk.
    void assignRemoteUrls(const std::map<std::string, std::string>& inherited);

    // hash -> url of every chunk that has been assigned one
    std::map<std::string, std::string> assignedUrls() const;

    // Where the chunk lives remotely: its url, or this version's key while unassigned.
    std::string remoteKeyFor(const ChunkRef& chunk) const;
};

// Flat, file-per-object format that predates chunking.
struct LegacyFileEntry {
    std::string path;
    std::string url;
    std::optional<uint64_t> size;
    std::string hash;
};

struct LegacyManifest {
    std::string version;
    BuildType buildType = BuildType::Production;
    std::vector<LegacyFileEntry> files;

    static LegacyManifest fromJson(const nlohmann::json& j);
};

// Decided once at parse time; chunk-only operations reject the legacy alternative.
using ParsedManifest = std::variant<ChunkManifest, LegacyManifest>;

// Inspect the manifestType tag, falling back to the shape of the files.
// Throws ManifestError for an unknown tag or input that fits neither shape.
ManifestType detectManifestType(const nlohmann::json& j);

// Structural validation. Stops at the first error (ManifestError naming the
// field); a totalSize that disagrees with the chunk sizes is only a warning,
// logged and returned.
std::vector<std::string> validateChunkManifest(const nlohmann::json& j, ValidationMode mode);
void validateLegacyManifest(const nlohmann::json& j);

ParsedManifest parseManifest(const nlohmann::json& j, ValidationMode mode,
                             std::vector<std::string>* warnings = nullptr);
ParsedManifest parseManifest(const std::string& text, ValidationMode mode,
                             std::vector<std::string>* warnings = nullptr);

// Throws ManifestError("manifestType") when the manifest is the legacy format.
ChunkManifest requireChunkBased(ParsedManifest parsed, const std::string& operation);

ChunkManifest parseChunkManifest(const std::string& text, ValidationMode mode);

// {"version": "..."} descriptor published beside each manifest
std::string serializeVersionDescriptor(const std::string& version);
void saveVersionDescriptor(const std::string& version, const std::filesystem::path& path);

std::string readTextFile(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const ChunkRef& chunk);
void from_json(const nlohmann::json& j, ChunkRef& chunk);
void to_json(nlohmann::json& j, const FileEntry& file);
void from_json(const nlohmann::json& j, FileEntry& file);

} // namespace Manifest
} // namespace PackageSync

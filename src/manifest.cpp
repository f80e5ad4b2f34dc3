// src/manifest.cpp
#include "manifest.hpp"

#include <fstream>
#include <iostream> // For logging
#include <iterator>
#include <stdexcept> // For std::runtime_error
#include <unordered_set>

#include "errors.hpp"
#include "remote_keys.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace PackageSync {
namespace Manifest {

namespace {

const char* const CHUNK_BASED_TAG = "chunk-based";
const char* const FILE_BASED_TAG = "file-based";

bool hasNonEmptyString(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_string() && !it->get<std::string>().empty();
}

// Built-in JSON stores literals like 42 as signed; parsed text as unsigned
bool isNonNegativeInteger(const json& j) {
    return j.is_number_unsigned() || (j.is_number_integer() && j.get<int64_t>() >= 0);
}

void requireVersion(const json& j) {
    if (!j.is_object()) {
        throw ManifestError("manifest", "Manifest must be a JSON object");
    }
    if (!hasNonEmptyString(j, "version")) {
        throw ManifestError("version", "Manifest missing version");
    }
    if (!isSafeVersion(j.at("version").get<std::string>())) {
        throw ManifestError("version", "Manifest version '" + j.at("version").get<std::string>() +
                                           "' cannot be used as a key segment");
    }
}

void requireFilesArray(const json& j) {
    auto it = j.find("files");
    if (it == j.end() || !it->is_array()) {
        throw ManifestError("files", "Manifest missing files array");
    }
}

BuildType buildTypeOf(const json& j) {
    auto it = j.find("buildType");
    if (it == j.end() || it->is_null()) {
        return BuildType::Production;
    }
    if (!it->is_string()) {
        throw ManifestError("buildType", "Manifest buildType must be a string");
    }
    return parseBuildType(it->get<std::string>());
}

} // namespace

std::string toString(BuildType build_type) {
    switch (build_type) {
    case BuildType::Production:
        return "production";
    case BuildType::Staging:
        return "staging";
    }
    return "production";
}

BuildType parseBuildType(const std::string& value) {
    if (value == "production") {
        return BuildType::Production;
    }
    if (value == "staging") {
        return BuildType::Staging;
    }
    throw ManifestError("buildType", "Invalid buildType '" + value + "'. Must be \"production\" or \"staging\"");
}

bool isSafeVersion(const std::string& version) {
    return !version.empty() && version.find_first_of("/\\") == std::string::npos &&
           version.find("..") == std::string::npos;
}

std::string toString(ManifestType type) {
    return type == ManifestType::ChunkBased ? CHUNK_BASED_TAG : FILE_BASED_TAG;
}

bool operator==(const ChunkRef& lhs, const ChunkRef& rhs) {
    return lhs.hash == rhs.hash && lhs.size == rhs.size && lhs.offset == rhs.offset && lhs.url == rhs.url;
}

uint64_t FileEntry::chunkBytes() const {
    uint64_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.size;
    }
    return total;
}

// --- JSON conversion, used through nlohmann's ADL hooks ---

void to_json(json& j, const ChunkRef& chunk) {
    j = json{
        {"hash", chunk.hash},
        {"size", chunk.size},
        {"offset", chunk.offset}
    };
    if (!chunk.url.empty()) {
        j["url"] = chunk.url;
    }
}

void from_json(const json& j, ChunkRef& chunk) {
    j.at("hash").get_to(chunk.hash);
    j.at("size").get_to(chunk.size);
    j.at("offset").get_to(chunk.offset);
    chunk.url = j.value("url", std::string());
}

void to_json(json& j, const FileEntry& file) {
    j = json{
        {"filename", file.filename},
        {"totalSize", file.totalSize},
        {"chunks", file.chunks}
    };
}

void from_json(const json& j, FileEntry& file) {
    j.at("filename").get_to(file.filename);
    j.at("chunks").get_to(file.chunks);
    auto it = j.find("totalSize");
    file.totalSize = (it != j.end() && isNonNegativeInteger(*it)) ? it->get<uint64_t>() : file.chunkBytes();
}

json ChunkManifest::toJson() const {
    return json{
        {"version", version},
        {"buildType", toString(buildType)},
        {"manifestType", CHUNK_BASED_TAG},
        {"files", files}
    };
}

ChunkManifest ChunkManifest::fromJson(const json& j) {
    ChunkManifest manifest;
    j.at("version").get_to(manifest.version);
    manifest.buildType = buildTypeOf(j);
    j.at("files").get_to(manifest.files);
    return manifest;
}

std::string ChunkManifest::serialize() const {
    return toJson().dump(2);
}

void ChunkManifest::save(const fs::path& path) const {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open file for writing manifest: " + path.string());
    }
    ofs << serialize();
    if (!ofs.good()) {
        throw std::runtime_error("Failed to write all data to manifest file: " + path.string());
    }
}

ChunkManifest ChunkManifest::load(const fs::path& path, ValidationMode mode) {
    return requireChunkBased(parseManifest(readTextFile(path), mode), "load");
}

const FileEntry* ChunkManifest::findFile(const std::string& filename) const {
    for (const auto& file : files) {
        if (file.filename == filename) {
            return &file;
        }
    }
    return nullptr;
}

std::vector<ChunkRef> ChunkManifest::flattenChunks() const {
    std::vector<ChunkRef> chunks;
    for (const auto& file : files) {
        chunks.insert(chunks.end(), file.chunks.begin(), file.chunks.end());
    }
    return chunks;
}

std::vector<ChunkRef> ChunkManifest::uniqueChunks() const {
    std::vector<ChunkRef> chunks;
    std::unordered_set<std::string> seen;
    for (const auto& file : files) {
        for (const auto& chunk : file.chunks) {
            if (seen.insert(chunk.hash).second) {
                chunks.push_back(chunk);
            }
        }
    }
    return chunks;
}

void ChunkManifest::assignRemoteUrls() {
    assignRemoteUrls({});
}

void ChunkManifest::assignRemoteUrls(const std::map<std::string, std::string>& inherited) {
    const std::string track = toString(buildType);
    for (auto& file : files) {
        for (auto& chunk : file.chunks) {
            auto it = inherited.find(chunk.hash);
            chunk.url = it != inherited.end() ? it->second : Remote::Keys::chunkKey(track, version, chunk.hash);
        }
    }
}

std::map<std::string, std::string> ChunkManifest::assignedUrls() const {
    std::map<std::string, std::string> urls;
    for (const auto& file : files) {
        for (const auto& chunk : file.chunks) {
            if (!chunk.url.empty()) {
                urls.emplace(chunk.hash, chunk.url);
            }
        }
    }
    return urls;
}

std::string ChunkManifest::remoteKeyFor(const ChunkRef& chunk) const {
    if (!chunk.url.empty()) {
        return chunk.url;
    }
    return Remote::Keys::chunkKey(toString(buildType), version, chunk.hash);
}

LegacyManifest LegacyManifest::fromJson(const json& j) {
    LegacyManifest manifest;
    j.at("version").get_to(manifest.version);
    manifest.buildType = buildTypeOf(j);
    for (const auto& entry : j.at("files")) {
        LegacyFileEntry file;
        entry.at("path").get_to(file.path);
        entry.at("url").get_to(file.url);
        auto size = entry.find("size");
        if (size != entry.end() && isNonNegativeInteger(*size)) {
            file.size = size->get<uint64_t>();
        }
        file.hash = entry.value("hash", std::string());
        manifest.files.push_back(std::move(file));
    }
    return manifest;
}

// --- Type detection and validation ---

ManifestType detectManifestType(const json& j) {
    auto tag = j.find("manifestType");
    if (tag != j.end() && !tag->is_null()) {
        if (tag->is_string() && tag->get<std::string>() == CHUNK_BASED_TAG) {
            return ManifestType::ChunkBased;
        }
        if (tag->is_string() && tag->get<std::string>() == FILE_BASED_TAG) {
            return ManifestType::LegacyFileBased;
        }
        throw ManifestError("manifestType", "Unknown manifestType " + tag->dump());
    }

    // Untagged: decide by shape, and refuse to guess when the files disagree
    requireFilesArray(j);
    const json& files = j.at("files");
    if (files.empty()) {
        throw ManifestError("manifestType", "Cannot determine manifest type: untagged manifest has no files");
    }

    size_t chunked = 0;
    size_t flat = 0;
    for (const auto& file : files) {
        if (!file.is_object()) {
            continue;
        }
        auto chunks = file.find("chunks");
        if (chunks != file.end() && chunks->is_array()) {
            ++chunked;
        } else if (file.contains("path")) {
            ++flat;
        }
    }
    if (chunked == files.size()) {
        return ManifestType::ChunkBased;
    }
    if (flat == files.size()) {
        return ManifestType::LegacyFileBased;
    }
    throw ManifestError("manifestType",
                        "Cannot determine manifest type: files mix chunk-based and file-based entries");
}

std::vector<std::string> validateChunkManifest(const json& j, ValidationMode mode) {
    requireVersion(j);
    requireFilesArray(j);
    buildTypeOf(j);

    std::vector<std::string> warnings;
    std::unordered_set<std::string> filenames;

    for (const auto& file : j.at("files")) {
        if (!file.is_object() || !hasNonEmptyString(file, "filename")) {
            throw ManifestError("filename", "File missing filename");
        }
        const std::string filename = file.at("filename").get<std::string>();
        if (!filenames.insert(filename).second) {
            throw ManifestError("filename", "Duplicate filename " + filename);
        }

        auto chunks = file.find("chunks");
        if (chunks == file.end() || !chunks->is_array()) {
            throw ManifestError("chunks", "File " + filename + " missing chunks array");
        }

        uint64_t calculated_size = 0;
        for (const auto& chunk : *chunks) {
            if (!chunk.is_object() || !hasNonEmptyString(chunk, "hash")) {
                throw ManifestError("hash", "Chunk missing hash in file " + filename);
            }
            auto size = chunk.find("size");
            if (size == chunk.end() || !isNonNegativeInteger(*size)) {
                throw ManifestError("size", "Chunk missing size in file " + filename);
            }
            auto offset = chunk.find("offset");
            if (offset == chunk.end() || !isNonNegativeInteger(*offset)) {
                throw ManifestError("offset", "Chunk missing offset in file " + filename);
            }
            auto url = chunk.find("url");
            bool has_url = url != chunk.end() && !url->is_null();
            if (has_url && !url->is_string()) {
                throw ManifestError("url", "Chunk url must be a string in file " + filename);
            }
            if (mode == ValidationMode::Strict && !hasNonEmptyString(chunk, "url")) {
                throw ManifestError("url", "Chunk missing url in file " + filename);
            }
            calculated_size += size->get<uint64_t>();
        }

        auto total = file.find("totalSize");
        if (total != file.end() && !total->is_null()) {
            if (!isNonNegativeInteger(*total)) {
                throw ManifestError("totalSize", "File " + filename + " has a non-numeric totalSize");
            }
            // Legacy manifests carry mismatches; warn instead of failing
            const uint64_t declared = total->get<uint64_t>();
            if (declared != calculated_size) {
                std::string warning = "File " + filename + ": totalSize (" + std::to_string(declared) +
                                      ") doesn't match sum of chunks (" + std::to_string(calculated_size) + ")";
                std::cerr << "Warning: " << warning << std::endl;
                warnings.push_back(std::move(warning));
            }
        }
    }
    return warnings;
}

void validateLegacyManifest(const json& j) {
    requireVersion(j);
    requireFilesArray(j);
    buildTypeOf(j);

    for (const auto& file : j.at("files")) {
        if (!file.is_object() || !hasNonEmptyString(file, "path")) {
            throw ManifestError("path", "File missing path");
        }
        if (!hasNonEmptyString(file, "url")) {
            throw ManifestError("url", "File " + file.at("path").get<std::string>() + " missing url");
        }
    }
}

ParsedManifest parseManifest(const json& j, ValidationMode mode, std::vector<std::string>* warnings) {
    requireVersion(j);

    if (detectManifestType(j) == ManifestType::ChunkBased) {
        std::vector<std::string> found = validateChunkManifest(j, mode);
        if (warnings) {
            warnings->insert(warnings->end(), found.begin(), found.end());
        }
        return ChunkManifest::fromJson(j);
    }

    validateLegacyManifest(j);
    return LegacyManifest::fromJson(j);
}

ParsedManifest parseManifest(const std::string& text, ValidationMode mode, std::vector<std::string>* warnings) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ManifestError("manifest", std::string("Error parsing manifest JSON: ") + e.what());
    }
    return parseManifest(j, mode, warnings);
}

ChunkManifest requireChunkBased(ParsedManifest parsed, const std::string& operation) {
    if (auto* manifest = std::get_if<ChunkManifest>(&parsed)) {
        return std::move(*manifest);
    }
    throw ManifestError("manifestType",
                        "Operation '" + operation + "' requires a chunk-based manifest, got a file-based manifest");
}

ChunkManifest parseChunkManifest(const std::string& text, ValidationMode mode) {
    return requireChunkBased(parseManifest(text, mode), "parse");
}

std::string serializeVersionDescriptor(const std::string& version) {
    return json{{"version", version}}.dump(2);
}

void saveVersionDescriptor(const std::string& version, const fs::path& path) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open file for writing version descriptor: " + path.string());
    }
    ofs << serializeVersionDescriptor(version);
    if (!ofs.good()) {
        throw std::runtime_error("Failed to write version descriptor: " + path.string());
    }
}

std::string readTextFile(const fs::path& path) {
    if (!fs::exists(path)) {
        throw std::runtime_error("File not found: " + path.string());
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

} // namespace Manifest
} // namespace PackageSync

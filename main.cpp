// main.cpp
#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <memory> // For std::make_shared
#include <mutex>
#include <optional>
#include <thread>

// Crow includes
#include <crow.h>

#include <nlohmann/json.hpp>

// Our project includes
#include "chunk_config.hpp"
#include "chunk_store.hpp"
#include "delta_detector.hpp"
#include "errors.hpp"
#include "filesystem_remote_store.hpp"
#include "manifest.hpp"
#include "package_builder.hpp"
#include "service_config.hpp"
#include "upload_orchestrator.hpp"

namespace fs = std::filesystem;
using namespace PackageSync;

// The one upload the service runs at a time, plus what status requests need to see
struct UploadJob {
    std::shared_ptr<Chunks::ChunkStore> chunk_store;
    std::shared_ptr<Upload::UploadSession> session;
    std::thread worker;

    std::mutex mtx;
    ProgressEvent last_event;
    std::string error;
};

crow::response jsonError(int code, const std::string& message) {
    crow::json::wvalue body;
    body["error"] = message;
    return crow::response(code, body);
}

// Map the exception currently being handled to an HTTP response. Must be
// called from inside a catch block.
crow::response errorResponse(const std::string& context) {
    try {
        throw;
    } catch (const PromotionError& e) {
        std::cerr << context << ": " << e.what() << std::endl;
        crow::json::wvalue body;
        body["error"] = e.what();
        body["missingChunks"] = e.missingCount();
        return crow::response(409, body);
    } catch (const ManifestError& e) {
        std::cerr << context << ": " << e.what() << std::endl;
        crow::json::wvalue body;
        body["error"] = e.what();
        body["field"] = e.field();
        return crow::response(400, body);
    } catch (const BuildTypeMismatchError& e) {
        std::cerr << context << ": " << e.what() << std::endl;
        return jsonError(409, e.what());
    } catch (const ObjectNotFoundError& e) {
        std::cerr << context << ": " << e.what() << std::endl;
        return jsonError(404, e.what());
    } catch (const nlohmann::json::exception& e) {
        return jsonError(400, std::string("Bad Request: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return jsonError(400, std::string("Bad Request: ") + e.what());
    } catch (const std::exception& e) {
        std::cerr << context << ": " << e.what() << std::endl;
        return jsonError(500, "Internal Server Error: " + std::string(e.what()));
    }
}

// Parse a JSON request body; an empty body reads as an empty object.
nlohmann::json requestBody(const crow::request& req) {
    if (req.body.empty()) {
        return nlohmann::json::object();
    }
    nlohmann::json body = nlohmann::json::parse(req.body);
    if (!body.is_object()) {
        throw std::invalid_argument("request body must be a JSON object");
    }
    return body;
}

std::string requireString(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::invalid_argument(std::string("'") + key + "' is required");
    }
    return it->get<std::string>();
}

crow::json::wvalue toJson(const Upload::UploadStats& stats) {
    crow::json::wvalue out;
    out["totalChunks"] = stats.totalChunks;
    out["uploadedChunks"] = stats.uploadedChunks;
    out["skippedChunks"] = stats.skippedChunks;
    out["failedChunks"] = stats.failedChunks;
    out["filesProcessed"] = stats.filesProcessed;
    out["cancelled"] = stats.cancelled;
    out["complete"] = stats.complete();

    std::vector<crow::json::wvalue> failed;
    for (const auto& outcome : stats.failedChunksDetails) {
        crow::json::wvalue item;
        item["hash"] = outcome.hash;
        item["key"] = outcome.key;
        item["error"] = outcome.reason;
        failed.push_back(std::move(item));
    }
    out["failedChunksDetails"] = std::move(failed);
    return out;
}

crow::json::wvalue toJson(const Delta::DeltaStats& stats) {
    crow::json::wvalue out;
    out["totalFiles"] = stats.totalFiles;
    out["newFilesCount"] = stats.newFilesCount;
    out["changedFilesCount"] = stats.changedFilesCount;
    out["deletedFilesCount"] = stats.deletedFilesCount;
    out["chunksToUploadCount"] = stats.chunksToUploadCount;
    out["totalChunksInNew"] = stats.totalChunksInNew;
    return out;
}

std::vector<crow::json::wvalue> fileNames(const std::vector<Manifest::FileEntry>& files) {
    std::vector<crow::json::wvalue> names;
    for (const auto& file : files) {
        names.emplace_back(file.filename);
    }
    return names;
}

int main(int argc, char* argv[]) {
    Config::ServiceConfig config;
    try {
        if (argc > 1) {
            config = Config::ServiceConfig::load(argv[1]);
        }
        Config::ChunkConfig::ensureDirectoryExists(config.workspaceDir);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    // Shared state captured by the route lambdas; lives as long as the app
    auto remote = std::make_shared<Remote::FilesystemRemoteStore>(config.remoteRoot);
    // Verification, promotion and listing never read local chunks; they use the workspace cache
    auto workspace_store = std::make_shared<Chunks::ChunkStore>(
        config.workspaceDir / Config::ChunkConfig::CHUNKS_DIR_NAME, config.readerThreads);
    auto orchestrator = std::make_shared<Upload::UploadOrchestrator>(*remote, *workspace_store);

    std::mutex job_mtx;
    std::shared_ptr<UploadJob> active_job;

    auto currentJob = [&job_mtx, &active_job]() {
        std::lock_guard<std::mutex> lock(job_mtx);
        return active_job;
    };

    // --- Crow Application Setup ---
    crow::SimpleApp app;

    // --- POST /packages: Chunk a source tree and write its manifest ---
    // {"sourceDir", "version", "buildType", "outputDir"?, "minChunkSize"?, "avgChunkSize"?,
    //  "maxChunkSize"?, "excludeDebugSymbols"?, "excludeSaved"?}
    CROW_ROUTE(app, "/packages").methods("POST"_method)
    ([&config](const crow::request& req) {
        try {
            nlohmann::json body = requestBody(req);

            Package::PackageOptions options;
            options.sourceDir = requireString(body, "sourceDir");
            options.version = requireString(body, "version");
            if (!Manifest::isSafeVersion(options.version)) {
                return jsonError(400, "Invalid version '" + options.version + "'");
            }
            options.buildType = Manifest::parseBuildType(body.value("buildType", std::string("production")));
            options.outputDir = body.value("outputDir", (config.workspaceDir / (Manifest::toString(options.buildType) + "_" +
                                                                                 options.version)).string());
            options.chunking = Config::ChunkConfig(
                body.value("minChunkSize", Config::ChunkConfig::DEFAULT_MIN_SIZE),
                body.value("avgChunkSize", Config::ChunkConfig::DEFAULT_AVG_SIZE),
                body.value("maxChunkSize", Config::ChunkConfig::DEFAULT_MAX_SIZE));
            options.filters.excludeDebugSymbols = body.value("excludeDebugSymbols", true);
            options.filters.excludeSaved = body.value("excludeSaved", true);

            Package::PackageResult result = Package::PackageBuilder::build(options);

            crow::json::wvalue response_json;
            response_json["manifestPath"] = result.manifestPath.string();
            response_json["versionPath"] = result.versionPath.string();
            response_json["chunksDir"] = result.chunksDir.string();
            response_json["filesProcessed"] = result.stats.filesProcessed;
            response_json["totalChunks"] = result.stats.totalChunks;
            response_json["uniqueChunks"] = result.stats.uniqueChunks;
            response_json["totalSize"] = result.stats.totalSize;
            response_json["deduplicationRatio"] = result.stats.deduplicationRatio;
            return crow::response(201, response_json); // 201 Created
        } catch (const std::exception&) {
            return errorResponse("Error during packaging");
        }
    });

    // --- POST /deltas: Compare two manifests ---
    // {"oldManifestPath", "newManifestPath"}
    CROW_ROUTE(app, "/deltas").methods("POST"_method)
    ([](const crow::request& req) {
        try {
            nlohmann::json body = requestBody(req);
            Delta::ManifestDelta delta = Delta::detectDelta(
                Manifest::readTextFile(requireString(body, "oldManifestPath")),
                Manifest::readTextFile(requireString(body, "newManifestPath")));

            crow::json::wvalue response_json;
            response_json["newFiles"] = fileNames(delta.newFiles);
            response_json["changedFiles"] = fileNames(delta.changedFiles);
            response_json["deletedFiles"] = fileNames(delta.deletedFiles);
            response_json["chunksToUpload"] =
                crow::json::wvalue::list(delta.chunksToUpload.begin(), delta.chunksToUpload.end());
            response_json["uploadBytes"] = delta.uploadBytes();
            response_json["stats"] = toJson(delta.stats);
            return crow::response(200, response_json);
        } catch (const std::exception&) {
            return errorResponse("Error detecting delta");
        }
    });

    // --- POST /uploads: Start uploading a package in the background ---
    // {"manifestPath", "mode"?: "full"|"delta", "oldManifestPath"?, "chunksDir"?}
    CROW_ROUTE(app, "/uploads").methods("POST"_method)
    ([&](const crow::request& req) {
        try {
            nlohmann::json body = requestBody(req);
            const fs::path manifest_path = requireString(body, "manifestPath");
            const Upload::UploadMode mode = Upload::parseUploadMode(body.value("mode", std::string("delta")));

            Manifest::ChunkManifest new_manifest = Manifest::ChunkManifest::load(manifest_path, Manifest::ValidationMode::Lenient);
            std::optional<Manifest::ChunkManifest> old_manifest;
            if (body.contains("oldManifestPath")) {
                old_manifest = Manifest::ChunkManifest::load(requireString(body, "oldManifestPath"),
                                                             Manifest::ValidationMode::Lenient);
            }

            std::lock_guard<std::mutex> lock(job_mtx);
            if (active_job) {
                Upload::SessionState state = active_job->session->state();
                if (state == Upload::SessionState::Idle || state == Upload::SessionState::Uploading ||
                    state == Upload::SessionState::Paused) {
                    return jsonError(409, "An upload is already in progress");
                }
                if (active_job->worker.joinable()) {
                    active_job->worker.join(); // Finished; reclaim the thread
                }
            }

            auto job = std::make_shared<UploadJob>();
            job->chunk_store = std::make_shared<Chunks::ChunkStore>(
                body.value("chunksDir", (manifest_path.parent_path() / Config::ChunkConfig::CHUNKS_DIR_NAME).string()),
                config.readerThreads);

            Upload::UploadOrchestrator job_orchestrator(*remote, *job->chunk_store);
            Upload::UploadPlan plan = job_orchestrator.planUpload(std::move(new_manifest),
                                                                  old_manifest ? &*old_manifest : nullptr, mode);
            job->session = job_orchestrator.createSession(std::move(plan));

            crow::json::wvalue response_json;
            response_json["version"] = job->session->plan().manifest.version;
            response_json["buildType"] = Manifest::toString(job->session->plan().manifest.buildType);
            response_json["mode"] = job->session->plan().mode == Upload::UploadMode::Delta ? "delta" : "full";
            response_json["totalChunks"] = job->session->plan().worklist.size();

            job->worker = std::thread([job]() {
                try {
                    Upload::UploadStats stats = job->session->run([job](const ProgressEvent& event) {
                        std::lock_guard<std::mutex> lock(job->mtx);
                        job->last_event = event;
                    });
                    std::cout << "Upload of " << job->session->plan().manifest.version << " finished: "
                              << stats.uploadedChunks << " uploaded, " << stats.skippedChunks << " skipped, "
                              << stats.failedChunks << " failed" << (stats.cancelled ? " (cancelled)" : "")
                              << std::endl;
                } catch (const std::exception& e) {
                    std::cerr << "Upload failed: " << e.what() << std::endl;
                    std::lock_guard<std::mutex> lock(job->mtx);
                    job->error = e.what();
                }
            });
            active_job = job;

            std::cout << "Started upload of " << job->session->plan().manifest.version << " ("
                      << job->session->plan().worklist.size() << " chunks)" << std::endl;
            return crow::response(202, response_json); // 202 Accepted
        } catch (const std::exception&) {
            return errorResponse("Error starting upload");
        }
    });

    auto sessionControl = [&currentJob](const std::string& action) {
        std::shared_ptr<UploadJob> job = currentJob();
        if (!job) {
            return jsonError(404, "No upload session");
        }
        if (action == "pause") {
            job->session->pause();
        } else if (action == "resume") {
            job->session->resume();
        } else {
            job->session->cancel();
        }
        crow::json::wvalue response_json;
        response_json["state"] = Upload::toString(job->session->state());
        response_json["paused"] = job->session->isPaused();
        return crow::response(200, response_json);
    };

    // --- POST /uploads/pause, /uploads/resume, /uploads/cancel ---
    CROW_ROUTE(app, "/uploads/pause").methods("POST"_method)
    ([sessionControl]() { return sessionControl("pause"); });
    CROW_ROUTE(app, "/uploads/resume").methods("POST"_method)
    ([sessionControl]() { return sessionControl("resume"); });
    CROW_ROUTE(app, "/uploads/cancel").methods("POST"_method)
    ([sessionControl]() { return sessionControl("cancel"); });

    // --- GET /uploads/status: Progress of the current or last upload ---
    CROW_ROUTE(app, "/uploads/status")
    ([&currentJob]() {
        std::shared_ptr<UploadJob> job = currentJob();
        if (!job) {
            return jsonError(404, "No upload session");
        }

        crow::json::wvalue response_json;
        response_json["state"] = Upload::toString(job->session->state());
        response_json["paused"] = job->session->isPaused();
        response_json["cursor"] = job->session->cursor();
        response_json["stats"] = toJson(job->session->stats());

        std::lock_guard<std::mutex> lock(job->mtx);
        response_json["percentage"] = job->last_event.percentage;
        response_json["message"] = job->last_event.message;
        if (!job->error.empty()) {
            response_json["error"] = job->error;
        }
        return crow::response(200, response_json);
    });

    // --- POST /verify: Check every chunk of a manifest exists remotely ---
    // {"manifestPath"}
    CROW_ROUTE(app, "/verify").methods("POST"_method)
    ([orchestrator](const crow::request& req) {
        try {
            nlohmann::json body = requestBody(req);
            Manifest::ChunkManifest manifest = Manifest::ChunkManifest::load(requireString(body, "manifestPath"),
                                                                             Manifest::ValidationMode::Lenient);
            Upload::VerifyResult result = orchestrator->verify(manifest);

            std::vector<crow::json::wvalue> missing;
            for (const auto& location : result.missingChunks) {
                crow::json::wvalue item;
                item["hash"] = location.hash;
                item["size"] = location.size;
                item["key"] = location.key;
                missing.push_back(std::move(item));
            }

            crow::json::wvalue response_json;
            response_json["totalChunks"] = result.totalChunks;
            response_json["existingChunks"] = result.existingChunks.size();
            response_json["missingChunks"] = std::move(missing);
            response_json["totalSize"] = result.totalSize;
            response_json["existingSize"] = result.existingSize;
            response_json["missingSize"] = result.missingSize;
            response_json["allChunksExist"] = result.allChunksExist;
            return crow::response(200, response_json);
        } catch (const std::exception&) {
            return errorResponse("Error verifying chunks");
        }
    });

    // --- GET /versions/<buildType>: Published versions of a track ---
    CROW_ROUTE(app, "/versions/<string>")
    ([orchestrator](std::string build_type) {
        try {
            Upload::VersionListing listing = orchestrator->listVersions(Manifest::parseBuildType(build_type));

            crow::json::wvalue response_json;
            response_json["versions"] = crow::json::wvalue::list(listing.versions.begin(), listing.versions.end());
            if (listing.currentVersion) {
                response_json["currentVersion"] = *listing.currentVersion;
            } else {
                response_json["currentVersion"] = nullptr;
            }
            return crow::response(200, response_json);
        } catch (const std::exception&) {
            return errorResponse("Error listing versions");
        }
    });

    // --- POST /promote: Point a track's latest manifest at a version ---
    // {"version", "buildType", "manifestPath"?}
    CROW_ROUTE(app, "/promote").methods("POST"_method)
    ([orchestrator](const crow::request& req) {
        try {
            nlohmann::json body = requestBody(req);
            const std::string version = requireString(body, "version");
            const Manifest::BuildType build_type = Manifest::parseBuildType(requireString(body, "buildType"));

            std::optional<Manifest::ChunkManifest> local_manifest;
            if (body.contains("manifestPath")) {
                local_manifest = Manifest::ChunkManifest::load(requireString(body, "manifestPath"),
                                                               Manifest::ValidationMode::Lenient);
            }

            Upload::PromoteResult result = orchestrator->promote(version, build_type,
                                                                 local_manifest ? &*local_manifest : nullptr);

            crow::json::wvalue response_json;
            response_json["version"] = result.version;
            response_json["buildType"] = Manifest::toString(result.buildType);
            response_json["latestKey"] = result.latestKey;
            response_json["totalChunks"] = result.totalChunks;
            return crow::response(200, response_json);
        } catch (const std::exception&) {
            return errorResponse("Error promoting version");
        }
    });

    std::cout << "Starting Package Sync Service on http://localhost:" << config.port << std::endl;
    std::cout << "Remote store: " << remote->root() << ", workspace: " << config.workspaceDir << std::endl;
    app.port(config.port).multithreaded().run(); // Returns on SIGINT/SIGTERM

    // Stop a running upload at the next chunk and wait for it
    if (std::shared_ptr<UploadJob> job = currentJob()) {
        job->session->cancel();
        if (job->worker.joinable()) {
            job->worker.join();
        }
    }
    return 0;
}

// src/upload_orchestrator.cpp
#include "upload_orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <iostream> // For logging
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "errors.hpp"
#include "remote_keys.hpp"

namespace PackageSync
{
    namespace Upload
    {

        using Manifest::BuildType;
        using Manifest::ChunkManifest;
        using Manifest::ChunkRef;

        namespace
        {
            // Share of the progress bar given to each phase of an upload
            constexpr double PLAN_DONE = 5.0;
            constexpr double CHUNKS_SPAN = 80.0;
            constexpr double MANIFEST_START = 85.0;
            constexpr double VERSION_START = 90.0;

            std::string shortHash(const std::string &hash, size_t length = 8)
            {
                return hash.substr(0, length) + "...";
            }

            std::vector<std::string> splitVersion(const std::string &version)
            {
                std::vector<std::string> parts;
                std::istringstream iss(version);
                std::string part;
                while (std::getline(iss, part, '.'))
                {
                    parts.push_back(part);
                }
                return parts;
            }

            bool isNumber(const std::string &value)
            {
                return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c)
                                                     { return std::isdigit(c) != 0; });
            }
        } // namespace

        UploadMode parseUploadMode(const std::string &value)
        {
            if (value == "full")
            {
                return UploadMode::Full;
            }
            if (value == "delta")
            {
                return UploadMode::Delta;
            }
            throw std::invalid_argument("Invalid upload mode '" + value + "'. Must be \"full\" or \"delta\"");
        }

        std::string toString(SessionState state)
        {
            switch (state)
            {
            case SessionState::Idle:
                return "idle";
            case SessionState::Uploading:
                return "uploading";
            case SessionState::Paused:
                return "paused";
            case SessionState::Completed:
                return "completed";
            case SessionState::Failed:
                return "failed";
            case SessionState::Cancelled:
                return "cancelled";
            }
            return "unknown";
        }

        // --- UploadSession ---

        UploadSession::UploadSession(Remote::RemoteStore &remote, const Chunks::ChunkStore &chunk_store,
                                     UploadPlan plan)
            : remote(remote), chunk_store(chunk_store), upload_plan(std::move(plan))
        {
        }

        UploadStats UploadSession::run(const ProgressCallback &on_progress)
        {
            {
                std::lock_guard<std::mutex> lock(mtx);
                if (current_state != SessionState::Idle)
                {
                    throw std::logic_error("Upload session has already been started");
                }
                current_state = SessionState::Uploading;
                counters.totalChunks = upload_plan.worklist.size();
                counters.filesProcessed = upload_plan.filesToUpload;
            }

            ProgressReporter progress(on_progress);
            const size_t total = upload_plan.worklist.size();
            progress.report(PLAN_DONE, "Uploading " + std::to_string(total) + " chunks for version " +
                                           upload_plan.manifest.version);

            for (size_t i = 0; i < total; ++i)
            {
                if (!waitIfPaused())
                {
                    return finishCancelled(progress);
                }
                {
                    std::lock_guard<std::mutex> lock(mtx);
                    position = i;
                }
                uploadChunk(i, progress);
            }

            bool cancelled_late = false;
            {
                std::lock_guard<std::mutex> lock(mtx);
                position = total;
                cancelled_late = cancelled;
            }
            if (cancelled_late)
            {
                return finishCancelled(progress);
            }

            try
            {
                publishManifest(progress);
            }
            catch (const std::exception &e)
            {
                {
                    std::lock_guard<std::mutex> lock(mtx);
                    current_state = SessionState::Failed;
                }
                ProgressEvent event;
                event.percentage = progress.lastPercentage();
                event.message = std::string("Failed to publish manifest: ") + e.what();
                event.error = true;
                progress.report(std::move(event));
                throw UploadError("Failed to publish manifest for version " + upload_plan.manifest.version + ": " +
                                  e.what());
            }

            UploadStats result;
            {
                std::lock_guard<std::mutex> lock(mtx);
                current_state = SessionState::Completed;
                result = counters;
            }

            std::string summary = "Upload complete! " + std::to_string(result.uploadedChunks) + " uploaded, " +
                                  std::to_string(result.skippedChunks) + " skipped";
            if (result.failedChunks > 0)
            {
                summary += ", " + std::to_string(result.failedChunks) + " failed (upload incomplete)";
            }
            ProgressEvent done;
            done.percentage = 100.0;
            done.message = summary;
            done.error = result.failedChunks > 0;
            progress.report(std::move(done));
            return result;
        }

        bool UploadSession::waitIfPaused()
        {
            std::unique_lock<std::mutex> lock(mtx);
            if (paused && !cancelled)
            {
                current_state = SessionState::Paused;
                resume_cv.wait(lock, [this]
                               { return !paused || cancelled; });
                if (!cancelled)
                {
                    current_state = SessionState::Uploading;
                }
            }
            return !cancelled;
        }

        void UploadSession::uploadChunk(size_t index, ProgressReporter &progress)
        {
            const ChunkRef &chunk = upload_plan.worklist[index];
            const size_t total = upload_plan.worklist.size();
            const double percentage = PLAN_DONE + (static_cast<double>(index + 1) / total) * CHUNKS_SPAN;
            const std::string track = Manifest::toString(upload_plan.manifest.buildType);
            std::string key;

            ProgressEvent event;
            event.percentage = percentage;
            event.chunk_hash = chunk.hash;

            try
            {
                key = Remote::Keys::chunkKey(track, upload_plan.manifest.version, chunk.hash);

                if (!chunk_store.exists(chunk.hash))
                {
                    throw std::runtime_error("Chunk file not found: " + chunk_store.chunkPath(chunk.hash).string());
                }

                // Catches chunks placed by an earlier, interrupted pass
                if (remote.exists(key))
                {
                    std::lock_guard<std::mutex> lock(mtx);
                    ++counters.skippedChunks;
                    counters.skippedChunksDetails.push_back({chunk.hash, key, "already_exists"});
                    event.chunk_status = ChunkStatus::Skipped;
                }
                else
                {
                    std::optional<std::vector<char>> data = chunk_store.get(chunk.hash);
                    if (!data)
                    {
                        throw std::runtime_error("Chunk file not found: " + chunk_store.chunkPath(chunk.hash).string());
                    }
                    remote.putObject(key, *data);

                    std::lock_guard<std::mutex> lock(mtx);
                    ++counters.uploadedChunks;
                    event.chunk_status = ChunkStatus::Uploaded;
                }

                UploadStats snapshot = stats();
                event.message = "Uploading chunks: " + std::to_string(index + 1) + "/" + std::to_string(total) + " (" +
                                std::to_string(snapshot.uploadedChunks) + " uploaded, " +
                                std::to_string(snapshot.skippedChunks) + " skipped)" + (isPaused() ? " (Paused)" : "");
            }
            catch (const std::exception &e)
            {
                std::cerr << "Failed to upload chunk " << chunk.hash << ": " << e.what() << std::endl;
                if (!key.empty())
                {
                    std::cerr << "Key: " << key << std::endl;
                }
                {
                    std::lock_guard<std::mutex> lock(mtx);
                    ++counters.failedChunks;
                    counters.failedChunksDetails.push_back({chunk.hash, key, e.what()});
                }
                event.chunk_status = ChunkStatus::Failed;
                event.error = true;
                event.message = "Error uploading chunk " + shortHash(chunk.hash) + ": " + e.what();
            }

            progress.report(std::move(event));
        }

        void UploadSession::publishManifest(ProgressReporter &progress)
        {
            ChunkManifest &manifest = upload_plan.manifest;
            const std::string track = Manifest::toString(manifest.buildType);

            progress.report(MANIFEST_START, "Uploading manifest...");
            manifest.assignRemoteUrls(upload_plan.reusedChunkKeys);
            const std::string body = manifest.serialize();
            remote.putObject(Remote::Keys::versionManifestKey(track, manifest.version), body);
            remote.putObject(Remote::Keys::latestManifestKey(track), body);

            progress.report(VERSION_START, "Uploading version file...");
            remote.putObject(Remote::Keys::versionDescriptorKey(track, manifest.version),
                             Manifest::serializeVersionDescriptor(manifest.version));
        }

        UploadStats UploadSession::finishCancelled(ProgressReporter &progress)
        {
            UploadStats result;
            {
                std::lock_guard<std::mutex> lock(mtx);
                current_state = SessionState::Cancelled;
                counters.cancelled = true;
                result = counters;
            }
            std::cout << "Upload of version " << upload_plan.manifest.version << " cancelled after "
                      << result.uploadedChunks << " uploaded chunk(s)." << std::endl;
            progress.report(progress.lastPercentage(), "Upload cancelled");
            return result;
        }

        void UploadSession::pause()
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (current_state == SessionState::Completed || current_state == SessionState::Failed ||
                current_state == SessionState::Cancelled)
            {
                return;
            }
            paused = true;
        }

        void UploadSession::resume()
        {
            {
                std::lock_guard<std::mutex> lock(mtx);
                if (!paused)
                {
                    return;
                }
                paused = false;
            }
            resume_cv.notify_all();
        }

        void UploadSession::cancel()
        {
            {
                std::lock_guard<std::mutex> lock(mtx);
                if (current_state == SessionState::Completed || current_state == SessionState::Failed)
                {
                    return;
                }
                cancelled = true;
                paused = false;
                if (current_state == SessionState::Idle)
                {
                    current_state = SessionState::Cancelled;
                    counters.cancelled = true;
                }
            }
            resume_cv.notify_all();
        }

        SessionState UploadSession::state() const
        {
            std::lock_guard<std::mutex> lock(mtx);
            return current_state;
        }

        bool UploadSession::isPaused() const
        {
            std::lock_guard<std::mutex> lock(mtx);
            return paused;
        }

        size_t UploadSession::cursor() const
        {
            std::lock_guard<std::mutex> lock(mtx);
            return position;
        }

        UploadStats UploadSession::stats() const
        {
            std::lock_guard<std::mutex> lock(mtx);
            return counters;
        }

        // --- UploadOrchestrator ---

        UploadOrchestrator::UploadOrchestrator(Remote::RemoteStore &remote, const Chunks::ChunkStore &chunk_store)
            : remote(remote), chunk_store(chunk_store)
        {
        }

        UploadPlan UploadOrchestrator::planUpload(ChunkManifest new_manifest, const ChunkManifest *old_manifest,
                                                  UploadMode mode, const ProgressCallback &on_progress) const
        {
            ProgressReporter progress(on_progress);
            UploadPlan plan;
            plan.mode = mode;

            if (mode == UploadMode::Delta && old_manifest != nullptr)
            {
                progress.report(0.0, "Detecting changes...");
                Delta::ManifestDelta delta = Delta::detectDelta(*old_manifest, new_manifest);

                plan.worklist = delta.chunksToUploadDetails;
                plan.filesToUpload = delta.newFiles.size() + delta.changedFiles.size();
                plan.delta = delta.stats;

                std::unordered_set<std::string> queued;
                for (const auto &chunk : plan.worklist)
                {
                    queued.insert(chunk.hash);
                }
                std::unordered_set<std::string> referenced;
                for (const auto &chunk : new_manifest.uniqueChunks())
                {
                    referenced.insert(chunk.hash);
                }
                const ChunkManifest previous = withPublishedUrls(*old_manifest);
                for (const auto &chunk : previous.uniqueChunks())
                {
                    if (referenced.count(chunk.hash) > 0 && queued.count(chunk.hash) == 0)
                    {
                        plan.reusedChunkKeys.emplace(chunk.hash, previous.remoteKeyFor(chunk));
                    }
                }
                progress.report(PLAN_DONE, "Found " + std::to_string(plan.worklist.size()) + " chunks to upload (" +
                                               std::to_string(delta.stats.newFilesCount) + " new, " +
                                               std::to_string(delta.stats.changedFilesCount) + " changed files)");
            }
            else
            {
                if (mode == UploadMode::Delta)
                {
                    std::cerr << "Warning: delta upload requested without an old manifest; uploading all chunks."
                              << std::endl;
                    plan.mode = UploadMode::Full;
                }
                progress.report(0.0, "Preparing full upload...");
                plan.worklist = new_manifest.uniqueChunks();
                plan.filesToUpload = new_manifest.files.size();
                progress.report(PLAN_DONE, "Uploading all " + std::to_string(plan.worklist.size()) + " chunks");
            }

            plan.manifest = std::move(new_manifest);
            return plan;
        }

        ChunkManifest UploadOrchestrator::withPublishedUrls(const ChunkManifest &manifest) const
        {
            ChunkManifest resolved = manifest;
            if (!resolved.assignedUrls().empty())
            {
                return resolved;
            }

            const std::string key =
                Remote::Keys::versionManifestKey(Manifest::toString(manifest.buildType), manifest.version);
            try
            {
                ChunkManifest published =
                    Manifest::parseChunkManifest(remote.getObjectAsString(key), Manifest::ValidationMode::Lenient);
                resolved.assignRemoteUrls(published.assignedUrls());
            }
            catch (const ObjectNotFoundError &)
            {
                // Not published yet; its chunks are expected under its own version
            }
            return resolved;
        }

        std::shared_ptr<UploadSession> UploadOrchestrator::createSession(UploadPlan plan) const
        {
            return std::make_shared<UploadSession>(remote, chunk_store, std::move(plan));
        }

        UploadStats UploadOrchestrator::upload(ChunkManifest manifest, std::vector<ChunkRef> worklist,
                                               const ProgressCallback &on_progress) const
        {
            UploadPlan plan;
            plan.filesToUpload = manifest.files.size();
            plan.manifest = std::move(manifest);
            plan.worklist = std::move(worklist);
            return createSession(std::move(plan))->run(on_progress);
        }

        VerifyResult UploadOrchestrator::verify(const ChunkManifest &manifest, const ProgressCallback &on_progress) const
        {
            ProgressReporter progress(on_progress);
            const std::string track = Manifest::toString(manifest.buildType);
            const std::vector<ChunkRef> chunks = manifest.uniqueChunks();

            VerifyResult result;
            result.totalChunks = chunks.size();

            std::cout << "Verifying " << chunks.size() << " chunks for version " << manifest.version
                      << ", buildType " << track << std::endl;
            progress.report(0.0, "Starting verification of " + std::to_string(chunks.size()) + " chunks...");

            for (size_t i = 0; i < chunks.size(); ++i)
            {
                const ChunkRef &chunk = chunks[i];
                ChunkLocation location{chunk.hash, chunk.size, manifest.remoteKeyFor(chunk)};

                bool found = false;
                try
                {
                    found = remote.exists(location.key);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Warning: existence check failed for " << location.key << ": " << e.what()
                              << " (counting as missing)" << std::endl;
                }

                result.totalSize += chunk.size;
                ProgressEvent event;
                event.percentage = (static_cast<double>(i + 1) / chunks.size()) * 100.0;
                event.chunk_hash = chunk.hash;
                if (found)
                {
                    result.existingSize += chunk.size;
                    result.existingChunks.push_back(std::move(location));
                    event.chunk_status = ChunkStatus::Exists;
                    event.message = "Chunk " + std::to_string(i + 1) + "/" + std::to_string(chunks.size()) +
                                    " exists (" + std::to_string(result.existingChunks.size()) + " found, " +
                                    std::to_string(result.missingChunks.size()) + " missing)";
                }
                else
                {
                    result.missingSize += chunk.size;
                    result.missingChunks.push_back(std::move(location));
                    event.chunk_status = ChunkStatus::Missing;
                    event.message = "Chunk " + std::to_string(i + 1) + "/" + std::to_string(chunks.size()) +
                                    " missing: " + shortHash(chunk.hash, 16);
                }
                progress.report(std::move(event));
            }

            result.allChunksExist = result.missingChunks.empty();
            progress.report(100.0, "Verification complete! " + std::to_string(result.existingChunks.size()) +
                                       " found, " + std::to_string(result.missingChunks.size()) + " missing");
            return result;
        }

        PromoteResult UploadOrchestrator::promote(const std::string &version, BuildType build_type,
                                                  const ChunkManifest *local_manifest,
                                                  const ProgressCallback &on_progress) const
        {
            if (!Manifest::isSafeVersion(version))
            {
                throw std::invalid_argument("Invalid version '" + version + "'");
            }

            ProgressReporter progress(on_progress);
            const std::string track = Manifest::toString(build_type);
            const std::string version_key = Remote::Keys::versionManifestKey(track, version);

            ChunkManifest manifest;
            if (local_manifest != nullptr)
            {
                manifest = withPublishedUrls(*local_manifest);
            }
            else
            {
                progress.report(0.0, "Fetching manifest for version " + version + "...");
                manifest = Manifest::parseChunkManifest(remote.getObjectAsString(version_key),
                                                        Manifest::ValidationMode::Lenient);
            }

            if (manifest.version != version)
            {
                throw ManifestError("version", "Manifest is for version " + manifest.version + ", not " + version);
            }
            if (manifest.buildType != build_type)
            {
                throw BuildTypeMismatchError("Cannot promote a " + Manifest::toString(manifest.buildType) +
                                             " manifest on the " + track + " track");
            }

            // Verification takes the 5-85% band of this operation's progress
            VerifyResult check = verify(manifest, [&progress](const ProgressEvent &event)
                                        {
                                            ProgressEvent scaled = event;
                                            scaled.percentage = 5.0 + event.percentage * 0.8;
                                            progress.report(std::move(scaled));
                                        });
            if (!check.allChunksExist)
            {
                const size_t missing = check.missingChunks.size();
                ProgressEvent event;
                event.percentage = progress.lastPercentage();
                event.message = "Promotion blocked: " + std::to_string(missing) + " chunk(s) missing";
                event.error = true;
                progress.report(std::move(event));
                throw PromotionError("Cannot promote version " + version + ": " + std::to_string(missing) +
                                         " chunk(s) missing from the remote store",
                                     missing);
            }

            progress.report(90.0, "Updating latest manifest for " + track + "...");
            manifest.assignRemoteUrls(manifest.assignedUrls());
            const std::string latest_key = Remote::Keys::latestManifestKey(track);
            remote.putObject(latest_key, manifest.serialize());

            std::cout << "Promoted version " << version << " to " << latest_key << std::endl;
            progress.report(100.0, "Version " + version + " is now the latest " + track + " build");

            PromoteResult result;
            result.version = version;
            result.buildType = build_type;
            result.latestKey = latest_key;
            result.totalChunks = check.totalChunks;
            return result;
        }

        VersionListing UploadOrchestrator::listVersions(BuildType build_type) const
        {
            const std::string track = Manifest::toString(build_type);
            const std::string prefix = Remote::Keys::versionsPrefix(track);

            VersionListing listing;
            for (const auto &common_prefix : remote.listCommonPrefixes(prefix, "/"))
            {
                std::string version = common_prefix.substr(prefix.size());
                if (!version.empty() && version.back() == '/')
                {
                    version.pop_back();
                }
                if (!version.empty())
                {
                    listing.versions.push_back(std::move(version));
                }
            }
            std::sort(listing.versions.begin(), listing.versions.end(),
                      [](const std::string &a, const std::string &b)
                      { return compareVersions(a, b) < 0; });

            const std::string latest_key = Remote::Keys::latestManifestKey(track);
            if (remote.exists(latest_key))
            {
                try
                {
                    ChunkManifest latest = Manifest::parseChunkManifest(remote.getObjectAsString(latest_key),
                                                                        Manifest::ValidationMode::Lenient);
                    listing.currentVersion = latest.version;
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Warning: could not read " << latest_key << ": " << e.what() << std::endl;
                }
            }
            return listing;
        }

        int UploadOrchestrator::compareVersions(const std::string &lhs, const std::string &rhs)
        {
            const std::vector<std::string> a = splitVersion(lhs);
            const std::vector<std::string> b = splitVersion(rhs);
            const size_t common = std::min(a.size(), b.size());

            for (size_t i = 0; i < common; ++i)
            {
                if (isNumber(a[i]) && isNumber(b[i]))
                {
                    // Compare by length first so long numbers never overflow
                    const std::string x = a[i].substr(std::min(a[i].find_first_not_of('0'), a[i].size() - 1));
                    const std::string y = b[i].substr(std::min(b[i].find_first_not_of('0'), b[i].size() - 1));
                    if (x.size() != y.size())
                    {
                        return x.size() < y.size() ? -1 : 1;
                    }
                    int cmp = x.compare(y);
                    if (cmp != 0)
                    {
                        return cmp < 0 ? -1 : 1;
                    }
                }
                else
                {
                    int cmp = a[i].compare(b[i]);
                    if (cmp != 0)
                    {
                        return cmp < 0 ? -1 : 1;
                    }
                }
            }
            if (a.size() == b.size())
            {
                return 0;
            }
            return a.size() < b.size() ? -1 : 1;
        }

    } // namespace Upload
} // namespace PackageSync

// include/upload_orchestrator.hpp
#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chunk_store.hpp"
#include "delta_detector.hpp"
#include "manifest.hpp"
#include "progress.hpp"
#include "remote_store.hpp"

namespace PackageSync
{
    namespace Upload
    {

        enum class UploadMode
        {
            Full,
            Delta
        };

        UploadMode parseUploadMode(const std::string &value);

        //   Idle -> Uploading <-> Paused -> Completed | Failed
        // Cancelled is reached from any non-terminal state through cancel().
        enum class SessionState
        {
            Idle,
            Uploading,
            Paused,
            Completed,
            Failed,
            Cancelled
        };

        std::string toString(SessionState state);

        struct ChunkOutcome
        {
            std::string hash;
            std::string key;
            std::string reason;
        };

        struct UploadStats
        {
            size_t totalChunks = 0;
            size_t uploadedChunks = 0;
            size_t skippedChunks = 0;
            size_t failedChunks = 0;
            size_t filesProcessed = 0;
            std::vector<ChunkOutcome> skippedChunksDetails;
            std::vector<ChunkOutcome> failedChunksDetails;
            bool cancelled = false;

            // False when any chunk failed or the session was cancelled; the
            // package then needs another pass before it can be promoted.
            bool complete() const { return failedChunks == 0 && !cancelled; }
        };

        struct UploadPlan
        {
            Manifest::ChunkManifest manifest;
            std::vector<Manifest::ChunkRef> worklist; // Unique chunks, upload order
            UploadMode mode = UploadMode::Full;
            size_t filesToUpload = 0;
            std::optional<Delta::DeltaStats> delta; // Set for delta plans
            // Delta plans: hash -> existing remote key of each chunk the old
            // version already published. The new manifest points there
            // instead of at a copy under its own version.
            std::map<std::string, std::string> reusedChunkKeys;
        };

        // One upload invocation. Created by UploadOrchestrator::createSession()
        // and owned by the caller, who may pause, resume or cancel it from
        // another thread while run() is executing.
        //
        // Only one session should run against a remote store at a time. This
        // is the caller's contract; nothing here locks across sessions.
        class UploadSession
        {
        public:
            UploadSession(Remote::RemoteStore &remote, const Chunks::ChunkStore &chunk_store, UploadPlan plan);

            UploadSession(const UploadSession &) = delete;
            UploadSession &operator=(const UploadSession &) = delete;

            // Upload the worklist in order, then publish the manifest (to the
            // version path and the latest path) and the version descriptor.
            //
            // Per-chunk failures are counted and skipped over; failing to
            // publish the manifest or descriptor throws UploadError. May be
            // called once; a second call throws std::logic_error.
            UploadStats run(const ProgressCallback &on_progress = nullptr);

            // Cooperative: takes effect before the next chunk is started and
            // the session continues from that same chunk on resume().
            void pause();
            // No-op unless paused.
            void resume();
            // Stop before the next chunk (also releases a pause). The manifest
            // is not published and run() returns stats with cancelled set.
            void cancel();

            SessionState state() const;
            bool isPaused() const;
            // Index of the chunk being processed, or worklist size once the loop is done
            size_t cursor() const;
            UploadStats stats() const;

            const UploadPlan &plan() const { return upload_plan; }

        private:
            Remote::RemoteStore &remote;
            const Chunks::ChunkStore &chunk_store;
            UploadPlan upload_plan;

            mutable std::mutex mtx;
            std::condition_variable resume_cv;
            bool paused = false;
            bool cancelled = false;
            SessionState current_state = SessionState::Idle;
            size_t position = 0;
            UploadStats counters;

            // Blocks while paused. Returns false if the session was cancelled.
            bool waitIfPaused();
            void uploadChunk(size_t index, ProgressReporter &progress);
            void publishManifest(ProgressReporter &progress);
            UploadStats finishCancelled(ProgressReporter &progress);
        };

        struct ChunkLocation
        {
            std::string hash;
            uint64_t size = 0;
            std::string key;
        };

        struct VerifyResult
        {
            size_t totalChunks = 0;
            std::vector<ChunkLocation> existingChunks;
            std::vector<ChunkLocation> missingChunks;
            uint64_t totalSize = 0;
            uint64_t existingSize = 0;
            uint64_t missingSize = 0;
            bool allChunksExist = false;
        };

        struct PromoteResult
        {
            std::string version;
            Manifest::BuildType buildType = Manifest::BuildType::Production;
            std::string latestKey;
            size_t totalChunks = 0;
        };

        struct VersionListing
        {
            std::vector<std::string> versions; // Oldest first
            std::optional<std::string> currentVersion;
        };

        // Sequences chunk upload, manifest publication, verification and
        // promotion against one remote store.
        class UploadOrchestrator
        {
        public:
            UploadOrchestrator(Remote::RemoteStore &remote, const Chunks::ChunkStore &chunk_store);

            // Work out which chunks must travel. Delta mode with an old manifest
            // narrows the set through the delta detector (build types must
            // match); otherwise every distinct chunk of the new manifest is queued.
            UploadPlan planUpload(Manifest::ChunkManifest new_manifest, const Manifest::ChunkManifest *old_manifest,
                                  UploadMode mode, const ProgressCallback &on_progress = nullptr) const;

            std::shared_ptr<UploadSession> createSession(UploadPlan plan) const;

            // Build and run a session in one go.
            UploadStats upload(Manifest::ChunkManifest manifest, std::vector<Manifest::ChunkRef> worklist,
                               const ProgressCallback &on_progress = nullptr) const;

            // Read-only existence check of every distinct chunk, at its url or,
            // while unassigned, under the manifest's own version. A failing
            // existence check counts as missing.
            VerifyResult verify(const Manifest::ChunkManifest &manifest,
                                const ProgressCallback &on_progress = nullptr) const;

            // Repoint the latest manifest of build_type at version. Uses
            // local_manifest when given, otherwise fetches the published one.
            // A local manifest without urls takes them from the published copy
            // when there is one, so chunks reused from an earlier version are
            // looked up where they live.
            // Throws PromotionError if any chunk is missing remotely, in which
            // case the latest pointer is left as it was. Concurrent promotions
            // are last-writer-wins.
            PromoteResult promote(const std::string &version, Manifest::BuildType build_type,
                                  const Manifest::ChunkManifest *local_manifest = nullptr,
                                  const ProgressCallback &on_progress = nullptr) const;

            VersionListing listVersions(Manifest::BuildType build_type) const;

            // Dotted comparison, numeric where both parts are numbers.
            // Negative, zero or positive like strcmp.
            static int compareVersions(const std::string &lhs, const std::string &rhs);

        private:
            Remote::RemoteStore &remote;
            const Chunks::ChunkStore &chunk_store;

            // A copy of manifest; if none of its chunks has a url yet, they are
            // taken from the published manifest of the same version, if any.
            Manifest::ChunkManifest withPublishedUrls(const Manifest::ChunkManifest &manifest) const;
        };

    } // namespace Upload
} // namespace PackageSync

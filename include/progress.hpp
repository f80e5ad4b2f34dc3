// include/progress.hpp
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace PackageSync
{

    // Per-chunk outcome attached to progress events during upload and verification.
    enum class ChunkStatus
    {
        Uploaded,
        Skipped,
        Failed,
        Exists,
        Missing
    };

    std::string toString(ChunkStatus status);

    struct ProgressEvent
    {
        double percentage = 0.0;
        std::string message;
        std::optional<ChunkStatus> chunk_status;
        std::optional<std::string> chunk_hash;
        bool error = false;
    };

    using ProgressCallback = std::function<void(const ProgressEvent &)>;

    // Wraps a caller's callback so one operation reports a percentage that never
    // goes backwards and stays within [0, 100]. A null callback makes every
    // report a no-op.
    class ProgressReporter
    {
    public:
        explicit ProgressReporter(ProgressCallback callback) : callback(std::move(callback)) {}

        void report(double percentage, const std::string &message);
        void report(ProgressEvent event);

        double lastPercentage() const { return last_percentage; }

    private:
        ProgressCallback callback;
        double last_percentage = 0.0;
    };

} // namespace PackageSync

// src/progress.cpp
#include "progress.hpp"

#include <algorithm>

namespace PackageSync
{

    std::string toString(ChunkStatus status)
    {
        switch (status)
        {
        case ChunkStatus::Uploaded:
            return "uploaded";
        case ChunkStatus::Skipped:
            return "skipped";
        case ChunkStatus::Failed:
            return "failed";
        case ChunkStatus::Exists:
            return "exists";
        case ChunkStatus::Missing:
            return "missing";
        }
        return "unknown";
    }

    void ProgressReporter::report(double percentage, const std::string &message)
    {
        ProgressEvent event;
        event.percentage = percentage;
        event.message = message;
        report(std::move(event));
    }

    void ProgressReporter::report(ProgressEvent event)
    {
        event.percentage = std::clamp(event.percentage, 0.0, 100.0);
        event.percentage = std::max(event.percentage, last_percentage);
        last_percentage = event.percentage;
        if (callback)
        {
            callback(event);
        }
    }

} // namespace PackageSync

#pragma once

#include "job_state.hpp"
#include "progress.hpp"

#include <filesystem>
#include <memory>

namespace rangefetch {

// Unit of work run by DownloadManager on its own thread.
class DownloadTask {
public:
    virtual ~DownloadTask() = default;

    // Runs to a terminal state; failures are recorded, not thrown.
    virtual void start() = 0;

    [[nodiscard]] virtual Progress getProgress() const = 0;
    [[nodiscard]] virtual bool isRunning() const = 0;
    [[nodiscard]] virtual bool hasError() const = 0;

    [[nodiscard]] virtual JobState state() const = 0;
    // Empty until the target has been resolved.
    [[nodiscard]] virtual std::filesystem::path outputPath() const = 0;
};

using DownloadTaskPtr = std::shared_ptr<DownloadTask>;

} // namespace rangefetch

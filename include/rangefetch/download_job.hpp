#pragma once

#include "download_task.hpp"
#include "http_transport.hpp"
#include "job_state.hpp"
#include "output_registry.hpp"
#include "resolver.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace rangefetch {

struct JobOptions {
    std::string link;
    std::filesystem::path destination_dir;
    // Number of chunks, which is also the number of concurrent requests.
    std::size_t workers{8};
};

// One link, resolved and downloaded into destination_dir/<file name>.
//
// start() drives INIT -> RESOLVING -> PLANNING -> FETCHING -> MERGING -> DONE,
// or RESOLVING -> FALLBACK_FETCHING -> DONE when the target cannot be split.
// Every chunk is awaited before any failure is judged. A failure ends in FAILED
// with no final file and no part stores left on disk. start() does not throw.
//
// Right after resolving, the job claims its final path in `outputs`. When
// another job of the same registry holds that path the job writes to
// "<stem> (N)<ext>" instead. Without a registry the job only guards itself.
class DownloadJob final : public DownloadTask {
public:
    DownloadJob(JobOptions options, TargetResolverPtr resolver, HttpTransportPtr transport,
                OutputRegistryPtr outputs = nullptr);
    ~DownloadJob() override;

    void start() override;
    [[nodiscard]] Progress getProgress() const override;
    [[nodiscard]] bool isRunning() const override;
    [[nodiscard]] bool hasError() const override;

    [[nodiscard]] JobState state() const override;
    [[nodiscard]] std::filesystem::path outputPath() const override;
    [[nodiscard]] std::uint64_t bytesTransferred() const;
    // Chunks that failed in the last chunked run; 0 otherwise.
    [[nodiscard]] std::size_t failedChunks() const;
    [[nodiscard]] std::string errorMessage() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangefetch

#include "rangefetch/download_job.hpp"
#include "rangefetch/chunk.hpp"
#include "rangefetch/chunk_fetcher.hpp"
#include "rangefetch/detail/scope_exit.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/merge_assembler.hpp"
#include "rangefetch/single_stream_downloader.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangefetch {

namespace {

struct ChunkedPlan {
    std::vector<ChunkSpec> chunks;
};

struct SingleStream {};

using JobStrategy = std::variant<ChunkedPlan, SingleStream>;

} // namespace

class DownloadJob::Impl {
public:
    Impl(JobOptions options, TargetResolverPtr resolver, HttpTransportPtr transport,
         OutputRegistryPtr outputs)
        : options_(std::move(options)),
          resolver_(std::move(resolver)),
          transport_(std::move(transport)),
          outputs_(outputs ? std::move(outputs) : std::make_shared<OutputRegistry>()) {
        options_.workers = std::max<std::size_t>(1, options_.workers);
    }

    ~Impl() { releaseOutput(); }

    void start() {
        resetState();
        try {
            run();
        } catch (const JobAbortedError& ex) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                failed_chunks_ = ex.failedChunks();
            }
            registerError(ex.what());
        } catch (const std::exception& ex) {
            registerError(ex.what());
        }
        setRunning(false);
    }

    [[nodiscard]] Progress getProgress() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return {
            options_.link,
            output_path_.empty() ? options_.link : output_path_.string(),
            std::string{to_string(state_)},
            total_bytes_,
            progress_.total(),
            is_running_,
            has_error_,
            error_message_
        };
    }

    [[nodiscard]] bool isRunning() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return is_running_;
    }

    [[nodiscard]] bool hasError() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return has_error_;
    }

    [[nodiscard]] JobState state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

    [[nodiscard]] std::filesystem::path outputPath() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return output_path_;
    }

    [[nodiscard]] std::uint64_t bytesTransferred() const { return progress_.total(); }

    [[nodiscard]] std::size_t failedChunks() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return failed_chunks_;
    }

    [[nodiscard]] std::string errorMessage() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return error_message_;
    }

private:
    struct StrategyRunner {
        Impl& self;
        const DownloadTarget& target;
        const std::filesystem::path& final_path;

        void operator()(const ChunkedPlan& plan) const { self.runChunked(plan, target, final_path); }
        void operator()(const SingleStream&) const { self.runSingleStream(target, final_path); }
    };

    void run() {
        setState(JobState::Resolving);
        if (!resolver_ || !transport_) {
            throw Error("job has no resolver or transport");
        }
        const DownloadTarget target = resolver_->resolve(options_.link);
        const std::filesystem::path desired = options_.destination_dir / target.file_name;
        const std::filesystem::path final_path = outputs_->claim(desired);
        if (final_path != desired) {
            spdlog::info("{} is taken by another download; saving {} as {}", desired.string(),
                         options_.link, final_path.filename().string());
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            output_path_ = final_path;
            total_bytes_ = target.total_size;
        }

        JobStrategy strategy = SingleStream{};
        if (target.supportsChunking()) {
            setState(JobState::Planning);
            strategy = ChunkedPlan{planChunks(target.total_size, options_.workers)};
        }
        std::visit(StrategyRunner{*this, target, final_path}, strategy);

        setState(JobState::Done);
        spdlog::info("Download complete: {}", final_path.string());
    }

    void runChunked(const ChunkedPlan& plan, const DownloadTarget& target,
                    const std::filesystem::path& final_path) {
        const std::size_t count = plan.chunks.size();
        spdlog::info("Downloading {} ({:.2f} MB) using {} workers", target.file_name,
                     static_cast<double>(target.total_size) / 1024.0 / 1024.0, count);

        // Part stores never outlive the job, whichever way it ends.
        auto cleanup = detail::makeScopeExit(
            [&final_path, count] { MergeAssembler::removeParts(final_path, count); });

        setState(JobState::Fetching);
        std::vector<ChunkResult> results(count);
        for (std::size_t i = 0; i < count; ++i) {
            results[i].index = i;
            results[i].error = "not dispatched";
        }

        ChunkFetcher fetcher(*transport_, progress_);
        std::vector<std::thread> workers;
        workers.reserve(count);
        try {
            for (const auto& chunk : plan.chunks) {
                auto part = partPath(final_path, chunk.index);
                spdlog::debug("Dispatching chunk {} [{}-{}]", chunk.index, chunk.start, chunk.end);
                workers.emplace_back([&fetcher, &results, &target, chunk, part = std::move(part)] {
                    results[chunk.index] = fetcher.fetch(target.direct_url, chunk, part);
                });
            }
        } catch (const std::exception& ex) {
            // Undispatched chunks keep their failed result; started ones are still joined.
            spdlog::error("Cannot dispatch chunk: {}", ex.what());
        }

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }

        std::size_t failed = 0;
        for (const auto& result : results) {
            if (!result.success) {
                ++failed;
                spdlog::debug("Chunk {} failed: {}", result.index, result.error);
            }
        }
        if (failed > 0) {
            throw JobAbortedError(failed, count);
        }

        setState(JobState::Merging);
        MergeAssembler{}.merge(final_path, count);
    }

    void runSingleStream(const DownloadTarget& target, const std::filesystem::path& final_path) {
        setState(JobState::FallbackFetching);
        spdlog::info("File size unknown or server does not support ranges; "
                     "falling back to a single stream for {}", target.file_name);

        SingleStreamDownloader downloader(*transport_, progress_);
        const auto written = downloader.download(target.direct_url, final_path, target.total_size);

        std::lock_guard<std::mutex> lock(state_mutex_);
        if (total_bytes_ == 0) {
            total_bytes_ = written;
        }
    }

    // The claim outlives a finished run so a later job cannot overwrite the
    // result; it is given up only on restart or destruction.
    void releaseOutput() {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!output_path_.empty()) {
            outputs_->release(output_path_);
            output_path_.clear();
        }
    }

    void resetState() {
        progress_.reset();
        releaseOutput();

        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = JobState::Init;
        total_bytes_ = 0;
        failed_chunks_ = 0;
        has_error_ = false;
        error_message_.clear();
        is_running_ = true;
    }

    void setState(JobState state) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        spdlog::debug("[{}] {} -> {}", options_.link, to_string(state_), to_string(state));
        state_ = state;
    }

    void registerError(const std::string& message) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        error_message_ = fmt::format("{} failed: {}", to_string(state_), message);
        spdlog::error("{}: {}", options_.link, error_message_);
        has_error_ = true;
        state_ = JobState::Failed;
    }

    void setRunning(bool running) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        is_running_ = running;
    }

    JobOptions options_;
    TargetResolverPtr resolver_;
    HttpTransportPtr transport_;
    OutputRegistryPtr outputs_;

    JobProgress progress_;

    mutable std::mutex state_mutex_;
    JobState state_{JobState::Init};
    std::filesystem::path output_path_;
    std::uint64_t total_bytes_{0};
    std::size_t failed_chunks_{0};
    bool is_running_{false};
    bool has_error_{false};
    std::string error_message_;
};

DownloadJob::DownloadJob(JobOptions options, TargetResolverPtr resolver, HttpTransportPtr transport,
                         OutputRegistryPtr outputs)
    : impl_(std::make_unique<Impl>(std::move(options), std::move(resolver), std::move(transport),
                                   std::move(outputs))) {}

DownloadJob::~DownloadJob() = default;

void DownloadJob::start() { impl_->start(); }

Progress DownloadJob::getProgress() const { return impl_->getProgress(); }

bool DownloadJob::isRunning() const { return impl_->isRunning(); }

bool DownloadJob::hasError() const { return impl_->hasError(); }

JobState DownloadJob::state() const { return impl_->state(); }

std::filesystem::path DownloadJob::outputPath() const { return impl_->outputPath(); }

std::uint64_t DownloadJob::bytesTransferred() const { return impl_->bytesTransferred(); }

std::size_t DownloadJob::failedChunks() const { return impl_->failedChunks(); }

std::string DownloadJob::errorMessage() const { return impl_->errorMessage(); }

} // namespace rangefetch

#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace rangefetch {

// Snapshot of one task, consumed by the progress panel.
struct Progress {
    std::string url;
    std::string filename;
    std::string stage;
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    bool is_running{false};
    bool has_error{false};
    std::string error_message;
};

// Bytes transferred by every fetcher of one job. Only ever grows between resets.
class JobProgress {
public:
    JobProgress() = default;
    JobProgress(const JobProgress&) = delete;
    JobProgress& operator=(const JobProgress&) = delete;

    void add(std::uint64_t bytes) noexcept { bytes_.fetch_add(bytes, std::memory_order_relaxed); }
    void reset() noexcept { bytes_.store(0, std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t total() const noexcept {
        return bytes_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> bytes_{0};
};

} // namespace rangefetch

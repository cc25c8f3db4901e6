#pragma once

#include "download_task.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace rangefetch {

class DownloadManager {
public:
    explicit DownloadManager(bool render_progress = true);

    void addTask(DownloadTaskPtr task);

    // Runs every task on its own thread and blocks until all have finished.
    // Returns true when every task reached Done.
    bool start();

    // Writes the output path of every task that reached Done.
    void printCompleted(std::ostream& out) const;

    // Writes one diagnostic line per failed task.
    void printErrors(std::ostream& out) const;

    [[nodiscard]] std::size_t taskCount() const noexcept { return tasks_.size(); }

    static std::string formatTaskLine(const Progress& progress);
    static std::string formatSize(std::uint64_t bytes);

private:
    void renderProgressLoop();
    std::string buildProgressPanel() const;
    bool hasActiveTasks() const;
    void redrawPanel(const std::string& panel, std::size_t& previous_lines);

    bool render_progress_;
    std::atomic<std::size_t> finished_{0};
    std::vector<std::thread> threads_;
    std::vector<DownloadTaskPtr> tasks_;
};

} // namespace rangefetch

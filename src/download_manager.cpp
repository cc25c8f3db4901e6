#include "rangefetch/download_manager.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangefetch {

DownloadManager::DownloadManager(bool render_progress) : render_progress_(render_progress) {}

void DownloadManager::addTask(DownloadTaskPtr task) {
    if (task) {
        tasks_.push_back(std::move(task));
    }
}

bool DownloadManager::start() {
    finished_ = 0;
    threads_.reserve(tasks_.size());
    for (auto& task : tasks_) {
        try {
            threads_.emplace_back([this, task]() {
                task->start();
                ++finished_;
            });
        } catch (const std::system_error& ex) {
            spdlog::error("Cannot start download thread: {}", ex.what());
            ++finished_;
        }
    }

    if (render_progress_) {
        renderProgressLoop();
    }

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    // A task whose thread never started is still in Init and counts as a failure.
    return std::all_of(tasks_.begin(), tasks_.end(), [](const DownloadTaskPtr& task) {
        return task->state() == JobState::Done;
    });
}

void DownloadManager::printCompleted(std::ostream& out) const {
    for (const auto& task : tasks_) {
        if (task->state() == JobState::Done) {
            out << "Download complete: " << task->outputPath().string() << '\n';
        }
    }
}

void DownloadManager::printErrors(std::ostream& out) const {
    for (const auto& task : tasks_) {
        const auto progress = task->getProgress();
        if (progress.has_error) {
            out << fmt::format("Error: {}: {}", progress.url, progress.error_message) << '\n';
        }
    }
}

void DownloadManager::renderProgressLoop() {
    std::size_t previous_lines = 0;
    while (true) {
        const bool active = hasActiveTasks();
        const auto panel = buildProgressPanel();
        redrawPanel(panel, previous_lines);

        if (!active) {
            break;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << std::flush;
}

std::string DownloadManager::buildProgressPanel() const {
    std::string panel;
    panel.reserve(tasks_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("rangefetch ({} tasks)\n", tasks_.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;

    for (const auto& task : tasks_) {
        const auto progress = task->getProgress();
        panel += formatTaskLine(progress);
        panel.push_back('\n');

        total_all += progress.total_bytes;
        downloaded_all += progress.downloaded_bytes;
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(std::min(ratio, 1.0) * 100.0));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string DownloadManager::formatTaskLine(const Progress& progress) {
    std::string line;
    line.reserve(256);

    std::string display_name;
    if (!progress.filename.empty()) {
        display_name = std::filesystem::path{progress.filename}.filename().string();
    }
    if (display_name.empty()) {
        display_name = progress.filename;
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (progress.total_bytes > 0) {
        const double ratio = std::min(1.0, static_cast<double>(progress.downloaded_bytes) /
                                               static_cast<double>(progress.total_bytes));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? "#" : "-";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})", display_name, bar, percent,
                            formatSize(progress.downloaded_bytes),
                            formatSize(progress.total_bytes));
    } else if (progress.downloaded_bytes > 0) {
        line += fmt::format("{:<20} [streaming] {}", display_name,
                            formatSize(progress.downloaded_bytes));
    } else {
        line += fmt::format("{:<20} [{}]", display_name,
                            progress.stage.empty() ? "init" : progress.stage);
    }

    if (progress.has_error) {
        line += fmt::format("  FAILED {}", progress.error_message);
    } else if (!progress.is_running && progress.stage == "done") {
        line.append("  Done");
    }

    return line;
}

std::string DownloadManager::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

bool DownloadManager::hasActiveTasks() const {
    return finished_.load() < tasks_.size();
}

void DownloadManager::redrawPanel(const std::string& panel, std::size_t& previous_lines) {
    const std::size_t current_lines =
        static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines > 0) {
        std::cout << "\033[" << previous_lines << "F\033[J";
    }
    std::cout << panel;
    previous_lines = current_lines;
}

} // namespace rangefetch

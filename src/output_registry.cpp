#include "rangefetch/output_registry.hpp"

#include <string>

#include <fmt/format.h>

namespace rangefetch {

namespace {

std::filesystem::path numberedSibling(const std::filesystem::path& path, std::size_t n) {
    const auto stem = path.stem().string();
    const auto ext = path.extension().string();
    return path.parent_path() / fmt::format("{} ({}){}", stem, n, ext);
}

} // namespace

std::filesystem::path OutputRegistry::claim(const std::filesystem::path& desired) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (claimed_.insert(desired).second) {
        return desired;
    }
    for (std::size_t n = 1;; ++n) {
        auto candidate = numberedSibling(desired, n);
        if (claimed_.insert(candidate).second) {
            return candidate;
        }
    }
}

void OutputRegistry::release(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    claimed_.erase(path);
}

bool OutputRegistry::isClaimed(const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.count(path) > 0;
}

std::size_t OutputRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.size();
}

} // namespace rangefetch

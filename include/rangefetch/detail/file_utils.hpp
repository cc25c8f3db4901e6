#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>

namespace rangefetch::detail {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

// Opens with std::fopen; a null FilePtr signals failure.
[[nodiscard]] FilePtr openFile(const std::filesystem::path& path, const char* mode);

// Flushes and closes, reporting whether every buffered byte reached the file.
[[nodiscard]] bool closeFile(FilePtr& file) noexcept;

// Removes `path` if present; failures are logged, never thrown.
bool removeQuietly(const std::filesystem::path& path) noexcept;

} // namespace rangefetch::detail

#include "rangefetch/merge_assembler.hpp"
#include "rangefetch/chunk.hpp"
#include "rangefetch/detail/file_utils.hpp"
#include "rangefetch/detail/scope_exit.hpp"
#include "rangefetch/errors.hpp"

#include <cstdio>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangefetch {

namespace {
constexpr std::size_t kCopyBufferSize = 1024 * 1024;
} // namespace

void MergeAssembler::merge(const std::filesystem::path& final_path,
                           std::size_t part_count) const {
    auto cleanup = detail::makeScopeExit([&] {
        const auto removed = removeParts(final_path, part_count);
        spdlog::debug("Removed {} part files of {}", removed, final_path.string());
    });

    for (std::size_t i = 0; i < part_count; ++i) {
        const auto part = partPath(final_path, i);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(part, ec)) {
            throw MergeIntegrityError(
                fmt::format("part file {} is missing", part.string()));
        }
    }

    spdlog::info("Merging {} parts into {}", part_count, final_path.filename().string());

    detail::FilePtr out = detail::openFile(final_path, "wb");
    if (!out) {
        throw Error(fmt::format("cannot create {}", final_path.string()));
    }
    auto discard = detail::makeScopeExit([&] {
        out.reset();
        detail::removeQuietly(final_path);
    });

    std::vector<char> buffer(kCopyBufferSize);
    for (std::size_t i = 0; i < part_count; ++i) {
        const auto part = partPath(final_path, i);
        detail::FilePtr in = detail::openFile(part, "rb");
        if (!in) {
            throw MergeIntegrityError(fmt::format("part file {} is missing", part.string()));
        }

        std::size_t got = 0;
        while ((got = std::fread(buffer.data(), 1, buffer.size(), in.get())) > 0) {
            if (std::fwrite(buffer.data(), 1, got, out.get()) != got) {
                throw Error(fmt::format("cannot write {}", final_path.string()));
            }
        }
        if (std::ferror(in.get())) {
            throw MergeIntegrityError(fmt::format("cannot read part file {}", part.string()));
        }
    }

    if (!detail::closeFile(out)) {
        throw Error(fmt::format("cannot finish {}", final_path.string()));
    }
    discard.dismiss();
}

std::size_t MergeAssembler::removeParts(const std::filesystem::path& final_path,
                                        std::size_t part_count) noexcept {
    std::size_t removed = 0;
    for (std::size_t i = 0; i < part_count; ++i) {
        if (detail::removeQuietly(partPath(final_path, i))) {
            ++removed;
        }
    }
    return removed;
}

} // namespace rangefetch

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace rangefetch {

struct CliOptions {
    std::vector<std::string> links;
    std::filesystem::path download_dir;
    std::size_t threads{8};
    long stall_timeout_seconds{30};
    std::string api_endpoint;
    bool direct{false};
    bool show_progress{true};
    bool verbose{false};
    bool show_help{false};
};

// Parses argv. Throws std::invalid_argument for unknown options, missing values,
// out-of-range numbers or missing required options. With -h/--help the result
// only has show_help set.
[[nodiscard]] CliOptions parseCommandLine(int argc, const char* const* argv);

void printUsage(const char* program_name);

} // namespace rangefetch

#include "rangefetch/cli_options.hpp"
#include "rangefetch/resolver.hpp"

#include <iostream>
#include <stdexcept>

namespace rangefetch {

namespace {

constexpr long kMaxThreads = 64;

long parseNumber(const std::string& option, const std::string& value, long min, long max) {
    std::size_t consumed = 0;
    long number = 0;
    try {
        number = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    if (consumed != value.size() || number < min || number > max) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    return number;
}

} // namespace

void printUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name
              << " -l <link> -d <directory> [-t <threads>] [options]" << std::endl;
    std::cerr << "Options:\n"
              << "  -l, --link <link>                Public share link (repeatable)\n"
              << "  -d, --download_location <dir>    Download directory\n"
              << "  -t, --threads <n>                Parallel connections, 1-64 (default: 8)\n"
              << "      --timeout <seconds>          Abort a stalled request after this long (default: 30)\n"
              << "      --api <url>                  Resource API endpoint\n"
              << "      --direct                     Treat links as direct download URLs\n"
              << "      --no-progress                Do not draw the progress panel\n"
              << "  -v, --verbose                    Debug logging\n"
              << "  -h, --help                       Show this message" << std::endl;
}

CliOptions parseCommandLine(int argc, const char* const* argv) {
    CliOptions options;
    options.api_endpoint = YandexDiskResolver::kDefaultApiEndpoint;

    int arg_index = 1;
    auto requireValue = [&](const std::string& option) -> std::string {
        if (arg_index + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + option);
        }
        arg_index += 2;
        return argv[arg_index - 1];
    };

    while (arg_index < argc) {
        const std::string option = argv[arg_index];

        if (option == "-l" || option == "--link") {
            options.links.push_back(requireValue(option));
        } else if (option == "-d" || option == "--download_location") {
            options.download_dir = requireValue(option);
        } else if (option == "-t" || option == "--threads") {
            options.threads =
                static_cast<std::size_t>(parseNumber(option, requireValue(option), 1, kMaxThreads));
        } else if (option == "--timeout") {
            options.stall_timeout_seconds = parseNumber(option, requireValue(option), 1, 86400);
        } else if (option == "--api") {
            options.api_endpoint = requireValue(option);
        } else if (option == "--direct") {
            options.direct = true;
            ++arg_index;
        } else if (option == "--no-progress") {
            options.show_progress = false;
            ++arg_index;
        } else if (option == "-v" || option == "--verbose") {
            options.verbose = true;
            ++arg_index;
        } else if (option == "-h" || option == "--help") {
            CliOptions help;
            help.show_help = true;
            return help;
        } else {
            throw std::invalid_argument("Unknown option: " + option);
        }
    }

    if (options.links.empty()) {
        throw std::invalid_argument("Missing required option --link");
    }
    if (options.download_dir.empty()) {
        throw std::invalid_argument("Missing required option --download_location");
    }
    return options;
}

} // namespace rangefetch

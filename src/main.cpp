#include "rangefetch/cli_options.hpp"
#include "rangefetch/curl_transport.hpp"
#include "rangefetch/detail/curl_utils.hpp"
#include "rangefetch/download_job.hpp"
#include "rangefetch/download_manager.hpp"
#include "rangefetch/output_registry.hpp"
#include "rangefetch/resolver.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <unistd.h>

int main(int argc, char** argv) {
    rangefetch::CliOptions options;
    try {
        options = rangefetch::parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << std::endl;
        rangefetch::printUsage(argv[0]);
        return 1;
    }
    if (options.show_help) {
        rangefetch::printUsage(argv[0]);
        return 0;
    }

    try {
        spdlog::set_default_logger(spdlog::stderr_color_mt("rangefetch"));
        spdlog::set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
        rangefetch::detail::ensureCurlInitialized();

        std::error_code ec;
        std::filesystem::create_directories(options.download_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create download directory: " +
                                     options.download_dir.string() + " - " + ec.message());
        }

        rangefetch::TransportOptions transport_options;
        transport_options.stall_timeout_seconds = options.stall_timeout_seconds;
        auto transport = std::make_shared<rangefetch::CurlTransport>(transport_options);

        rangefetch::TargetResolverPtr resolver;
        if (options.direct) {
            resolver = std::make_shared<rangefetch::DirectUrlResolver>(transport);
        } else {
            resolver = std::make_shared<rangefetch::YandexDiskResolver>(transport,
                                                                        options.api_endpoint);
        }

        const bool render = options.show_progress && isatty(STDOUT_FILENO) == 1;
        rangefetch::DownloadManager manager(render);
        auto outputs = std::make_shared<rangefetch::OutputRegistry>();
        for (const auto& link : options.links) {
            rangefetch::JobOptions job_options{link, options.download_dir, options.threads};
            manager.addTask(std::make_shared<rangefetch::DownloadJob>(
                std::move(job_options), resolver, transport, outputs));
        }

        const bool ok = manager.start();
        manager.printCompleted(std::cout);
        std::cout << std::flush;
        if (!ok) {
            manager.printErrors(std::cerr);
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

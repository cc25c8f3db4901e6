#include "rangefetch/resolver.hpp"
#include "rangefetch/detail/curl_utils.hpp"
#include "rangefetch/detail/url_utils.hpp"
#include "rangefetch/errors.hpp"

#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rangefetch {

namespace {

std::string apiErrorDetail(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return {};
    }
    for (const char* key : {"description", "message", "error"}) {
        const auto it = json.find(key);
        if (it != json.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return {};
}

} // namespace

DownloadTarget probeTarget(HttpTransport& transport, const std::string& direct_url,
                           std::string file_name) {
    ProbeResult probe;
    try {
        probe = transport.probe(direct_url);
    } catch (const TransferError& ex) {
        throw ResolutionError(fmt::format("metadata probe failed: {}", ex.what()));
    }

    // Non-HTTP schemes report 0; anything but 2xx leaves the size unreliable.
    const bool usable =
        probe.status_code == 0 || (probe.status_code >= 200 && probe.status_code < 300);
    if (!usable) {
        spdlog::debug("Metadata request for {} answered HTTP {}; size and range support unknown",
                      direct_url, probe.status_code);
    }

    DownloadTarget target;
    target.direct_url = direct_url;
    target.file_name = std::move(file_name);
    target.total_size = usable ? probe.content_length : 0;
    target.supports_ranges =
        usable && detail::toLower(detail::trim(probe.accept_ranges)) == "bytes";
    return target;
}

YandexDiskResolver::YandexDiskResolver(HttpTransportPtr transport, std::string api_endpoint)
    : transport_(std::move(transport)), api_endpoint_(std::move(api_endpoint)) {}

DownloadTarget YandexDiskResolver::resolve(const std::string& link) {
    if (link.empty()) {
        throw ResolutionError("empty share link");
    }

    std::string api_url;
    HttpResponse response;
    try {
        api_url = fmt::format("{}?public_key={}", api_endpoint_, detail::urlEncode(link));
        response = transport_->get(api_url);
    } catch (const TransferError& ex) {
        throw ResolutionError(fmt::format("resource API unreachable: {}", ex.what()));
    }

    if (response.status_code >= 400) {
        const std::string detail = apiErrorDetail(response.body);
        throw ResolutionError(detail.empty()
                                  ? fmt::format("resource API returned HTTP {}", response.status_code)
                                  : fmt::format("resource API returned HTTP {}: {}",
                                                response.status_code, detail));
    }

    std::string href;
    try {
        const auto json = nlohmann::json::parse(response.body);
        if (!json.is_object() || !json.contains("href") || !json.at("href").is_string()) {
            throw ResolutionError("resource API response has no download href");
        }
        href = json.at("href").get<std::string>();
    } catch (const nlohmann::json::exception& ex) {
        throw ResolutionError(fmt::format("malformed resource API response: {}", ex.what()));
    }
    if (href.empty()) {
        throw ResolutionError("resource API returned an empty download href");
    }

    const auto name = detail::queryParameter(href, "filename");
    auto target = probeTarget(*transport_, href,
                              detail::sanitizeFileName(name ? *name : kPlaceholderFileName));
    spdlog::info("Resolved {} -> {} ({} bytes, ranges {})", link, target.file_name,
                 target.total_size, target.supports_ranges ? "supported" : "unsupported");
    return target;
}

DirectUrlResolver::DirectUrlResolver(HttpTransportPtr transport) : transport_(std::move(transport)) {}

DownloadTarget DirectUrlResolver::resolve(const std::string& link) {
    if (link.empty()) {
        throw ResolutionError("empty URL");
    }

    auto name = detail::queryParameter(link, "filename");
    if (!name || name->empty()) {
        name = detail::lastPathSegment(link);
    }
    auto target = probeTarget(*transport_, link,
                              detail::sanitizeFileName(name ? *name : kPlaceholderFileName));
    spdlog::info("Probed {} -> {} ({} bytes, ranges {})", link, target.file_name,
                 target.total_size, target.supports_ranges ? "supported" : "unsupported");
    return target;
}

} // namespace rangefetch

#include "rangefetch/curl_transport.hpp"
#include "rangefetch/detail/curl_utils.hpp"
#include "rangefetch/detail/url_utils.hpp"
#include "rangefetch/errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangefetch {

namespace {

constexpr long kReceiveBufferSize = 512L * 1024L;

struct StreamContext {
    const BodySink* sink{nullptr};
    bool aborted{false};
};

struct HeaderContext {
    std::string accept_ranges;
};

size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    if (!out) {
        return 0;
    }
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t forwardToSink(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    const size_t total = size * nmemb;
    if (!ctx || !ctx->sink) {
        return 0;
    }
    if (total == 0) {
        return 0;
    }
    if (!(*ctx->sink)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

// Headers of every response in a redirect chain arrive here; a status line
// starts a new response, so only the final one's values survive.
size_t collectHeader(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<HeaderContext*>(userdata);
    const size_t total = size * nmemb;
    if (!ctx) {
        return 0;
    }

    const std::string line(ptr, total);
    if (line.rfind("HTTP/", 0) == 0) {
        ctx->accept_ranges.clear();
        return total;
    }

    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        return total;
    }
    if (detail::toLower(detail::trim(line.substr(0, colon))) == "accept-ranges") {
        ctx->accept_ranges = detail::trim(line.substr(colon + 1));
    }
    return total;
}

long responseCode(CURL* curl) {
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    return code;
}

[[noreturn]] void throwCurlError(const std::string& url, CURLcode res) {
    throw TransferError(fmt::format("{}: curl error: {}", url, curl_easy_strerror(res)));
}

} // namespace

CurlTransport::CurlTransport(TransportOptions options) : options_(std::move(options)) {
    detail::ensureCurlInitialized();
}

void CurlTransport::applyCommonOptions(void* curl_handle) const {
    auto* curl = static_cast<CURL*>(curl_handle);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    if (options_.stall_timeout_seconds > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, options_.stall_timeout_seconds);
    }
    if (options_.total_timeout_seconds > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.total_timeout_seconds);
    }
}

HttpResponse CurlTransport::get(const std::string& url) {
    detail::CurlHandle curl = detail::makeCurlHandle();

    HttpResponse response;
    applyCommonOptions(curl.get());
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &appendToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throwCurlError(url, res);
    }
    response.status_code = responseCode(curl.get());
    spdlog::debug("GET {} -> {}", url, response.status_code);
    return response;
}

ProbeResult CurlTransport::probe(const std::string& url) {
    detail::CurlHandle curl = detail::makeCurlHandle();

    HeaderContext headers;
    applyCommonOptions(curl.get());
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &collectHeader);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throwCurlError(url, res);
    }

    ProbeResult result;
    result.status_code = responseCode(curl.get());
    result.accept_ranges = std::move(headers.accept_ranges);

    curl_off_t length = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    // -1 when the server sent no Content-Length
    result.content_length = static_cast<std::uint64_t>(std::max<curl_off_t>(0, length));

    spdlog::debug("HEAD {} -> {} (length={}, accept-ranges='{}')", url, result.status_code,
                  result.content_length, result.accept_ranges);
    return result;
}

long CurlTransport::stream(const std::string& url, const std::optional<ByteRange>& range,
                           const BodySink& sink) {
    detail::CurlHandle curl = detail::makeCurlHandle();

    StreamContext ctx{&sink, false};
    applyCommonOptions(curl.get());
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, kReceiveBufferSize);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &forwardToSink);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

    std::string range_spec;
    if (range) {
        range_spec = fmt::format("{}-{}", range->start, range->end);
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range_spec.c_str());
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        if (ctx.aborted) {
            throw TransferError(fmt::format("{}: transfer aborted by receiver", url));
        }
        throwCurlError(url, res);
    }
    return responseCode(curl.get());
}

} // namespace rangefetch

#include "rangefetch/detail/curl_utils.hpp"
#include "rangefetch/errors.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace rangefetch::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw TransferError("Failed to allocate curl handle");
    }
    return curl;
}

std::string urlEncode(const std::string& value) {
    CurlHandle curl = makeCurlHandle();
    std::unique_ptr<char, decltype(&curl_free)> escaped{
        curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size())), &curl_free};
    if (!escaped) {
        throw TransferError("Failed to URL-encode value");
    }
    return std::string{escaped.get()};
}

} // namespace rangefetch::detail

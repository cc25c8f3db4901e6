#pragma once

#include <curl/curl.h>

#include <memory>
#include <string>

namespace rangefetch::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// curl_global_init exactly once per process; throws std::runtime_error on failure.
void ensureCurlInitialized();

// Initialises libcurl if needed and returns a fresh easy handle. Throws TransferError.
[[nodiscard]] CurlHandle makeCurlHandle();

// Percent-encodes a query component.
[[nodiscard]] std::string urlEncode(const std::string& value);

} // namespace rangefetch::detail

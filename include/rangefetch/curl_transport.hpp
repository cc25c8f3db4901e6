#pragma once

#include "http_transport.hpp"

#include <string>

namespace rangefetch {

struct TransportOptions {
    long connect_timeout_seconds{15};
    // Abort a transfer that moves less than one byte per second for this long.
    long stall_timeout_seconds{30};
    // 0 disables the overall limit.
    long total_timeout_seconds{0};
    std::string user_agent{"rangefetch/1.0"};
};

// libcurl-backed transport. Every call uses its own easy handle, so one instance
// can be shared by all workers of a job.
class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(TransportOptions options = {});

    [[nodiscard]] HttpResponse get(const std::string& url) override;
    [[nodiscard]] ProbeResult probe(const std::string& url) override;
    long stream(const std::string& url, const std::optional<ByteRange>& range,
                const BodySink& sink) override;

    [[nodiscard]] const TransportOptions& options() const noexcept { return options_; }

private:
    void applyCommonOptions(void* curl_handle) const;

    TransportOptions options_;
};

} // namespace rangefetch

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace rangefetch {

struct HttpResponse {
    long status_code{0};
    std::string body;
};

struct ProbeResult {
    long status_code{0};
    std::uint64_t content_length{0};
    std::string accept_ranges;
};

// Inclusive byte span sent as "Range: bytes=<start>-<end>".
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};
};

// Receives each body buffer in order; returning false aborts the transfer.
using BodySink = std::function<bool(const char* data, std::size_t size)>;

// Implementations must allow concurrent calls from several worker threads.
// Transport failures are reported by throwing TransferError.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // HTTP error statuses are returned, not thrown.
    [[nodiscard]] virtual HttpResponse get(const std::string& url) = 0;

    // Metadata request; a status >= 400 throws.
    [[nodiscard]] virtual ProbeResult probe(const std::string& url) = 0;

    // Streamed GET; a status >= 400 or a sink abort throws. Returns the final status.
    virtual long stream(const std::string& url, const std::optional<ByteRange>& range,
                        const BodySink& sink) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

} // namespace rangefetch

#pragma once

#include "download_target.hpp"
#include "http_transport.hpp"

#include <memory>
#include <string>

namespace rangefetch {

// Turns a user-supplied link into a directly fetchable target.
// Any failure is reported as ResolutionError.
class TargetResolver {
public:
    virtual ~TargetResolver() = default;

    [[nodiscard]] virtual DownloadTarget resolve(const std::string& link) = 0;
};

using TargetResolverPtr = std::shared_ptr<TargetResolver>;

// Resolves Yandex Disk public share links through the public resources API.
class YandexDiskResolver final : public TargetResolver {
public:
    static constexpr const char* kDefaultApiEndpoint =
        "https://cloud-api.yandex.net/v1/disk/public/resources/download";

    explicit YandexDiskResolver(HttpTransportPtr transport,
                                std::string api_endpoint = kDefaultApiEndpoint);

    [[nodiscard]] DownloadTarget resolve(const std::string& link) override;

private:
    HttpTransportPtr transport_;
    std::string api_endpoint_;
};

// The link already is the direct URL; only the metadata probe is performed.
class DirectUrlResolver final : public TargetResolver {
public:
    explicit DirectUrlResolver(HttpTransportPtr transport);

    [[nodiscard]] DownloadTarget resolve(const std::string& link) override;

private:
    HttpTransportPtr transport_;
};

// Probes `direct_url` for size and range support. Throws ResolutionError.
[[nodiscard]] DownloadTarget probeTarget(HttpTransport& transport, const std::string& direct_url,
                                         std::string file_name);

} // namespace rangefetch

#include "rangefetch/resolver.hpp"
#include "rangefetch/errors.hpp"

#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <memory>

using namespace rangefetch;
using rangefetch::test::FakeTransport;

namespace {

const std::string kEndpoint = "https://api.example.com/v1/disk/public/resources/download";
const std::string kLink = "https://disk.yandex.ru/d/abc123";
const std::string kHref =
    "https://downloader.example.com/disk/7f3e?uid=0&filename=report%202024.pdf"
    "&disposition=attachment";

std::string hrefBody(const std::string& href) {
    return R"({"href":")" + href + R"(","method":"GET","templated":false})";
}

} // namespace

TEST_CASE("Share link resolves through the API and a metadata request") {
    auto transport = std::make_shared<FakeTransport>();
    transport->setGetResponse({200, hrefBody(kHref)});
    transport->addResource(kHref, {test::makePayload(4096)});

    YandexDiskResolver resolver(transport, kEndpoint);
    const auto target = resolver.resolve(kLink);

    CHECK(target.direct_url == kHref);
    CHECK(target.file_name == "report 2024.pdf");
    CHECK(target.total_size == 4096);
    CHECK(target.supports_ranges);
    CHECK(target.supportsChunking());

    const auto gets = transport->getUrls();
    REQUIRE(gets.size() == 1);
    CHECK(gets[0] == kEndpoint + "?public_key=https%3A%2F%2Fdisk.yandex.ru%2Fd%2Fabc123");
    const auto probes = transport->probeUrls();
    REQUIRE(probes.size() == 1);
    CHECK(probes[0] == kHref);
}

TEST_CASE("Missing filename parameter falls back to the placeholder") {
    const std::string href = "https://downloader.example.com/disk/7f3e?uid=0";
    auto transport = std::make_shared<FakeTransport>();
    transport->setGetResponse({200, hrefBody(href)});
    transport->addResource(href, {"data"});

    const auto target = YandexDiskResolver(transport, kEndpoint).resolve(kLink);

    CHECK(target.file_name == "unknown_file");
}

TEST_CASE("Range support requires Accept-Ranges: bytes") {
    auto transport = std::make_shared<FakeTransport>();
    transport->setGetResponse({200, hrefBody(kHref)});
    YandexDiskResolver resolver(transport, kEndpoint);

    FakeTransport::Resource resource{"data"};
    resource.accept_ranges = "none";
    transport->addResource(kHref, resource);
    CHECK_FALSE(resolver.resolve(kLink).supports_ranges);

    resource.accept_ranges = "";
    transport->addResource(kHref, resource);
    CHECK_FALSE(resolver.resolve(kLink).supports_ranges);

    resource.accept_ranges = " Bytes ";
    transport->addResource(kHref, resource);
    CHECK(resolver.resolve(kLink).supports_ranges);
}

TEST_CASE("Unknown size is reported as zero") {
    auto transport = std::make_shared<FakeTransport>();
    transport->setGetResponse({200, hrefBody(kHref)});
    FakeTransport::Resource resource{"data"};
    resource.report_length = false;
    transport->addResource(kHref, resource);

    const auto target = YandexDiskResolver(transport, kEndpoint).resolve(kLink);

    CHECK(target.total_size == 0);
    CHECK_FALSE(target.supportsChunking());
}

TEST_CASE("API error status surfaces the API description") {
    auto transport = std::make_shared<FakeTransport>();
    transport->setGetResponse(
        {404, R"({"message":"Не удалось найти запрошенный ресурс.","description":"Resource not found.","error":"DiskNotFoundError"})"});

    CHECK_THROWS_WITH(YandexDiskResolver(transport, kEndpoint).resolve(kLink),
                      Catch::Contains("HTTP 404: Resource not found."));
    CHECK(transport->probeUrls().empty());
}

TEST_CASE("Malformed API responses are resolution errors") {
    auto transport = std::make_shared<FakeTransport>();
    YandexDiskResolver resolver(transport, kEndpoint);

    transport->setGetResponse({200, "<html>oops</html>"});
    CHECK_THROWS_AS(resolver.resolve(kLink), ResolutionError);

    transport->setGetResponse({200, R"({"method":"GET"})"});
    CHECK_THROWS_AS(resolver.resolve(kLink), ResolutionError);

    transport->setGetResponse({200, R"({"href":42})"});
    CHECK_THROWS_AS(resolver.resolve(kLink), ResolutionError);

    CHECK_THROWS_AS(resolver.resolve(""), ResolutionError);
}

TEST_CASE("Transport failures during resolution are resolution errors") {
    auto transport = std::make_shared<FakeTransport>();
    YandexDiskResolver resolver(transport, kEndpoint);

    transport->failGets();
    CHECK_THROWS_AS(resolver.resolve(kLink), ResolutionError);

    // The href is not served, so the metadata probe fails.
    transport->setGetResponse({200, hrefBody(kHref)});
    CHECK_THROWS_WITH(resolver.resolve(kLink), Catch::Contains("metadata probe failed"));
}

TEST_CASE("Direct URLs take their name from the path") {
    const std::string url = "https://files.example.com/pub/archive.tar.gz";
    auto transport = std::make_shared<FakeTransport>();
    transport->addResource(url, {test::makePayload(777)});

    const auto target = DirectUrlResolver(transport).resolve(url);

    CHECK(target.direct_url == url);
    CHECK(target.file_name == "archive.tar.gz");
    CHECK(target.total_size == 777);
    CHECK(transport->getUrls().empty());
}

TEST_CASE("Direct URLs prefer the filename parameter") {
    const std::string url = "https://files.example.com/get?id=9&filename=notes.txt";
    auto transport = std::make_shared<FakeTransport>();
    transport->addResource(url, {"hello"});

    CHECK(DirectUrlResolver(transport).resolve(url).file_name == "notes.txt");
}

TEST_CASE("A non-success metadata status leaves size and range support unknown") {
    const std::string url = "https://files.example.com/pub/cached.iso";
    auto transport = std::make_shared<FakeTransport>();
    FakeTransport::Resource resource{test::makePayload(2048)};
    resource.head_status = 304;
    transport->addResource(url, resource);

    const auto target = DirectUrlResolver(transport).resolve(url);

    CHECK(target.file_name == "cached.iso");
    CHECK(target.total_size == 0);
    CHECK_FALSE(target.supports_ranges);
    CHECK_FALSE(target.supportsChunking());
}

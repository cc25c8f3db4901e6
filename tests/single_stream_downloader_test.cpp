#include "rangefetch/single_stream_downloader.hpp"
#include "rangefetch/errors.hpp"

#include "test_helpers.hpp"

#include <catch2/catch.hpp>

using namespace rangefetch;
using rangefetch::test::FakeTransport;
using rangefetch::test::TempDir;

namespace {
const std::string kUrl = "https://cdn.example.com/stream";
} // namespace

TEST_CASE("Single stream writes the whole body to the final path") {
    TempDir dir;
    FakeTransport transport;
    const auto body = test::makePayload(50000);
    transport.addResource(kUrl, {body});
    JobProgress progress;

    const auto final_path = dir.path() / "stream.bin";
    const auto written = SingleStreamDownloader(transport, progress).download(kUrl, final_path);

    CHECK(written == body.size());
    CHECK(progress.total() == body.size());
    CHECK(test::readFile(final_path) == body);
    CHECK(transport.plainRequests() == 1);
    CHECK(transport.rangedRequests() == 0);
}

TEST_CASE("Interrupted single stream leaves no file behind") {
    TempDir dir;
    FakeTransport transport;
    FakeTransport::Resource resource{test::makePayload(50000)};
    resource.fail_plain = true;
    transport.addResource(kUrl, resource);
    JobProgress progress;

    const auto final_path = dir.path() / "stream.bin";
    CHECK_THROWS_AS(SingleStreamDownloader(transport, progress).download(kUrl, final_path),
                    TransferError);
    CHECK_FALSE(std::filesystem::exists(final_path));
    CHECK(progress.total() == 25000);
}

TEST_CASE("Stream shorter than the advertised size is discarded") {
    TempDir dir;
    FakeTransport transport;
    transport.addResource(kUrl, {test::makePayload(1000)});
    JobProgress progress;

    const auto final_path = dir.path() / "stream.bin";
    CHECK_THROWS_WITH(
        SingleStreamDownloader(transport, progress).download(kUrl, final_path, 2000),
        Catch::Contains("1000 of 2000 bytes"));
    CHECK_FALSE(std::filesystem::exists(final_path));
}

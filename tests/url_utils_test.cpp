#include "rangefetch/detail/url_utils.hpp"

#include <catch2/catch.hpp>

using namespace rangefetch::detail;

TEST_CASE("Query parameters are found and decoded") {
    const std::string href =
        "https://downloader.disk.yandex.ru/disk/5f1a?uid=0&filename=My%20File+v2.zip"
        "&disposition=attachment&hash=";

    CHECK(queryParameter(href, "filename") == std::optional<std::string>("My File v2.zip"));
    CHECK(queryParameter(href, "uid") == std::optional<std::string>("0"));
    CHECK(queryParameter(href, "hash") == std::optional<std::string>(""));
    CHECK_FALSE(queryParameter(href, "missing").has_value());
    CHECK_FALSE(queryParameter("https://example.com/file.bin", "filename").has_value());
}

TEST_CASE("Fragments do not leak into query values") {
    CHECK(queryParameter("https://example.com/f?filename=a.txt#top", "filename") ==
          std::optional<std::string>("a.txt"));
}

TEST_CASE("Last path segment ignores the query string") {
    CHECK(lastPathSegment("https://example.com/files/data%20set.tar.gz?x=1") ==
          std::optional<std::string>("data set.tar.gz"));
    CHECK(lastPathSegment("https://example.com/dir/") == std::optional<std::string>("dir"));
    CHECK(lastPathSegment("https://example.com/a+b.txt") == std::optional<std::string>("a+b.txt"));
    CHECK_FALSE(lastPathSegment("https://example.com/").has_value());
    CHECK_FALSE(lastPathSegment("https://example.com").has_value());
}

TEST_CASE("File names are reduced to a bare name") {
    CHECK(sanitizeFileName("report.pdf") == "report.pdf");
    CHECK(sanitizeFileName("../../etc/passwd") == "passwd");
    CHECK(sanitizeFileName("dir\\inner.txt") == "inner.txt");
    CHECK(sanitizeFileName("..") == "unknown_file");
    CHECK(sanitizeFileName("") == "unknown_file");
    CHECK(sanitizeFileName("folder/") == "unknown_file");
}

TEST_CASE("Percent decoding keeps malformed escapes") {
    CHECK(percentDecode("100%") == "100%");
    CHECK(percentDecode("%zz") == "%zz");
    CHECK(percentDecode("%41%62c") == "Abc");
    CHECK(percentDecode("a+b", false) == "a+b");
}

TEST_CASE("Header values are compared case-insensitively after trimming") {
    CHECK(toLower(trim("  Bytes \r\n")) == "bytes");
    CHECK(trim("   ").empty());
}

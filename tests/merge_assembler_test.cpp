#include "rangefetch/merge_assembler.hpp"
#include "rangefetch/chunk.hpp"
#include "rangefetch/errors.hpp"

#include "test_helpers.hpp"

#include <catch2/catch.hpp>

using namespace rangefetch;
using rangefetch::test::TempDir;

TEST_CASE("Merge concatenates parts in index order and removes them") {
    TempDir dir;
    const auto final_path = dir.path() / "out.bin";
    // Written out of order on purpose; only the index decides placement.
    test::writeFile(partPath(final_path, 2), "defg");
    test::writeFile(partPath(final_path, 0), "abc");
    test::writeFile(partPath(final_path, 1), "");

    MergeAssembler{}.merge(final_path, 3);

    CHECK(test::readFile(final_path) == "abcdefg");
    CHECK(dir.entryCount() == 1);
}

TEST_CASE("Merge reproduces a large payload byte for byte") {
    TempDir dir;
    const auto final_path = dir.path() / "big.bin";
    const auto payload = test::makePayload(3 * 1024 * 1024 + 17);
    const auto chunks = planChunks(payload.size(), 5);
    for (const auto& chunk : chunks) {
        test::writeFile(partPath(final_path, chunk.index),
                        payload.substr(chunk.start, chunk.length()));
    }

    MergeAssembler{}.merge(final_path, chunks.size());

    CHECK(test::readFile(final_path) == payload);
}

TEST_CASE("Missing part aborts the merge without a final file") {
    TempDir dir;
    const auto final_path = dir.path() / "out.bin";
    test::writeFile(partPath(final_path, 0), "abc");
    test::writeFile(partPath(final_path, 2), "ghi");

    CHECK_THROWS_AS(MergeAssembler{}.merge(final_path, 3), MergeIntegrityError);

    CHECK_FALSE(std::filesystem::exists(final_path));
    CHECK(dir.entryCount() == 0);
}

TEST_CASE("Cleaning up parts twice is a no-op the second time") {
    TempDir dir;
    const auto final_path = dir.path() / "out.bin";
    test::writeFile(partPath(final_path, 0), "a");
    test::writeFile(partPath(final_path, 1), "b");

    CHECK(MergeAssembler::removeParts(final_path, 4) == 2);
    CHECK(MergeAssembler::removeParts(final_path, 4) == 0);
    CHECK(dir.entryCount() == 0);
}

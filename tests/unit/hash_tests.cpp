#include <doctest/doctest.h>
#include <assetkit/hash.hpp>

#include "../test_helpers.hpp"

using namespace assetkit;
using namespace assetkit::test;

TEST_CASE("compute_sha256_bytes matches known digests") {
    auto empty = compute_sha256_bytes(std::string());
    REQUIRE(empty.ok);
    CHECK(empty.hex_digest == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    auto abc = compute_sha256_bytes(std::string("abc"));
    REQUIRE(abc.ok);
    CHECK(abc.hex_digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(abc.prefixed() == "sha256:" + abc.hex_digest);
}

TEST_CASE("compute_sha256_file hashes file contents") {
    TempDir dir;
    write_file(dir.sub("a.md"), "abc");
    auto result = compute_sha256_file(dir.sub("a.md"));
    REQUIRE(result.ok);
    CHECK(result.hex_digest == compute_sha256_bytes(std::string("abc")).hex_digest);
}

TEST_CASE("compute_sha256_file fails for a missing file") {
    TempDir dir;
    auto result = compute_sha256_file(dir.sub("missing.md"));
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}

TEST_CASE("hashes_equal accepts bare and prefixed digests") {
    std::string hex = compute_sha256_bytes(std::string("x")).hex_digest;
    CHECK(hashes_equal("sha256:" + hex, hex));
    CHECK(hashes_equal(hex, "sha256:" + hex));
    CHECK_FALSE(hashes_equal("sha256:" + hex, "sha256:00"));
    CHECK_FALSE(hashes_equal("", ""));
}

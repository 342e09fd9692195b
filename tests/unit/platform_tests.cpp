#include <doctest/doctest.h>
#include <cdd/hash.hpp>
#include <cdd/platform.hpp>

#include "../test_helpers.hpp"

TEST_CASE("sha256 and sha1 digests") {
    auto sha256 = cdd::compute_sha256("abc");
    REQUIRE(sha256.ok);
    CHECK(sha256.hex_digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto sha1 = cdd::compute_sha1("abc");
    REQUIRE(sha1.ok);
    CHECK(sha1.hex_digest == "a9993e364706816aba3e25717850c26c9cd0d89d");

    cdd::testing::TempDir dir;
    auto file = cdd::compute_sha256_file(dir.write("abc.txt", "abc"));
    REQUIRE(file.ok);
    CHECK(file.hex_digest == sha256.hex_digest);

    auto missing = cdd::compute_sha256_file(dir.path() + "/missing");
    CHECK_FALSE(missing.ok);
    CHECK_FALSE(missing.error.empty());
}

TEST_CASE("random_hex_token") {
    auto a = cdd::random_hex_token(16);
    auto b = cdd::random_hex_token(16);
    CHECK(a.size() == 32);
    CHECK(a != b);
    CHECK(a.find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("file helpers and environment") {
    cdd::testing::TempDir dir;
    std::string path = dir.path() + "/f.txt";
    CHECK(cdd::write_file(path, "content"));
    CHECK(cdd::read_file(path) == std::optional<std::string>("content"));
    CHECK_FALSE(cdd::read_file(dir.path() + "/none"));

    CHECK(cdd::get_env("PATH").has_value());
    CHECK_FALSE(cdd::get_env("CDD_SURELY_UNSET_VARIABLE").has_value());
    CHECK(cdd::get_all_env().count("PATH") == 1);
    CHECK(cdd::get_process_id() > 0);
    CHECK(cdd::get_os_family() != "unknown");
}

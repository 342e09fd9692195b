#include <doctest/doctest.h>
#include <cdd/analyze.hpp>
#include <cdd/platform.hpp>

#include "../test_helpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

TEST_CASE("source types by extension") {
    CHECK(cdd::source_file_type("a/b/main.py") == std::optional<std::string>("python"));
    CHECK(cdd::source_file_type("synth.SCD") == std::optional<std::string>("supercollider"));
    CHECK(cdd::source_file_type("x.hpp") == std::optional<std::string>("cpp"));
    CHECK_FALSE(cdd::source_file_type("archive.tar.gz"));
    CHECK_FALSE(cdd::is_source_file("Makefile"));
}

TEST_CASE("count_lines counts a trailing unterminated line") {
    cdd::testing::TempDir dir;
    CHECK(cdd::count_lines(dir.write("a.txt", "one\ntwo\n")) == 2);
    CHECK(cdd::count_lines(dir.write("b.txt", "one\ntwo")) == 2);
    CHECK(cdd::count_lines(dir.write("c.txt", "")) == 0);
}

TEST_CASE("analyze_source writes the reference documents") {
    cdd::testing::TempDir dir;
    auto source = dir.write("ref/widget.py", "abc");
    std::string out = dir.path() + "/analysis/widget";

    auto result = cdd::analyze_source(source, out);
    REQUIRE(result.isOk());
    const auto& a = result.value();

    CHECK(a.structure.hash == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(a.structure.file_type == "python");
    CHECK(a.structure.line_count == 1);
    CHECK(a.structure.size_bytes == 3);
    CHECK(a.structure.snapshot_path == "source.py");
    CHECK(a.files == std::vector<std::string>{"source.py", "structure.json", "PATTERNS.md", "elements.md"});

    for (const auto& f : a.files) {
        CHECK(fs::exists(fs::path(out) / f));
    }
    CHECK(cdd::read_file(out + "/source.py") == std::optional<std::string>("abc"));

    auto patterns = cdd::read_file(out + "/PATTERNS.md");
    REQUIRE(patterns);
    CHECK(patterns->find("# Reference: widget.py") == 0);
    CHECK(patterns->find("> Hash: ba7816bf8f01...") != std::string::npos);

    auto loaded = cdd::load_source_structure(out);
    REQUIRE(loaded.isOk());
    CHECK(loaded.value().hash == a.structure.hash);
    CHECK(loaded.value().line_count == 1);
    CHECK(loaded.value().original_path == source);

    auto by_file = cdd::load_source_structure(out + "/structure.json");
    CHECK(by_file.isOk());
}

TEST_CASE("analyze_source rejects missing and unsupported files") {
    cdd::testing::TempDir dir;

    auto missing = cdd::analyze_source(dir.path() + "/nope.py", dir.path() + "/out");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == cdd::ErrorCode::FILE_NOT_FOUND);

    auto binary = cdd::analyze_source(dir.write("blob.bin", "x"), dir.path() + "/out");
    REQUIRE(binary.isErr());
    CHECK(binary.error().message() == "Unsupported source type: .bin");
    CHECK_FALSE(fs::exists(dir.path() + "/out"));
}

TEST_CASE("load_source_structure validates the document") {
    cdd::testing::TempDir dir;
    CHECK(cdd::load_source_structure(dir.path()).isErr());

    dir.write("structure.json", "{\"type\": \"other\"}");
    CHECK(cdd::load_source_structure(dir.path()).isErr());

    dir.write("structure.json", "not json");
    CHECK(cdd::load_source_structure(dir.path()).isErr());
}

TEST_CASE("compare_source_analyses") {
    cdd::SourceStructure a;
    a.hash = "aa";
    a.file_type = "python";
    a.line_count = 10;

    auto same = cdd::compare_source_analyses(a, a);
    CHECK(same["match"] == true);
    CHECK(same["summary"] == "Files are identical");

    cdd::SourceStructure b = a;
    b.hash = "bb";
    b.line_count = 13;
    auto grown = cdd::compare_source_analyses(a, b);
    CHECK(grown["match"] == false);
    CHECK(grown["file_type_match"] == true);
    CHECK(grown["summary"] == "Files differ (+3 lines) - use contracts to verify structural requirements");

    b.line_count = 8;
    b.file_type = "javascript";
    auto shrunk = cdd::compare_source_analyses(a, b);
    CHECK(shrunk["file_type_match"] == false);
    CHECK(shrunk["summary"] == "Files differ (-2 lines) - use contracts to verify structural requirements");

    b.line_count = 10;
    CHECK(cdd::compare_source_analyses(a, b)["summary"] ==
          "Files differ (same line count) - use contracts to verify structural requirements");
}

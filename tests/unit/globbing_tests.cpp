#include <doctest/doctest.h>
#include <cdd/globbing.hpp>

#include "../test_helpers.hpp"

using nlohmann::json;

namespace {

std::vector<std::string> relative(const cdd::testing::TempDir& dir, const std::vector<std::string>& paths) {
    std::vector<std::string> out;
    for (const auto& p : paths) {
        out.push_back(p.substr(dir.path().size() + 1));
    }
    return out;
}

} // namespace

TEST_CASE("single-segment wildcards") {
    cdd::testing::TempDir dir;
    dir.write("src/a.cpp", "");
    dir.write("src/b.cpp", "");
    dir.write("src/b.hpp", "");
    dir.write("src/.hidden.cpp", "");

    CHECK(relative(dir, cdd::glob_paths(dir.path(), "src/*.cpp")) ==
          std::vector<std::string>{"src/a.cpp", "src/b.cpp"});
    CHECK(relative(dir, cdd::glob_paths(dir.path(), "src/?.hpp")) == std::vector<std::string>{"src/b.hpp"});
    CHECK(relative(dir, cdd::glob_paths(dir.path(), "src/[a].cpp")) == std::vector<std::string>{"src/a.cpp"});
    CHECK(cdd::glob_paths(dir.path(), "src/*.rs").empty());
    CHECK(cdd::glob_paths(dir.path(), "").empty());
}

TEST_CASE("double star spans zero or more directories") {
    cdd::testing::TempDir dir;
    dir.write("lib/top.py", "");
    dir.write("lib/pkg/mid.py", "");
    dir.write("lib/pkg/deep/low.py", "");
    dir.write("lib/.cache/skip.py", "");

    CHECK(relative(dir, cdd::glob_paths(dir.path(), "lib/**/*.py")) ==
          std::vector<std::string>{"lib/pkg/deep/low.py", "lib/pkg/mid.py", "lib/top.py"});
}

TEST_CASE("double star stops at a symlink back into the walk") {
    cdd::testing::TempDir dir;
    dir.write("loop/a/file.txt", "");
    std::filesystem::create_directory_symlink(dir / "loop", dir / "loop/a/back");
    dir.write("data/real.txt", "");
    std::filesystem::create_directory_symlink(dir / "data", dir / "loop/data");

    CHECK(relative(dir, cdd::glob_paths(dir.path(), "loop/**/*.txt")) ==
          std::vector<std::string>{"loop/a/file.txt", "loop/data/real.txt"});
}

TEST_CASE("literal paths match only when they exist") {
    cdd::testing::TempDir dir;
    dir.write("contracts/a.yaml", "");
    dir.write("src/x.py", "");

    auto hit = cdd::glob_paths(dir.path() + "/contracts", "../src/x.py");
    REQUIRE(hit.size() == 1);
    CHECK(hit[0] == dir.path() + "/contracts/../src/x.py");
    CHECK(cdd::glob_paths(dir.path() + "/contracts", "../src/y.py").empty());
}

TEST_CASE("expand_files accepts strings and lists and de-duplicates") {
    cdd::testing::TempDir dir;
    dir.write("a.txt", "");
    dir.write("b.txt", "");

    CHECK(cdd::expand_files("*.txt", dir.path(), json::object()).size() == 2);
    CHECK(cdd::expand_files(json::array({"a.txt", "*.txt", 7}), dir.path(), json::object()).size() == 2);
    CHECK(cdd::expand_files(json::array({"{name}.txt"}), dir.path(), {{"name", "b"}}) ==
          std::vector<std::string>{dir.path() + "/b.txt"});
    CHECK(cdd::expand_files(json(), dir.path(), json::object()).empty());
    CHECK(cdd::expand_files(json::object(), dir.path(), json::object()).empty());
}

TEST_CASE("find_yaml_files walks directories recursively in order") {
    cdd::testing::TempDir dir;
    dir.write("contracts/project.yaml", "");
    dir.write("contracts/b.yaml", "");
    dir.write("contracts/sub/a.yaml", "");
    dir.write("contracts/notes.md", "");

    auto files = relative(dir, cdd::find_yaml_files(dir.path() + "/contracts"));
    CHECK(files == std::vector<std::string>{"contracts/b.yaml", "contracts/project.yaml", "contracts/sub/a.yaml"});

    CHECK(cdd::find_yaml_files(dir.path() + "/contracts/b.yaml").size() == 1);
    CHECK(cdd::find_yaml_files(dir.path() + "/nowhere").empty());
}

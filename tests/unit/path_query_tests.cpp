#include <doctest/doctest.h>
#include <cdd/path_query.hpp>

using cdd::resolve_path;
using cdd::interpolate_vars;
using cdd::interpolate_string;
using nlohmann::json;

namespace {

json sample_root() {
    return json::parse(R"({
        "steps": [{"value": {"count": 3, "items": ["a", "b"]}}],
        "saved": {"result": {"ok": true}, "odd key": 7},
        "vars": {"name": "demo"}
    })");
}

} // namespace

// ============================================================================
// Resolution
// ============================================================================

TEST_CASE("resolve_path walks keys and indices") {
    auto root = sample_root();

    auto r = resolve_path(root, std::string("$.steps[0].value.count"));
    REQUIRE(r.ok);
    CHECK(r.value == 3);

    r = resolve_path(root, std::string("$.steps[0].value.items[1]"));
    REQUIRE(r.ok);
    CHECK(r.value == "b");

    r = resolve_path(root, std::string("$.saved.result.ok"));
    REQUIRE(r.ok);
    CHECK(r.value == true);
}

TEST_CASE("resolve_path accepts quoted keys in brackets") {
    auto root = sample_root();

    auto r = resolve_path(root, std::string("$.saved['odd key']"));
    REQUIRE(r.ok);
    CHECK(r.value == 7);

    r = resolve_path(root, std::string("$.saved[\"result\"].ok"));
    REQUIRE(r.ok);
    CHECK(r.value == true);
}

TEST_CASE("resolve_path returns null for missing keys and out-of-range indices") {
    auto root = sample_root();

    auto r = resolve_path(root, std::string("$.saved.missing.deeper"));
    CHECK(r.ok);
    CHECK(r.value.is_null());

    r = resolve_path(root, std::string("$.steps[5]"));
    CHECK(r.ok);
    CHECK(r.value.is_null());

    r = resolve_path(root, std::string("$.steps[-1]"));
    CHECK(r.ok);
    CHECK(r.value.is_null());
}

TEST_CASE("resolve_path reports type_mismatch when descending through scalars") {
    auto root = sample_root();

    auto r = resolve_path(root, std::string("$.steps.value"));
    CHECK_FALSE(r.ok);
    CHECK(r.error == "type_mismatch");

    r = resolve_path(root, std::string("$.vars.name[0]"));
    CHECK_FALSE(r.ok);
    CHECK(r.error == "type_mismatch");
}

TEST_CASE("resolve_path rejects malformed paths") {
    auto root = sample_root();

    CHECK(resolve_path(root, std::string("steps[0]")).error == "invalid_path");
    CHECK(resolve_path(root, std::string("$.steps[0")).error == "invalid_path");
    CHECK(resolve_path(root, std::string("$.steps[abc]")).error == "invalid_path");
}

TEST_CASE("resolve_path with no path resolves to null") {
    auto r = resolve_path(sample_root(), std::optional<std::string>{});
    CHECK(r.ok);
    CHECK(r.value.is_null());
}

TEST_CASE("resolve_path on the bare root marker returns the root") {
    auto root = sample_root();
    auto r = resolve_path(root, std::string("$."));
    REQUIRE(r.ok);
    CHECK(r.value == root);
}

TEST_CASE("is_path_expression only accepts strings starting with the root marker") {
    CHECK(cdd::is_path_expression(json("$.steps[0]")));
    CHECK_FALSE(cdd::is_path_expression(json("steps")));
    CHECK_FALSE(cdd::is_path_expression(json(42)));
}

// ============================================================================
// Interpolation
// ============================================================================

TEST_CASE("interpolate_string replaces brace and vars-path references") {
    json vars = {{"pack", "core"}, {"n", 3}};

    CHECK(interpolate_string("src/{pack}/*.cpp", vars) == "src/core/*.cpp");
    CHECK(interpolate_string("count=$.vars.n", vars) == "count=3");
    CHECK(interpolate_string("{missing}-x", vars) == "-x");
    CHECK(interpolate_string("no refs", vars) == "no refs");
}

TEST_CASE("interpolate_vars recurses into arrays and objects") {
    json vars = {{"dir", "out"}};
    json value = {{"paths", {"{dir}/a", "{dir}/b"}}, {"n", 1}};

    json result = interpolate_vars(value, vars);
    CHECK(result["paths"][0] == "out/a");
    CHECK(result["paths"][1] == "out/b");
    CHECK(result["n"] == 1);
}

#include <doctest/doctest.h>
#include <cdd/assertions.hpp>

#include "../test_helpers.hpp"

using cdd::apply_op;
using cdd::run_assertions;
using nlohmann::json;

namespace {

cdd::AssertionResult op(const std::string& name, const json& actual, const json& expected,
                        const json& raw = json::object()) {
    return apply_op(name, actual, expected, nullptr, raw);
}

} // namespace

// ============================================================================
// Equality and Ordering
// ============================================================================

TEST_CASE("eq and ne compare JSON values structurally") {
    CHECK(op("eq", json{{"a", 1}}, json{{"a", 1}}).pass);
    CHECK_FALSE(op("eq", "1", 1).pass);
    CHECK(op("ne", "1", 1).pass);
    CHECK(op("eq", 2, 2.0).pass);
}

TEST_CASE("numeric comparisons reject non-numbers") {
    CHECK(op("lt", 1, 2).pass);
    CHECK(op("lte", 2, 2).pass);
    CHECK(op("gt", 3.5, 3).pass);
    CHECK_FALSE(op("gte", 1, 2).pass);

    auto r = op("lt", "1", 2);
    CHECK_FALSE(r.pass);
    REQUIRE(r.error);
    CHECK(*r.error == "type_mismatch");

    r = op("gt", nullptr, 2);
    REQUIRE(r.error);
    CHECK(*r.error == "type_mismatch");
}

TEST_CASE("in_range bounds are inclusive") {
    json bounds = {{"min", 1}, {"max", 5}};
    CHECK(op("in_range", 5, nullptr, bounds).pass);
    CHECK(op("in_range", 1, nullptr, bounds).pass);
    CHECK_FALSE(op("in_range", 5.0001, nullptr, bounds).pass);
    CHECK_FALSE(op("in_range", 0, nullptr, bounds).pass);

    auto r = op("in_range", 3, nullptr, {{"min", 1}});
    REQUIRE(r.error);
    CHECK(*r.error == "type_mismatch");
}

TEST_CASE("approx uses the tolerance field") {
    json raw = {{"tolerance", 0.1}};
    auto r = op("approx", 1.05, 1.0, raw);
    CHECK(r.pass);
    CHECK(r.details["tolerance"] == 0.1);
    CHECK_FALSE(op("approx", 1.2, 1.0, raw).pass);
    CHECK(op("approx", 1.2, 1.0).error.has_value());
}

// ============================================================================
// Containers and Strings
// ============================================================================

TEST_CASE("contains uses element equality on lists and substring on strings") {
    CHECK_FALSE(op("contains", json::array({"ab"}), "a").pass);
    CHECK(op("contains", json::array({"ab", "a"}), "a").pass);
    CHECK(op("contains", "abc", "b").pass);
    CHECK_FALSE(op("contains", "abc", "d").pass);

    auto r = op("contains", 12, "1");
    REQUIRE(r.error);
    CHECK(*r.error == "type_mismatch");
}

TEST_CASE("has_keys requires every listed key") {
    json obj = {{"a", 1}, {"b", 2}};
    CHECK(op("has_keys", obj, json::array({"a", "b"})).pass);
    CHECK_FALSE(op("has_keys", obj, json::array({"a", "c"})).pass);
    CHECK(op("has_keys", obj, "a").error.has_value());
}

TEST_CASE("matches searches anywhere and supports multiline anchors") {
    CHECK(op("matches", "hello world", "wor").pass);
    CHECK(op("matches", "first\nsecond", "^second$").pass);
    CHECK(op("not_matches", "hello", "bye").pass);
    CHECK_FALSE(op("not_matches", "hello", "ell").pass);
}

TEST_CASE("matches prefers the pattern field over expected") {
    auto r = apply_op("matches", "abc123", "zzz", "[0-9]+", json::object());
    CHECK(r.pass);
    CHECK(r.expected == "[0-9]+");
}

TEST_CASE("invalid regular expressions report an exception") {
    auto r = op("matches", "abc", "([a-z");
    CHECK_FALSE(r.pass);
    REQUIRE(r.error);
    CHECK(*r.error == "exception");
    CHECK(r.details.contains("exception"));
}

TEST_CASE("call_order checks for an ordered subsequence") {
    CHECK(op("call_order", json::array({"a", "b", "c"}), json::array({"a", "c"})).pass);
    CHECK_FALSE(op("call_order", json::array({"a", "b"}), json::array({"b", "a"})).pass);
    CHECK_FALSE(op("call_order", json::array(), json::array({"a"})).pass);
    CHECK(op("call_order", json::array({"a"}), json::array()).pass);
}

TEST_CASE("file_exists checks the filesystem") {
    cdd::testing::TempDir dir;
    std::string file = dir.write("present.txt", "x");

    CHECK(op("file_exists", file, true).pass);
    CHECK_FALSE(op("file_exists", dir.path() + "/absent.txt", true).pass);
}

TEST_CASE("unknown operators fail with unknown_op") {
    auto r = op("frobnicate", 1, 1);
    CHECK_FALSE(r.pass);
    REQUIRE(r.error);
    CHECK(*r.error == "unknown_op");
}

// ============================================================================
// run_assertions
// ============================================================================

TEST_CASE("run_assertions resolves path operands against the context") {
    json context = {{"steps", json::array({{{"ok", true}, {"value", 42}}})}};
    json asserts = json::array({
        {{"op", "eq"}, {"actual", "$.steps[0].value"}, {"expected", 42}},
        {{"op", "eq"}, {"actual", "$.steps[0].ok"}, {"expected", true}, {"message", "step ran"}},
        {{"op", "eq"}, {"actual", "$.steps[3].value"}, {"expected", nullptr}},
    });

    auto results = run_assertions(context, asserts);
    REQUIRE(results.size() == 3);
    CHECK(results[0].pass);
    CHECK(results[1].pass);
    REQUIRE(results[1].message);
    CHECK(*results[1].message == "step ran");
    CHECK(results[2].pass);
}

TEST_CASE("run_assertions keeps going after a failure") {
    json context = {{"steps", json::array()}};
    json asserts = json::array({
        {{"op", "eq"}, {"actual", 1}, {"expected", 2}},
        {{"op", "eq"}, {"actual", "$.steps.value"}, {"expected", 1}},
        {{"op", "eq"}, {"actual", 3}, {"expected", 3}},
    });

    auto results = run_assertions(context, asserts);
    REQUIRE(results.size() == 3);
    CHECK_FALSE(results[0].pass);
    REQUIRE(results[1].error);
    CHECK(*results[1].error == "type_mismatch");
    CHECK(results[1].actual.is_null());
    CHECK(results[2].pass);
}

TEST_CASE("file_exists without expected defaults to true") {
    cdd::testing::TempDir dir;
    std::string file = dir.write("x.txt", "x");

    auto results = run_assertions(json::object(),
                                  json::array({{{"op", "file_exists"}, {"actual", file}}}));
    REQUIRE(results.size() == 1);
    CHECK(results[0].pass);
    CHECK(results[0].expected == true);
}

TEST_CASE("assertion_to_json carries the report fields") {
    auto r = op("eq", 1, 2);
    json j = cdd::assertion_to_json(r);
    CHECK(j["op"] == "eq");
    CHECK(j["pass"] == false);
    CHECK(j["error"].is_null());
    CHECK(j["details"].is_object());
    CHECK_FALSE(j.contains("message"));
}

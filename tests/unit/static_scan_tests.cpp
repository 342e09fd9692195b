#include <doctest/doctest.h>
#include <cdd/static_executor.hpp>
#include <cdd/sclang_executor.hpp>

#include "../test_helpers.hpp"

using nlohmann::json;

namespace {

cdd::TestSpec scan_test(json files, json asserts) {
    cdd::TestSpec t;
    t.id = "S1";
    t.type = "static";
    t.files = std::move(files);
    t.asserts = std::move(asserts);
    return t;
}

} // namespace

TEST_CASE("not_matches reports one failure per hit with its location") {
    cdd::testing::TempDir dir;
    dir.write("src/a.txt", "ok line\nTODO: first\nfine\n  TODO: second\nTODO: third\n");

    auto t = scan_test("src/*.txt",
                       json::array({{{"op", "not_matches"}, {"pattern", "TODO"}, {"message", "no todos"}}}));
    auto outcome = cdd::run_static_test(t, dir.path(), json::object());

    CHECK(outcome.status == cdd::TestStatus::Fail);
    CHECK(outcome.files_scanned == 1);
    REQUIRE(outcome.assertions.size() == 3);

    CHECK(outcome.assertions[0].details["line"] == 2);
    CHECK(outcome.assertions[1].details["line"] == 4);
    CHECK(outcome.assertions[2].details["line"] == 5);
    CHECK(outcome.assertions[1].details["col"] == 3);
    CHECK(outcome.assertions[1].details["snippet"] == "TODO: second");
    CHECK(outcome.assertions[0].details["match"] == "TODO");
    CHECK(*outcome.assertions[0].message == "no todos");
    CHECK_FALSE(outcome.assertions[0].pass);
}

TEST_CASE("matches fails once per file without a match") {
    cdd::testing::TempDir dir;
    dir.write("a.h", "#pragma once\n");
    dir.write("b.h", "int x;\n");

    auto t = scan_test(json::array({"a.h", "b.h"}),
                       json::array({{{"op", "matches"}, {"expected", "^#pragma once$"}}}));
    auto outcome = cdd::run_static_test(t, dir.path(), json::object());

    CHECK(outcome.files_scanned == 2);
    REQUIRE(outcome.assertions.size() == 1);
    CHECK(outcome.assertions[0].details["file"] == dir.path() + "/b.h");
}

TEST_CASE("a clean scan passes and other ops are ignored") {
    cdd::testing::TempDir dir;
    dir.write("lib/x.cpp", "int main() {}\n");

    auto t = scan_test("lib/**/*.cpp",
                       json::array({{{"op", "not_matches"}, {"pattern", "printf"}},
                                    {{"op", "equals"}, {"path", "$.steps"}, {"expected", 1}}}));
    auto outcome = cdd::run_static_test(t, dir.path(), json::object());
    CHECK(outcome.status == cdd::TestStatus::Pass);
    CHECK(outcome.assertions.empty());
}

TEST_CASE("file scans interpolate variables and error when nothing matches") {
    cdd::testing::TempDir dir;
    dir.write("pkg/main.py", "print('x')\n");

    auto t = scan_test("{pkg}/*.py", json::array({{{"op", "not_matches"}, {"pattern", "print\\("}}}));
    auto outcome = cdd::run_static_test(t, dir.path(), {{"pkg", "pkg"}});
    CHECK(outcome.status == cdd::TestStatus::Fail);
    CHECK(outcome.assertions.size() == 1);

    outcome = cdd::run_static_test(t, dir.path(), {{"pkg", "missing"}});
    CHECK(outcome.status == cdd::TestStatus::Error);
    REQUIRE(outcome.error);
    CHECK(*outcome.error == "No files matched: missing/*.py");
}

TEST_CASE("an invalid pattern becomes an exception failure") {
    auto failures = cdd::scan_file_assertions("f.txt", "abc", json::array({{{"op", "matches"}, {"pattern", "(["}}}));
    REQUIRE(failures.size() == 1);
    REQUIRE(failures[0].error);
    CHECK(*failures[0].error == "exception");
    CHECK(failures[0].details.contains("exception"));
}

TEST_CASE("the static executor refuses steps and describes its placeholder ast") {
    cdd::StaticExecutor executor(cdd::make_null_logger());
    cdd::RunContext ctx;
    cdd::RunnerConfig cfg;
    cfg.executor = "static";
    cfg.parser = "python_ast";

    CHECK_FALSE(executor.supports("call"));
    auto r = executor.execute_step(ctx, cfg, "T", cdd::StepSpec{}, 1000);
    REQUIRE(r.error_code);
    CHECK(*r.error_code == "static_no_steps");

    json ast = cdd::analyze_static_placeholder(cfg, "contracts/parser.yaml");
    CHECK(ast["schema_version"] == "1.0");
    CHECK(ast["parser"] == "python_ast");
    CHECK(ast["calls"].empty());
    CHECK(ast["source_included"] == false);
}

TEST_CASE("sclang render_nrt is not implemented yet") {
    cdd::SclangExecutor executor(cdd::make_null_logger());
    cdd::RunContext ctx;
    cdd::RunnerConfig cfg;

    cdd::StepSpec step;
    step.action = "render_nrt";
    step.with = {{"synthdef", "sine"}, {"dur_s", 2}};

    CHECK(executor.supports("render_nrt"));
    auto r = executor.execute_step(ctx, cfg, "T", step, 1000);
    CHECK_FALSE(r.ok);
    REQUIRE(r.error_code);
    CHECK(*r.error_code == "not_implemented");
    CHECK(*r.message == "sclang render_nrt not yet implemented (synthdef=sine, dur=2s)");
    CHECK(r.value["metrics"]["rms_db"].is_null());

    step.action = "call";
    r = executor.execute_step(ctx, cfg, "T", step, 1000);
    CHECK(*r.error_code == "unsupported_action");
}

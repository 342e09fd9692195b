#include <doctest/doctest.h>
#include <cdd/runner.hpp>

#include "../test_helpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

const char* kProject =
    "project: demo\n"
    "version: 1.0.0\n"
    "status: draft\n"
    "cdd_spec: \"1.1.5\"\n";

const char* kShellContract =
    "contract: shell_demo\n"
    "runner:\n"
    "  executor: shell\n"
    "  timeout_ms: 5000\n"
    "tests:\n"
    "  - id: A\n"
    "    steps:\n"
    "      - action: shell\n"
    "        command: [\"false\"]\n"
    "    assert:\n"
    "      - {op: eq, actual: \"$.steps[0].ok\", expected: true}\n"
    "  - id: B\n"
    "    requirement: R-1\n"
    "    steps:\n"
    "      - action: shell\n"
    "        command: [sh, -c, \"echo 5\"]\n"
    "    assert:\n"
    "      - {op: eq, actual: \"$.steps[0].stdout_int\", expected: 5}\n";

struct Workspace {
    cdd::testing::TempDir dir;

    std::string contracts() const { return dir.path() + "/contracts"; }

    cdd::Report run(const std::string& path,
                    cdd::RunnerOptions options = {},
                    const json& vars = json::object(),
                    const std::vector<std::string>& only = {}) const {
        options.artifacts_root = dir.path() + "/artifacts";
        if (options.tool_version.empty()) options.tool_version = "1.1.5";
        cdd::ContractRunner runner(cdd::ExecutorRegistry::with_builtins(), options, cdd::make_null_logger());
        return runner.run(path, vars, only);
    }
};

const cdd::TestResult& result_for(const cdd::Report& report, const std::string& id) {
    for (const auto& r : report.results) {
        if (r.id == id) return r;
    }
    FAIL("no result for " << id);
    return report.results.front();
}

} // namespace

TEST_CASE("a failing test does not stop its siblings") {
    Workspace ws;
    ws.dir.write("contracts/project.yaml", kProject);
    ws.dir.write("contracts/shell_demo.yaml", kShellContract);

    auto report = ws.run(ws.contracts());

    CHECK(report.contract == "demo");
    CHECK(report.schema_version == "1.1");
    CHECK(report.warnings.empty());
    CHECK(report.run_id.rfind("run_", 0) == 0);
    CHECK(fs::is_directory(report.artifacts_dir + "/shell_demo"));

    CHECK(report.summary.passed == 1);
    CHECK(report.summary.failed == 1);
    CHECK(report.summary.skipped == 0);
    CHECK(report.summary.error == 0);
    CHECK(report.has_failures());

    const auto& a = result_for(report, "A");
    CHECK(a.status == cdd::TestStatus::Fail);
    CHECK(a.message == "One or more assertions failed");
    CHECK(a.steps[0]["error_code"] == "nonzero_exit");

    const auto& b = result_for(report, "B");
    CHECK(b.status == cdd::TestStatus::Pass);
    CHECK(b.requirement == std::optional<std::string>("R-1"));
    CHECK(b.message == "All assertions passed");
}

TEST_CASE("the only filter and fail-fast narrow the run") {
    Workspace ws;
    ws.dir.write("contracts/project.yaml", kProject);
    ws.dir.write("contracts/shell_demo.yaml", kShellContract);

    auto only_b = ws.run(ws.contracts(), {}, json::object(), {"B"});
    REQUIRE(only_b.results.size() == 1);
    CHECK(only_b.results[0].id == "B");
    CHECK_FALSE(only_b.has_failures());

    cdd::RunnerOptions fail_fast;
    fail_fast.matrix_fail_fast = true;
    auto stopped = ws.run(ws.contracts(), fail_fast);
    REQUIRE(stopped.results.size() == 1);
    CHECK(stopped.results[0].id == "A");
}

TEST_CASE("a major version mismatch aborts before any test runs") {
    Workspace ws;
    ws.dir.write("contracts/project.yaml", "project: demo\ncdd_spec: \"2.0.0\"\n");
    ws.dir.write("contracts/shell_demo.yaml", kShellContract);

    auto report = ws.run(ws.contracts());

    CHECK(report.contract == "project");
    REQUIRE(report.errors.size() == 1);
    CHECK(report.errors[0].code == "spec_major_mismatch");
    CHECK(report.errors[0].message == "Project targets CDD 2.0.0, tooling is 1.1.5");
    REQUIRE(report.results.size() == 1);
    CHECK(report.results[0].id == "VERSION");
    CHECK(report.results[0].status == cdd::TestStatus::Error);
    CHECK(report.summary.error == 1);
    CHECK_FALSE(fs::exists(report.artifacts_dir));
}

TEST_CASE("an exact-version requirement turns a minor drift into an abort") {
    Workspace ws;
    ws.dir.write("contracts/project.yaml", "project: demo\ncdd_spec: \"1.0.0\"\n");
    ws.dir.write("contracts/shell_demo.yaml", kShellContract);

    auto relaxed = ws.run(ws.contracts());
    REQUIRE(relaxed.warnings.size() == 1);
    CHECK(relaxed.warnings[0].code == "spec_version_mismatch");
    CHECK(relaxed.results.size() == 2);

    cdd::RunnerOptions exact;
    exact.require_exact_spec = true;
    auto strict = ws.run(ws.contracts(), exact);
    REQUIRE(strict.errors.size() == 1);
    CHECK(strict.errors[0].code == "spec_exact_mismatch");
    CHECK(strict.results[0].id == "VERSION");
}

TEST_CASE("without a project contract the run warns and continues") {
    Workspace ws;
    ws.dir.write("contracts/shell_demo.yaml", kShellContract);

    auto report = ws.run(ws.contracts());
    CHECK(report.contract == "unknown");
    REQUIRE(report.warnings.size() == 1);
    CHECK(report.warnings[0].code == "spec_version_missing");
    CHECK(report.results.size() == 2);
}

TEST_CASE("a single contract file runs alone") {
    Workspace ws;
    ws.dir.write("contracts/project.yaml", kProject);
    auto file = ws.dir.write("contracts/shell_demo.yaml", kShellContract);
    ws.dir.write("contracts/other.yaml",
                 "contract: other\nrunner: {executor: shell}\ntests:\n  - id: X\n    assert: []\n");

    auto report = ws.run(file);
    CHECK(report.contract == "demo");
    CHECK(report.results.size() == 2);

    auto all = ws.run(ws.contracts() + "/");
    CHECK(all.results.size() == 3);
}

TEST_CASE("broken contracts and executors become synthetic errors") {
    Workspace ws;
    ws.dir.write("contracts/project.yaml", kProject);
    ws.dir.write("contracts/a_broken.yaml", "tests: [unclosed\n");
    ws.dir.write("contracts/b_python.yaml",
                 "contract: py\nrunner: {executor: python}\ntests:\n  - id: P\n    assert: []\n");
    ws.dir.write("contracts/c_ok.yaml",
                 "contract: ok\nrunner: {executor: shell}\ntests:\n  - id: OK\n    assert: []\n");

    auto report = ws.run(ws.contracts());
    REQUIRE(report.results.size() == 3);
    CHECK(report.results[0].id == "INVALID");
    CHECK(report.results[0].status == cdd::TestStatus::Error);
    CHECK(report.results[1].id == "EXECUTOR");
    CHECK(report.results[1].message == "Unknown executor 'python' (available: native, sclang, shell, static)");
    CHECK(report.results[2].id == "OK");
    CHECK(report.results[2].status == cdd::TestStatus::Pass);
    CHECK(report.summary.error == 2);
}

TEST_CASE("an unreadable project contract is reported as INVALID") {
    Workspace ws;
    ws.dir.write("contracts/project.yaml", "project: [oops\n");
    ws.dir.write("contracts/shell_demo.yaml", kShellContract);

    auto report = ws.run(ws.contracts());
    REQUIRE(report.results.size() == 1);
    CHECK(report.results[0].id == "INVALID");
    CHECK(report.errors.size() == 1);
}

TEST_CASE("variables, saved results, waits and unsupported actions") {
    Workspace ws;
    ws.dir.write("contracts/vars.yaml",
                 "contract: vars\n"
                 "runner: {executor: shell}\n"
                 "vars:\n"
                 "  name: contract\n"
                 "tests:\n"
                 "  - id: V\n"
                 "    steps:\n"
                 "      - action: shell\n"
                 "        command: [echo, \"{greeting} {name}\"]\n"
                 "        save_as: out\n"
                 "      - action: wait\n"
                 "        seconds: 0.01\n"
                 "      - action: call\n"
                 "    assert:\n"
                 "      - {op: eq, actual: \"$.out.stdout\", expected: \"hi contract\\n\"}\n"
                 "      - {op: eq, actual: \"$.steps[1].ok\", expected: true}\n"
                 "      - {op: eq, actual: \"$.steps[2].error_code\", expected: invalid_action}\n"
                 "      - {op: eq, actual: \"$.vars.greeting\", expected: hi}\n"
                 "      - {op: eq, actual: \"$.contract.contract\", expected: vars}\n");

    auto report = ws.run(ws.contracts(), {}, {{"greeting", "hi"}, {"name", "cli"}});
    REQUIRE(report.results.size() == 1);
    const auto& v = report.results[0];
    CHECK(v.message == "All assertions passed");
    CHECK(v.status == cdd::TestStatus::Pass);
    CHECK(v.steps.size() == 3);
}

TEST_CASE("static contracts scan files and evaluate against the ast") {
    Workspace ws;
    ws.dir.write("src/app.py", "import os\nprint('debug')\n");
    ws.dir.write("src/lib.py", "def f():\n    return 1\n");
    ws.dir.write("contracts/static.yaml",
                 "contract: lint_rules\n"
                 "runner: {executor: static, parser: python_ast}\n"
                 "tests:\n"
                 "  - id: S1\n"
                 "    type: static\n"
                 "    files: ../src/*.py\n"
                 "    assert:\n"
                 "      - {op: not_matches, pattern: \"print\\\\(\"}\n"
                 "  - id: S2\n"
                 "    type: static\n"
                 "    files: ../src/none/*.py\n"
                 "    assert: []\n"
                 "  - id: S3\n"
                 "    assert:\n"
                 "      - {op: eq, actual: \"$.ast.schema_version\", expected: \"1.0\"}\n"
                 "  - id: S4\n"
                 "    steps:\n"
                 "      - action: call\n"
                 "    assert: []\n");

    auto report = ws.run(ws.contracts());
    REQUIRE(report.results.size() == 4);

    const auto& s1 = result_for(report, "S1");
    CHECK(s1.status == cdd::TestStatus::Fail);
    CHECK(s1.message == "1 failures in 2 files");
    CHECK(s1.extra["files_scanned"] == 2);
    CHECK(s1.assertions[0]["details"]["line"] == 2);

    const auto& s2 = result_for(report, "S2");
    CHECK(s2.status == cdd::TestStatus::Error);
    CHECK(s2.message == "No files matched: ../src/none/*.py");

    CHECK(result_for(report, "S3").status == cdd::TestStatus::Pass);

    const auto& s4 = result_for(report, "S4");
    CHECK(s4.status == cdd::TestStatus::Error);
    CHECK(s4.message == "Static tests must have no steps");
}

TEST_CASE("native contracts call into a shared library") {
    Workspace ws;
    ws.dir.write("contracts/native.yaml",
                 std::string("contract: native_demo\n"
                             "runner:\n"
                             "  executor: native\n"
                             "  entry: ") + CDD_TEST_NATIVE_ENTRY + "\n"
                 "  symbol: cdd_fixture_add\n"
                 "tests:\n"
                 "  - id: N1\n"
                 "    steps:\n"
                 "      - action: call\n"
                 "        with: {a: 20, b: 22}\n"
                 "    assert:\n"
                 "      - {op: eq, actual: \"$.steps[0].value\", expected: 42}\n"
                 "  - id: N2\n"
                 "    steps:\n"
                 "      - action: call\n"
                 "        method: cdd_fixture_fail\n"
                 "    assert:\n"
                 "      - {op: eq, actual: \"$.steps[0].ok\", expected: true}\n");

    auto report = ws.run(ws.contracts());
    REQUIRE(report.results.size() == 2);
    CHECK(report.results[0].status == cdd::TestStatus::Pass);
    CHECK(report.results[1].status == cdd::TestStatus::Fail);
    CHECK(report.results[1].steps[0]["message"] == "boom");
}

TEST_CASE("report serialization round trips the summary") {
    Workspace ws;
    ws.dir.write("contracts/project.yaml", kProject);
    ws.dir.write("contracts/shell_demo.yaml", kShellContract);

    auto report = ws.run(ws.contracts());
    json j = json::parse(cdd::serialize_report_json(report));
    CHECK(j["summary"] == json({{"passed", 1}, {"failed", 1}, {"skipped", 0}, {"error", 0}}));
    CHECK(j["project_spec"] == "1.1.5");
    CHECK(j["results"].size() == 2);
}

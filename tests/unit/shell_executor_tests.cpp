#include <doctest/doctest.h>
#include <cdd/shell_executor.hpp>

#include "../test_helpers.hpp"

#include <chrono>

using nlohmann::json;

namespace {

struct ShellFixture {
    cdd::testing::TempDir dir;
    cdd::ShellExecutor executor{cdd::make_null_logger()};
    cdd::RunContext ctx;
    cdd::RunnerConfig cfg;

    ShellFixture() {
        ctx.work_dir = dir.path();
        ctx.artifacts_dir = dir.path() + "/artifacts";
        ctx.contract = {{"contract", "shell_demo"}};
        ctx.runner = {{"run_id", "run_test"}};
        ctx.vars = {{"greeting", "hi"}};
        cfg.executor = "shell";
    }

    cdd::StepResult run(std::vector<std::string> command, int timeout_ms = 5000) {
        cdd::StepSpec step;
        step.action = "shell";
        step.command = std::move(command);
        return executor.execute_step(ctx, cfg, "T", step, timeout_ms);
    }
};

} // namespace

TEST_CASE("shell setup creates the artifacts directory") {
    ShellFixture f;
    REQUIRE(f.executor.setup(f.ctx, f.cfg).ok);
    CHECK(std::filesystem::is_directory(f.ctx.artifacts_dir));
}

TEST_CASE("shell captures output and exit status") {
    ShellFixture f;
    auto r = f.run({"sh", "-c", "echo out; echo err >&2"});
    CHECK(r.ok);
    CHECK(r.value["returncode"] == 0);
    CHECK(r.captured_stdout == "out\n");
    CHECK(r.captured_stderr == "err\n");
    CHECK(r.meta.contains("duration_ms"));
}

TEST_CASE("a nonzero exit is reported with its code") {
    ShellFixture f;
    auto r = f.run({"sh", "-c", "exit 3"});
    CHECK_FALSE(r.ok);
    CHECK(r.value["returncode"] == 3);
    REQUIRE(r.error_code);
    CHECK(*r.error_code == "nonzero_exit");
    CHECK(*r.message == "Exit code: 3");
}

TEST_CASE("arguments are interpolated without a shell") {
    ShellFixture f;
    auto r = f.run({"echo", "{greeting} $HOME-literal"});
    REQUIRE(r.ok);
    CHECK(r.captured_stdout == "hi $HOME-literal\n");
}

TEST_CASE("the step runs in the contract directory with contract variables in its environment") {
    ShellFixture f;
    f.cfg.env["EXTRA"] = "yes";
    auto r = f.run({"sh", "-c", "pwd; echo $CONTRACT $RUN_ID $EXTRA"});
    REQUIRE(r.ok);
    CHECK(r.captured_stdout == f.dir.path() + "\nshell_demo run_test yes\n");
}

TEST_CASE("a command that outlives its timeout is killed") {
    ShellFixture f;
    auto start = std::chrono::steady_clock::now();
    auto r = f.run({"sh", "-c", "echo started; sleep 10"}, 300);
    auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK_FALSE(r.ok);
    REQUIRE(r.error_code);
    CHECK(*r.error_code == "timeout");
    CHECK(*r.message == "Command timed out after 300ms");
    CHECK(elapsed < std::chrono::seconds(5));
}

TEST_CASE("missing commands and programs are reported") {
    ShellFixture f;

    cdd::StepSpec step;
    step.action = "shell";
    auto r = f.executor.execute_step(f.ctx, f.cfg, "T", step, 1000);
    REQUIRE(r.error_code);
    CHECK(*r.error_code == "missing_command");

    r = f.run({"cdd-no-such-program-xyz"});
    CHECK_FALSE(r.ok);
    REQUIRE(r.error_code);
    CHECK(*r.error_code == "exception");
}

TEST_CASE("step_result_to_json adds stdout_int when stdout is an integer") {
    ShellFixture f;
    auto r = f.run({"echo", " 42 "});
    json envelope = cdd::step_result_to_json(r);
    CHECK(envelope["ok"] == true);
    CHECK(envelope["stdout_int"] == 42);

    r = f.run({"echo", "forty-two"});
    envelope = cdd::step_result_to_json(r);
    CHECK(envelope["stdout_int"].is_null());
}

TEST_CASE("parse_stdout_int accepts signed integers only") {
    CHECK(cdd::parse_stdout_int("-12\n") == -12);
    CHECK(cdd::parse_stdout_int("+7") == 7);
    CHECK_FALSE(cdd::parse_stdout_int("1.5"));
    CHECK_FALSE(cdd::parse_stdout_int(""));
}

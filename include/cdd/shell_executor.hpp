#pragma once

#include "cdd/executor.hpp"
#include "cdd/log.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cdd {

// ============================================================================
// Process Execution
// ============================================================================

struct ProcessRequest {
    std::vector<std::string> argv;              // argv[0] looked up on PATH
    std::map<std::string, std::string> env;     // complete environment
    std::string cwd;
    int timeout_ms = 0;                         // 0 waits forever
};

struct ProcessResult {
    bool ok = false;            // process ran to completion
    bool timed_out = false;
    int exit_code = -1;
    std::string error;          // spawn/wait failure
    std::string stdout_text;
    std::string stderr_text;
};

// Spawn without a shell, capture both output streams, and kill the child
// when the timeout expires
ProcessResult run_process(const ProcessRequest& request);

// ============================================================================
// Shell Executor
// ============================================================================

class ShellExecutor : public Executor {
public:
    explicit ShellExecutor(Logger logger) : logger_(std::move(logger)) {}

    std::string name() const override { return "shell"; }
    bool supports(const std::string& action) const override { return action == "shell"; }

    // Creates the artifacts directory
    ExecutorStatus setup(RunContext& ctx, const RunnerConfig& cfg) override;

    StepResult execute_step(const RunContext& ctx,
                            const RunnerConfig& cfg,
                            const std::string& test_id,
                            const StepSpec& step,
                            int timeout_ms) override;

    ExecutorStatus teardown(RunContext& ctx, const RunnerConfig& cfg) override;

private:
    Logger logger_;
};

// Process env + runner.env + CONTRACT, RUN_ID, ARTIFACTS_DIR
std::map<std::string, std::string> build_step_environment(const RunContext& ctx,
                                                          const RunnerConfig& cfg);

} // namespace cdd

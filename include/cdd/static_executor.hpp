#pragma once

#include "cdd/assertions.hpp"
#include "cdd/executor.hpp"
#include "cdd/log.hpp"
#include "cdd/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cdd {

// ============================================================================
// Static Executor
// ============================================================================
//
// Runs no steps. Static contracts are verified two ways:
//   - assertions against $.ast, the structure produced by a parser plugin
//     (currently an empty placeholder)
//   - file-scan tests (`type: static` + `files:`), regex assertions run
//     directly against file contents

class StaticExecutor : public Executor {
public:
    explicit StaticExecutor(Logger logger) : logger_(std::move(logger)) {}

    std::string name() const override { return "static"; }
    bool supports(const std::string& /*action*/) const override { return false; }

    ExecutorStatus setup(RunContext& ctx, const RunnerConfig& cfg) override;

    // Always static_no_steps
    StepResult execute_step(const RunContext& ctx,
                            const RunnerConfig& cfg,
                            const std::string& test_id,
                            const StepSpec& step,
                            int timeout_ms) override;

    ExecutorStatus teardown(RunContext& ctx, const RunnerConfig& cfg) override;

private:
    Logger logger_;
};

// AST placeholder for future parser plugins (runner.parser)
nlohmann::json analyze_static_placeholder(const RunnerConfig& cfg,
                                          const std::string& contract_path);

// ============================================================================
// File Scanning
// ============================================================================

// Failures only. not_matches yields one failure per regex match (with file,
// line, col, match and snippet details); matches yields one failure when the
// content has no match at all.
std::vector<AssertionResult> scan_file_assertions(const std::string& file_path,
                                                  const std::string& content,
                                                  const nlohmann::json& asserts);

struct StaticTestOutcome {
    TestStatus status = TestStatus::Error;
    std::vector<AssertionResult> assertions;
    int files_scanned = 0;
    std::optional<std::string> error;
};

// Expand the test's files (relative to base_dir, after interpolation) and
// scan each. No matched file is an error.
StaticTestOutcome run_static_test(const TestSpec& test,
                                  const std::string& base_dir,
                                  const nlohmann::json& vars);

} // namespace cdd

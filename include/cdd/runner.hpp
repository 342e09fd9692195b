#pragma once

/**
 * @file runner.hpp
 * @brief Contract runner: load, gate on spec version, execute, report
 *
 * @example
 * ```cpp
 * auto logger = cdd::make_console_logger(false, false);
 * cdd::ContractRunner runner(cdd::ExecutorRegistry::with_builtins(), {}, logger);
 * cdd::Report report = runner.run("contracts");
 * std::cout << cdd::serialize_report_json(report) << "\n";
 * ```
 */

#include "cdd/assertions.hpp"
#include "cdd/contract.hpp"
#include "cdd/executor.hpp"
#include "cdd/executor_registry.hpp"
#include "cdd/log.hpp"
#include "cdd/report.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cdd {

struct RunnerOptions {
    std::string artifacts_root = "artifacts";
    bool require_exact_spec = false;
    bool matrix_fail_fast = false;
    std::string tool_version;       // empty: the built-in tool version
};

class ContractRunner {
public:
    ContractRunner(ExecutorRegistry registry, RunnerOptions options, Logger logger);

    /**
     * @brief Run a contracts directory or a single contract file
     * @param contracts_path Directory holding project.yaml, or one contract file
     * @param injected_vars Variables from the caller; contract `vars` win on collision
     * @param only_test_ids When non-empty, run only these test ids
     */
    Report run(const std::string& contracts_path,
               const nlohmann::json& injected_vars = nlohmann::json::object(),
               const std::vector<std::string>& only_test_ids = {}) const;

    const RunnerOptions& options() const { return options_; }

private:
    std::vector<TestResult> run_contract_tests(RunContext& ctx,
                                               const ComponentContract& contract,
                                               const std::vector<std::string>& only_test_ids) const;

    TestResult run_static_file_test(const RunContext& ctx,
                                    const TestSpec& test,
                                    const std::string& contract_path) const;

    std::pair<std::vector<StepResult>, nlohmann::json> execute_steps(
        const RunContext& ctx,
        const RunnerConfig& cfg,
        const std::string& test_id,
        const nlohmann::json& steps,
        Executor& executor,
        int timeout_ms) const;

    RunContext build_context(const ComponentContract& contract,
                             const std::string& artifacts_dir,
                             const nlohmann::json& injected_vars,
                             const std::string& tool_version,
                             const std::string& run_id,
                             const std::optional<std::string>& project_spec) const;

    std::string resolved_tool_version() const;

    ExecutorRegistry registry_;
    RunnerOptions options_;
    Logger logger_;
};

// Assertion context: {vars, env, runner, contract, steps, ast} with saved
// step results merged at the top level
nlohmann::json build_assertion_context(const RunContext& ctx,
                                       const std::vector<StepResult>& step_results,
                                       const nlohmann::json& saved);

// error if any assertion carries an error code (first one surfaced), else
// fail if any did not pass, else pass
TestStatus status_from_assertions(const std::vector<AssertionResult>& results,
                                  std::string& message);

} // namespace cdd

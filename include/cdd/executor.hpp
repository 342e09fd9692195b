#pragma once

/**
 * @file executor.hpp
 * @brief Step executor interface and the step result envelope
 *
 * The runner creates one executor per component contract, calls setup()
 * once before the first test, execute_step() for each step, and teardown()
 * once after the last test, whatever the test outcomes were.
 */

#include "cdd/contract.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>

namespace cdd {

// ============================================================================
// Run Context
// ============================================================================

// Per-contract environment, exposed to assertions as $.vars, $.env,
// $.runner and $.contract
struct RunContext {
    std::string artifacts_dir;
    std::string work_dir;                                // contract directory
    nlohmann::json vars = nlohmann::json::object();
    nlohmann::json env = nlohmann::json::object();       // os, os_family, cxx_*
    nlohmann::json runner = nlohmann::json::object();    // tool_version, run_id, flags
    nlohmann::json contract = nlohmann::json::object();  // contract, version, status, path
};

// ============================================================================
// Step Result Envelope
// ============================================================================

struct StepResult {
    bool ok = false;
    nlohmann::json value;
    std::optional<std::string> error_code;
    std::optional<std::string> message;
    nlohmann::json meta = nlohmann::json::object();      // always gains duration_ms
    std::string captured_stdout;
    std::string captured_stderr;
    nlohmann::json artifacts = nlohmann::json::array();

    static StepResult failure(const std::string& code, const std::string& message);
};

// Envelope form consumed by assertions and reports:
// {ok, value, error_code, message, meta, stdout, stdout_int, stderr, artifacts}
nlohmann::json step_result_to_json(const StepResult& result);

// Best-effort integer parse of trimmed stdout
std::optional<long long> parse_stdout_int(const std::string& text);

// ============================================================================
// Executor Interface
// ============================================================================

struct ExecutorStatus {
    bool ok = false;
    std::string error;

    static ExecutorStatus success() { return {true, {}}; }
    static ExecutorStatus failure(std::string error) { return {false, std::move(error)}; }
};

class Executor {
public:
    virtual ~Executor() = default;

    virtual std::string name() const = 0;

    // True if this executor handles `action`
    virtual bool supports(const std::string& action) const = 0;

    virtual ExecutorStatus setup(RunContext& ctx, const RunnerConfig& cfg) = 0;

    virtual StepResult execute_step(const RunContext& ctx,
                                    const RunnerConfig& cfg,
                                    const std::string& test_id,
                                    const StepSpec& step,
                                    int timeout_ms) = 0;

    virtual ExecutorStatus teardown(RunContext& ctx, const RunnerConfig& cfg) = 0;
};

} // namespace cdd

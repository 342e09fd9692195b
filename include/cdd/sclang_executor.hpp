#pragma once

#include "cdd/executor.hpp"
#include "cdd/log.hpp"
#include "cdd/shell_executor.hpp"

#include <string>

namespace cdd {

// ============================================================================
// SuperCollider Executor (placeholder)
// ============================================================================
//
// render_nrt keeps its result shape ({wav_path, hash, metrics}) but is not
// implemented yet; `shell` steps are passed to a ShellExecutor unchanged.

class SclangExecutor : public Executor {
public:
    explicit SclangExecutor(Logger logger);

    std::string name() const override { return "sclang"; }
    bool supports(const std::string& action) const override;

    ExecutorStatus setup(RunContext& ctx, const RunnerConfig& cfg) override;

    StepResult execute_step(const RunContext& ctx,
                            const RunnerConfig& cfg,
                            const std::string& test_id,
                            const StepSpec& step,
                            int timeout_ms) override;

    ExecutorStatus teardown(RunContext& ctx, const RunnerConfig& cfg) override;

private:
    StepResult render_nrt(const StepSpec& step) const;

    Logger logger_;
    ShellExecutor shell_;
};

} // namespace cdd

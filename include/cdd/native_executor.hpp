#pragma once

#include "cdd/cdd_entry.h"
#include "cdd/executor.hpp"
#include "cdd/log.hpp"

#include <string>
#include <vector>

namespace cdd {

// ============================================================================
// Native Executor (in-process calls into a shared library)
// ============================================================================
//
// Actions:
//   call     invoke the symbol once, capturing stdout/stderr and duration
//   call_n   invoke the symbol n times, reporting duration statistics

class NativeExecutor : public Executor {
public:
    explicit NativeExecutor(Logger logger);
    ~NativeExecutor() override;

    NativeExecutor(const NativeExecutor&) = delete;
    NativeExecutor& operator=(const NativeExecutor&) = delete;

    std::string name() const override { return "native"; }
    bool supports(const std::string& action) const override;

    // Loads runner.entry (relative to the contract directory)
    ExecutorStatus setup(RunContext& ctx, const RunnerConfig& cfg) override;

    StepResult execute_step(const RunContext& ctx,
                            const RunnerConfig& cfg,
                            const std::string& test_id,
                            const StepSpec& step,
                            int timeout_ms) override;

    // Unloads the library
    ExecutorStatus teardown(RunContext& ctx, const RunnerConfig& cfg) override;

private:
    StepResult do_call(const StepSpec& step);
    StepResult do_call_n(const StepSpec& step);
    cdd_entry_fn resolve_symbol(const std::string& symbol) const;
    std::string target_symbol(const StepSpec& step) const;
    void unload();

    Logger logger_;
    void* handle_ = nullptr;
    std::string symbol_;
};

// ============================================================================
// Duration statistics for call_n
// ============================================================================

struct DurationStats {
    double min_ms = 0.0;
    double max_ms = 0.0;
    double mean_ms = 0.0;
    double p50_ms = 0.0;
    double p95_ms = 0.0;   // exact only with >= 20 samples, else max
    double p99_ms = 0.0;   // exact only with >= 100 samples, else max
};

// `durations_ms` must not be empty
DurationStats compute_duration_stats(const std::vector<double>& durations_ms);

} // namespace cdd

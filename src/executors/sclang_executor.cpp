#include "cdd/sclang_executor.hpp"
#include "cdd/contract.hpp"
#include "cdd/types.hpp"

#include <filesystem>

namespace cdd {

SclangExecutor::SclangExecutor(Logger logger)
    : logger_(logger), shell_(std::move(logger)) {}

bool SclangExecutor::supports(const std::string& action) const {
    return action == "render_nrt" || action == "shell";
}

ExecutorStatus SclangExecutor::setup(RunContext& ctx, const RunnerConfig& /*cfg*/) {
    std::error_code ec;
    std::filesystem::create_directories(ctx.artifacts_dir, ec);
    if (ec) {
        return ExecutorStatus::failure("cannot create artifacts directory " + ctx.artifacts_dir +
                                       ": " + ec.message());
    }
    return ExecutorStatus::success();
}

StepResult SclangExecutor::execute_step(const RunContext& ctx,
                                        const RunnerConfig& cfg,
                                        const std::string& test_id,
                                        const StepSpec& step,
                                        int timeout_ms) {
    if (step.action == "render_nrt") return render_nrt(step);
    if (step.action == "shell") return shell_.execute_step(ctx, cfg, test_id, step, timeout_ms);
    return StepResult::failure(codes::kUnsupportedAction, "Unknown action: " + step.action);
}

ExecutorStatus SclangExecutor::teardown(RunContext& /*ctx*/, const RunnerConfig& /*cfg*/) {
    return ExecutorStatus::success();
}

// TODO: generate the .scd script from runner.script_template, run
// `sclang -i` in NRT mode and read back the rendered wav and metrics.json
StepResult SclangExecutor::render_nrt(const StepSpec& step) const {
    auto field = [&](const char* key, const char* fallback) {
        if (step.with.is_object() && step.with.contains(key)) {
            return scalar_to_string(step.with[key]);
        }
        return std::string(fallback);
    };

    std::string synthdef = field("synthdef", "unknown");
    std::string dur_s = field("dur_s", "1.0");
    logger_->debug("sclang: render_nrt requested for {}", synthdef);

    StepResult r = StepResult::failure(
        codes::kNotImplemented,
        "sclang render_nrt not yet implemented (synthdef=" + synthdef + ", dur=" + dur_s + "s)");
    r.value = {
        {"wav_path", nullptr},
        {"hash", nullptr},
        {"metrics", {{"rms_db", nullptr}, {"peak_dbfs", nullptr}, {"dc_offset", nullptr}}},
    };
    return r;
}

} // namespace cdd

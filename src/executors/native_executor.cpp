#include "cdd/native_executor.hpp"
#include "cdd/types.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <numeric>

#include <dlfcn.h>
#include <unistd.h>

namespace cdd {

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

// Redirects one standard stream into an anonymous temporary file for the
// lifetime of the object
class StreamCapture {
public:
    StreamCapture(FILE* stream, int fd) : stream_(stream), fd_(fd) {
        std::fflush(stream_);
        tmp_ = std::tmpfile();
        if (!tmp_) return;
        saved_ = dup(fd_);
        if (saved_ < 0 || dup2(fileno(tmp_), fd_) < 0) {
            if (saved_ >= 0) close(saved_);
            saved_ = -1;
        }
    }

    ~StreamCapture() {
        restore();
        if (tmp_) std::fclose(tmp_);
    }

    StreamCapture(const StreamCapture&) = delete;
    StreamCapture& operator=(const StreamCapture&) = delete;

    // Restore the stream and return everything written while captured
    std::string finish() {
        restore();
        std::string out;
        if (!tmp_) return out;
        std::rewind(tmp_);
        char buffer[4096];
        size_t n;
        while ((n = std::fread(buffer, 1, sizeof(buffer), tmp_)) > 0) {
            out.append(buffer, n);
        }
        return out;
    }

private:
    void restore() {
        if (saved_ < 0) return;
        std::fflush(stream_);
        dup2(saved_, fd_);
        close(saved_);
        saved_ = -1;
    }

    FILE* stream_;
    int fd_;
    FILE* tmp_ = nullptr;
    int saved_ = -1;
};

// Owns the strings a native entry allocates
struct CallOutput {
    cdd_call_result raw{nullptr, nullptr};

    CallOutput() = default;
    ~CallOutput() {
        std::free(raw.json);
        std::free(raw.error);
    }
    CallOutput(const CallOutput&) = delete;
    CallOutput& operator=(const CallOutput&) = delete;
};

struct CallOutcome {
    bool ok = false;
    nlohmann::json value;
    std::string error;
};

CallOutcome invoke(cdd_entry_fn fn, const std::string& args_json) {
    CallOutcome outcome;
    CallOutput out;
    int rc = fn(args_json.c_str(), &out.raw);
    if (rc != 0) {
        outcome.error = out.raw.error ? out.raw.error
                                      : "call returned status " + std::to_string(rc);
        return outcome;
    }
    if (out.raw.json) {
        try {
            outcome.value = nlohmann::json::parse(out.raw.json);
        } catch (const nlohmann::json::parse_error& e) {
            outcome.error = std::string("return value is not valid JSON: ") + e.what();
            return outcome;
        }
    }
    outcome.ok = true;
    return outcome;
}

double elapsed_ms(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

} // namespace

// ============================================================================
// Duration Statistics
// ============================================================================

DurationStats compute_duration_stats(const std::vector<double>& durations_ms) {
    DurationStats stats;
    if (durations_ms.empty()) return stats;

    std::vector<double> sorted = durations_ms;
    std::sort(sorted.begin(), sorted.end());
    size_t len = sorted.size();

    stats.min_ms = sorted.front();
    stats.max_ms = sorted.back();
    stats.mean_ms = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(len);
    stats.p50_ms = sorted[len / 2];
    stats.p95_ms = len >= 20 ? sorted[static_cast<size_t>(static_cast<double>(len) * 0.95)] : sorted.back();
    stats.p99_ms = len >= 100 ? sorted[static_cast<size_t>(static_cast<double>(len) * 0.99)] : sorted.back();
    return stats;
}

// ============================================================================
// Native Executor
// ============================================================================

NativeExecutor::NativeExecutor(Logger logger) : logger_(std::move(logger)) {}

NativeExecutor::~NativeExecutor() {
    unload();
}

bool NativeExecutor::supports(const std::string& action) const {
    return action == "call" || action == "call_n";
}

ExecutorStatus NativeExecutor::setup(RunContext& ctx, const RunnerConfig& cfg) {
    if (!cfg.entry || cfg.entry->empty()) {
        return ExecutorStatus::failure("native executor requires runner.entry");
    }

    fs::path entry_path = fs::path(ctx.work_dir) / *cfg.entry;
    std::error_code ec;
    if (!fs::exists(entry_path, ec)) {
        return ExecutorStatus::failure("Entry file not found: " + entry_path.string());
    }

    unload();
    handle_ = dlopen(entry_path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle_) {
        const char* err = dlerror();
        return ExecutorStatus::failure("Cannot load " + entry_path.string() + ": " +
                                       (err ? err : "unknown error"));
    }

    symbol_ = cfg.symbol.value_or("");
    logger_->debug("native: loaded {}", entry_path.string());
    return ExecutorStatus::success();
}

ExecutorStatus NativeExecutor::teardown(RunContext& /*ctx*/, const RunnerConfig& /*cfg*/) {
    unload();
    return ExecutorStatus::success();
}

void NativeExecutor::unload() {
    if (handle_) {
        dlclose(handle_);
        handle_ = nullptr;
    }
    symbol_.clear();
}

std::string NativeExecutor::target_symbol(const StepSpec& step) const {
    if (step.method && !step.method->empty()) return *step.method;
    return symbol_;
}

cdd_entry_fn NativeExecutor::resolve_symbol(const std::string& symbol) const {
    if (!handle_ || symbol.empty()) return nullptr;
    dlerror();
    void* sym = dlsym(handle_, symbol.c_str());
    if (dlerror() != nullptr) return nullptr;
    return reinterpret_cast<cdd_entry_fn>(sym);
}

StepResult NativeExecutor::execute_step(const RunContext& /*ctx*/,
                                        const RunnerConfig& /*cfg*/,
                                        const std::string& test_id,
                                        const StepSpec& step,
                                        int /*timeout_ms*/) {
    logger_->debug("[{}] native {}: {}", test_id, step.action, target_symbol(step));
    if (step.action == "call") return do_call(step);
    if (step.action == "call_n") return do_call_n(step);
    return StepResult::failure(codes::kUnsupportedAction, "Unknown action: " + step.action);
}

StepResult NativeExecutor::do_call(const StepSpec& step) {
    std::string symbol = target_symbol(step);
    if (symbol.empty()) {
        return StepResult::failure(codes::kSymbolNotFound,
                                   "No call target: set runner.symbol or step.method");
    }
    cdd_entry_fn fn = resolve_symbol(symbol);
    if (!fn) {
        return StepResult::failure(codes::kSymbolNotFound, "Symbol not found: " + symbol);
    }

    std::string args = step.with.dump();

    std::cout.flush();
    std::cerr.flush();
    StreamCapture out_capture(stdout, STDOUT_FILENO);
    StreamCapture err_capture(stderr, STDERR_FILENO);

    auto start = Clock::now();
    CallOutcome outcome = invoke(fn, args);
    auto duration_ms = static_cast<long long>(elapsed_ms(start));

    std::cout.flush();
    std::cerr.flush();

    StepResult r;
    r.captured_stdout = out_capture.finish();
    r.captured_stderr = err_capture.finish();

    if (!outcome.ok) {
        r.error_code = codes::kException;
        r.message = outcome.error;
        return r;
    }

    r.meta["duration_ms"] = duration_ms;

    const nlohmann::json& v = outcome.value;
    if (v.is_object() && v.contains("ok")) {
        const auto& ok = v["ok"];
        r.ok = ok.is_boolean() ? ok.get<bool>() : !ok.is_null();
        r.value = v.value("value", nlohmann::json());
        if (v.contains("error_code") && v["error_code"].is_string()) {
            r.error_code = v["error_code"].get<std::string>();
        }
        if (v.contains("message") && v["message"].is_string()) {
            r.message = v["message"].get<std::string>();
        }
        if (v.contains("meta") && v["meta"].is_object()) {
            r.meta.update(v["meta"]);
        }
        return r;
    }

    r.ok = true;
    r.value = v;
    return r;
}

StepResult NativeExecutor::do_call_n(const StepSpec& step) {
    int n = step.n && *step.n > 0 ? *step.n : 1;
    std::string symbol = target_symbol(step);
    cdd_entry_fn fn = resolve_symbol(symbol);
    if (!fn) {
        return StepResult::failure(codes::kSymbolNotFound,
                                   symbol.empty() ? "No call target: set runner.symbol or step.method"
                                                  : "Symbol not found: " + symbol);
    }

    std::string args = step.with.dump();
    std::vector<double> durations;
    std::optional<std::string> first_error;

    for (int i = 0; i < n; ++i) {
        std::cout.flush();
        std::cerr.flush();
        // Output is discarded
        StreamCapture out_capture(stdout, STDOUT_FILENO);
        StreamCapture err_capture(stderr, STDERR_FILENO);

        auto start = Clock::now();
        CallOutcome outcome = invoke(fn, args);
        double ms = elapsed_ms(start);

        if (outcome.ok) {
            durations.push_back(ms);
        } else if (!first_error) {
            first_error = outcome.error;
        }
    }

    StepResult r;
    if (durations.empty()) {
        r.ok = false;
        r.error_code = first_error ? codes::kException : codes::kAllFailed;
        r.message = first_error.value_or("All iterations failed");
        r.value = {{"n", n}, {"durations_ms", nlohmann::json::array()}};
        return r;
    }

    DurationStats stats = compute_duration_stats(durations);
    r.ok = true;
    r.value = {
        {"n", n},
        {"durations_ms", durations},
        {"min_ms", stats.min_ms},
        {"max_ms", stats.max_ms},
        {"mean_ms", stats.mean_ms},
        {"p50_ms", stats.p50_ms},
        {"p95_ms", stats.p95_ms},
        {"p99_ms", stats.p99_ms},
    };
    if (first_error) {
        r.error_code = codes::kException;
        r.message = *first_error;
    }
    return r;
}

} // namespace cdd

#include "cdd/runner.hpp"
#include "cdd/hash.hpp"
#include "cdd/platform.hpp"
#include "cdd/spec_version.hpp"
#include "cdd/static_executor.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

namespace cdd {

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kProjectFile = "project.yaml";

long long elapsed_ms(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

// "contracts/" and "contracts" name the same directory
fs::path normalize_input(const std::string& path) {
    fs::path p(path);
    if (!p.has_filename() && p.has_parent_path()) {
        p = p.parent_path();
    }
    return p;
}

std::vector<fs::path> collect_contract_files(const fs::path& contracts_dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(contracts_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const auto& p = it->path();
        if (p.extension() != ".yaml") continue;
        if (p.filename() == kProjectFile) continue;
        files.push_back(p);
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string make_run_id(const std::string& seed) {
    auto digest = compute_sha1(seed);
    std::string hex = digest.ok ? digest.hex_digest : random_hex_token(5);
    return "run_" + hex.substr(0, 10);
}

bool has_steps(const nlohmann::json& steps) {
    if (steps.is_null()) return false;
    if (steps.is_array() || steps.is_object()) return !steps.empty();
    return true;
}

bool stops_run(TestStatus status) {
    return status == TestStatus::Fail || status == TestStatus::Error;
}

} // namespace

// ============================================================================
// Free Helpers
// ============================================================================

nlohmann::json build_assertion_context(const RunContext& ctx,
                                       const std::vector<StepResult>& step_results,
                                       const nlohmann::json& saved) {
    nlohmann::json steps = nlohmann::json::array();
    for (const auto& sr : step_results) {
        steps.push_back(step_result_to_json(sr));
    }

    nlohmann::json context = {
        {"vars", ctx.vars},
        {"env", ctx.env},
        {"runner", ctx.runner},
        {"contract", ctx.contract},
        {"steps", steps},
        {"ast", ctx.runner.is_object() ? ctx.runner.value("ast", nlohmann::json()) : nlohmann::json()},
    };

    // Saved results are addressable as $.<save_as>
    if (saved.is_object()) {
        for (auto it = saved.begin(); it != saved.end(); ++it) {
            context[it.key()] = it.value();
        }
    }
    return context;
}

TestStatus status_from_assertions(const std::vector<AssertionResult>& results,
                                  std::string& message) {
    for (const auto& r : results) {
        if (r.error) {
            message = "Assertion error: " + *r.error;
            return TestStatus::Error;
        }
    }
    for (const auto& r : results) {
        if (!r.pass) {
            message = "One or more assertions failed";
            return TestStatus::Fail;
        }
    }
    message = "All assertions passed";
    return TestStatus::Pass;
}

// ============================================================================
// Contract Runner
// ============================================================================

ContractRunner::ContractRunner(ExecutorRegistry registry, RunnerOptions options, Logger logger)
    : registry_(std::move(registry)), options_(std::move(options)), logger_(std::move(logger)) {}

std::string ContractRunner::resolved_tool_version() const {
    return options_.tool_version.empty() ? tool_version() : options_.tool_version;
}

Report ContractRunner::run(const std::string& contracts_path,
                           const nlohmann::json& injected_vars,
                           const std::vector<std::string>& only_test_ids) const {
    std::error_code ec;
    fs::path input = normalize_input(contracts_path);
    bool input_is_file = fs::is_regular_file(input, ec);
    fs::path repo_root = input_is_file ? input.parent_path().parent_path() : input.parent_path();

    Report report;
    report.started_at = get_current_timestamp();
    report.tool_version = resolved_tool_version();
    report.schema_version = schema_version_for(report.tool_version);

    // ------------------------------------------------------------------------
    // LoadProject
    // ------------------------------------------------------------------------
    fs::path project_path = input_is_file ? repo_root / "contracts" / kProjectFile
                                          : input / kProjectFile;
    std::optional<ProjectContract> project;
    std::optional<Diagnostic> project_error;
    if (fs::is_regular_file(project_path, ec)) {
        auto doc = load_contract_document(project_path.string());
        if (doc.isOk()) {
            project = parse_project_contract(doc.value(), project_path.string());
        } else {
            project_error = Diagnostic{error_code_to_string(doc.error().code()), doc.error().message()};
        }
    } else {
        logger_->debug("no project contract at {}, running {} alone", project_path.string(), input.string());
        project_path = input;
    }

    report.contract = project ? project->project : "unknown";
    report.run_id = make_run_id(project_path.string() + get_current_timestamp());
    fs::path run_root = fs::path(options_.artifacts_root) / report.run_id;
    report.artifacts_dir = run_root.string();

    // ------------------------------------------------------------------------
    // CheckSpecVersion
    // ------------------------------------------------------------------------
    if (project && project->cdd_spec) {
        report.project_spec = project->cdd_spec;
    } else {
        report.project_spec = read_version_sidecar(repo_root.string());
    }

    auto spec_check = check_spec_version(report.project_spec, report.tool_version,
                                         options_.require_exact_spec);
    report.warnings = spec_check.warnings;
    for (const auto& w : report.warnings) {
        logger_->warn("{}: {}", w.code, w.message);
    }

    if (project_error) {
        spec_check.errors.push_back(*project_error);
    }
    if (spec_check.fatal()) {
        // Abort: one synthetic result, nothing executed
        report.contract = "project";
        report.errors = spec_check.errors;
        const auto& first = report.errors.front();
        std::string id = project_error && !project ? "INVALID" : "VERSION";
        logger_->error("{}: {}", first.code, first.message);
        report.results.push_back(TestResult::synthetic(id, std::nullopt, TestStatus::Error, first.message));
        report.summary = summarize(report.results);
        return report;
    }

    // ------------------------------------------------------------------------
    // RunContracts
    // ------------------------------------------------------------------------
    std::vector<fs::path> contract_files;
    if (input_is_file) {
        contract_files.push_back(input);
    } else {
        contract_files = collect_contract_files(input);
    }

    fs::create_directories(run_root, ec);
    if (ec) {
        logger_->warn("cannot create artifacts directory {}: {}", run_root.string(), ec.message());
    }

    for (const auto& cpath : contract_files) {
        auto doc = load_contract_document(cpath.string());
        if (doc.isErr()) {
            logger_->error("{}", doc.error().message());
            report.results.push_back(TestResult::synthetic("INVALID", std::nullopt, TestStatus::Error,
                                                           doc.error().message()));
            continue;
        }

        ComponentContract contract = parse_component_contract(doc.value(), cpath.string());
        logger_->info("contract {} ({})", contract.name, cpath.string());

        RunContext ctx = build_context(contract, (run_root / contract.name).string(), injected_vars,
                                       report.tool_version, report.run_id, report.project_spec);

        auto results = run_contract_tests(ctx, contract, only_test_ids);
        for (auto& r : results) {
            report.results.push_back(std::move(r));
        }
    }

    // ------------------------------------------------------------------------
    // Aggregate
    // ------------------------------------------------------------------------
    report.summary = summarize(report.results);
    logger_->info("{} passed, {} failed, {} skipped, {} error",
                  report.summary.passed, report.summary.failed,
                  report.summary.skipped, report.summary.error);
    return report;
}

RunContext ContractRunner::build_context(const ComponentContract& contract,
                                         const std::string& artifacts_dir,
                                         const nlohmann::json& injected_vars,
                                         const std::string& tool_version,
                                         const std::string& run_id,
                                         const std::optional<std::string>& project_spec) const {
    std::error_code ec;
    fs::create_directories(artifacts_dir, ec);
    if (ec) {
        logger_->warn("cannot create artifacts directory {}: {}", artifacts_dir, ec.message());
    }

    RunContext ctx;
    ctx.artifacts_dir = artifacts_dir;
    ctx.work_dir = fs::path(contract.path).parent_path().string();
    if (ctx.work_dir.empty()) ctx.work_dir = ".";

    RuntimeVersion rt = get_runtime_version();
    ctx.env = {
        {"os", get_os_description()},
        {"os_family", get_os_family()},
        {"cxx_major", rt.major},
        {"cxx_minor", rt.minor},
        {"cxx_patch", rt.patch},
    };

    ctx.runner = {
        {"tool_version", tool_version},
        {"run_id", run_id},
        {"require_exact_spec", options_.require_exact_spec},
        {"matrix_fail_fast", options_.matrix_fail_fast},
    };

    const auto& raw = contract.raw;
    ctx.contract = {
        {"contract", contract.name},
        {"version", raw.is_object() ? raw.value("version", nlohmann::json()) : nlohmann::json()},
        {"status", raw.is_object() ? raw.value("status", nlohmann::json()) : nlohmann::json()},
        {"path", contract.path},
        {"project_spec", project_spec ? nlohmann::json(*project_spec) : nlohmann::json()},
    };

    // Caller variables first; the contract's own vars win on collision
    ctx.vars = injected_vars.is_object() ? injected_vars : nlohmann::json::object();
    for (auto it = contract.vars.begin(); it != contract.vars.end(); ++it) {
        ctx.vars[it.key()] = it.value();
    }
    return ctx;
}

std::vector<TestResult> ContractRunner::run_contract_tests(
    RunContext& ctx,
    const ComponentContract& contract,
    const std::vector<std::string>& only_test_ids) const {
    const RunnerConfig& cfg = contract.runner;

    if (!contract.tests.is_array()) {
        return {TestResult::synthetic("INVALID", std::nullopt, TestStatus::Error, "tests must be a list")};
    }

    auto created = registry_.create(cfg.executor, logger_);
    if (created.isErr()) {
        return {TestResult::synthetic("EXECUTOR", std::nullopt, TestStatus::Error,
                                      created.error().message())};
    }
    std::unique_ptr<Executor> executor = std::move(created.value());

    auto setup = executor->setup(ctx, cfg);
    if (!setup.ok) {
        return {TestResult::synthetic("EXECUTOR", std::nullopt, TestStatus::Error,
                                      "Executor setup failed: " + setup.error)};
    }

    bool is_static = cfg.executor == "static";
    if (is_static) {
        ctx.runner["ast"] = analyze_static_placeholder(cfg, contract.path);
    }

    std::vector<TestResult> results;

    for (const auto& raw_test : contract.tests) {
        auto test = parse_test_spec(raw_test);
        if (!test) {
            results.push_back(TestResult::synthetic("UNKNOWN", std::nullopt, TestStatus::Error,
                                                    "test entry must be an object"));
            continue;
        }

        if (!only_test_ids.empty() &&
            std::find(only_test_ids.begin(), only_test_ids.end(), test->id) == only_test_ids.end()) {
            continue;
        }

        logger_->debug("test {}", test->id);

        TestResult result;
        if (test->is_file_scan()) {
            result = run_static_file_test(ctx, *test, contract.path);
        } else if (is_static && has_steps(test->steps)) {
            result = TestResult::synthetic(test->id, test->requirement, TestStatus::Error,
                                           "Static tests must have no steps");
        } else {
            std::vector<StepResult> step_results;
            nlohmann::json saved = nlohmann::json::object();
            if (!is_static) {
                auto executed = execute_steps(ctx, cfg, test->id, test->steps, *executor, cfg.timeout_ms);
                step_results = std::move(executed.first);
                saved = std::move(executed.second);
            }

            auto context = build_assertion_context(ctx, step_results, saved);
            auto assertions = run_assertions(context, test->asserts);

            result.id = test->id;
            result.name = test->name;
            result.requirement = test->requirement;
            result.type = test->type;
            result.status = status_from_assertions(assertions, result.message);
            for (const auto& a : assertions) {
                result.assertions.push_back(assertion_to_json(a));
            }
            for (const auto& sr : step_results) {
                result.steps.push_back(step_result_to_json(sr));
            }
        }

        logger_->debug("test {}: {} ({})", result.id, test_status_to_string(result.status), result.message);
        TestStatus status = result.status;
        results.push_back(std::move(result));

        if (options_.matrix_fail_fast && stops_run(status)) {
            logger_->info("fail-fast: stopping {} after {}", contract.name, test->id);
            break;
        }
    }

    auto teardown = executor->teardown(ctx, cfg);
    if (!teardown.ok) {
        results.push_back(TestResult::synthetic("TEARDOWN", std::nullopt, TestStatus::Error,
                                                "Executor teardown failed: " + teardown.error));
    }
    return results;
}

TestResult ContractRunner::run_static_file_test(const RunContext& ctx,
                                                const TestSpec& test,
                                                const std::string& contract_path) const {
    auto start = Clock::now();
    std::string base_dir = fs::path(contract_path).parent_path().string();
    if (base_dir.empty()) base_dir = ".";

    StaticTestOutcome outcome = run_static_test(test, base_dir, ctx.vars);

    TestResult result;
    result.id = test.id;
    result.name = test.name;
    result.requirement = test.requirement;
    result.type = "static";
    result.status = outcome.status;
    for (const auto& a : outcome.assertions) {
        result.assertions.push_back(assertion_to_json(a));
    }

    if (outcome.status == TestStatus::Fail) {
        result.message = std::to_string(outcome.assertions.size()) + " failures in " +
                         std::to_string(outcome.files_scanned) + " files";
    } else if (outcome.error) {
        result.message = *outcome.error;
    } else {
        result.message = "Scanned " + std::to_string(outcome.files_scanned) + " files";
    }

    result.extra = {
        {"duration_ms", elapsed_ms(start)},
        {"files_scanned", outcome.files_scanned},
    };
    return result;
}

std::pair<std::vector<StepResult>, nlohmann::json> ContractRunner::execute_steps(
    const RunContext& ctx,
    const RunnerConfig& cfg,
    const std::string& test_id,
    const nlohmann::json& steps,
    Executor& executor,
    int timeout_ms) const {
    std::vector<StepResult> out;
    nlohmann::json saved = nlohmann::json::object();

    if (steps.is_null()) return {out, saved};
    if (!steps.is_array()) {
        out.push_back(StepResult::failure(codes::kTypeMismatch, "steps must be a list"));
        return {out, saved};
    }

    for (const auto& raw_step : steps) {
        auto step = parse_step_spec(raw_step);
        if (!step) {
            out.push_back(StepResult::failure(codes::kTypeMismatch, "step must be an object"));
            continue;
        }

        StepResult res;
        if (step->action == "wait") {
            double seconds = std::max(0.0, step->seconds.value_or(0.0));
            std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
            res.ok = true;
            res.meta["wait_s"] = step->seconds.value_or(0.0);
            res.meta["duration_ms"] = static_cast<long long>(seconds * 1000.0);
        } else if (!executor.supports(step->action)) {
            res = StepResult::failure(codes::kInvalidAction, "Action not supported: " + step->action);
            res.meta["duration_ms"] = 0;
            out.push_back(std::move(res));
            continue;
        } else {
            auto start = Clock::now();
            try {
                res = executor.execute_step(ctx, cfg, test_id, *step, timeout_ms);
            } catch (const std::exception& e) {
                res = StepResult::failure(codes::kExecutorException, e.what());
            }
            if (!res.meta.is_object()) res.meta = nlohmann::json::object();
            if (!res.meta.contains("duration_ms")) {
                res.meta["duration_ms"] = elapsed_ms(start);
            }
        }

        if (step->save_as && !step->warmup) {
            saved[*step->save_as] = step_result_to_json(res);
        }
        out.push_back(std::move(res));
    }
    return {out, saved};
}

} // namespace cdd

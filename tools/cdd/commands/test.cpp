/**
 * CDD CLI - test command
 *
 * Run a contracts directory or a single contract file and print the report.
 */

#include "../common.hpp"
#include <cdd/executor_registry.hpp>
#include <cdd/runner.hpp>
#include <CLI/CLI.hpp>

namespace cdd::cli::commands {

void print_report(const Report& report) {
    std::cout << rule() << std::endl;
    std::cout << "  CDD Test Report" << std::endl;
    std::cout << "  contract: " << report.contract << std::endl;
    std::cout << "  run_id:   " << report.run_id << std::endl;
    std::cout << "  passed: " << report.summary.passed
              << "  failed: " << report.summary.failed
              << "  skipped: " << report.summary.skipped
              << "  error: " << report.summary.error << std::endl;
    std::cout << rule() << std::endl;

    for (const auto& w : report.warnings) {
        std::cout << "warning " << w.code << ": " << w.message << std::endl;
    }
    for (const auto& e : report.errors) {
        std::cout << "error " << e.code << ": " << e.message << std::endl;
    }

    for (const auto& r : report.results) {
        std::cout << "  [" << test_status_to_string(r.status) << "] " << r.id;
        if (r.requirement) std::cout << " (" << *r.requirement << ")";
        if (!r.message.empty()) std::cout << " - " << truncate(r.message, 120);
        std::cout << std::endl;
    }
}

namespace {

struct TestOptions {
    std::string path = "contracts";
    std::string artifacts;
    bool json = false;
    bool require_exact_spec = false;
    bool matrix_fail_fast = false;
    std::vector<std::string> vars;
    std::vector<std::string> only;
};

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

std::optional<nlohmann::json> parse_vars(const std::vector<std::string>& kvs, std::string& error) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& kv : kvs) {
        auto eq = kv.find('=');
        if (eq == std::string::npos) {
            error = "--var must be key=value, got: " + kv;
            return std::nullopt;
        }
        out[trim(kv.substr(0, eq))] = kv.substr(eq + 1);
    }
    return out;
}

int cmd_test(const GlobalOptions& opts, const TestOptions& test_opts) {
    std::string error;
    auto vars = parse_vars(test_opts.vars, error);
    if (!vars) {
        print_error(error, test_opts.json);
        return 2;
    }

    RunnerOptions runner_opts;
    runner_opts.artifacts_root = resolve_artifacts_root(test_opts.artifacts);
    runner_opts.require_exact_spec = test_opts.require_exact_spec;
    runner_opts.matrix_fail_fast = test_opts.matrix_fail_fast;

    ContractRunner runner(ExecutorRegistry::with_builtins(), runner_opts, make_cli_logger(opts));
    Report report = runner.run(test_opts.path, *vars, test_opts.only);

    if (test_opts.json) {
        std::cout << serialize_report_json(report) << std::endl;
    } else {
        print_report(report);
    }

    return report.has_failures() ? 1 : 0;
}

} // anonymous namespace

void setup_test(CLI::App* app, GlobalOptions& opts) {
    static TestOptions test_opts;

    app->add_option("path", test_opts.path, "Contracts directory or file");
    app->add_flag("--json", test_opts.json, "Emit machine-readable JSON report");
    app->add_option("--artifacts", test_opts.artifacts, "Artifacts output root (default: $CDD_ARTIFACTS or ./artifacts)");
    app->add_flag("--require-exact-spec", test_opts.require_exact_spec, "Error unless exact spec match");
    app->add_option("--var", test_opts.vars, "Inject variable (key=value). Repeatable.");
    app->add_flag("--matrix-fail-fast", test_opts.matrix_fail_fast, "Stop a contract at its first failing test");
    app->add_option("--only", test_opts.only, "Run only matching test ids (repeatable)");

    app->callback([&opts]() {
        std::exit(cmd_test(opts, test_opts));
    });
}

} // namespace cdd::cli::commands

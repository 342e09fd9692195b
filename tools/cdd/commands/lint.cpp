/**
 * CDD CLI - lint and coverage commands
 */

#include "../common.hpp"
#include <cdd/coverage.hpp>
#include <cdd/lint.hpp>
#include <CLI/CLI.hpp>

namespace cdd::cli::commands {

namespace {

struct LintOptions {
    std::string path = "contracts";
    bool json = false;
    bool strict = false;
};

int cmd_lint(const GlobalOptions& /* opts */, const LintOptions& lint_opts) {
    LintReport res = lint_contracts(lint_opts.path, lint_opts.strict);

    if (lint_opts.json) {
        output_json(lint_to_json(res));
    } else {
        std::cout << "CDD Lint: " << (res.ok ? "PASS" : "FAIL") << std::endl;
        std::cout << "  Contracts: " << res.contracts_checked << std::endl;
        std::cout << "  Errors:    " << res.errors.size() << std::endl;
        std::cout << "  Warnings:  " << res.warnings.size() << std::endl;
        print_diagnostics("Errors", res.errors);
        print_diagnostics("Warnings", res.warnings);
    }

    return res.ok ? 0 : 1;
}

int cmd_coverage(const GlobalOptions& /* opts */, const LintOptions& cov_opts) {
    CoverageReport cov = compute_coverage(cov_opts.path);

    if (cov_opts.json) {
        output_json(coverage_to_json(cov));
    } else {
        std::cout << "CDD Coverage" << std::endl;
        for (const auto& r : cov.requirements) {
            std::cout << "  " << r.id << "  " << r.linked_tests << "  "
                      << (r.linked_tests > 0 ? "covered" : "UNCOVERED") << std::endl;
        }
        std::cout << "Uncovered: " << cov.uncovered_count << std::endl;
    }

    if (cov_opts.strict && cov.uncovered_count > 0) {
        return 1;
    }
    return 0;
}

} // anonymous namespace

void setup_lint(CLI::App* app, GlobalOptions& opts) {
    static LintOptions lint_opts;

    app->add_option("path", lint_opts.path, "Contracts directory or file");
    app->add_flag("--json", lint_opts.json, "Emit machine-readable JSON");
    app->add_flag("--strict", lint_opts.strict, "Treat warnings as errors");

    app->callback([&opts]() {
        std::exit(cmd_lint(opts, lint_opts));
    });
}

void setup_coverage(CLI::App* app, GlobalOptions& opts) {
    static LintOptions cov_opts;

    app->add_option("path", cov_opts.path, "Contracts directory or file");
    app->add_flag("--json", cov_opts.json, "Emit machine-readable JSON");
    app->add_flag("--strict", cov_opts.strict, "Exit non-zero if uncovered requirements exist");

    app->callback([&opts]() {
        std::exit(cmd_coverage(opts, cov_opts));
    });
}

} // namespace cdd::cli::commands

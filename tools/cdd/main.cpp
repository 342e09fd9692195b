/**
 * CDD CLI - Entry Point
 *
 * Contract-driven development test engine command-line interface.
 */

#include <CLI/CLI.hpp>
#include <cdd/spec_version.hpp>
#include "common.hpp"

namespace cdd::cli::commands {
    void setup_test(CLI::App* app, GlobalOptions& opts);
    void setup_isolate(CLI::App* app, GlobalOptions& opts);
    void setup_paths(CLI::App* app, GlobalOptions& opts);
    void setup_lint(CLI::App* app, GlobalOptions& opts);
    void setup_coverage(CLI::App* app, GlobalOptions& opts);
    void setup_analyze(CLI::App* app, GlobalOptions& opts);
    void setup_compare(CLI::App* app, GlobalOptions& opts);
    void setup_spec(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace cdd::cli;

    CLI::App app{"cdd - Contract-Driven Development tooling"};
    app.set_version_flag("-V,--version", cdd::tool_version());
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* test_cmd = app.add_subcommand("test", "Run contract tests");
    commands::setup_test(test_cmd, opts);

    auto* isolate_cmd = app.add_subcommand("isolate", "Execute single contract in isolated workspace");
    commands::setup_isolate(isolate_cmd, opts);

    auto* paths_cmd = app.add_subcommand("paths", "Verify all file paths in contracts resolve");
    commands::setup_paths(paths_cmd, opts);

    auto* lint_cmd = app.add_subcommand("lint", "Lint contract files (schema + coverage gates)");
    commands::setup_lint(lint_cmd, opts);

    auto* coverage_cmd = app.add_subcommand("coverage", "Requirement coverage report");
    commands::setup_coverage(coverage_cmd, opts);

    auto* analyze_cmd = app.add_subcommand("analyze", "Capture a source file as a frozen reference");
    commands::setup_analyze(analyze_cmd, opts);

    auto* compare_cmd = app.add_subcommand("compare", "Compare two source reference analyses");
    commands::setup_compare(compare_cmd, opts);

    auto* spec_cmd = app.add_subcommand("spec", "Print the tool/spec version");
    commands::setup_spec(spec_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}

/**
 * CDD CLI - isolate command
 *
 * Execute a single contract inside a disposable sandbox that links only the
 * project directories the contract reaches.
 */

#include "../common.hpp"
#include <cdd/isolate.hpp>
#include <CLI/CLI.hpp>

#include <filesystem>

namespace cdd::cli::commands {

void print_report(const Report& report);
void print_path_verification(const PathVerification& result);

namespace {

struct IsolateCliOptions {
    IsolateOptions isolate;
    std::string project;
    std::string work_dir;
};

void print_header(const IsolateContext& ctx) {
    std::string links;
    for (const auto& root : ctx.link_roots) {
        links += links.empty() ? root : ", " + root;
    }

    std::cout << std::endl << rule('=', 45) << std::endl;
    std::cout << "CDD Isolate: " << std::filesystem::path(ctx.contract_path).filename().string() << std::endl;
    std::cout << "Project: " << ctx.project_root << std::endl;
    std::cout << "Work:    " << ctx.work_dir << std::endl;
    std::cout << "Links:   " << (links.empty() ? "(none)" : links) << std::endl;
    std::cout << rule('=', 45) << std::endl;
}

int cmd_isolate(const GlobalOptions& opts, IsolateCliOptions& cli_opts) {
    IsolateOptions options = cli_opts.isolate;
    if (!cli_opts.project.empty()) options.project = cli_opts.project;
    if (!cli_opts.work_dir.empty()) options.work_dir = cli_opts.work_dir;
    options.verbose = opts.verbose;

    auto logger = make_cli_logger(opts);
    IsolateOutcome outcome = run_isolate(options, ExecutorRegistry::with_builtins(), logger);

    if (!outcome.context) {
        print_error(outcome.error.empty() ? "Unknown error" : outcome.error, false);
        return exit_code_value(outcome.exit);
    }

    const IsolateContext& ctx = *outcome.context;
    print_header(ctx);

    if (options.dry_run) {
        std::cout << std::endl << "Dry run - no changes made" << std::endl;
        return exit_code_value(outcome.exit);
    }

    if (!outcome.error.empty()) {
        print_error(outcome.error, false);
    }
    if (outcome.paths && (!outcome.paths->ok || options.paths_only)) {
        print_path_verification(*outcome.paths);
        if (outcome.paths->ok) {
            std::cout << "Path verification passed" << std::endl;
        }
    }
    if (outcome.report) {
        print_report(*outcome.report);
    }

    std::cout << std::endl << rule('=', 45) << std::endl;
    std::cout << "Result: " << (outcome.exit == IsolateExit::Success ? "PASS" : "FAIL") << std::endl;
    std::cout << (outcome.cleaned ? "Cleaned: " : "Kept: ") << ctx.work_dir << std::endl;
    std::cout << rule('=', 45) << std::endl;

    return exit_code_value(outcome.exit);
}

} // anonymous namespace

void setup_isolate(CLI::App* app, GlobalOptions& opts) {
    static IsolateCliOptions isolate_opts;

    app->add_option("contract", isolate_opts.isolate.contract_path, "Path to contract YAML file")
        ->required();
    app->add_option("-p,--project", isolate_opts.project, "Project root directory");
    app->add_flag("-k,--keep", isolate_opts.isolate.keep, "Keep work directory after run");
    app->add_flag("--keep-on-fail", isolate_opts.isolate.keep_on_fail, "Keep work dir only on failure");
    app->add_option("-w,--work-dir", isolate_opts.work_dir, "Custom work directory");
    app->add_flag("--paths-only", isolate_opts.isolate.paths_only, "Only run path verification");
    app->add_flag("--dry-run", isolate_opts.isolate.dry_run, "Print plan and exit");

    app->callback([&opts]() {
        std::exit(cmd_isolate(opts, isolate_opts));
    });
}

} // namespace cdd::cli::commands

/**
 * CDD CLI - paths command
 *
 * Verify that every file a contract references resolves from its directory.
 */

#include "../common.hpp"
#include <cdd/paths.hpp>
#include <CLI/CLI.hpp>

namespace cdd::cli::commands {

void print_path_verification(const PathVerification& result) {
    for (const auto& contract : result.results) {
        std::cout << std::endl << rule() << std::endl;
        std::cout << "  Path Verification: " << contract.contract << std::endl;
        std::cout << "  Contract: " << contract.contract_path << std::endl;
        std::cout << rule() << std::endl;

        if (!contract.passed.empty()) {
            std::cout << std::endl << "  " << contract.passed.size() << " paths OK:" << std::endl;
            for (const auto& p : contract.passed) {
                std::cout << "    ok " << p << std::endl;
            }
        }

        if (!contract.failed.empty()) {
            std::cout << std::endl << "  " << contract.failed.size() << " paths FAILED:" << std::endl;
            for (const auto& f : contract.failed) {
                std::cout << "    missing " << f.path << std::endl;
                if (f.suggestion) {
                    std::cout << "      Did you mean: " << *f.suggestion << " ?" << std::endl;
                }
            }
        }

        std::cout << std::endl;
        if (contract.ok) {
            std::cout << "  RESULT: PASS (" << contract.passed.size() << " files)" << std::endl;
        } else {
            std::cout << "  RESULT: FAIL (" << contract.failed.size() << " missing, "
                      << contract.passed.size() << " found)" << std::endl;
        }
    }

    std::cout << std::endl << rule() << std::endl;
    if (result.ok) {
        std::cout << "  ALL CONTRACTS PASSED PATH VERIFICATION" << std::endl;
    } else {
        std::cout << "  PATH VERIFICATION FAILED - Fix paths before running cdd test" << std::endl;
    }
    std::cout << rule() << std::endl;
}

namespace {

struct PathsOptions {
    std::string path = "contracts";
    bool json = false;
};

int cmd_paths(const GlobalOptions& /* opts */, const PathsOptions& paths_opts) {
    auto result = verify_paths(paths_opts.path);
    if (result.isErr()) {
        print_error(result.error().message(), paths_opts.json);
        return 1;
    }

    if (paths_opts.json) {
        output_json(path_verification_to_json(result.value()));
    } else {
        print_path_verification(result.value());
    }

    return result.value().ok ? 0 : 1;
}

} // anonymous namespace

void setup_paths(CLI::App* app, GlobalOptions& opts) {
    static PathsOptions paths_opts;

    app->add_option("path", paths_opts.path, "Contracts directory or file");
    app->add_flag("--json", paths_opts.json, "Emit machine-readable JSON");

    app->callback([&opts]() {
        std::exit(cmd_paths(opts, paths_opts));
    });
}

} // namespace cdd::cli::commands

/**
 * CDD CLI - spec command
 */

#include "../common.hpp"
#include <cdd/spec_version.hpp>
#include <CLI/CLI.hpp>

namespace cdd::cli::commands {

namespace {

struct SpecOptions {
    bool version = false;
    bool json = false;
};

int cmd_spec(const GlobalOptions& /* opts */, const SpecOptions& spec_opts) {
    std::string version = tool_version();
    if (spec_opts.json) {
        output_json({{"tool_version", version}, {"schema_version", schema_version_for(version)}});
        return 0;
    }
    if (spec_opts.version) {
        std::cout << version << std::endl;
        return 0;
    }
    std::cout << "cdd " << version << " (report schema " << schema_version_for(version) << ")"
              << std::endl;
    return 0;
}

} // anonymous namespace

void setup_spec(CLI::App* app, GlobalOptions& opts) {
    static SpecOptions spec_opts;

    app->add_flag("--version", spec_opts.version, "Print tool/spec version");
    app->add_flag("--json", spec_opts.json, "Emit machine-readable JSON");

    app->callback([&opts]() {
        std::exit(cmd_spec(opts, spec_opts));
    });
}

} // namespace cdd::cli::commands

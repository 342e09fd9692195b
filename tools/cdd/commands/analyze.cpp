/**
 * CDD CLI - analyze and compare commands
 *
 * Capture a readable source file as a frozen reference, and compare two
 * captured references.
 */

#include "../common.hpp"
#include <cdd/analyze.hpp>
#include <CLI/CLI.hpp>

namespace cdd::cli::commands {

namespace {

struct AnalyzeOptions {
    std::string source;
    std::string output = "analysis/";
    bool json = false;
};

struct CompareOptions {
    std::string original;
    std::string generated;
    bool json = false;
};

int cmd_analyze(const GlobalOptions& opts, const AnalyzeOptions& analyze_opts) {
    auto logger = make_cli_logger(opts);
    logger->info("Analyzing: {}", analyze_opts.source);

    auto result = analyze_source(analyze_opts.source, analyze_opts.output);
    if (result.isErr()) {
        print_error("Analysis failed: " + result.error().message(), analyze_opts.json);
        return 1;
    }

    const SourceAnalysis& a = result.value();
    if (analyze_opts.json) {
        output_json(source_analysis_to_json(a));
        return 0;
    }

    std::cout << "CDD Analyze - Source Reference" << std::endl;
    std::cout << "  Source: " << a.source_name << std::endl;
    std::cout << "  Type:   " << a.structure.file_type << std::endl;
    std::cout << "  Lines:  " << a.structure.line_count << std::endl;
    std::cout << "  Size:   " << a.structure.size_bytes << " bytes" << std::endl;
    std::cout << "  Hash:   " << a.structure.hash.substr(0, 12) << "..." << std::endl;
    std::cout << "  Output: " << a.output_dir << std::endl;
    std::cout << std::endl << "Files created:" << std::endl;
    for (const auto& f : a.files) {
        std::cout << "  - " << f << std::endl;
    }
    return 0;
}

int cmd_compare(const GlobalOptions& /* opts */, const CompareOptions& compare_opts) {
    auto original = load_source_structure(compare_opts.original);
    if (original.isErr()) {
        print_error(original.error().message(), compare_opts.json);
        return 1;
    }
    auto generated = load_source_structure(compare_opts.generated);
    if (generated.isErr()) {
        print_error(generated.error().message(), compare_opts.json);
        return 1;
    }

    nlohmann::json diff = compare_source_analyses(original.value(), generated.value());
    if (compare_opts.json) {
        output_json(diff);
    } else {
        std::cout << "Source Reference Comparison" << std::endl;
        if (!diff["match"].get<bool>()) {
            std::cout << "  Original hash:   " << original.value().hash.substr(0, 12) << "..." << std::endl;
            std::cout << "  Generated hash:  " << generated.value().hash.substr(0, 12) << "..." << std::endl;
            std::cout << "  Original lines:  " << original.value().line_count << std::endl;
            std::cout << "  Generated lines: " << generated.value().line_count << std::endl;
        }
        if (!diff["file_type_match"].get<bool>()) {
            std::cout << "  File type mismatch: " << original.value().file_type << " vs "
                      << generated.value().file_type << std::endl;
        }
        std::cout << diff["summary"].get<std::string>() << std::endl;
    }

    return diff["match"].get<bool>() ? 0 : 1;
}

} // anonymous namespace

void setup_analyze(CLI::App* app, GlobalOptions& opts) {
    static AnalyzeOptions analyze_opts;

    app->add_option("source", analyze_opts.source, "Source file to analyze")->required();
    app->add_option("-o,--output", analyze_opts.output, "Output directory for analysis artifacts");
    app->add_flag("--json", analyze_opts.json, "Emit machine-readable JSON summary");

    app->callback([&opts]() {
        std::exit(cmd_analyze(opts, analyze_opts));
    });
}

void setup_compare(CLI::App* app, GlobalOptions& opts) {
    static CompareOptions compare_opts;

    app->add_option("original", compare_opts.original, "Original analysis directory or structure.json")
        ->required();
    app->add_option("generated", compare_opts.generated, "Generated analysis directory or structure.json")
        ->required();
    app->add_flag("--json", compare_opts.json, "Emit machine-readable JSON");

    app->callback([&opts]() {
        std::exit(cmd_compare(opts, compare_opts));
    });
}

} // namespace cdd::cli::commands

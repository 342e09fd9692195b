#include "cdd/static_executor.hpp"
#include "cdd/contract.hpp"
#include "cdd/globbing.hpp"
#include "cdd/path_query.hpp"
#include "cdd/platform.hpp"

#include <cctype>
#include <filesystem>
#include <regex>

namespace cdd {

namespace {

constexpr size_t kSnippetLimit = 200;

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

std::string line_at(const std::string& content, size_t line_start) {
    size_t line_end = content.find('\n', line_start);
    if (line_end == std::string::npos) line_end = content.size();
    return content.substr(line_start, line_end - line_start);
}

nlohmann::json optional_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    return it == obj.end() ? nlohmann::json() : *it;
}

std::string scan_pattern(const nlohmann::json& assertion) {
    auto pattern = optional_field(assertion, "pattern");
    if (pattern.is_string() && !pattern.get_ref<const std::string&>().empty()) {
        return pattern.get<std::string>();
    }
    auto expected = optional_field(assertion, "expected");
    return expected.is_string() ? expected.get<std::string>() : "";
}

AssertionResult scan_failure(const std::string& op,
                             nlohmann::json actual,
                             std::string expected,
                             const nlohmann::json& message,
                             nlohmann::json details) {
    AssertionResult r;
    r.op = op;
    r.actual = std::move(actual);
    r.expected = std::move(expected);
    r.pass = false;
    if (message.is_string() && !message.get_ref<const std::string&>().empty()) {
        r.message = message.get<std::string>();
    }
    r.details = std::move(details);
    return r;
}

} // namespace

// ============================================================================
// Static Executor
// ============================================================================

ExecutorStatus StaticExecutor::setup(RunContext& /*ctx*/, const RunnerConfig& /*cfg*/) {
    return ExecutorStatus::success();
}

StepResult StaticExecutor::execute_step(const RunContext& /*ctx*/,
                                        const RunnerConfig& /*cfg*/,
                                        const std::string& test_id,
                                        const StepSpec& /*step*/,
                                        int /*timeout_ms*/) {
    logger_->debug("[{}] static executor asked to run a step", test_id);
    return StepResult::failure(codes::kStaticNoSteps,
                               "Static executor does not execute steps; use assertions against "
                               "$.ast or type: static tests");
}

ExecutorStatus StaticExecutor::teardown(RunContext& /*ctx*/, const RunnerConfig& /*cfg*/) {
    return ExecutorStatus::success();
}

nlohmann::json analyze_static_placeholder(const RunnerConfig& cfg,
                                          const std::string& contract_path) {
    return {
        {"schema_version", "1.0"},
        {"calls", nlohmann::json::array()},
        {"bus_reads", nlohmann::json::object()},
        {"imports", nlohmann::json::array()},
        {"definitions", nlohmann::json::array()},
        {"parse_errors", nlohmann::json::array()},
        {"parser", cfg.parser ? nlohmann::json(*cfg.parser) : nlohmann::json()},
        {"source_included", false},
        {"contract_file", contract_path},
    };
}

// ============================================================================
// File Scanning
// ============================================================================

std::vector<AssertionResult> scan_file_assertions(const std::string& file_path,
                                                  const std::string& content,
                                                  const nlohmann::json& asserts) {
    std::vector<AssertionResult> failures;
    if (!asserts.is_array()) return failures;

    for (const auto& a : asserts) {
        auto op_value = optional_field(a, "op");
        std::string op = op_value.is_string() ? op_value.get<std::string>() : "";
        if (op != "matches" && op != "not_matches") continue;

        std::string pattern = scan_pattern(a);
        auto message = optional_field(a, "message");

        try {
            std::regex re(pattern, std::regex::ECMAScript | std::regex::multiline);

            if (op == "not_matches") {
                for (auto it = std::sregex_iterator(content.begin(), content.end(), re);
                     it != std::sregex_iterator(); ++it) {
                    size_t pos = static_cast<size_t>(it->position(0));
                    size_t line_start = 0;
                    if (pos > 0) {
                        size_t nl = content.rfind('\n', pos - 1);
                        line_start = nl == std::string::npos ? 0 : nl + 1;
                    }
                    long line = 1;
                    for (size_t k = 0; k < pos; ++k) {
                        if (content[k] == '\n') ++line;
                    }
                    std::string snippet = trim(line_at(content, line_start).substr(0, kSnippetLimit));

                    failures.push_back(scan_failure(
                        op, it->str(0), "no match for /" + pattern + "/", message,
                        {
                            {"file", file_path},
                            {"line", line},
                            {"col", static_cast<long>(pos - line_start) + 1},
                            {"match", it->str(0)},
                            {"snippet", snippet},
                        }));
                }
            } else if (!std::regex_search(content, re)) {
                failures.push_back(scan_failure(op, nullptr, "match for /" + pattern + "/", message,
                                                {{"file", file_path}}));
            }
        } catch (const std::regex_error& e) {
            auto r = scan_failure(op, nullptr, pattern, message,
                                  {{"file", file_path}, {"exception", e.what()}});
            r.error = codes::kException;
            failures.push_back(std::move(r));
        }
    }
    return failures;
}

StaticTestOutcome run_static_test(const TestSpec& test,
                                  const std::string& base_dir,
                                  const nlohmann::json& vars) {
    StaticTestOutcome outcome;

    nlohmann::json files_spec = interpolate_vars(test.files, vars);
    auto paths = expand_files(files_spec, base_dir, vars);

    if (paths.empty()) {
        outcome.status = TestStatus::Error;
        outcome.error = "No files matched: " + scalar_to_string(files_spec);
        return outcome;
    }

    for (const auto& path : paths) {
        std::error_code ec;
        auto content = std::filesystem::is_directory(path, ec) ? std::nullopt : read_file(path);
        if (!content) {
            AssertionResult r;
            r.op = "read";
            r.actual = path;
            r.expected = "readable file";
            r.pass = false;
            r.error = codes::kException;
            r.details = {{"file", path}, {"exception", "cannot read file"}};
            outcome.assertions.push_back(std::move(r));
            continue;
        }

        auto failures = scan_file_assertions(path, *content, test.asserts);
        for (auto& f : failures) {
            outcome.assertions.push_back(std::move(f));
        }
    }

    outcome.files_scanned = static_cast<int>(paths.size());
    outcome.status = outcome.assertions.empty() ? TestStatus::Pass : TestStatus::Fail;
    return outcome;
}

} // namespace cdd

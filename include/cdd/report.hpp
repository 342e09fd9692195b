#pragma once

#include "cdd/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace cdd {

// ============================================================================
// Test Result
// ============================================================================

struct TestResult {
    std::string id;
    std::string name;
    std::optional<std::string> requirement;
    std::optional<std::string> type;
    TestStatus status = TestStatus::Error;
    std::string message;
    nlohmann::json assertions = nlohmann::json::array();
    nlohmann::json steps = nlohmann::json::array();
    nlohmann::json extra = nlohmann::json::object();  // duration_ms, files_scanned

    // Synthetic result for failures outside a test body (VERSION, EXECUTOR, ...)
    static TestResult synthetic(const std::string& id,
                                const std::optional<std::string>& requirement,
                                TestStatus status,
                                const std::string& message);
};

// ============================================================================
// Report
// ============================================================================

struct Summary {
    int passed = 0;
    int failed = 0;
    int skipped = 0;
    int error = 0;
};

struct Report {
    std::string schema_version;
    std::string report_type = "single";
    std::string contract;
    std::string run_id;
    std::string tool_version;
    std::optional<std::string> project_spec;
    std::string started_at;
    std::vector<Diagnostic> warnings;
    std::vector<Diagnostic> errors;
    Summary summary;
    std::vector<TestResult> results;
    std::string artifacts_dir;

    bool has_failures() const { return summary.failed > 0 || summary.error > 0; }
};

Summary summarize(const std::vector<TestResult>& results);

nlohmann::json test_result_to_json(const TestResult& result);
nlohmann::json report_to_json(const Report& report);

// Pretty-printed report document
std::string serialize_report_json(const Report& report, int indent = 2);

} // namespace cdd

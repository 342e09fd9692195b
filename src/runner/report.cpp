#include "cdd/report.hpp"

namespace cdd {

namespace {

nlohmann::json optional_to_json(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json();
}

nlohmann::json diagnostics_to_json(const std::vector<Diagnostic>& diags) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& d : diags) {
        arr.push_back({{"code", d.code}, {"message", d.message}});
    }
    return arr;
}

} // namespace

TestResult TestResult::synthetic(const std::string& id,
                                 const std::optional<std::string>& requirement,
                                 TestStatus status,
                                 const std::string& message) {
    TestResult r;
    r.id = id;
    r.requirement = requirement;
    r.status = status;
    r.message = message;
    return r;
}

Summary summarize(const std::vector<TestResult>& results) {
    Summary s;
    for (const auto& r : results) {
        switch (r.status) {
            case TestStatus::Pass: ++s.passed; break;
            case TestStatus::Fail: ++s.failed; break;
            case TestStatus::Skipped: ++s.skipped; break;
            case TestStatus::Error: ++s.error; break;
        }
    }
    return s;
}

nlohmann::json test_result_to_json(const TestResult& result) {
    nlohmann::json j = {
        {"id", result.id},
        {"name", result.name},
        {"requirement", optional_to_json(result.requirement)},
        {"type", optional_to_json(result.type)},
        {"status", test_status_to_string(result.status)},
        {"message", result.message},
        {"assertions", result.assertions},
        {"steps", result.steps},
    };
    if (result.extra.is_object()) {
        for (auto it = result.extra.begin(); it != result.extra.end(); ++it) {
            j[it.key()] = it.value();
        }
    }
    return j;
}

nlohmann::json report_to_json(const Report& report) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& r : report.results) {
        results.push_back(test_result_to_json(r));
    }

    return {
        {"schema_version", report.schema_version},
        {"report_type", report.report_type},
        {"contract", report.contract},
        {"run_id", report.run_id},
        {"tool_version", report.tool_version},
        {"project_spec", optional_to_json(report.project_spec)},
        {"started_at", report.started_at},
        {"warnings", diagnostics_to_json(report.warnings)},
        {"errors", diagnostics_to_json(report.errors)},
        {"summary", {
            {"passed", report.summary.passed},
            {"failed", report.summary.failed},
            {"skipped", report.summary.skipped},
            {"error", report.summary.error},
        }},
        {"results", results},
        {"artifacts_dir", report.artifacts_dir},
    };
}

std::string serialize_report_json(const Report& report, int indent) {
    // Captured process output is not guaranteed to be UTF-8
    return report_to_json(report).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace cdd

#include "cdd/lint.hpp"
#include "cdd/contract.hpp"
#include "cdd/globbing.hpp"
#include "cdd/platform.hpp"

#include <filesystem>
#include <set>

namespace cdd {

namespace fs = std::filesystem;

namespace {

class LintCollector {
public:
    LintCollector(std::string path, LintReport& report) : path_(std::move(path)), report_(report) {}

    void error(const std::string& code, const std::string& message) {
        report_.errors.push_back({code, path_ + ": " + message});
    }

    void warning(const std::string& code, const std::string& message) {
        report_.warnings.push_back({code, path_ + ": " + message});
    }

    void require_fields(const nlohmann::json& doc, std::initializer_list<const char*> fields,
                        const std::string& prefix) {
        for (const char* field : fields) {
            if (!doc.contains(field)) {
                error("missing_field", prefix + "'" + field + "'");
            }
        }
    }

private:
    std::string path_;
    LintReport& report_;
};

bool valid_status(const nlohmann::json& status) {
    // Case-sensitive
    return status == "draft" || status == "frozen" || status == "deprecated";
}

void lint_project(const nlohmann::json& doc, LintCollector& lint) {
    lint.require_fields(doc, {"project", "version", "status", "goal", "success_criteria", "components"},
                        "missing required field ");

    auto status = doc.value("status", nlohmann::json());
    if (!valid_status(status)) {
        lint.error("invalid_status", "status must be draft|frozen|deprecated");
    }
    if (status == "frozen" && !doc.contains("cdd_spec")) {
        lint.error("missing_cdd_spec", "frozen project requires 'cdd_spec' field");
    }
}

void lint_component(const nlohmann::json& doc, LintCollector& lint) {
    lint.require_fields(doc, {"contract", "version", "status", "description", "runner",
                              "requirements", "tests"},
                        "missing required field ");

    auto status = doc.value("status", nlohmann::json());
    if (!valid_status(status)) {
        lint.error("invalid_status", "status must be draft|frozen|deprecated");
    }

    auto runner = doc.value("runner", nlohmann::json::object());
    if (!runner.is_object()) {
        lint.error("invalid_runner", "runner must be an object");
    } else if (!runner.contains("executor")) {
        lint.error("missing_executor", "runner.executor is required");
    }

    std::set<std::string> req_ids;
    auto requirements = doc.value("requirements", nlohmann::json::array());
    if (!requirements.is_array()) {
        lint.error("invalid_requirements", "requirements must be an array");
    } else {
        for (const auto& r : requirements) {
            if (!r.is_object()) {
                lint.error("invalid_requirement", "requirement must be an object");
                continue;
            }
            lint.require_fields(r, {"id", "priority", "description", "acceptance_criteria"},
                                "requirement missing ");
            if (r.contains("id")) req_ids.insert(scalar_to_string(r["id"]));
        }
    }

    auto tests = doc.value("tests", nlohmann::json::array());
    if (!tests.is_array()) {
        lint.error("invalid_tests", "tests must be an array");
        return;
    }

    std::set<std::string> linked;
    for (const auto& t : tests) {
        if (!t.is_object()) {
            lint.error("invalid_test", "test must be an object");
            continue;
        }
        lint.require_fields(t, {"id", "name", "type", "assert"}, "test missing ");

        auto req = t.value("requirement", nlohmann::json());
        bool has_link = !req.is_null() && req != false && req != "";
        if (has_link) {
            linked.insert(scalar_to_string(req));
        } else if (status == "frozen") {
            std::string id = t.contains("id") ? scalar_to_string(t["id"]) : "?";
            lint.warning("unlinked_test", "test " + id + " has no requirement link");
        }
    }

    for (const auto& id : req_ids) {
        if (linked.count(id) == 0) {
            lint.error("uncovered_requirement", "requirement " + id + " has no linked tests");
        }
    }
}

} // namespace

LintReport lint_contracts(const std::string& contracts_path, bool strict) {
    LintReport report;

    std::error_code ec;
    if (!fs::exists(contracts_path, ec)) {
        report.errors.push_back({codes::kPathNotFound, "Path not found: " + contracts_path});
        return report;
    }

    for (const auto& file : find_yaml_files(contracts_path)) {
        ++report.contracts_checked;
        LintCollector lint(file, report);

        auto text = read_file(file);
        if (!text) {
            lint.error("unexpected_error", "cannot read file");
            continue;
        }

        auto doc = parse_yaml_document(*text, file);
        if (doc.isErr()) {
            report.errors.push_back({"yaml_parse_error", doc.error().message()});
            continue;
        }

        const auto& d = doc.value();
        if (!d.is_object()) {
            lint.error("invalid_yaml", "must be a mapping");
            continue;
        }

        if (d.contains("project")) {
            lint_project(d, lint);
        } else if (d.contains("contract")) {
            lint_component(d, lint);
        } else {
            lint.error("unknown_contract_type", "must have 'project' or 'contract' field");
        }
    }

    report.ok = report.errors.empty() && !(strict && !report.warnings.empty());
    return report;
}

nlohmann::json lint_to_json(const LintReport& report) {
    auto diagnostics = [](const std::vector<Diagnostic>& list) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& d : list) {
            arr.push_back({{"code", d.code}, {"message", d.message}});
        }
        return arr;
    };
    return {
        {"ok", report.ok},
        {"errors", diagnostics(report.errors)},
        {"warnings", diagnostics(report.warnings)},
        {"contracts_checked", report.contracts_checked},
    };
}

} // namespace cdd

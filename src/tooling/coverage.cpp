#include "cdd/coverage.hpp"
#include "cdd/contract.hpp"
#include "cdd/globbing.hpp"

#include <map>

namespace cdd {

CoverageReport compute_coverage(const std::string& contracts_path) {
    std::map<std::string, int> linked;

    for (const auto& file : find_yaml_files(contracts_path)) {
        auto doc = load_contract_document(file);
        if (doc.isErr()) continue;

        const auto& d = doc.value();
        if (d.contains("project")) continue;

        auto reqs = d.value("requirements", nlohmann::json::array());
        if (reqs.is_array()) {
            for (const auto& r : reqs) {
                if (r.is_object() && r.contains("id")) {
                    linked.emplace(scalar_to_string(r["id"]), 0);
                }
            }
        }

        // Links count against requirements seen so far, in file order
        auto tests = d.value("tests", nlohmann::json::array());
        if (!tests.is_array()) continue;
        for (const auto& t : tests) {
            if (!t.is_object()) continue;
            auto req = t.value("requirement", nlohmann::json());
            if (req.is_null()) continue;
            auto it = linked.find(scalar_to_string(req));
            if (it != linked.end()) ++it->second;
        }
    }

    CoverageReport report;
    for (const auto& [id, count] : linked) {
        report.requirements.push_back({id, count});
        if (count == 0) ++report.uncovered_count;
    }
    report.total_count = static_cast<int>(report.requirements.size());
    return report;
}

nlohmann::json coverage_to_json(const CoverageReport& report) {
    nlohmann::json reqs = nlohmann::json::array();
    for (const auto& r : report.requirements) {
        reqs.push_back({{"id", r.id}, {"linked_tests", r.linked_tests}});
    }
    return {
        {"requirements", reqs},
        {"uncovered_count", report.uncovered_count},
        {"total_count", report.total_count},
    };
}

} // namespace cdd

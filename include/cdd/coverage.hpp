#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace cdd {

struct RequirementCoverage {
    std::string id;
    int linked_tests = 0;
};

struct CoverageReport {
    std::vector<RequirementCoverage> requirements;   // sorted by id
    int uncovered_count = 0;
    int total_count = 0;
};

// Requirement -> linked test count over a contract file or directory
// (recursive). Project contracts and unreadable files are skipped.
CoverageReport compute_coverage(const std::string& contracts_path);

nlohmann::json coverage_to_json(const CoverageReport& report);

} // namespace cdd

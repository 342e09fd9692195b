#pragma once

#include "cdd/result.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace cdd {

// ============================================================================
// Path Verification (pre-gate for `cdd test` and `cdd isolate`)
// ============================================================================
//
// Every file a contract refers to (files: globs and path-like shell
// arguments) must resolve relative to the contract's directory.

struct FailedPath {
    std::string path;
    std::optional<std::string> suggestion;
};

struct ContractPathReport {
    std::string contract;
    std::string contract_path;
    bool ok = false;
    std::vector<std::string> passed;
    std::vector<FailedPath> failed;
    int total = 0;
};

struct PathVerification {
    bool ok = false;
    int contracts_checked = 0;
    int total_paths = 0;
    int passed_paths = 0;
    int failed_paths = 0;
    std::vector<ContractPathReport> results;
};

// Contains a separator, is not a URL or a flag, and has an extension or an
// explicit ./ or ../ prefix
bool looks_like_path(const nlohmann::json& value);

// Paths from files: fields and shell command arrays, in document order
std::vector<std::string> extract_file_paths(const nlohmann::json& contract_doc);

// Nearby spelling of `path` that does exist, if any
std::optional<std::string> suggest_fix(const std::string& path, const std::string& contract_dir);

Result<ContractPathReport> verify_contract_paths(const std::string& contract_path);

// A file, or every *.yaml in a directory except project.yaml
Result<PathVerification> verify_paths(const std::string& contracts_path);

nlohmann::json path_verification_to_json(const PathVerification& verification);

} // namespace cdd

#pragma once

#include "cdd/result.hpp"
#include "cdd/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cdd {

// ============================================================================
// Runner Configuration (component `runner:` section)
// ============================================================================

struct RunnerConfig {
    std::string executor = "native";
    std::optional<std::string> entry;        // native: shared library path
    std::optional<std::string> symbol;       // native: default call target
    std::optional<std::string> parser;       // static: AST parser plugin name
    std::map<std::string, std::string> env;  // shell: environment overrides
    int timeout_ms = 30000;
    nlohmann::json raw = nlohmann::json::object();
};

// ============================================================================
// Steps, Tests, Requirements
// ============================================================================

struct StepSpec {
    std::string action;
    nlohmann::json with = nlohmann::json::object();
    std::optional<std::string> save_as;
    std::optional<std::string> method;
    std::optional<int> n;
    bool warmup = false;
    std::optional<std::vector<std::string>> command;
    std::optional<double> seconds;
};

struct TestSpec {
    std::string id;
    std::string name;
    std::optional<std::string> requirement;
    std::optional<std::string> type;         // absent | "static" | free-form
    nlohmann::json steps;                    // raw; entries parsed one by one
    nlohmann::json asserts = nlohmann::json::array();
    nlohmann::json files;                    // string | array | null

    // A `type: static` test with a `files` field scans files instead of
    // running steps
    bool is_file_scan() const;
};

struct Requirement {
    std::string id;
    std::string priority;
    std::string description;
    nlohmann::json acceptance_criteria;
};

// ============================================================================
// Contracts
// ============================================================================

struct ProjectContract {
    std::string path;
    std::string project;
    std::string version;
    std::string status;
    std::string goal;
    nlohmann::json success_criteria;
    std::vector<std::string> components;
    std::optional<std::string> cdd_spec;
};

struct ComponentContract {
    std::string path;
    std::string name;            // `contract:` field, falls back to file stem
    std::optional<std::string> version;
    std::optional<std::string> status;
    std::string description;
    RunnerConfig runner;
    nlohmann::json vars = nlohmann::json::object();
    std::vector<Requirement> requirements;
    nlohmann::json tests;        // raw; must be an array to run
    nlohmann::json raw;
};

// ============================================================================
// Loading
// ============================================================================

// Parse YAML (or JSON) text into a JSON tree. Scalars follow the YAML core
// schema: null, bool, int, float, else string; quoted scalars stay strings.
Result<nlohmann::json> parse_yaml_document(const std::string& text,
                                           const std::string& source_path);

// Read and parse a contract file; the document must be a mapping
Result<nlohmann::json> load_contract_document(const std::string& path);

ProjectContract parse_project_contract(const nlohmann::json& doc, const std::string& path);
ComponentContract parse_component_contract(const nlohmann::json& doc, const std::string& path);
RunnerConfig parse_runner_config(const nlohmann::json& runner);

// nullopt when the entry is not an object
std::optional<StepSpec> parse_step_spec(const nlohmann::json& step);
std::optional<TestSpec> parse_test_spec(const nlohmann::json& test);

// File name without directory and last extension
std::string contract_stem(const std::string& path);

// Render a scalar JSON value as plain text (strings unquoted)
std::string scalar_to_string(const nlohmann::json& value);

} // namespace cdd

#include "cdd/contract.hpp"
#include "cdd/platform.hpp"

#include <cmath>
#include <filesystem>
#include <limits>
#include <regex>

#include <yaml-cpp/yaml.h>

namespace cdd {

namespace fs = std::filesystem;

namespace {

// ============================================================================
// YAML -> JSON (core schema scalar typing)
// ============================================================================

bool is_null_scalar(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

std::optional<bool> bool_scalar(const std::string& s) {
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    return std::nullopt;
}

nlohmann::json typed_scalar(const std::string& s) {
    static const std::regex int_re(R"([-+]?[0-9]+)");
    static const std::regex hex_re(R"(0x[0-9a-fA-F]+)");
    static const std::regex oct_re(R"(0o[0-7]+)");
    static const std::regex float_re(R"([-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?)");
    static const std::regex inf_re(R"([-+]?\.(inf|Inf|INF))");
    static const std::regex nan_re(R"(\.(nan|NaN|NAN))");

    if (is_null_scalar(s)) return nullptr;
    if (auto b = bool_scalar(s)) return *b;

    try {
        if (std::regex_match(s, int_re)) return std::stoll(s);
        if (std::regex_match(s, hex_re)) return std::stoll(s.substr(2), nullptr, 16);
        if (std::regex_match(s, oct_re)) return std::stoll(s.substr(2), nullptr, 8);
        if (std::regex_match(s, float_re)) return std::stod(s);
    } catch (const std::out_of_range&) {
        // Too large for a 64-bit integer: keep the text
        return s;
    }

    if (std::regex_match(s, inf_re)) {
        return s[0] == '-' ? -std::numeric_limits<double>::infinity()
                           : std::numeric_limits<double>::infinity();
    }
    if (std::regex_match(s, nan_re)) return std::numeric_limits<double>::quiet_NaN();
    return s;
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            // Quoted scalars carry the non-specific "!" tag
            if (node.Tag() == "!") return node.Scalar();
            return typed_scalar(node.Scalar());
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.Scalar()] = yaml_to_json(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

std::string get_string(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
    if (!j.is_object()) return fallback;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    return scalar_to_string(*it);
}

std::optional<std::string> get_optional_string(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return scalar_to_string(*it);
}

nlohmann::json get_or(const nlohmann::json& j, const char* key, nlohmann::json fallback) {
    if (!j.is_object()) return fallback;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    return *it;
}

std::optional<long long> get_integer(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    if (it->is_number_integer()) return it->get<long long>();
    if (it->is_number_float()) return static_cast<long long>(it->get<double>());
    if (it->is_string()) {
        try {
            return std::stoll(it->get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// Loading
// ============================================================================

std::string scalar_to_string(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

std::string contract_stem(const std::string& path) {
    return fs::path(path).stem().string();
}

Result<nlohmann::json> parse_yaml_document(const std::string& text,
                                           const std::string& source_path) {
    try {
        YAML::Node root = YAML::Load(text);
        return Result<nlohmann::json>::ok(yaml_to_json(root));
    } catch (const YAML::Exception& e) {
        return Result<nlohmann::json>::err(
            Error(ErrorCode::PARSE_ERROR, source_path + ": " + e.what()));
    }
}

Result<nlohmann::json> load_contract_document(const std::string& path) {
    auto text = read_file(path);
    if (!text) {
        std::error_code ec;
        auto code = fs::exists(path, ec) ? ErrorCode::IO_ERROR : ErrorCode::FILE_NOT_FOUND;
        return Result<nlohmann::json>::err(Error(code, "cannot read contract: " + path));
    }

    auto doc = parse_yaml_document(*text, path);
    if (doc.isErr()) return doc;

    nlohmann::json value = doc.value();
    if (value.is_null()) {
        value = nlohmann::json::object();
    }
    if (!value.is_object()) {
        return Result<nlohmann::json>::err(
            Error(ErrorCode::INVALID_CONTRACT, path + " must parse to a mapping"));
    }
    return Result<nlohmann::json>::ok(std::move(value));
}

// ============================================================================
// Typed Views
// ============================================================================

ProjectContract parse_project_contract(const nlohmann::json& doc, const std::string& path) {
    ProjectContract p;
    p.path = path;
    p.project = get_string(doc, "project", "unknown");
    p.version = get_string(doc, "version");
    p.status = get_string(doc, "status");
    p.goal = get_string(doc, "goal");
    p.success_criteria = get_or(doc, "success_criteria", nlohmann::json::array());

    auto components = get_or(doc, "components", nlohmann::json::array());
    if (components.is_array()) {
        for (const auto& c : components) {
            p.components.push_back(scalar_to_string(c));
        }
    }

    // An empty pin counts as absent
    auto spec = get_optional_string(doc, "cdd_spec");
    if (spec && !spec->empty()) {
        p.cdd_spec = spec;
    }
    return p;
}

RunnerConfig parse_runner_config(const nlohmann::json& runner) {
    RunnerConfig cfg;
    cfg.raw = runner.is_object() ? runner : nlohmann::json::object();
    cfg.executor = get_string(runner, "executor", "native");
    cfg.entry = get_optional_string(runner, "entry");
    cfg.symbol = get_optional_string(runner, "symbol");
    cfg.parser = get_optional_string(runner, "parser");

    if (auto timeout = get_integer(runner, "timeout_ms")) {
        cfg.timeout_ms = static_cast<int>(*timeout);
    }

    auto env = get_or(runner, "env", nlohmann::json::object());
    if (env.is_object()) {
        for (auto it = env.begin(); it != env.end(); ++it) {
            cfg.env[it.key()] = scalar_to_string(it.value());
        }
    }
    return cfg;
}

std::optional<StepSpec> parse_step_spec(const nlohmann::json& step) {
    if (!step.is_object()) return std::nullopt;

    StepSpec s;
    s.action = get_string(step, "action");
    s.with = get_or(step, "with", nlohmann::json::object());
    s.save_as = get_optional_string(step, "save_as");
    if (s.save_as && s.save_as->empty()) s.save_as.reset();
    s.method = get_optional_string(step, "method");
    if (auto n = get_integer(step, "n")) {
        s.n = static_cast<int>(*n);
    }

    auto warmup = get_or(step, "warmup", false);
    s.warmup = warmup.is_boolean() ? warmup.get<bool>() : !warmup.is_null();

    auto command = get_or(step, "command", nullptr);
    if (command.is_array()) {
        std::vector<std::string> argv;
        for (const auto& arg : command) {
            argv.push_back(scalar_to_string(arg));
        }
        s.command = std::move(argv);
    } else if (command.is_string()) {
        s.command = std::vector<std::string>{command.get<std::string>()};
    }

    auto seconds = get_or(step, "seconds", nullptr);
    if (seconds.is_number()) {
        s.seconds = seconds.get<double>();
    }
    return s;
}

std::optional<TestSpec> parse_test_spec(const nlohmann::json& test) {
    if (!test.is_object()) return std::nullopt;

    TestSpec t;
    t.id = get_string(test, "id");
    t.name = get_string(test, "name");
    t.requirement = get_optional_string(test, "requirement");
    t.type = get_optional_string(test, "type");
    t.steps = get_or(test, "steps", nullptr);
    t.asserts = get_or(test, "assert", nlohmann::json::array());
    t.files = get_or(test, "files", nullptr);
    return t;
}

bool TestSpec::is_file_scan() const {
    if (!type || *type != "static") return false;
    if (files.is_string()) return !files.get_ref<const std::string&>().empty();
    if (files.is_array() || files.is_object()) return !files.empty();
    return !files.is_null() && files != false;
}

ComponentContract parse_component_contract(const nlohmann::json& doc, const std::string& path) {
    ComponentContract c;
    c.path = path;
    c.raw = doc;
    c.name = get_string(doc, "contract", contract_stem(path));
    c.version = get_optional_string(doc, "version");
    c.status = get_optional_string(doc, "status");
    c.description = get_string(doc, "description");
    c.runner = parse_runner_config(get_or(doc, "runner", nlohmann::json::object()));

    auto vars = get_or(doc, "vars", nlohmann::json::object());
    if (vars.is_object()) c.vars = vars;

    auto reqs = get_or(doc, "requirements", nlohmann::json::array());
    if (reqs.is_array()) {
        for (const auto& r : reqs) {
            if (!r.is_object()) continue;
            Requirement req;
            req.id = get_string(r, "id");
            req.priority = get_string(r, "priority");
            req.description = get_string(r, "description");
            req.acceptance_criteria = get_or(r, "acceptance_criteria", nullptr);
            c.requirements.push_back(std::move(req));
        }
    }

    c.tests = get_or(doc, "tests", nlohmann::json::array());
    return c;
}

} // namespace cdd

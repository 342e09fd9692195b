#include "cdd/paths.hpp"
#include "cdd/contract.hpp"
#include "cdd/globbing.hpp"
#include "cdd/path_query.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>
#include <set>

namespace fs = std::filesystem;

namespace cdd {

namespace {

bool has_glob_magic(const std::string& path) {
    return path.find_first_of("*?[") != std::string::npos;
}

bool path_resolves(const fs::path& contract_dir, const std::string& path) {
    if (has_glob_magic(path)) {
        return !glob_paths(contract_dir.string(), path).empty();
    }
    std::error_code ec;
    return fs::exists(contract_dir / path, ec);
}

nlohmann::json array_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return nlohmann::json::array();
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) return nlohmann::json::array();
    return *it;
}

} // namespace

bool looks_like_path(const nlohmann::json& value) {
    static const std::regex extension_re(R"(\.\w+$)");

    if (!value.is_string()) return false;
    const std::string& s = value.get_ref<const std::string&>();

    if (s.find('/') == std::string::npos && s.find('\\') == std::string::npos) return false;
    if (s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0) return false;
    if (s.rfind("-", 0) == 0) return false;
    return std::regex_search(s, extension_re) || s.rfind("../", 0) == 0 || s.rfind("./", 0) == 0;
}

std::vector<std::string> extract_file_paths(const nlohmann::json& contract_doc) {
    std::vector<std::string> paths;
    nlohmann::json vars = contract_doc.is_object() ? contract_doc.value("vars", nlohmann::json::object())
                                                   : nlohmann::json::object();

    for (const auto& test : array_field(contract_doc, "tests")) {
        if (!test.is_object()) continue;

        auto files = test.value("files", nlohmann::json());
        if (files.is_string()) {
            paths.push_back(interpolate_string(files.get<std::string>(), vars));
        } else if (files.is_array()) {
            for (const auto& f : files) {
                if (f.is_string()) paths.push_back(interpolate_string(f.get<std::string>(), vars));
            }
        }

        for (const auto& step : array_field(test, "steps")) {
            for (const auto& arg : array_field(step, "command")) {
                if (looks_like_path(arg)) {
                    paths.push_back(interpolate_string(arg.get<std::string>(), vars));
                }
            }
        }
    }
    return paths;
}

std::optional<std::string> suggest_fix(const std::string& path, const std::string& contract_dir) {
    fs::path dir(contract_dir);

    std::string parent_path = "../" + path;
    if (path_resolves(dir, parent_path)) return parent_path;

    if (path.rfind("../", 0) == 0) {
        std::string child_path = path.substr(3);
        if (path_resolves(dir, child_path)) return child_path;
    }

    std::string grandparent_path = "../../" + path;
    if (path_resolves(dir, grandparent_path)) return grandparent_path;

    return std::nullopt;
}

Result<ContractPathReport> verify_contract_paths(const std::string& contract_path) {
    auto doc = load_contract_document(contract_path);
    if (doc.isErr()) {
        return Result<ContractPathReport>::err(doc.error());
    }

    fs::path contract_dir = fs::path(contract_path).parent_path();
    if (contract_dir.empty()) contract_dir = ".";

    ContractPathReport report;
    report.contract_path = contract_path;
    report.contract = doc.value().contains("contract") ? scalar_to_string(doc.value()["contract"])
                                                       : contract_stem(contract_path);

    std::set<std::string> seen;
    for (const auto& path : extract_file_paths(doc.value())) {
        if (!seen.insert(path).second) continue;
        ++report.total;
        if (path_resolves(contract_dir, path)) {
            report.passed.push_back(path);
        } else {
            report.failed.push_back({path, suggest_fix(path, contract_dir.string())});
        }
    }
    report.ok = report.failed.empty();
    return Result<ContractPathReport>::ok(std::move(report));
}

Result<PathVerification> verify_paths(const std::string& contracts_path) {
    std::error_code ec;
    if (!fs::exists(contracts_path, ec)) {
        return Result<PathVerification>::err(
            Error(ErrorCode::FILE_NOT_FOUND, "Path not found: " + contracts_path));
    }

    std::vector<std::string> contract_files;
    if (fs::is_regular_file(contracts_path, ec)) {
        contract_files.push_back(contracts_path);
    } else {
        for (fs::directory_iterator it(contracts_path, ec), end; !ec && it != end; it.increment(ec)) {
            const auto& p = it->path();
            if (p.extension() == ".yaml" && p.filename() != "project.yaml" && it->is_regular_file(ec)) {
                contract_files.push_back(p.string());
            }
        }
        std::sort(contract_files.begin(), contract_files.end());
    }

    PathVerification verification;
    for (const auto& cf : contract_files) {
        auto result = verify_contract_paths(cf);
        if (result.isErr()) {
            return Result<PathVerification>::err(result.error());
        }
        verification.passed_paths += static_cast<int>(result.value().passed.size());
        verification.failed_paths += static_cast<int>(result.value().failed.size());
        verification.results.push_back(std::move(result.value()));
    }

    verification.contracts_checked = static_cast<int>(contract_files.size());
    verification.total_paths = verification.passed_paths + verification.failed_paths;
    verification.ok = verification.failed_paths == 0;
    return Result<PathVerification>::ok(std::move(verification));
}

nlohmann::json path_verification_to_json(const PathVerification& verification) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& r : verification.results) {
        nlohmann::json failed = nlohmann::json::array();
        for (const auto& f : r.failed) {
            failed.push_back({
                {"path", f.path},
                {"suggestion", f.suggestion ? nlohmann::json(*f.suggestion) : nlohmann::json()},
            });
        }
        results.push_back({
            {"contract", r.contract},
            {"contract_path", r.contract_path},
            {"ok", r.ok},
            {"passed", r.passed},
            {"failed", failed},
            {"total", r.total},
        });
    }

    return {
        {"ok", verification.ok},
        {"contracts_checked", verification.contracts_checked},
        {"total_paths", verification.total_paths},
        {"passed_paths", verification.passed_paths},
        {"failed_paths", verification.failed_paths},
        {"results", results},
    };
}

} // namespace cdd

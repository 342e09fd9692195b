#include "cdd/spec_version.hpp"
#include "cdd/platform.hpp"

#include <cctype>
#include <filesystem>

#ifndef CDD_VERSION
#define CDD_VERSION "0.0.0"
#endif

namespace cdd {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

// "1" -> "1.0.0", "1.2" -> "1.2.0"; prerelease/build suffixes are left alone
std::string pad_version(const std::string& s) {
    size_t suffix_pos = s.find_first_of("-+");
    std::string core = s.substr(0, suffix_pos);
    std::string suffix = suffix_pos == std::string::npos ? "" : s.substr(suffix_pos);

    int dots = 0;
    for (char c : core) {
        if (c == '.') ++dots;
    }
    for (; dots < 2; ++dots) {
        core += ".0";
    }
    return core + suffix;
}

} // namespace

std::string tool_version() {
    return CDD_VERSION;
}

std::string schema_version_for(const std::string& version) {
    auto first = version.find('.');
    if (first == std::string::npos) return "1.0";
    auto second = version.find('.', first + 1);
    return version.substr(0, second);
}

std::optional<Version> parse_spec_version(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    try {
        return semver::version::parse(pad_version(s));
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

std::optional<std::string> read_version_sidecar(const std::string& repo_root) {
    auto path = std::filesystem::path(repo_root) / ".cdd-version";
    auto content = read_file(path.string());
    if (!content) return std::nullopt;

    std::string value = trim(*content);
    if (value.empty()) return std::nullopt;
    return value;
}

SpecCheckResult check_spec_version(const std::optional<std::string>& project_spec,
                                   const std::string& tool_version,
                                   bool require_exact) {
    SpecCheckResult result;

    if (!project_spec || project_spec->empty()) {
        result.warnings.push_back({codes::kSpecVersionMissing,
                                   "No cdd_spec or .cdd-version found"});
        return result;
    }

    auto project = parse_spec_version(*project_spec);
    auto tool = parse_spec_version(tool_version);
    if (!project || !tool) {
        const std::string& bad = project ? tool_version : *project_spec;
        result.warnings.push_back({codes::kSpecVersionParseError,
                                   "Could not parse cdd_spec '" + bad + "'"});
        return result;
    }

    std::string relation = "Project targets CDD " + *project_spec + ", tooling is " + tool_version;

    if (project->major() != tool->major()) {
        result.errors.push_back({codes::kSpecMajorMismatch, relation});
    } else if (*project != *tool) {
        if (require_exact) {
            result.errors.push_back({codes::kSpecExactMismatch, relation + " (exact required)"});
        } else {
            result.warnings.push_back({codes::kSpecVersionMismatch, relation});
        }
    }
    return result;
}

} // namespace cdd

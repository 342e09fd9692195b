#pragma once

/**
 * @file spec_version.hpp
 * @brief Spec-version gating between a project and the tool
 *
 * A project pins the contract schema it targets (`cdd_spec`, or the
 * `.cdd-version` sidecar file). Before any test runs:
 *   - differing major version                  -> spec_major_mismatch (fatal)
 *   - same major, different version, exact mode -> spec_exact_mismatch (fatal)
 *   - same major, different version             -> spec_version_mismatch (warning)
 *   - no pin                                    -> spec_version_missing (warning)
 *   - unparsable pin                            -> spec_version_parse_error (warning)
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>

#include "cdd/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cdd {

using Version = semver::version;

/// Tool (and spec) version baked in at build time
std::string tool_version();

/// Report schema version: "MAJOR.MINOR" of the tool version
std::string schema_version_for(const std::string& version);

/// Parse a spec version; missing minor/patch components are zero-padded
std::optional<Version> parse_spec_version(const std::string& str);

/// Contents of <repo_root>/.cdd-version, trimmed; nullopt if absent or empty
std::optional<std::string> read_version_sidecar(const std::string& repo_root);

struct SpecCheckResult {
    std::vector<Diagnostic> warnings;
    std::vector<Diagnostic> errors;

    bool fatal() const { return !errors.empty(); }
};

SpecCheckResult check_spec_version(const std::optional<std::string>& project_spec,
                                   const std::string& tool_version,
                                   bool require_exact);

} // namespace cdd

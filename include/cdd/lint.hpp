#pragma once

#include "cdd/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace cdd {

struct LintReport {
    bool ok = false;
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;
    int contracts_checked = 0;
};

// Schema and coverage checks for a contract file or directory (recursive).
// strict: warnings also make the result not ok.
LintReport lint_contracts(const std::string& contracts_path, bool strict);

nlohmann::json lint_to_json(const LintReport& report);

} // namespace cdd

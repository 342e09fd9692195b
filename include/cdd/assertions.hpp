#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace cdd {

// ============================================================================
// Assertion Result
// ============================================================================

struct AssertionResult {
    std::string op;
    nlohmann::json actual;
    nlohmann::json expected;
    bool pass = false;
    std::optional<std::string> error;    // type_mismatch, unknown_op, exception, ...
    std::optional<std::string> message;  // user context from the contract
    nlohmann::json details = nlohmann::json::object();
};

// ============================================================================
// Evaluation
// ============================================================================

// Evaluate every assertion in `asserts` (array of assertion objects) against
// `context`. One failure never stops the remaining assertions.
std::vector<AssertionResult> run_assertions(const nlohmann::json& context,
                                            const nlohmann::json& asserts);

// Apply one operator to already-resolved operands. `raw` is the assertion
// object, consulted for min/max/tolerance.
AssertionResult apply_op(const std::string& op,
                         const nlohmann::json& actual,
                         const nlohmann::json& expected,
                         const nlohmann::json& pattern,
                         const nlohmann::json& raw);

// Report form: {op, actual, expected, pass, error, details[, message]}
nlohmann::json assertion_to_json(const AssertionResult& result);

} // namespace cdd

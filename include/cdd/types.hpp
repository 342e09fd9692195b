#pragma once

#include <optional>
#include <string>
#include <vector>

namespace cdd {

// ============================================================================
// Test Status
// ============================================================================

enum class TestStatus {
    Pass,
    Fail,
    Skipped,
    Error
};

inline const char* test_status_to_string(TestStatus s) {
    switch (s) {
        case TestStatus::Pass: return "pass";
        case TestStatus::Fail: return "fail";
        case TestStatus::Skipped: return "skipped";
        case TestStatus::Error: return "error";
        default: return "error";
    }
}

// ============================================================================
// Diagnostic (report warnings and errors)
// ============================================================================

struct Diagnostic {
    std::string code;     // lowercase snake_case
    std::string message;
};

// ============================================================================
// Error Codes
// ============================================================================
//
// Codes survive serialization into the report, so they are plain strings.

namespace codes {

// Path resolver. path_not_found is reserved: missing paths resolve to null.
inline constexpr const char* kPathNotFound = "path_not_found";
inline constexpr const char* kTypeMismatch = "type_mismatch";
inline constexpr const char* kInvalidPath = "invalid_path";

// Assertion evaluator
inline constexpr const char* kUnknownOp = "unknown_op";
inline constexpr const char* kException = "exception";

// Executors
inline constexpr const char* kSymbolNotFound = "symbol_not_found";
inline constexpr const char* kTimeout = "timeout";
inline constexpr const char* kNonzeroExit = "nonzero_exit";
inline constexpr const char* kUnsupportedAction = "unsupported_action";
inline constexpr const char* kInvalidAction = "invalid_action";
inline constexpr const char* kMissingCommand = "missing_command";
inline constexpr const char* kStaticNoSteps = "static_no_steps";
inline constexpr const char* kNotImplemented = "not_implemented";
inline constexpr const char* kExecutorException = "executor_exception";
inline constexpr const char* kAllFailed = "all_failed";

// Runner
inline constexpr const char* kSpecMajorMismatch = "spec_major_mismatch";
inline constexpr const char* kSpecExactMismatch = "spec_exact_mismatch";
inline constexpr const char* kSpecVersionMismatch = "spec_version_mismatch";
inline constexpr const char* kSpecVersionMissing = "spec_version_missing";
inline constexpr const char* kSpecVersionParseError = "spec_version_parse_error";

} // namespace codes

} // namespace cdd

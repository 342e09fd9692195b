#pragma once

/**
 * @file isolate.hpp
 * @brief Run one contract inside a disposable, symlinked sandbox
 *
 * The sandbox holds a copy of the contract under contracts/ plus a symlink
 * for every top-level project directory ("link root") the contract reaches
 * through a ../ reference. Replacing or deleting a work directory is gated:
 * it must not be /, $HOME, the project root or an ancestor of it, and its
 * marker file must carry an isolate token (the one written at creation, for
 * cleanup).
 */

#include "cdd/executor_registry.hpp"
#include "cdd/log.hpp"
#include "cdd/paths.hpp"
#include "cdd/report.hpp"
#include "cdd/result.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>

namespace cdd {

// ============================================================================
// Exit Codes
// ============================================================================

enum class IsolateExit : int {
    Success = 0,
    TestFailure = 1,
    PathFailure = 2,
    ParseError = 3,
    NoProjectRoot = 4,
    InvalidPath = 5,
};

inline int exit_code_value(IsolateExit e) { return static_cast<int>(e); }

inline constexpr const char* kIsolateMarkerFile = ".cdd-isolate-marker";

// ============================================================================
// Context
// ============================================================================

struct IsolateOptions {
    std::string contract_path;
    std::optional<std::string> project;     // explicit project root
    std::optional<std::string> work_dir;    // explicit sandbox location
    bool keep = false;
    bool keep_on_fail = false;
    bool verbose = false;
    bool paths_only = false;
    bool dry_run = false;
};

struct IsolateContext {
    std::string contract_path;              // absolute
    std::string project_root;
    std::string work_dir;
    std::set<std::string> link_roots;
    std::string marker_token;               // known only after setup
    bool verbose = false;
    bool dry_run = false;
    bool keep = false;
    bool keep_on_fail = false;
    bool paths_only = false;
};

// ============================================================================
// Steps
// ============================================================================

// Parse the contract; `extends` is rejected (UNSUPPORTED_FEATURE)
Result<nlohmann::json> parse_isolate_contract(const std::string& contract_path);

// Walk upwards from the contract's directory. Preference: .cdd/+contracts/,
// then .git/+contracts/, then contracts/+src/. An explicit root wins if it
// is a directory.
std::optional<std::string> detect_project_root(const std::string& contract_path,
                                               const std::optional<std::string>& explicit_root);

// files: entries, step file: fields, and command arguments containing '/'
// or starting with ".."
std::set<std::string> extract_referenced_paths(const nlohmann::json& contract);

// First project-relative component of every ../ reference. A reference that
// leaves the project root is INVALID_PATH.
Result<std::set<std::string>> compute_link_roots(const std::set<std::string>& paths,
                                                 const std::string& project_root,
                                                 const std::string& contract_dir);

// <tmp>/cdd-isolate-<sha256(abs contract path)[0:8]>-<pid>, or the override
std::string compute_work_dir(const std::string& contract_path,
                             const std::optional<std::string>& custom_work_dir);

// CDD_ISOLATE_TMP or /tmp
std::string isolate_tmp_root();

// Build the sandbox; returns the marker token. An existing work directory is
// replaced only when it is a stale sandbox (has a marker). `written_token`, if
// given, receives the token as soon as the marker is on disk, so a caller can
// clean up after a later failure.
Result<std::string> setup_work_dir(const IsolateContext& ctx,
                                   const Logger& logger,
                                   std::string* written_token = nullptr);

std::optional<std::string> read_marker_token(const std::string& work_dir);

bool is_safe_to_cleanup(const std::string& work_dir,
                        const std::string& expected_token,
                        const std::string& project_root);

// Honors keep/keep-on-fail, then the safety checks. True if deleted.
bool cleanup_work_dir(const IsolateContext& ctx, int exit_code, const Logger& logger);

// ============================================================================
// Orchestration
// ============================================================================

struct IsolatePlan {
    IsolateExit exit = IsolateExit::Success;
    std::string error;
    std::optional<IsolateContext> context;
    std::string contract_name;
};

// Parse, detect the root, compute link roots and the work directory
IsolatePlan plan_isolate(const IsolateOptions& options);

struct IsolateOutcome {
    IsolateExit exit = IsolateExit::Success;
    std::string error;
    std::optional<IsolateContext> context;
    std::optional<PathVerification> paths;
    std::optional<Report> report;
    bool cleaned = false;
};

// Verify paths and run the tests with the working directory switched into an
// already materialized sandbox. A contract that fails to load is exit 1.
void run_in_work_dir(const IsolateContext& ctx,
                     const ExecutorRegistry& registry,
                     const Logger& logger,
                     IsolateOutcome& outcome);

// Plan, materialize, run in the sandbox, then clean up. An exception during
// the run is exit 1 and the sandbox is still cleaned up.
IsolateOutcome run_isolate(const IsolateOptions& options,
                           const ExecutorRegistry& registry,
                           const Logger& logger);

} // namespace cdd

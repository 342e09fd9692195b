#include "cdd/isolate.hpp"
#include "cdd/contract.hpp"
#include "cdd/hash.hpp"
#include "cdd/platform.hpp"
#include "cdd/runner.hpp"

#include <filesystem>
#include <sstream>

namespace cdd {

namespace fs = std::filesystem;

namespace {

fs::path canonical_or_weak(const fs::path& p) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(fs::absolute(p, ec), ec);
    if (ec) return fs::absolute(p).lexically_normal();
    return resolved;
}

bool is_dir(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

// Restores the previous working directory on scope exit
class ScopedWorkingDirectory {
public:
    explicit ScopedWorkingDirectory(const fs::path& dir) {
        std::error_code ec;
        previous_ = fs::current_path(ec);
        if (ec) return;
        fs::current_path(dir, ec);
        active_ = !ec;
    }

    ~ScopedWorkingDirectory() {
        if (!active_) return;
        std::error_code ec;
        fs::current_path(previous_, ec);
    }

    ScopedWorkingDirectory(const ScopedWorkingDirectory&) = delete;
    ScopedWorkingDirectory& operator=(const ScopedWorkingDirectory&) = delete;

    bool active() const { return active_; }

private:
    fs::path previous_;
    bool active_ = false;
};

// "/", $HOME, the project root or any directory containing it
bool is_protected_dir(const fs::path& dir, const std::string& project_root) {
    fs::path resolved = canonical_or_weak(dir);
    if (resolved == fs::path("/")) return true;

    if (auto home = get_env("HOME")) {
        if (!home->empty() && resolved == canonical_or_weak(*home)) return true;
    }

    fs::path rel = canonical_or_weak(project_root).lexically_relative(resolved);
    return !rel.empty() && *rel.begin() != "..";
}

nlohmann::json list_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return nlohmann::json::array();
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) return nlohmann::json::array();
    return *it;
}

} // namespace

// ============================================================================
// Contract + Root Detection
// ============================================================================

Result<nlohmann::json> parse_isolate_contract(const std::string& contract_path) {
    auto doc = load_contract_document(contract_path);
    if (doc.isErr()) {
        auto code = doc.error().code();
        if (code == ErrorCode::FILE_NOT_FOUND) {
            return Result<nlohmann::json>::err(
                Error(code, "Contract not found: " + contract_path));
        }
        if (code == ErrorCode::PARSE_ERROR) {
            return Result<nlohmann::json>::err(
                Error(code, "Contract parse error: " + doc.error().message()));
        }
        if (code == ErrorCode::INVALID_CONTRACT) {
            return Result<nlohmann::json>::err(Error(code, "Contract must be a YAML mapping"));
        }
        return Result<nlohmann::json>::err(
            Error(code, "Failed to read contract: " + doc.error().message()));
    }

    if (doc.value().contains("extends")) {
        return Result<nlohmann::json>::err(
            Error(ErrorCode::UNSUPPORTED_FEATURE, "extends not supported by cdd isolate"));
    }
    return doc;
}

std::optional<std::string> detect_project_root(const std::string& contract_path,
                                               const std::optional<std::string>& explicit_root) {
    if (explicit_root) {
        fs::path root = canonical_or_weak(*explicit_root);
        if (is_dir(root)) return root.string();
        return std::nullopt;
    }

    fs::path current = canonical_or_weak(contract_path).parent_path();
    std::optional<std::pair<int, fs::path>> best;

    while (current != current.parent_path()) {
        bool has_contracts = is_dir(current / "contracts");

        if (has_contracts && is_dir(current / ".cdd")) {
            return current.string();
        }

        int rank = 0;
        if (has_contracts && is_dir(current / ".git")) {
            rank = 2;
        } else if (has_contracts && is_dir(current / "src")) {
            rank = 3;
        }
        // Nearest candidate wins among equal ranks
        if (rank != 0 && (!best || rank < best->first)) {
            best = std::make_pair(rank, current);
        }
        current = current.parent_path();
    }

    if (best) return best->second.string();
    return std::nullopt;
}

// ============================================================================
// Referenced Paths
// ============================================================================

std::set<std::string> extract_referenced_paths(const nlohmann::json& contract) {
    std::set<std::string> paths;

    for (const auto& test : list_field(contract, "tests")) {
        if (!test.is_object()) continue;

        auto files = test.value("files", nlohmann::json());
        if (files.is_string()) {
            paths.insert(files.get<std::string>());
        } else if (files.is_array()) {
            for (const auto& f : files) {
                if (f.is_string()) paths.insert(f.get<std::string>());
            }
        }

        for (const auto& step : list_field(test, "steps")) {
            if (!step.is_object()) continue;

            auto file = step.value("file", nlohmann::json());
            if (file.is_string()) paths.insert(file.get<std::string>());

            for (const auto& arg : list_field(step, "command")) {
                if (!arg.is_string()) continue;
                const auto& s = arg.get_ref<const std::string&>();
                if (s.find('/') != std::string::npos || s.rfind("..", 0) == 0) {
                    paths.insert(s);
                }
            }
        }
    }
    return paths;
}

Result<std::set<std::string>> compute_link_roots(const std::set<std::string>& paths,
                                                 const std::string& project_root,
                                                 const std::string& contract_dir) {
    std::set<std::string> roots;
    fs::path root = canonical_or_weak(project_root);

    for (const auto& ref : paths) {
        if (ref.rfind("..", 0) != 0) continue;

        fs::path resolved = canonical_or_weak(fs::path(contract_dir) / ref);
        fs::path rel = resolved.lexically_relative(root);

        if (rel.empty() || *rel.begin() == "..") {
            std::ostringstream msg;
            msg << "Path '" << ref << "' resolves outside project root.\n"
                << "  Resolved: " << resolved.string() << "\n"
                << "  Project:  " << root.string() << "\n"
                << "Consider using --project to specify correct root.";
            return Result<std::set<std::string>>::err(Error(ErrorCode::INVALID_PATH, msg.str()));
        }

        std::string first = rel.begin()->string();
        if (first != ".") roots.insert(first);
    }
    return Result<std::set<std::string>>::ok(std::move(roots));
}

// ============================================================================
// Work Directory
// ============================================================================

std::string isolate_tmp_root() {
    auto tmp = get_env("CDD_ISOLATE_TMP");
    if (tmp && !tmp->empty()) return *tmp;
    return "/tmp";
}

std::string compute_work_dir(const std::string& contract_path,
                             const std::optional<std::string>& custom_work_dir) {
    if (custom_work_dir) {
        return canonical_or_weak(*custom_work_dir).string();
    }

    std::string abs_path = canonical_or_weak(contract_path).string();
    std::string digest = compute_sha256(abs_path).hex_digest.substr(0, 8);

    fs::path dir = fs::path(isolate_tmp_root()) /
                   ("cdd-isolate-" + digest + "-" + std::to_string(get_process_id()));
    return dir.string();
}

Result<std::string> setup_work_dir(const IsolateContext& ctx,
                                   const Logger& logger,
                                   std::string* written_token) {
    fs::path work_dir(ctx.work_dir);
    std::error_code ec;
    if (written_token) written_token->clear();

    if (is_protected_dir(work_dir, ctx.project_root)) {
        return Result<std::string>::err(Error(ErrorCode::SETUP_FAILED,
            "Refusing to use " + work_dir.string() + " as work directory (protected path)"));
    }

    if (fs::exists(work_dir, ec)) {
        // Only a stale sandbox may be replaced
        if (!read_marker_token(work_dir.string())) {
            return Result<std::string>::err(Error(ErrorCode::SETUP_FAILED,
                "Refusing to replace " + work_dir.string() + ": not an isolate work directory"));
        }
        logger->debug("rm -rf {}", work_dir.string());
        fs::remove_all(work_dir, ec);
        if (ec) {
            return Result<std::string>::err(Error(ErrorCode::SETUP_FAILED,
                "cannot remove " + work_dir.string() + ": " + ec.message()));
        }
    }

    fs::path contracts_dir = work_dir / "contracts";
    logger->debug("mkdir -p {}", contracts_dir.string());
    fs::create_directories(contracts_dir, ec);
    if (ec) {
        return Result<std::string>::err(Error(ErrorCode::SETUP_FAILED,
            "cannot create " + contracts_dir.string() + ": " + ec.message()));
    }

    fs::path marker = work_dir / kIsolateMarkerFile;
    logger->debug("touch {}", marker.string());
    std::string token = random_hex_token(16);
    if (token.empty()) {
        return Result<std::string>::err(
            Error(ErrorCode::SETUP_FAILED, "cannot generate marker token"));
    }
    std::string marker_content = "token=" + token + "\n" +
                                 "created=" + get_current_timestamp() + "\n" +
                                 "pid=" + std::to_string(get_process_id()) + "\n";
    if (!write_file(marker.string(), marker_content)) {
        return Result<std::string>::err(
            Error(ErrorCode::SETUP_FAILED, "cannot write " + marker.string()));
    }
    if (written_token) *written_token = token;

    fs::path source_contract(ctx.contract_path);
    fs::path dest = contracts_dir / source_contract.filename();
    logger->debug("cp {} {}", source_contract.string(), dest.string());
    fs::copy_file(source_contract, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result<std::string>::err(Error(ErrorCode::SETUP_FAILED,
            "cannot copy " + source_contract.string() + ": " + ec.message()));
    }

    for (const auto& link_root : ctx.link_roots) {
        fs::path source = fs::path(ctx.project_root) / link_root;
        fs::path target = work_dir / link_root;

        if (!is_dir(source)) {
            return Result<std::string>::err(Error(ErrorCode::INVALID_PATH,
                "Link root '" + link_root + "' does not exist: " + source.string()));
        }

        logger->debug("ln -s {} {}", source.string(), target.string());
        fs::create_directory_symlink(source, target, ec);
        if (ec) {
            return Result<std::string>::err(Error(ErrorCode::SETUP_FAILED,
                "cannot link " + target.string() + ": " + ec.message()));
        }
    }

    return Result<std::string>::ok(std::move(token));
}

// ============================================================================
// Cleanup Safety
// ============================================================================

std::optional<std::string> read_marker_token(const std::string& work_dir) {
    auto content = read_file((fs::path(work_dir) / kIsolateMarkerFile).string());
    if (!content) return std::nullopt;

    std::istringstream lines(*content);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.rfind("token=", 0) == 0) {
            return line.substr(6);
        }
    }
    return std::nullopt;
}

bool is_safe_to_cleanup(const std::string& work_dir,
                        const std::string& expected_token,
                        const std::string& project_root) {
    if (is_protected_dir(work_dir, project_root)) return false;

    auto actual = read_marker_token(work_dir);
    return actual && !expected_token.empty() && *actual == expected_token;
}

bool cleanup_work_dir(const IsolateContext& ctx, int exit_code, const Logger& logger) {
    bool should_keep = ctx.keep || (ctx.keep_on_fail && exit_code != 0);
    if (should_keep) return false;

    if (!is_safe_to_cleanup(ctx.work_dir, ctx.marker_token, ctx.project_root)) {
        logger->warn("Refusing to cleanup {} (safety check failed)", ctx.work_dir);
        return false;
    }

    logger->debug("rm -rf {}", ctx.work_dir);
    std::error_code ec;
    fs::remove_all(ctx.work_dir, ec);
    if (ec) {
        logger->warn("Cleanup of {} incomplete: {}", ctx.work_dir, ec.message());
        return false;
    }
    return true;
}

// ============================================================================
// Orchestration
// ============================================================================

IsolatePlan plan_isolate(const IsolateOptions& options) {
    IsolatePlan plan;
    std::string contract_path = canonical_or_weak(options.contract_path).string();

    auto contract = parse_isolate_contract(contract_path);
    if (contract.isErr()) {
        plan.exit = IsolateExit::ParseError;
        plan.error = contract.error().message();
        return plan;
    }

    auto project_root = detect_project_root(contract_path, options.project);
    if (!project_root) {
        plan.exit = IsolateExit::NoProjectRoot;
        plan.error = "Could not detect project root. Use --project to specify.";
        return plan;
    }

    auto refs = extract_referenced_paths(contract.value());
    auto link_roots = compute_link_roots(refs, *project_root,
                                         fs::path(contract_path).parent_path().string());
    if (link_roots.isErr()) {
        plan.exit = IsolateExit::InvalidPath;
        plan.error = link_roots.error().message();
        return plan;
    }

    IsolateContext ctx;
    ctx.contract_path = contract_path;
    ctx.project_root = *project_root;
    ctx.work_dir = compute_work_dir(contract_path, options.work_dir);
    ctx.link_roots = std::move(link_roots.value());
    ctx.verbose = options.verbose;
    ctx.dry_run = options.dry_run;
    ctx.keep = options.keep;
    ctx.keep_on_fail = options.keep_on_fail;
    ctx.paths_only = options.paths_only;

    plan.context = std::move(ctx);
    plan.contract_name = contract.value().contains("contract")
                             ? scalar_to_string(contract.value()["contract"])
                             : contract_stem(contract_path);
    return plan;
}

void run_in_work_dir(const IsolateContext& ctx,
                     const ExecutorRegistry& registry,
                     const Logger& logger,
                     IsolateOutcome& outcome) {
    ScopedWorkingDirectory cwd(ctx.work_dir);
    if (!cwd.active()) {
        outcome.exit = IsolateExit::InvalidPath;
        outcome.error = "Cannot enter work directory: " + ctx.work_dir;
        return;
    }

    auto paths = verify_paths("contracts");
    if (paths.isErr()) {
        outcome.exit = IsolateExit::TestFailure;
        outcome.error = "Error during execution: " + paths.error().message();
        return;
    }

    outcome.paths = paths.value();
    if (!paths.value().ok) {
        outcome.exit = IsolateExit::PathFailure;
        return;
    }
    if (ctx.paths_only) return;

    RunnerOptions runner_options;
    runner_options.artifacts_root = "artifacts";
    ContractRunner runner(registry, runner_options, logger);
    Report report = runner.run("contracts");
    if (report.has_failures()) {
        outcome.exit = IsolateExit::TestFailure;
    }
    outcome.report = std::move(report);
}

IsolateOutcome run_isolate(const IsolateOptions& options,
                           const ExecutorRegistry& registry,
                           const Logger& logger) {
    IsolateOutcome outcome;

    auto plan = plan_isolate(options);
    outcome.exit = plan.exit;
    outcome.error = plan.error;
    if (plan.exit != IsolateExit::Success || !plan.context) {
        return outcome;
    }

    IsolateContext ctx = *plan.context;
    logger->info("Isolating {}", plan.contract_name);
    logger->debug("Project root: {}", ctx.project_root);
    logger->debug("Work dir: {}", ctx.work_dir);

    if (ctx.dry_run) {
        outcome.context = ctx;
        return outcome;
    }

    std::string written_token;
    auto token = setup_work_dir(ctx, logger, &written_token);
    if (token.isErr()) {
        outcome.exit = IsolateExit::InvalidPath;
        outcome.error = token.error().message();
        // Remove a partially built sandbox only if this run wrote its marker
        if (!written_token.empty()) {
            ctx.marker_token = written_token;
            outcome.cleaned = cleanup_work_dir(ctx, exit_code_value(outcome.exit), logger);
        }
        outcome.context = ctx;
        return outcome;
    }
    ctx.marker_token = token.value();

    try {
        run_in_work_dir(ctx, registry, logger, outcome);
    } catch (const std::exception& e) {
        outcome.exit = IsolateExit::TestFailure;
        outcome.error = std::string("Error during execution: ") + e.what();
        logger->error("{}", outcome.error);
    }

    outcome.cleaned = cleanup_work_dir(ctx, exit_code_value(outcome.exit), logger);
    if (!outcome.cleaned && (ctx.keep || ctx.keep_on_fail)) {
        logger->info("Work directory kept: {}", ctx.work_dir);
    }
    outcome.context = std::move(ctx);
    return outcome;
}

} // namespace cdd

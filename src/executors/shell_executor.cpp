#include "cdd/shell_executor.hpp"
#include "cdd/path_query.hpp"
#include "cdd/platform.hpp"
#include "cdd/types.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" char** environ;

namespace cdd {

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

// Pipe whose ends close on destruction
class Pipe {
public:
    Pipe() {
        if (pipe(fds_) != 0) {
            fds_[0] = fds_[1] = -1;
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool valid() const { return fds_[0] >= 0 && fds_[1] >= 0; }
    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) { close(fds_[0]); fds_[0] = -1; }
    }
    void close_write() {
        if (fds_[1] >= 0) { close(fds_[1]); fds_[1] = -1; }
    }

private:
    int fds_[2];
};

bool set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    return flags >= 0 && fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

int remaining_ms(const std::optional<Clock::time_point>& deadline) {
    if (!deadline) return -1;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Decode a waitpid status into result fields
void record_status(int status, ProcessResult& result) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }
}

} // namespace

// ============================================================================
// Process Execution
// ============================================================================

ProcessResult run_process(const ProcessRequest& request) {
    ProcessResult result;

    if (request.argv.empty()) {
        result.error = "empty argv";
        return result;
    }

    std::vector<std::string> env_strings;
    for (const auto& kv : request.env) {
        env_strings.push_back(kv.first + "=" + kv.second);
    }

    std::vector<char*> argv;
    for (const auto& s : request.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& s : env_strings) {
        envp.push_back(const_cast<char*>(s.c_str()));
    }
    envp.push_back(nullptr);

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe exec_pipe;   // carries errno if exec fails
    if (!out_pipe.valid() || !err_pipe.valid() || !exec_pipe.valid()) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    set_cloexec(exec_pipe.write_end());

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process: own process group so a timeout reaches grandchildren
        setpgid(0, 0);
        dup2(out_pipe.write_end(), STDOUT_FILENO);
        dup2(err_pipe.write_end(), STDERR_FILENO);
        close(out_pipe.read_end());
        close(err_pipe.read_end());
        close(exec_pipe.read_end());

        int err = 0;
        if (!request.cwd.empty() && chdir(request.cwd.c_str()) != 0) {
            err = errno;
        } else {
            environ = envp.data();
            execvp(argv[0], argv.data());
            err = errno;
        }
        ssize_t written = write(exec_pipe.write_end(), &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    // Parent process
    out_pipe.close_write();
    err_pipe.close_write();
    exec_pipe.close_write();

    int child_errno = 0;
    ssize_t n = read(exec_pipe.read_end(), &child_errno, sizeof(child_errno));
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status;
        waitpid(pid, &status, 0);
        result.error = "failed to start '" + request.argv[0] + "': " + strerror(child_errno);
        return result;
    }

    std::optional<Clock::time_point> deadline;
    if (request.timeout_ms > 0) {
        deadline = Clock::now() + std::chrono::milliseconds(request.timeout_ms);
    }

    struct pollfd fds[2];
    fds[0] = {out_pipe.read_end(), POLLIN, 0};
    fds[1] = {err_pipe.read_end(), POLLIN, 0};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    int open_streams = 2;
    char buffer[4096];

    while (open_streams > 0) {
        int wait_ms = remaining_ms(deadline);
        if (deadline && wait_ms == 0) {
            result.timed_out = true;
            break;
        }
        int ready = poll(fds, 2, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error = "poll failed: " + std::string(strerror(errno));
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t got = read(fds[i].fd, buffer, sizeof(buffer));
            if (got > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    // Output is closed; the child may still be running
    int status = 0;
    while (!result.timed_out && result.error.empty()) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            record_status(status, result);
            return result;
        }
        if (w == -1 && errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            break;
        }
        if (deadline && remaining_ms(deadline) == 0) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
    result.ok = false;
    return result;
}

// ============================================================================
// Shell Executor
// ============================================================================

std::map<std::string, std::string> build_step_environment(const RunContext& ctx,
                                                          const RunnerConfig& cfg) {
    std::map<std::string, std::string> env;
    for (const auto& kv : get_all_env()) {
        env[kv.first] = kv.second;
    }
    for (const auto& kv : cfg.env) {
        env[kv.first] = kv.second;
    }

    auto text_field = [](const nlohmann::json& obj, const char* key) -> std::string {
        if (!obj.is_object() || !obj.contains(key) || !obj[key].is_string()) return "";
        return obj[key].get<std::string>();
    };
    env["CONTRACT"] = text_field(ctx.contract, "contract");
    env["RUN_ID"] = text_field(ctx.runner, "run_id");
    env["ARTIFACTS_DIR"] = ctx.artifacts_dir;
    return env;
}

ExecutorStatus ShellExecutor::setup(RunContext& ctx, const RunnerConfig& /*cfg*/) {
    std::error_code ec;
    fs::create_directories(ctx.artifacts_dir, ec);
    if (ec) {
        return ExecutorStatus::failure("cannot create artifacts directory " + ctx.artifacts_dir +
                                       ": " + ec.message());
    }
    return ExecutorStatus::success();
}

StepResult ShellExecutor::execute_step(const RunContext& ctx,
                                       const RunnerConfig& cfg,
                                       const std::string& test_id,
                                       const StepSpec& step,
                                       int timeout_ms) {
    if (step.action != "shell") {
        return StepResult::failure(codes::kUnsupportedAction,
                                   "shell executor only handles 'shell', got: " + step.action);
    }
    if (!step.command || step.command->empty()) {
        return StepResult::failure(codes::kMissingCommand, "shell action requires 'command' field");
    }

    ProcessRequest request;
    for (const auto& arg : *step.command) {
        request.argv.push_back(interpolate_string(arg, ctx.vars));
    }
    request.env = build_step_environment(ctx, cfg);
    request.cwd = ctx.work_dir;
    request.timeout_ms = timeout_ms;

    logger_->debug("[{}] shell: {}", test_id, request.argv[0]);

    auto start = Clock::now();
    ProcessResult proc = run_process(request);
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();

    StepResult r;
    r.captured_stdout = proc.stdout_text;
    r.captured_stderr = proc.stderr_text;
    r.meta["duration_ms"] = duration_ms;

    if (proc.timed_out) {
        r.error_code = codes::kTimeout;
        r.message = "Command timed out after " + std::to_string(timeout_ms) + "ms";
        return r;
    }
    if (!proc.ok) {
        r.error_code = codes::kException;
        r.message = proc.error;
        return r;
    }

    r.value = {{"returncode", proc.exit_code}};
    r.ok = proc.exit_code == 0;
    if (!r.ok) {
        r.error_code = codes::kNonzeroExit;
        r.message = "Exit code: " + std::to_string(proc.exit_code);
    }
    return r;
}

ExecutorStatus ShellExecutor::teardown(RunContext& /*ctx*/, const RunnerConfig& /*cfg*/) {
    return ExecutorStatus::success();
}

} // namespace cdd

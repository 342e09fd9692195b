#include "cdd/platform.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#include <process.h>
#else
#include <sys/utsname.h>
#include <unistd.h>
#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif
#endif

namespace cdd {

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

std::string get_os_family() {
    switch (get_current_platform()) {
        case Platform::Linux: return "linux";
        case Platform::macOS: return "darwin";
        case Platform::Windows: return "windows";
        default: return "unknown";
    }
}

std::string get_os_description() {
#ifdef _WIN32
    return "Windows";
#else
    struct utsname info;
    if (uname(&info) != 0) {
        return get_os_family();
    }
    return std::string(info.sysname) + "-" + info.release + "-" + info.machine;
#endif
}

RuntimeVersion get_runtime_version() {
    RuntimeVersion v;
#if defined(__clang__)
    v.major = __clang_major__;
    v.minor = __clang_minor__;
    v.patch = __clang_patchlevel__;
#elif defined(__GNUC__)
    v.major = __GNUC__;
    v.minor = __GNUC_MINOR__;
    v.patch = __GNUC_PATCHLEVEL__;
#elif defined(_MSC_VER)
    v.major = _MSC_VER / 100;
    v.minor = _MSC_VER % 100;
    v.patch = 0;
#endif
    return v;
}

// ============================================================================
// File Utilities
// ============================================================================

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return ss.str();
}

bool write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(file);
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::unordered_map<std::string, std::string> get_all_env() {
    std::unordered_map<std::string, std::string> env;

#ifdef _WIN32
    char* environ_block = GetEnvironmentStrings();
    if (environ_block) {
        const char* p = environ_block;
        while (*p) {
            std::string entry(p);
            auto eq = entry.find('=');
            if (eq != std::string::npos && eq > 0) {
                env[entry.substr(0, eq)] = entry.substr(eq + 1);
            }
            p += entry.size() + 1;
        }
        FreeEnvironmentStrings(environ_block);
    }
#else
    for (char** ep = environ; *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        if (eq != std::string::npos) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
#endif

    return env;
}

long get_process_id() {
#ifdef _WIN32
    return static_cast<long>(_getpid());
#else
    return static_cast<long>(getpid());
#endif
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

} // namespace cdd

#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace cdd {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

Platform get_current_platform();

// "linux" | "darwin" | "windows" | "unknown"
std::string get_os_family();

// Human-readable OS description (uname sysname-release-machine)
std::string get_os_description();

// Version triplet of the compiler that built the tool
struct RuntimeVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;
};

RuntimeVersion get_runtime_version();

// ============================================================================
// File Utilities
// ============================================================================

// Read a whole file; nullopt when it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// Write (truncate) a file; false on failure
bool write_file(const std::string& path, const std::string& content);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get all environment variables as a map
std::unordered_map<std::string, std::string> get_all_env();

// Current process id
long get_process_id();

// Current timestamp as RFC3339 string, second precision, UTC ("...Z")
std::string get_current_timestamp();

} // namespace cdd

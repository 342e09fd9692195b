/**
 * CDD CLI - Common utilities and types
 */

#pragma once

#include <cdd/log.hpp>
#include <cdd/types.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace cdd::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

inline std::string safe_getenv(const char* name) {
    const char* val = std::getenv(name);
    return val ? val : "";
}

/**
 * Resolve the artifacts root.
 * Priority: --artifacts flag > CDD_ARTIFACTS env > ./artifacts
 */
inline std::string resolve_artifacts_root(const std::string& flag_value) {
    if (!flag_value.empty()) {
        return flag_value;
    }

    std::string env_root = safe_getenv("CDD_ARTIFACTS");
    if (!env_root.empty()) {
        return env_root;
    }

    return "artifacts";
}

inline Logger make_cli_logger(const GlobalOptions& opts) {
    return make_console_logger(opts.verbose, opts.quiet);
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

inline std::string rule(char c = '=', std::size_t width = 60) {
    return std::string(width, c);
}

inline std::string truncate(const std::string& s, std::size_t max_len) {
    return s.size() <= max_len ? s : s.substr(0, max_len);
}

inline void print_diagnostics(const std::string& title, const std::vector<Diagnostic>& list) {
    if (list.empty()) return;
    std::cout << title << ":" << std::endl;
    for (const auto& d : list) {
        std::cout << "  " << d.code << ": " << d.message << std::endl;
    }
}

} // namespace cdd::cli

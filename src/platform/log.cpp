#include "cdd/log.hpp"
#include "cdd/platform.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cdd {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    if (s == "trace") return spdlog::level::trace;
    if (s == "debug") return spdlog::level::debug;
    if (s == "info") return spdlog::level::info;
    if (s == "warn" || s == "warning") return spdlog::level::warn;
    if (s == "error") return spdlog::level::err;
    if (s == "off") return spdlog::level::off;
    return std::nullopt;
}

Logger make_console_logger(bool verbose, bool quiet) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("cdd", sink);
    logger->set_pattern("%^[%l]%$ %v");

    auto level = spdlog::level::info;
    if (verbose) {
        level = spdlog::level::debug;
    } else if (quiet) {
        level = spdlog::level::err;
    }
    if (!verbose && !quiet) {
        if (auto env_level = get_env("CDD_LOG_LEVEL")) {
            if (auto parsed = parse_log_level(*env_level)) {
                level = *parsed;
            }
        }
    }
    logger->set_level(level);
    return logger;
}

Logger make_null_logger() {
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("cdd-null", sink);
    logger->set_level(spdlog::level::off);
    return logger;
}

} // namespace cdd

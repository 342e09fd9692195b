#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace cdd {

// Output sink passed explicitly through the runner, executors and isolate.
// Built once at the entrypoint; library code never touches the default logger.
using Logger = std::shared_ptr<spdlog::logger>;

// Colored stderr logger. Level: verbose -> debug, quiet -> error, else info,
// unless CDD_LOG_LEVEL names a level.
Logger make_console_logger(bool verbose, bool quiet);

// Logger that drops everything (tests, embedding)
Logger make_null_logger();

// Parse "trace" | "debug" | "info" | "warn" | "error" | "off"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

} // namespace cdd

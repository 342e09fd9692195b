#pragma once

/**
 * @file path_query.hpp
 * @brief Path queries over result trees
 *
 * Grammar: `$` followed by selectors:
 *   .name          bare key
 *   [N]            non-negative index
 *   ["a.b"] ['a']  quoted key
 *
 * Resolution never coerces types. A missing key or out-of-range index
 * resolves to null without error; selecting into the wrong kind of value
 * is a type_mismatch.
 *
 * @example
 * ```cpp
 * auto r = cdd::resolve_path(context, "$.steps[0].value");
 * if (r.ok) use(r.value);
 * ```
 */

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace cdd {

struct PathResolution {
    bool ok = false;
    nlohmann::json value;   // null when missing
    std::string error;      // "type_mismatch" | "invalid_path" when !ok
};

// Resolve `path` against `root`
PathResolution resolve_path(const nlohmann::json& root, const std::string& path);

// Absent path literal resolves to null successfully
PathResolution resolve_path(const nlohmann::json& root, const std::optional<std::string>& path);

// True if `expr` is a string beginning with the "$." root marker
bool is_path_expression(const nlohmann::json& expr);

// Replace {name} and $.vars.name in every string of `value` with entries of
// `vars`. Recurses into arrays and objects. Unknown names become "".
nlohmann::json interpolate_vars(const nlohmann::json& value, const nlohmann::json& vars);

// String-only convenience for interpolate_vars
std::string interpolate_string(const std::string& value, const nlohmann::json& vars);

} // namespace cdd

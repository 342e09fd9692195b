#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace cdd {

// Expand one glob pattern relative to base_dir. Supports *, ?, [...] within
// a path segment and ** spanning any number of directories. Wildcards do not
// match a leading '.' in a name. Returns matching paths (base_dir joined).
std::vector<std::string> glob_paths(const std::string& base_dir, const std::string& pattern);

// `files_spec` is a glob string or an array of globs/paths. Variables are
// interpolated first. Result is sorted and de-duplicated; any other shape
// expands to nothing.
std::vector<std::string> expand_files(const nlohmann::json& files_spec,
                                      const std::string& base_dir,
                                      const nlohmann::json& vars);

// A file path yields itself; a directory yields every *.yaml below it,
// sorted. Anything else yields nothing.
std::vector<std::string> find_yaml_files(const std::string& path);

} // namespace cdd

#include "cdd/globbing.hpp"
#include "cdd/path_query.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

#include <fnmatch.h>

namespace fs = std::filesystem;

namespace cdd {

namespace {

bool has_magic(const std::string& segment) {
    return segment.find_first_of("*?[") != std::string::npos;
}

bool is_hidden(const std::string& name) {
    return !name.empty() && name[0] == '.';
}

std::vector<std::string> split_segments(const std::string& pattern) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= pattern.size()) {
        size_t pos = pattern.find('/', start);
        if (pos == std::string::npos) pos = pattern.size();
        std::string seg = pattern.substr(start, pos - start);
        if (!seg.empty()) segments.push_back(seg);
        start = pos + 1;
    }
    return segments;
}

std::vector<fs::path> list_children(const fs::path& dir, bool dirs_only) {
    std::vector<fs::path> out;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (is_hidden(it->path().filename().string())) continue;
        if (dirs_only && !it->is_directory(ec)) continue;
        out.push_back(it->path());
    }
    return out;
}

// `active` holds the canonical directories of the ** recursion in progress;
// a symlink back into one of them is not descended again
void expand(const fs::path& dir,
            const std::vector<std::string>& segments,
            size_t index,
            std::set<std::string>& out,
            std::vector<fs::path>& active) {
    std::error_code ec;
    if (index == segments.size()) {
        if (fs::exists(dir, ec)) out.insert(dir.string());
        return;
    }

    const std::string& seg = segments[index];
    bool last = index + 1 == segments.size();

    if (seg == "**") {
        fs::path real = fs::canonical(dir, ec);
        if (ec) return;
        if (std::find(active.begin(), active.end(), real) != active.end()) return;
        active.push_back(real);

        // Zero directories, then every non-hidden directory below
        if (last) {
            for (const auto& child : list_children(dir, false)) {
                out.insert(child.string());
            }
        } else {
            expand(dir, segments, index + 1, out, active);
        }
        for (const auto& sub : list_children(dir, true)) {
            expand(sub, segments, index, out, active);
        }

        active.pop_back();
        return;
    }

    if (!has_magic(seg)) {
        fs::path next = dir / seg;
        if (last) {
            if (fs::exists(next, ec)) out.insert(next.string());
        } else if (fs::is_directory(next, ec)) {
            expand(next, segments, index + 1, out, active);
        }
        return;
    }

    for (const auto& child : list_children(dir, !last)) {
        std::string name = child.filename().string();
        if (fnmatch(seg.c_str(), name.c_str(), FNM_PERIOD) != 0) continue;
        if (last) {
            out.insert(child.string());
        } else {
            expand(child, segments, index + 1, out, active);
        }
    }
}

} // namespace

std::vector<std::string> glob_paths(const std::string& base_dir, const std::string& pattern) {
    std::set<std::string> out;
    if (pattern.empty()) return {};

    fs::path root = (!pattern.empty() && pattern[0] == '/') ? fs::path("/") : fs::path(base_dir);
    std::vector<fs::path> active;
    expand(root, split_segments(pattern), 0, out, active);
    return std::vector<std::string>(out.begin(), out.end());
}

std::vector<std::string> expand_files(const nlohmann::json& files_spec,
                                      const std::string& base_dir,
                                      const nlohmann::json& vars) {
    std::vector<std::string> patterns;
    if (files_spec.is_string()) {
        patterns.push_back(files_spec.get<std::string>());
    } else if (files_spec.is_array()) {
        for (const auto& p : files_spec) {
            if (p.is_string()) patterns.push_back(p.get<std::string>());
        }
    } else {
        return {};
    }

    std::set<std::string> paths;
    for (const auto& pattern : patterns) {
        std::string expanded = interpolate_string(pattern, vars);
        for (auto& match : glob_paths(base_dir, expanded)) {
            paths.insert(std::move(match));
        }
    }
    return std::vector<std::string>(paths.begin(), paths.end());
}

std::vector<std::string> find_yaml_files(const std::string& path) {
    std::vector<std::string> files;
    std::error_code ec;

    if (fs::is_regular_file(path, ec)) {
        files.push_back(path);
        return files;
    }
    if (!fs::is_directory(path, ec)) return files;

    for (fs::recursive_directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".yaml" && it->is_regular_file(ec)) {
            files.push_back(it->path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace cdd

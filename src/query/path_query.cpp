#include "cdd/path_query.hpp"

#include <cctype>
#include <regex>
#include <variant>
#include <vector>

namespace cdd {

namespace {

struct KeySelector {
    std::string key;
};

struct IndexSelector {
    long long index;
};

using Selector = std::variant<KeySelector, IndexSelector>;

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

bool is_integer_literal(const std::string& s) {
    size_t i = 0;
    if (i < s.size() && s[i] == '-') ++i;
    if (i == s.size()) return false;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool is_quoted(const std::string& s) {
    if (s.size() < 2) return false;
    char q = s.front();
    return (q == '"' || q == '\'') && s.back() == q;
}

// Split the body after "$." into selectors; nullopt on malformed brackets
std::optional<std::vector<Selector>> tokenize(const std::string& body) {
    std::vector<Selector> out;
    std::string buf;
    size_t i = 0;

    auto flush = [&]() {
        if (!buf.empty()) {
            out.push_back(KeySelector{buf});
            buf.clear();
        }
    };

    while (i < body.size()) {
        char ch = body[i];
        if (ch == '.') {
            flush();
            ++i;
            continue;
        }
        if (ch == '[') {
            flush();
            size_t close = body.find(']', i);
            if (close == std::string::npos) return std::nullopt;
            std::string inner = trim(body.substr(i + 1, close - i - 1));
            if (is_quoted(inner)) {
                out.push_back(KeySelector{inner.substr(1, inner.size() - 2)});
            } else if (is_integer_literal(inner)) {
                try {
                    out.push_back(IndexSelector{std::stoll(inner)});
                } catch (const std::out_of_range&) {
                    return std::nullopt;
                }
            } else {
                return std::nullopt;
            }
            i = close + 1;
            continue;
        }
        buf += ch;
        ++i;
    }
    flush();
    return out;
}

std::string render_var(const nlohmann::json& vars, const std::string& name) {
    if (!vars.is_object()) return "";
    auto it = vars.find(name);
    if (it == vars.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

std::string replace_all(const std::string& input,
                        const std::regex& re,
                        const nlohmann::json& vars) {
    std::string out;
    auto begin = std::sregex_iterator(input.begin(), input.end(), re);
    auto end = std::sregex_iterator();
    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const auto& m = *it;
        out.append(input, last, static_cast<size_t>(m.position(0)) - last);
        out += render_var(vars, m[1].str());
        last = static_cast<size_t>(m.position(0) + m.length(0));
    }
    out.append(input, last, std::string::npos);
    return out;
}

} // namespace

// ============================================================================
// Resolution
// ============================================================================

PathResolution resolve_path(const nlohmann::json& root, const std::string& path) {
    PathResolution result;

    if (path.rfind("$.", 0) != 0) {
        result.error = "invalid_path";
        return result;
    }

    auto selectors = tokenize(path.substr(2));
    if (!selectors) {
        result.error = "invalid_path";
        return result;
    }

    const nlohmann::json* cur = &root;
    for (const auto& sel : *selectors) {
        if (auto key = std::get_if<KeySelector>(&sel)) {
            if (!cur->is_object()) {
                result.error = "type_mismatch";
                return result;
            }
            auto it = cur->find(key->key);
            if (it == cur->end()) {
                result.ok = true;
                return result;
            }
            cur = &(*it);
        } else {
            const auto& idx = std::get<IndexSelector>(sel);
            if (!cur->is_array()) {
                result.error = "type_mismatch";
                return result;
            }
            if (idx.index < 0 || static_cast<size_t>(idx.index) >= cur->size()) {
                result.ok = true;
                return result;
            }
            cur = &(*cur)[static_cast<size_t>(idx.index)];
        }
    }

    result.ok = true;
    result.value = *cur;
    return result;
}

PathResolution resolve_path(const nlohmann::json& root, const std::optional<std::string>& path) {
    if (!path) {
        PathResolution result;
        result.ok = true;
        return result;
    }
    return resolve_path(root, *path);
}

bool is_path_expression(const nlohmann::json& expr) {
    return expr.is_string() && expr.get_ref<const std::string&>().rfind("$.", 0) == 0;
}

// ============================================================================
// Interpolation
// ============================================================================

std::string interpolate_string(const std::string& value, const nlohmann::json& vars) {
    static const std::regex brace_re(R"(\{([a-zA-Z_][a-zA-Z0-9_]*)\})");
    static const std::regex path_re(R"(\$\.vars\.([a-zA-Z_][a-zA-Z0-9_]*))");
    return replace_all(replace_all(value, brace_re, vars), path_re, vars);
}

nlohmann::json interpolate_vars(const nlohmann::json& value, const nlohmann::json& vars) {
    if (value.is_string()) {
        return interpolate_string(value.get<std::string>(), vars);
    }
    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& v : value) {
            out.push_back(interpolate_vars(v, vars));
        }
        return out;
    }
    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = interpolate_vars(it.value(), vars);
        }
        return out;
    }
    return value;
}

} // namespace cdd

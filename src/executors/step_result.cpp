#include "cdd/executor.hpp"

#include <cctype>

namespace cdd {

StepResult StepResult::failure(const std::string& code, const std::string& message) {
    StepResult r;
    r.ok = false;
    r.error_code = code;
    r.message = message;
    return r;
}

std::optional<long long> parse_stdout_int(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (start == end) return std::nullopt;

    std::string s = text.substr(start, end - start);
    size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (i == s.size()) return std::nullopt;
    for (size_t k = i; k < s.size(); ++k) {
        if (!std::isdigit(static_cast<unsigned char>(s[k]))) return std::nullopt;
    }

    try {
        return std::stoll(s);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

nlohmann::json step_result_to_json(const StepResult& result) {
    auto stdout_int = parse_stdout_int(result.captured_stdout);
    return {
        {"ok", result.ok},
        {"value", result.value},
        {"error_code", result.error_code ? nlohmann::json(*result.error_code) : nlohmann::json()},
        {"message", result.message ? nlohmann::json(*result.message) : nlohmann::json()},
        {"meta", result.meta.is_object() ? result.meta : nlohmann::json::object()},
        {"stdout", result.captured_stdout},
        {"stdout_int", stdout_int ? nlohmann::json(*stdout_int) : nlohmann::json()},
        {"stderr", result.captured_stderr},
        {"artifacts", result.artifacts.is_array() ? result.artifacts : nlohmann::json::array()},
    };
}

} // namespace cdd

#include "cdd/assertions.hpp"
#include "cdd/path_query.hpp"
#include "cdd/types.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <functional>
#include <regex>

namespace fs = std::filesystem;

namespace cdd {

namespace {

struct EvaluatedOperand {
    nlohmann::json value;
    std::optional<std::string> error;
};

// Literals pass through; "$."-prefixed strings are resolved
EvaluatedOperand evaluate_operand(const nlohmann::json& context, const nlohmann::json& expr) {
    EvaluatedOperand out;
    if (is_path_expression(expr)) {
        auto r = resolve_path(context, expr.get<std::string>());
        if (!r.ok) {
            out.error = r.error;
            return out;
        }
        out.value = r.value;
        return out;
    }
    out.value = expr;
    return out;
}

nlohmann::json field_or_null(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    return it == obj.end() ? nlohmann::json() : *it;
}

AssertionResult make_result(const std::string& op,
                            nlohmann::json actual,
                            nlohmann::json expected,
                            bool pass) {
    AssertionResult r;
    r.op = op;
    r.actual = std::move(actual);
    r.expected = std::move(expected);
    r.pass = pass;
    return r;
}

AssertionResult type_mismatch(const std::string& op,
                              nlohmann::json actual,
                              nlohmann::json expected) {
    auto r = make_result(op, std::move(actual), std::move(expected), false);
    r.error = codes::kTypeMismatch;
    return r;
}

bool all_strings(const nlohmann::json& arr) {
    return std::all_of(arr.begin(), arr.end(),
                       [](const nlohmann::json& v) { return v.is_string(); });
}

AssertionResult compare_numbers(const std::string& op,
                                const nlohmann::json& actual,
                                const nlohmann::json& expected,
                                const std::function<bool(double, double)>& fn) {
    if (!actual.is_number() || !expected.is_number()) {
        return type_mismatch(op, actual, expected);
    }
    return make_result(op, actual, expected, fn(actual.get<double>(), expected.get<double>()));
}

bool regex_search_multiline(const std::string& text, const std::string& pattern) {
    std::regex re(pattern, std::regex::ECMAScript | std::regex::multiline);
    return std::regex_search(text, re);
}

// Greedy left-to-right subsequence scan
bool is_ordered_subsequence(const nlohmann::json& actual, const nlohmann::json& expected) {
    size_t pos = 0;
    for (const auto& want : expected) {
        while (pos < actual.size() && actual[pos] != want) ++pos;
        if (pos >= actual.size()) return false;
        ++pos;
    }
    return true;
}

AssertionResult apply_op_unchecked(const std::string& op,
                                   const nlohmann::json& actual,
                                   const nlohmann::json& expected,
                                   const nlohmann::json& pattern,
                                   const nlohmann::json& raw) {
    if (op == "eq") return make_result(op, actual, expected, actual == expected);
    if (op == "ne") return make_result(op, actual, expected, actual != expected);

    if (op == "lt") return compare_numbers(op, actual, expected, std::less<double>());
    if (op == "lte") return compare_numbers(op, actual, expected, std::less_equal<double>());
    if (op == "gt") return compare_numbers(op, actual, expected, std::greater<double>());
    if (op == "gte") return compare_numbers(op, actual, expected, std::greater_equal<double>());

    if (op == "in_range") {
        nlohmann::json mn = field_or_null(raw, "min");
        nlohmann::json mx = field_or_null(raw, "max");
        nlohmann::json bounds = {{"min", mn}, {"max", mx}};
        if (!actual.is_number() || !mn.is_number() || !mx.is_number()) {
            return type_mismatch(op, actual, bounds);
        }
        double v = actual.get<double>();
        bool ok = mn.get<double>() <= v && v <= mx.get<double>();
        return make_result(op, actual, bounds, ok);
    }

    if (op == "approx") {
        nlohmann::json tol = field_or_null(raw, "tolerance");
        if (!actual.is_number() || !expected.is_number() || !tol.is_number()) {
            return type_mismatch(op, actual, expected);
        }
        bool ok = std::fabs(actual.get<double>() - expected.get<double>()) <= tol.get<double>();
        auto r = make_result(op, actual, expected, ok);
        r.details["tolerance"] = tol;
        return r;
    }

    if (op == "contains") {
        if (actual.is_array()) {
            bool found = std::find(actual.begin(), actual.end(), expected) != actual.end();
            return make_result(op, actual, expected, found);
        }
        if (actual.is_string() && expected.is_string()) {
            bool found = actual.get_ref<const std::string&>().find(
                             expected.get_ref<const std::string&>()) != std::string::npos;
            return make_result(op, actual, expected, found);
        }
        return type_mismatch(op, actual, expected);
    }

    if (op == "has_keys") {
        if (!actual.is_object() || !expected.is_array() || !all_strings(expected)) {
            return type_mismatch(op, actual, expected);
        }
        bool ok = std::all_of(expected.begin(), expected.end(), [&](const nlohmann::json& k) {
            return actual.contains(k.get<std::string>());
        });
        return make_result(op, actual, expected, ok);
    }

    if (op == "matches" || op == "not_matches") {
        bool use_pattern = !pattern.is_null() && !(pattern.is_string() && pattern.get_ref<const std::string&>().empty());
        const nlohmann::json& pat = use_pattern ? pattern : expected;
        if (!actual.is_string() || !pat.is_string()) {
            return type_mismatch(op, actual, pat);
        }
        bool found = regex_search_multiline(actual.get<std::string>(), pat.get<std::string>());
        return make_result(op, actual, pat, op == "matches" ? found : !found);
    }

    if (op == "file_exists") {
        if (!actual.is_string()) {
            return type_mismatch(op, actual, expected);
        }
        std::error_code ec;
        bool ok = fs::exists(actual.get<std::string>(), ec);
        return make_result(op, actual, true, ok);
    }

    if (op == "call_order") {
        if (!actual.is_array() || !expected.is_array() || !all_strings(actual) || !all_strings(expected)) {
            return type_mismatch(op, actual, expected);
        }
        return make_result(op, actual, expected, is_ordered_subsequence(actual, expected));
    }

    auto r = make_result(op, actual, expected, false);
    r.error = codes::kUnknownOp;
    return r;
}

} // namespace

// ============================================================================
// Evaluation
// ============================================================================

AssertionResult apply_op(const std::string& op,
                         const nlohmann::json& actual,
                         const nlohmann::json& expected,
                         const nlohmann::json& pattern,
                         const nlohmann::json& raw) {
    try {
        return apply_op_unchecked(op, actual, expected, pattern, raw);
    } catch (const std::exception& e) {
        auto r = make_result(op, actual, expected, false);
        r.error = codes::kException;
        r.details["exception"] = e.what();
        return r;
    }
}

std::vector<AssertionResult> run_assertions(const nlohmann::json& context,
                                            const nlohmann::json& asserts) {
    std::vector<AssertionResult> results;
    if (!asserts.is_array()) return results;

    for (const auto& a : asserts) {
        nlohmann::json op_value = field_or_null(a, "op");
        std::string op = op_value.is_string() ? op_value.get<std::string>() : "";
        nlohmann::json expected_expr = field_or_null(a, "expected");
        nlohmann::json pattern_expr = field_or_null(a, "pattern");
        nlohmann::json message = field_or_null(a, "message");

        auto actual = evaluate_operand(context, field_or_null(a, "actual"));
        auto expected = evaluate_operand(context, expected_expr);
        EvaluatedOperand pattern;
        if (!pattern_expr.is_null()) {
            pattern = evaluate_operand(context, pattern_expr);
        }

        if (op == "file_exists" && expected_expr.is_null()) {
            expected.value = true;
            expected.error.reset();
        }

        AssertionResult r;
        if (actual.error) {
            r = make_result(op, nullptr, expected.value, false);
            r.error = actual.error;
        } else if (expected.error) {
            r = make_result(op, actual.value, nullptr, false);
            r.error = expected.error;
        } else if (pattern.error) {
            r = make_result(op, actual.value, pattern.value, false);
            r.error = pattern.error;
        } else {
            r = apply_op(op, actual.value, expected.value, pattern.value, a);
        }

        if (message.is_string() && !message.get_ref<const std::string&>().empty()) {
            r.message = message.get<std::string>();
        }
        results.push_back(std::move(r));
    }
    return results;
}

nlohmann::json assertion_to_json(const AssertionResult& result) {
    nlohmann::json j = {
        {"op", result.op},
        {"actual", result.actual},
        {"expected", result.expected},
        {"pass", result.pass},
        {"error", result.error ? nlohmann::json(*result.error) : nlohmann::json()},
        {"details", result.details.is_object() ? result.details : nlohmann::json::object()},
    };
    if (result.message) {
        j["message"] = *result.message;
    }
    return j;
}

} // namespace cdd

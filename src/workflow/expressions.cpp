#include "workflow/expressions.hpp"

namespace warden::workflow {

namespace {

bool is_compound(const std::string& term) {
    if (term.find("&&") == std::string::npos && term.find("||") == std::string::npos) {
        return false;
    }
    // Already wrapped as a single group
    if (term.front() == '(' && term.back() == ')') {
        int depth = 0;
        for (size_t i = 0; i < term.size(); ++i) {
            if (term[i] == '(') depth++;
            else if (term[i] == ')') depth--;
            if (depth == 0 && i + 1 < term.size()) return true;
        }
        return false;
    }
    return true;
}

std::string join(const std::vector<std::string>& terms, const char* op) {
    std::vector<std::string> kept;
    for (const auto& term : terms) {
        if (!term.empty()) kept.push_back(term);
    }
    if (kept.size() == 1) {
        return kept.front();
    }

    std::string result;
    for (const auto& term : kept) {
        if (!result.empty()) result += op;
        result += is_compound(term) ? "(" + term + ")" : term;
    }
    return result;
}

} // anonymous namespace

std::string expr_and(const std::vector<std::string>& terms) {
    return join(terms, " && ");
}

std::string expr_or(const std::vector<std::string>& terms) {
    return join(terms, " || ");
}

std::string wrap_expression(const std::string& expr) {
    return "${{ " + expr + " }}";
}

std::string unwrap_expression(const std::string& expr) {
    if (expr.size() >= 5 && expr.compare(0, 3, "${{") == 0 &&
        expr.compare(expr.size() - 2, 2, "}}") == 0) {
        std::string inner = expr.substr(3, expr.size() - 5);
        size_t start = inner.find_first_not_of(' ');
        size_t end = inner.find_last_not_of(' ');
        if (start == std::string::npos) return "";
        return inner.substr(start, end - start + 1);
    }
    return expr;
}

std::string safe_output_type_condition(const std::string& main_job, const std::string& output_type) {
    return expr_and({
        "!cancelled()",
        "needs." + main_job + ".result != 'skipped'",
        "contains(" + needs_output(main_job, "output_types") + ", '" + output_type + "')",
    });
}

std::string needs_output(const std::string& job, const std::string& key) {
    return "needs." + job + ".outputs." + key;
}

std::string step_output(const std::string& step_id, const std::string& key) {
    return "steps." + step_id + ".outputs." + key;
}

} // namespace warden::workflow

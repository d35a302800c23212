#include <monolith/condition.hpp>
#include <monolith/resolver.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace monolith {

const char* compare_op_text(CompareOp op) {
    switch (op) {
    case CompareOp::Eq: return "==";
    case CompareOp::Ne: return "!=";
    case CompareOp::Ge: return ">=";
    case CompareOp::Le: return "<=";
    case CompareOp::Gt: return ">";
    case CompareOp::Lt: return "<";
    }
    return "?";
}

std::optional<Comparison> Comparison::split(const std::string& expr) {
    static const std::array<CompareOp, 6> kPriority = {
        CompareOp::Eq, CompareOp::Ne, CompareOp::Ge,
        CompareOp::Le, CompareOp::Gt, CompareOp::Lt,
    };

    for (CompareOp op : kPriority) {
        std::string text = compare_op_text(op);
        auto at = expr.find(text);
        if (at == std::string::npos) continue;
        return Comparison{
            trim(expr.substr(0, at)),
            op,
            trim(expr.substr(at + text.size())),
        };
    }
    return std::nullopt;
}

static bool is_quoted(const std::string& s) {
    return s.size() >= 2 && (s.front() == '"' || s.front() == '\'') &&
           s.back() == s.front();
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Value comparison_operand(const std::string& operand, const Value& scope) {
    std::string text = trim(operand);
    if (is_quoted(text)) {
        return Value::string(strip_quotes(text));
    }
    auto r = resolve(text, scope);
    if (r.absent()) {
        return Value::string(text);
    }
    return std::move(r.value);
}

bool compare_values(const Value& left, CompareOp op, const Value& right) {
    auto ln = left.as_number();
    auto rn = right.as_number();
    if (ln && rn) {
        double a = *ln, b = *rn;
        switch (op) {
        case CompareOp::Eq: return a == b;
        case CompareOp::Ne: return a != b;
        case CompareOp::Ge: return a >= b;
        case CompareOp::Le: return a <= b;
        case CompareOp::Gt: return a > b;
        case CompareOp::Lt: return a < b;
        }
        return false;
    }

    std::string a = lower(left.to_display());
    std::string b = lower(strip_quotes(right.to_display()));
    switch (op) {
    case CompareOp::Eq: return a == b;
    case CompareOp::Ne: return a != b;
    default:            return false;
    }
}

bool evaluate_condition(const std::string& expr, const Value& scope) {
    std::string cond = trim(expr);
    std::string lc = lower(cond);
    if (lc == "true") return true;
    if (lc == "false") return false;

    if (auto cmp = Comparison::split(cond)) {
        Value left = comparison_operand(cmp->left, scope);
        Value right = comparison_operand(cmp->right, scope);
        return compare_values(left, cmp->op, right);
    }

    auto r = resolve(cond, scope);
    return !r.absent() && r.value.truthy();
}

} // namespace monolith

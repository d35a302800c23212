#pragma once

#include <monolith/value.hpp>
#include <optional>
#include <string>

namespace monolith {

enum class CompareOp { Eq, Ne, Ge, Le, Gt, Lt };

const char* compare_op_text(CompareOp op);

// A condition split at its first comparison operator. Operators are scanned
// in the order ==, !=, >=, <=, >, < so that ">=" wins over ">".
struct Comparison {
    std::string left;
    CompareOp op;
    std::string right;

    static std::optional<Comparison> split(const std::string& expr);
};

// Value of one side of a comparison: quoted text is a literal, otherwise the
// operand is resolved as a path and falls back to its own text.
Value comparison_operand(const std::string& operand, const Value& scope);

// Numeric when both sides coerce to numbers; otherwise a case-insensitive
// string match that only defines == and !=.
bool compare_values(const Value& left, CompareOp op, const Value& right);

// Evaluate an if/elseif condition against a scope
bool evaluate_condition(const std::string& expr, const Value& scope);

} // namespace monolith

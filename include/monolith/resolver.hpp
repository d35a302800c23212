#pragma once

#include <monolith/value.hpp>
#include <optional>
#include <string>
#include <vector>

namespace monolith {

// A variable expression split into its path and optional default filter:
//   "education.2.institute | default:'N/A'"
struct PathExpr {
    std::vector<std::string> segments;
    std::optional<std::string> fallback;

    static PathExpr parse(const std::string& expr);
};

// Outcome of walking a path through a scope. Each consumer decides what
// Absent means: empty text for substitution, false for conditions, no
// iterations for loops.
struct Resolution {
    enum State { Found, Defaulted, Absent };

    State state = Absent;
    Value value;

    bool found() const { return state == Found; }
    bool absent() const { return state == Absent; }
};

// Walk `path` through `scope`. Sequences take all-digit segments as
// zero-based indices; mappings take present keys; anything else fails.
// Failures never throw.
const Value* lookup(const Value& scope, const std::vector<std::string>& segments);

Resolution resolve(const PathExpr& expr, const Value& scope);
Resolution resolve(const std::string& expr, const Value& scope);

// Rendered text of a {{ ... }} directive body
std::string substitute(const std::string& expr, const Value& scope);

// String helpers shared by the template engine
std::string trim(const std::string& s);
std::string strip_quotes(const std::string& s);
bool is_all_digits(const std::string& s);

} // namespace monolith

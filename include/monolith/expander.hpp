#pragma once

#include <monolith/tmpl/ast.hpp>
#include <monolith/value.hpp>
#include <string>

namespace monolith {

// Conditional pass: every If node is replaced by the body of its first true
// branch (or its else branch, or nothing). Nested groups are reduced before
// the enclosing one is selected. Conditionals inside loop bodies are reduced
// here too, against the same scope, since this pass runs before loops.
NodeList expand_conditionals(const NodeList& nodes, const Value& scope);

// Loop pass: every For node becomes the concatenated text of its iterations.
// Each iteration renders the body against a fresh scope holding only the
// loop variable; nothing from `scope` is visible inside the body.
NodeList expand_loops(const NodeList& nodes, const Value& scope);

// Final pass: Text is copied, Variable nodes are resolved against `scope`.
// Any remaining group nodes are rendered by the two passes above first.
std::string substitute_variables(const NodeList& nodes, const Value& scope);

// Fresh iteration scope: { var: element }
Value loop_scope(const std::string& var, const Value& element);

// Elements a loop visits: absent -> none, sequence -> its items,
// anything else -> that single value
Value::ArrayT loop_items(const std::string& path, const Value& scope);

} // namespace monolith

#pragma once

#include <monolith/tmpl/ast.hpp>
#include <monolith/tmpl/lexer.hpp>
#include <string>

namespace monolith {

// Build the node tree from lexed tokens. An opening tag pairs with the first
// later closing tag carrying the same block id inside the enclosing body;
// elseif/else tags split an if body only when their id matches. Tags that
// pair with nothing stay in the tree as literal text and are listed in
// Template::unmatched. Parsing never fails.
Template parse_template(const std::vector<TemplateToken>& tokens);

// lex_template + parse_template
Template parse_template(const std::string& source,
                        const std::string& filename = "<input>");

} // namespace monolith

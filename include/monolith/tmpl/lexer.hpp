#pragma once

#include <monolith/tmpl/token.hpp>
#include <string>
#include <vector>

namespace monolith {

// Split template text into literal text, {{ variables }} and {%N ... %}
// block tags. Anything that does not form a well-shaped directive is kept as
// literal text, so lexing never fails.
std::vector<TemplateToken> lex_template(const std::string& source,
                                        const std::string& filename = "<input>");

} // namespace monolith

#pragma once

#include <string>
#include <vector>

namespace monolith {

// Source position for diagnostics
struct SourcePos {
    std::string file;
    int line = 1;
    int col = 1;
};

enum class TemplateTokenType {
    Text,      // literal text, including tags that did not lex as directives
    Variable,  // {{ expr }}
    If,        // {%N if cond %}
    Elseif,    // {%N elseif cond %}
    Else,      // {%N else %}
    Endif,     // {%N endif %}
    For,       // {%N for var in path %}
    Endfor     // {%N endfor %}
};

struct TemplateToken {
    TemplateTokenType type = TemplateTokenType::Text;
    std::string text;      // exact source text of the token
    std::string block_id;  // digits after "{%", compared textually
    std::string expr;      // condition, variable expression or loop path
    std::string var;       // loop variable
    SourcePos pos;
};

const char* template_token_name(TemplateTokenType t);

} // namespace monolith

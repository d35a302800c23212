#pragma once

#include <monolith/tmpl/token.hpp>
#include <optional>
#include <string>
#include <vector>

namespace monolith {

struct Node;
using NodeList = std::vector<Node>;

// One arm of a conditional group; `condition` is empty for the else arm
struct Branch {
    std::optional<std::string> condition;
    NodeList body;
};

struct Node {
    enum Kind { Text, Variable, If, For };

    Kind kind = Text;
    std::string text;      // Text: literal content
    std::string expr;      // Variable: expression; For: iterable path
    std::string var;       // For: loop variable
    std::string block_id;  // If/For: pairing id
    std::vector<Branch> branches;  // If
    NodeList body;                 // For
    SourcePos pos;

    static Node make_text(std::string t);
    static Node make_variable(std::string e, SourcePos p = {});
};

// A tag that found no partner and was kept as literal text
struct UnmatchedTag {
    std::string text;
    SourcePos pos;
};

struct Template {
    NodeList nodes;
    std::vector<UnmatchedTag> unmatched;
};

} // namespace monolith

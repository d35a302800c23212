#include <monolith/tmpl/parser.hpp>
#include <monolith/log.hpp>

namespace monolith {

Node Node::make_text(std::string t) {
    Node n;
    n.kind = Text;
    n.text = std::move(t);
    return n;
}

Node Node::make_variable(std::string e, SourcePos p) {
    Node n;
    n.kind = Variable;
    n.expr = std::move(e);
    n.pos = std::move(p);
    return n;
}

namespace {

using TT = TemplateTokenType;

constexpr size_t kNoClose = static_cast<size_t>(-1);

// ---------------------------------------------------------------------------
// Parser state machine
// ---------------------------------------------------------------------------

struct Parser {
    const std::vector<TemplateToken>& tokens;
    Template result;

    explicit Parser(const std::vector<TemplateToken>& toks) : tokens(toks) {}

    // Token in (open, hi) closing the group opened at `open`. A nested
    // opener of the same kind and id claims the next closer first; when the
    // openers outnumber the closers the first closer wins.
    size_t find_close(size_t open, size_t hi, TT close_type) const {
        const auto& head = tokens[open];
        size_t first = kNoClose;
        int depth = 1;
        for (size_t j = open + 1; j < hi; ++j) {
            if (tokens[j].block_id != head.block_id) continue;
            if (tokens[j].type == head.type) {
                ++depth;
            } else if (tokens[j].type == close_type) {
                if (first == kNoClose) first = j;
                if (--depth == 0) return j;
            }
        }
        return first;
    }

    static TT closer_of(TT open_type) {
        return open_type == TT::If ? TT::Endif : TT::Endfor;
    }

    void append_text(NodeList& out, const std::string& text) {
        if (!out.empty() && out.back().kind == Node::Text) {
            out.back().text += text;
        } else {
            out.push_back(Node::make_text(text));
        }
    }

    void keep_literal(NodeList& out, const TemplateToken& tok) {
        log::trace("%s:%d:%d: unmatched %s tag kept as text: %s",
                   tok.pos.file.c_str(), tok.pos.line, tok.pos.col,
                   template_token_name(tok.type), tok.text.c_str());
        append_text(out, tok.text);
        result.unmatched.push_back({tok.text, tok.pos});
    }

    // -- Ranges -------------------------------------------------------------

    void parse_range(size_t lo, size_t hi, NodeList& out) {
        size_t i = lo;
        while (i < hi) {
            const auto& tok = tokens[i];
            switch (tok.type) {
            case TT::Text:
                append_text(out, tok.text);
                ++i;
                break;
            case TT::Variable:
                out.push_back(Node::make_variable(tok.expr, tok.pos));
                ++i;
                break;
            case TT::If:
            case TT::For: {
                size_t close = find_close(i, hi, closer_of(tok.type));
                if (close == kNoClose) {
                    keep_literal(out, tok);
                    ++i;
                    break;
                }
                if (tok.type == TT::If) {
                    out.push_back(parse_if(i, close));
                } else {
                    out.push_back(parse_for(i, close));
                }
                i = close + 1;
                break;
            }
            default:
                // elseif/else/endif/endfor outside their group
                keep_literal(out, tok);
                ++i;
                break;
            }
        }
    }

    // -- Groups -------------------------------------------------------------

    Node parse_if(size_t open, size_t close) {
        const auto& head = tokens[open];
        Node node;
        node.kind = Node::If;
        node.block_id = head.block_id;
        node.pos = head.pos;

        Branch current;
        current.condition = head.expr;
        size_t seg_start = open + 1;

        size_t i = open + 1;
        while (i < close) {
            const auto& tok = tokens[i];
            if ((tok.type == TT::Elseif || tok.type == TT::Else) &&
                tok.block_id == head.block_id) {
                parse_range(seg_start, i, current.body);
                node.branches.push_back(std::move(current));

                current = Branch{};
                if (tok.type == TT::Elseif) current.condition = tok.expr;
                seg_start = i + 1;
                ++i;
                continue;
            }
            // Branch tags inside a nested group belong to that group
            if (tok.type == TT::If || tok.type == TT::For) {
                size_t nested = find_close(i, close, closer_of(tok.type));
                if (nested != kNoClose) {
                    i = nested + 1;
                    continue;
                }
            }
            ++i;
        }

        parse_range(seg_start, close, current.body);
        node.branches.push_back(std::move(current));
        return node;
    }

    Node parse_for(size_t open, size_t close) {
        const auto& head = tokens[open];
        Node node;
        node.kind = Node::For;
        node.block_id = head.block_id;
        node.var = head.var;
        node.expr = head.expr;
        node.pos = head.pos;
        parse_range(open + 1, close, node.body);
        return node;
    }
};

} // namespace

Template parse_template(const std::vector<TemplateToken>& tokens) {
    Parser parser(tokens);
    parser.parse_range(0, tokens.size(), parser.result.nodes);
    return std::move(parser.result);
}

Template parse_template(const std::string& source, const std::string& filename) {
    return parse_template(lex_template(source, filename));
}

} // namespace monolith

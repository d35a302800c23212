#include <monolith/tmpl/lexer.hpp>
#include <monolith/resolver.hpp>
#include <cctype>

namespace monolith {

const char* template_token_name(TemplateTokenType t) {
    switch (t) {
    case TemplateTokenType::Text:     return "Text";
    case TemplateTokenType::Variable: return "Variable";
    case TemplateTokenType::If:       return "If";
    case TemplateTokenType::Elseif:   return "Elseif";
    case TemplateTokenType::Else:     return "Else";
    case TemplateTokenType::Endif:    return "Endif";
    case TemplateTokenType::For:      return "For";
    case TemplateTokenType::Endfor:   return "Endfor";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Lexer state machine
// ---------------------------------------------------------------------------

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_word(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Cursor over the inside of a {% ... %} tag
struct TagCursor {
    const std::string& s;
    size_t i = 0;

    explicit TagCursor(const std::string& str) : s(str) {}

    bool at_end() const { return i >= s.size(); }

    // Consume one or more whitespace characters
    bool spaces() {
        size_t start = i;
        while (i < s.size() && is_space(s[i])) ++i;
        return i > start;
    }

    void opt_spaces() {
        while (i < s.size() && is_space(s[i])) ++i;
    }

    std::string word() {
        size_t start = i;
        while (i < s.size() && is_word(s[i])) ++i;
        return s.substr(start, i - start);
    }

    // Loop paths: [\w|.]+
    std::string path() {
        size_t start = i;
        while (i < s.size() && (is_word(s[i]) || s[i] == '.' || s[i] == '|')) ++i;
        return s.substr(start, i - start);
    }

    std::string rest() const {
        return i < s.size() ? s.substr(i) : std::string();
    }
};

struct Lexer {
    const std::string& source;
    const std::string& filename;
    size_t pos;
    int line;
    int col;

    std::vector<TemplateToken> tokens;
    std::string pending;
    SourcePos pending_pos;

    Lexer(const std::string& src, const std::string& fname)
        : source(src), filename(fname), pos(0), line(1), col(1) {}

    bool at_end() const { return pos >= source.size(); }

    bool starts_with(const char* lit) const {
        return source.compare(pos, 2, lit) == 0;
    }

    SourcePos here() const {
        return SourcePos{filename, line, col};
    }

    void advance_to(size_t target) {
        while (pos < target) {
            if (source[pos] == '\n') {
                ++line;
                col = 1;
            } else {
                ++col;
            }
            ++pos;
        }
    }

    void take_text_char() {
        if (pending.empty()) pending_pos = here();
        pending += source[pos];
        advance_to(pos + 1);
    }

    void flush_text() {
        if (pending.empty()) return;
        TemplateToken tok;
        tok.type = TemplateTokenType::Text;
        tok.text = std::move(pending);
        tok.pos = pending_pos;
        tokens.push_back(std::move(tok));
        pending.clear();
    }

    void emit(TemplateToken tok, size_t end) {
        flush_text();
        tok.text = source.substr(pos, end - pos);
        tok.pos = here();
        tokens.push_back(std::move(tok));
        advance_to(end);
    }

    // {{ expr }} must close on the line it opens
    bool try_variable() {
        size_t close = source.find("}}", pos + 2);
        if (close == std::string::npos) return false;

        std::string expr = trim(source.substr(pos + 2, close - pos - 2));
        if (expr.find('\n') != std::string::npos) return false;

        TemplateToken tok;
        tok.type = TemplateTokenType::Variable;
        tok.expr = std::move(expr);
        emit(std::move(tok), close + 2);
        return true;
    }

    // {%N keyword ... %}
    bool try_tag() {
        size_t p = pos + 2;
        size_t id_start = p;
        while (p < source.size() && std::isdigit(static_cast<unsigned char>(source[p]))) ++p;
        if (p == id_start) return false;

        size_t close = source.find("%}", p);
        if (close == std::string::npos) return false;

        TemplateToken tok;
        tok.block_id = source.substr(id_start, p - id_start);

        std::string inner = source.substr(p, close - p);
        TagCursor cur(inner);
        if (!cur.spaces()) return false;
        std::string kw = cur.word();

        if (kw == "if" || kw == "elseif") {
            // The condition must be separated from the keyword
            if (!cur.spaces()) return false;
            tok.type = kw == "if" ? TemplateTokenType::If : TemplateTokenType::Elseif;
            tok.expr = trim(cur.rest());
        } else if (kw == "else" || kw == "endif" || kw == "endfor") {
            cur.opt_spaces();
            if (!cur.at_end()) return false;
            tok.type = kw == "else"  ? TemplateTokenType::Else
                     : kw == "endif" ? TemplateTokenType::Endif
                                     : TemplateTokenType::Endfor;
        } else if (kw == "for") {
            if (!cur.spaces()) return false;
            tok.var = cur.word();
            if (tok.var.empty()) return false;
            if (!cur.spaces()) return false;
            if (cur.word() != "in") return false;
            if (!cur.spaces()) return false;
            tok.expr = cur.path();
            if (tok.expr.empty()) return false;
            cur.opt_spaces();
            if (!cur.at_end()) return false;
            tok.type = TemplateTokenType::For;
        } else {
            return false;
        }

        emit(std::move(tok), close + 2);
        return true;
    }

    void run() {
        while (!at_end()) {
            if (starts_with("{{") && try_variable()) continue;
            if (starts_with("{%") && try_tag()) continue;
            take_text_char();
        }
        flush_text();
    }
};

} // namespace

std::vector<TemplateToken> lex_template(const std::string& source,
                                        const std::string& filename) {
    Lexer lexer(source, filename);
    lexer.run();
    return std::move(lexer.tokens);
}

} // namespace monolith

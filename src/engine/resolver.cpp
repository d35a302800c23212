#include <monolith/resolver.hpp>
#include <cctype>

namespace monolith {

// ---------------------------------------------------------------------------
// String helpers
// ---------------------------------------------------------------------------

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string strip_quotes(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == '"' || s[b] == '\'')) ++b;
    while (e > b && (s[e - 1] == '"' || s[e - 1] == '\'')) --e;
    return s.substr(b, e - b);
}

bool is_all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// PathExpr
// ---------------------------------------------------------------------------

PathExpr PathExpr::parse(const std::string& expr) {
    PathExpr pe;

    std::string path = expr;
    auto bar = expr.find('|');
    if (bar != std::string::npos) {
        path = expr.substr(0, bar);

        // Only the first filter clause is considered
        std::string clause = expr.substr(bar + 1);
        auto next = clause.find('|');
        if (next != std::string::npos) clause = clause.substr(0, next);

        static const std::string kDefault = "default:";
        auto at = clause.find(kDefault);
        if (at != std::string::npos) {
            pe.fallback = strip_quotes(trim(clause.substr(at + kDefault.size())));
        }
    }

    path = trim(path);
    size_t start = 0;
    while (true) {
        auto dot = path.find('.', start);
        if (dot == std::string::npos) {
            pe.segments.push_back(trim(path.substr(start)));
            break;
        }
        pe.segments.push_back(trim(path.substr(start, dot - start)));
        start = dot + 1;
    }

    return pe;
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

const Value* lookup(const Value& scope, const std::vector<std::string>& segments) {
    const Value* current = &scope;
    for (const auto& seg : segments) {
        if (current->is_array() && is_all_digits(seg)) {
            // Oversized indices are simply out of range
            if (seg.size() > 18) return nullptr;
            current = current->at(static_cast<size_t>(std::stoull(seg)));
        } else if (current->is_object()) {
            current = current->find(seg);
        } else {
            return nullptr;
        }
        if (!current) return nullptr;
    }
    return current;
}

Resolution resolve(const PathExpr& expr, const Value& scope) {
    Resolution r;
    if (const Value* v = lookup(scope, expr.segments)) {
        r.state = Resolution::Found;
        r.value = *v;
    } else if (expr.fallback.has_value()) {
        r.state = Resolution::Defaulted;
        r.value = Value::string(expr.fallback.value());
    }
    return r;
}

Resolution resolve(const std::string& expr, const Value& scope) {
    return resolve(PathExpr::parse(expr), scope);
}

std::string substitute(const std::string& expr, const Value& scope) {
    auto r = resolve(expr, scope);
    if (r.absent()) return "";
    return r.value.to_display();
}

} // namespace monolith

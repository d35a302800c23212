#include <monolith/include.hpp>
#include <monolith/log.hpp>
#include <cctype>
#include <map>

namespace monolith {

static size_t skip_ws(const std::string& s, size_t i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    return i;
}

// Match {% include "name" %} at `start`; returns the end offset or 0
static size_t match_include(const std::string& s, size_t start, std::string& name) {
    static const std::string kKeyword = "include";

    size_t i = skip_ws(s, start + 2);
    if (s.compare(i, kKeyword.size(), kKeyword) != 0) return 0;
    i = skip_ws(s, i + kKeyword.size());
    if (i >= s.size() || s[i] != '"') return 0;

    size_t name_start = ++i;
    while (i < s.size() && s[i] != '"' && s[i] != '\n') ++i;
    if (i >= s.size() || s[i] != '"') return 0;
    name = s.substr(name_start, i - name_start);

    i = skip_ws(s, i + 1);
    if (s.compare(i, 2, "%}") != 0) return 0;
    return i + 2;
}

std::vector<IncludeDirective> find_includes(const std::string& text) {
    std::vector<IncludeDirective> found;
    size_t pos = 0;
    while ((pos = text.find("{%", pos)) != std::string::npos) {
        std::string name;
        size_t end = match_include(text, pos, name);
        if (end == 0) {
            pos += 2;
            continue;
        }
        found.push_back({text.substr(pos, end - pos), std::move(name), pos});
        pos = end;
    }
    return found;
}

std::string expand_includes(const std::string& text, const PartialReader& read_partial) {
    auto directives = find_includes(text);
    if (directives.empty()) return text;

    // Each distinct partial is read once per call
    std::map<std::string, std::optional<std::string>> partials;
    for (const auto& d : directives) {
        if (partials.count(d.name)) continue;
        auto content = read_partial(d.name);
        if (content.has_value()) {
            log::debug("include \"%s\": %zu byte(s)", d.name.c_str(), content->size());
        } else {
            log::debug("include \"%s\": partial not found, directive kept", d.name.c_str());
        }
        partials.emplace(d.name, std::move(content));
    }

    std::string out;
    out.reserve(text.size());
    size_t last = 0;
    for (const auto& d : directives) {
        const auto& content = partials.at(d.name);
        if (!content.has_value()) continue;
        out.append(text, last, d.offset - last);
        out += content.value();
        last = d.offset + d.text.size();
    }
    out.append(text, last, std::string::npos);
    return out;
}

} // namespace monolith

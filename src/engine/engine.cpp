#include <monolith/engine.hpp>
#include <monolith/expander.hpp>
#include <monolith/include.hpp>
#include <monolith/log.hpp>
#include <monolith/tmpl/parser.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace monolith {

namespace fs = std::filesystem;

Engine::Engine(fs::path template_dir)
    : template_dir_(std::move(template_dir)) {}

Result<std::string> Engine::read_template(const std::string& name) const {
    fs::path path = template_dir_ / name;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return MonolithError{MonolithError::IO,
            "cannot read template '" + name + "': file not found",
            "templates are looked up under '" + template_dir_.string() + "'",
            path.string(), 0};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return MonolithError{MonolithError::IO,
            "cannot read template '" + name + "': " + std::strerror(errno),
            "check file permissions", path.string(), 0};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    log::debug("loaded template %s", path.string().c_str());
    return Result<std::string>::ok(ss.str());
}

std::optional<std::string> Engine::read_partial(const std::string& name) const {
    fs::path path = template_dir_ / name;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string Engine::render_string(const std::string& source,
                                  const Value& context,
                                  const std::string& filename) const {
    std::string text = expand_includes(source,
        [this](const std::string& name) { return read_partial(name); });

    Template tmpl = parse_template(text, filename);
    if (!tmpl.unmatched.empty()) {
        log::debug("%s: %zu unmatched tag(s) left verbatim",
                   filename.c_str(), tmpl.unmatched.size());
    }

    NodeList nodes = expand_conditionals(tmpl.nodes, context);
    nodes = expand_loops(nodes, context);
    return substitute_variables(nodes, context);
}

Result<std::string> Engine::render(const std::string& template_name,
                                   const Value& context) const {
    return read_template(template_name).map([&](std::string& source) {
        return render_string(source, context, template_name);
    });
}

} // namespace monolith

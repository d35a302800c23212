#include <monolith/config.hpp>
#include <monolith/log.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace monolith {

template<typename T>
static std::string stream_text(const T& v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

static Value from_toml(const toml::node& node) {
    if (auto tbl = node.as_table()) {
        Value::ObjectT members;
        for (const auto& [key, val] : *tbl) {
            members.emplace(std::string(key), from_toml(val));
        }
        return Value::object(std::move(members));
    }
    if (auto arr = node.as_array()) {
        Value::ArrayT items;
        items.reserve(arr->size());
        for (const auto& elem : *arr) {
            items.push_back(from_toml(elem));
        }
        return Value::array(std::move(items));
    }
    if (auto s = node.as_string())         return Value::string(s->get());
    if (auto i = node.as_integer())        return Value::integer(i->get());
    if (auto f = node.as_floating_point()) return Value::number(f->get());
    if (auto b = node.as_boolean())        return Value::boolean(b->get());
    if (auto d = node.as_date())           return Value::string(stream_text(d->get()));
    if (auto t = node.as_time())           return Value::string(stream_text(t->get()));
    if (auto dt = node.as_date_time())     return Value::string(stream_text(dt->get()));
    return Value::null();
}

Result<Value> parse_context(const std::string& toml_str, const std::string& source_name) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source_name);
    } catch (const toml::parse_error& e) {
        return MonolithError{MonolithError::Parse,
            std::string("content TOML parse error: ") + std::string(e.description()),
            "", source_name, static_cast<int>(e.source().begin.line)};
    }
    return Result<Value>::ok(from_toml(doc));
}

// Optional string setting; absent keys keep the default
static Status read_setting(const Value& ctx, const char* key, std::string& out,
                           const std::string& source_name) {
    const Value* v = ctx.find(key);
    if (!v) return ok_status();
    if (v->kind() != Value::String) {
        return MonolithError{MonolithError::Config,
            std::string("'") + key + "' must be a string, got " +
                Value::kind_name(v->kind()),
            "", source_name, 0};
    }
    out = v->as_string();
    return ok_status();
}

Result<SiteConfig> SiteConfig::parse(const std::string& toml_str,
                                     const std::string& source_name) {
    auto ctx = parse_context(toml_str, source_name);
    MONOLITH_TRY(ctx);

    SiteConfig cfg;
    cfg.context = std::move(ctx).value();

    MONOLITH_TRY(read_setting(cfg.context, "outpath", cfg.outpath, source_name));
    MONOLITH_TRY(read_setting(cfg.context, "render", cfg.render, source_name));
    MONOLITH_TRY(read_setting(cfg.context, "template_path", cfg.template_path, source_name));
    MONOLITH_TRY(read_setting(cfg.context, "template", cfg.template_name, source_name));

    return Result<SiteConfig>::ok(std::move(cfg));
}

Result<SiteConfig> SiteConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return MonolithError{MonolithError::IO,
            "cannot open content file: " + path,
            "pass the name of a .toml file under the content directory"};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    log::debug("loaded content file %s", path.c_str());
    return SiteConfig::parse(ss.str(), path);
}

} // namespace monolith

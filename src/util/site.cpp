#include <monolith/site.hpp>
#include <monolith/engine.hpp>
#include <monolith/log.hpp>
#include <fstream>

namespace monolith {

namespace fs = std::filesystem;

Status ensure_directory(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return MonolithError{MonolithError::IO,
            "could not create directory '" + path.string() + "': " + ec.message()};
    }
    return ok_status();
}

Status write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return MonolithError{MonolithError::IO,
            "could not write to file '" + path.string() + "'",
            "check that the output directory is writable"};
    }
    out << content;
    out.close();
    if (!out) {
        return MonolithError{MonolithError::IO,
            "write failed for '" + path.string() + "'"};
    }
    return ok_status();
}

Result<fs::path> generate_site(const SiteConfig& cfg) {
    fs::path output_dir(cfg.outpath);
    MONOLITH_TRY(ensure_directory(output_dir));

    Engine engine(cfg.template_path);
    auto rendered = engine.render(cfg.template_name, cfg.context);
    MONOLITH_TRY(rendered);

    fs::path output_path = output_dir / cfg.render;
    MONOLITH_TRY(write_file(output_path, rendered.value()));

    log::debug("rendered %s -> %s (%zu bytes)", cfg.template_name.c_str(),
               output_path.string().c_str(), rendered.value().size());
    return Result<fs::path>::ok(output_path);
}

Result<fs::path> generate_site(const std::string& config_name,
                               const std::string& content_dir) {
    fs::path config_path = fs::path(content_dir) / config_name;
    return SiteConfig::load(config_path.string())
        .and_then([](SiteConfig& cfg) { return generate_site(cfg); });
}

} // namespace monolith

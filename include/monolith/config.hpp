#pragma once

#include <monolith/result.hpp>
#include <monolith/value.hpp>
#include <string>

namespace monolith {

// Convert a TOML document into a context tree. Tables become objects,
// arrays become arrays, dates and times become their ISO text.
Result<Value> parse_context(const std::string& toml_str,
                            const std::string& source_name = "<string>");

// A content file is both the render context and the site settings:
//
//   template_path = "templates"   # directory holding templates and partials
//   template = "base.html"        # template rendered
//   outpath = "output"            # directory the result is written to
//   render = "render.html"        # file name of the result
//
// Every other key is data for the template.
struct SiteConfig {
    Value context;
    std::string outpath = "output";
    std::string render = "render.html";
    std::string template_path = "templates";
    std::string template_name = "base.html";

    // Load from a TOML content file
    static Result<SiteConfig> load(const std::string& path);

    // Parse from TOML string
    static Result<SiteConfig> parse(const std::string& toml_str,
                                    const std::string& source_name = "<string>");
};

} // namespace monolith

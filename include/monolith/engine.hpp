#pragma once

#include <monolith/result.hpp>
#include <monolith/value.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace monolith {

// Renders templates found under a template directory.
//
// The pipeline is fixed: includes, then conditionals, then loops, then
// variable substitution, each against the caller's context. The engine holds
// no state beyond its directory, so one instance may serve several threads.
class Engine {
public:
    explicit Engine(std::filesystem::path template_dir = ".");

    // Read `template_name` and render it. Fails only when the template
    // cannot be read; every other anomaly degrades to empty values or
    // literal markup in the output.
    Result<std::string> render(const std::string& template_name,
                               const Value& context) const;

    // Render in-memory template text. Partials still come from the
    // template directory.
    std::string render_string(const std::string& source,
                              const Value& context,
                              const std::string& filename = "<string>") const;

    Result<std::string> read_template(const std::string& name) const;

    // nullopt when the partial does not exist or cannot be read
    std::optional<std::string> read_partial(const std::string& name) const;

    const std::filesystem::path& template_dir() const { return template_dir_; }

private:
    std::filesystem::path template_dir_;
};

} // namespace monolith

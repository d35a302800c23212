#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace monolith {

// An {% include "name" %} occurrence in raw template text
struct IncludeDirective {
    std::string text;  // exact directive text as written
    std::string name;  // partial file name between the quotes
    size_t offset = 0;
};

using PartialReader = std::function<std::optional<std::string>(const std::string& name)>;

// All include directives in source order
std::vector<IncludeDirective> find_includes(const std::string& text);

// Replace each include directive with the partial's contents. Partials the
// reader cannot supply leave their directive untouched. Inserted contents
// are not scanned for further includes.
std::string expand_includes(const std::string& text, const PartialReader& read_partial);

} // namespace monolith

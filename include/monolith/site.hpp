#pragma once

#include <monolith/config.hpp>
#include <monolith/result.hpp>
#include <filesystem>
#include <string>

namespace monolith {

// Load <content_dir>/<config_name>, render its template with the whole
// content as context, and write <outpath>/<render>. Returns the written path.
Result<std::filesystem::path> generate_site(const std::string& config_name,
                                            const std::string& content_dir = "content");

// Render an already-loaded config and write the result
Result<std::filesystem::path> generate_site(const SiteConfig& cfg);

// Create `path` (and parents) if missing
Status ensure_directory(const std::filesystem::path& path);

// Write `content` to `path`, replacing any existing file
Status write_file(const std::filesystem::path& path, const std::string& content);

} // namespace monolith

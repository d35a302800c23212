// monolith: render a site page from a TOML content file.
//
//     monolith                  # renders content/content.toml
//     monolith about.toml       # renders content/about.toml
//     monolith -v about.toml    # with debug logging
//
// The content file names the template, template directory and output
// location; see include/monolith/config.hpp.

#include <monolith/log.hpp>
#include <monolith/site.hpp>

#include <cstdio>
#include <cstring>
#include <string>

using namespace monolith;

static void print_usage() {
    std::fprintf(stderr,
        "usage: monolith [-v|--verbose] [-q|--quiet] [config-file]\n"
        "\n"
        "  config-file   TOML content file under ./content (default: content.toml)\n"
        "  -v, --verbose enable debug logging\n"
        "  -q, --quiet   only report warnings and errors\n"
        "  -h, --help    show this help\n");
}

int main(int argc, char** argv) {
    log::init_from_env();

    std::string config_name = "content.toml";
    bool have_config = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            log::set_level(log::Debug);
        } else if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            log::set_level(log::Warn);
        } else if (arg[0] == '-') {
            MonolithError err{MonolithError::InvalidArg,
                std::string("unknown option: ") + arg,
                "run 'monolith --help' for usage"};
            std::fprintf(stderr, "%s\n", err.format().c_str());
            return 1;
        } else if (have_config) {
            MonolithError err{MonolithError::InvalidArg,
                std::string("unexpected argument: ") + arg,
                "only one content file may be given"};
            std::fprintf(stderr, "%s\n", err.format().c_str());
            return 1;
        } else {
            config_name = arg;
            have_config = true;
        }
    }

    auto result = generate_site(config_name);
    if (result.is_err()) {
        std::fprintf(stderr, "%s\n", result.error().format().c_str());
        log::error("site generation failed");
        return 1;
    }

    log::info("site generated: %s", result.value().string().c_str());
    return 0;
}

#include <catch2/catch.hpp>
#include <monolith/log.hpp>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define dup _dup
#define dup2 _dup2
#define fileno _fileno
#define read _read
#define close _close
#define pipe(fds) _pipe(fds, 4096, 0)
#else
#include <unistd.h>
#endif

using namespace monolith::log;

// Helper: capture stderr output from a callable
static std::string capture_stderr(const std::function<void()>& fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
    REQUIRE(std::string(level_name(Off)) == "off");
}

TEST_CASE("parse_level accepts level names in any case", "[log]") {
    Level lvl = Info;
    REQUIRE(parse_level("DEBUG", lvl));
    REQUIRE(lvl == Debug);
    REQUIRE(parse_level("off", lvl));
    REQUIRE(lvl == Off);
    REQUIRE_FALSE(parse_level("loud", lvl));
    REQUIRE(lvl == Off);
}

TEST_CASE("init_from_env applies MONOLITH_LOG", "[log]") {
    setenv("MONOLITH_LOG", "trace", 1);
    init_from_env();
    REQUIRE(get_level() == Trace);

    setenv("MONOLITH_LOG", "nonsense", 1);
    init_from_env();
    REQUIRE(get_level() == Trace);

    unsetenv("MONOLITH_LOG");
    set_level(Info);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] { info("should not appear"); });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at threshold carry the level prefix", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] { warn("partial %s missing", "nav.html"); });
    REQUIRE(output.find("warn:") != std::string::npos);
    REQUIRE(output.find("partial nav.html missing") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Off silences errors too", "[log]") {
    set_level(Off);
    set_color_enabled(false);

    auto output = capture_stderr([] { error("hidden"); });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled());

    set_color_enabled(false);
    REQUIRE_FALSE(is_color_enabled());
}

#pragma once

#include <string>

namespace monolith {

struct MonolithError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    MonolithError() = default;
    MonolithError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    MonolithError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    MonolithError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace monolith

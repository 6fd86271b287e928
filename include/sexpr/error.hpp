#pragma once

#include <string>

namespace sexpr {

// Hard failures. Recoverable lexing/grouping problems are Diagnostics instead.
struct SexprError {
    enum Code {
        IO,
        Config,
        InvalidInput,
        ConfigMismatch,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    SexprError() = default;
    SexprError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SexprError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SexprError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace sexpr

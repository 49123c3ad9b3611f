#pragma once

#include <string>

namespace pkglint {

struct LintError {
    enum Code {
        IO,
        Parse,
        Config,
        Manifest,
        Dependency,
        Network,
        Compile,
        ProgramId,
        NotFound,
        Cycle,
        InvalidArg
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    LintError() = default;
    LintError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    LintError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    LintError(Code c, std::string msg, std::string h, std::string f, int l = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace pkglint

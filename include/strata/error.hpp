#pragma once

#include <string>

namespace strata {

struct StrataError {
    enum Code {
        IO,
        Parse,
        Manifest,
        Config,
        LockFile,
        Platform,
        Relocated,
        Install,
        Uninstall,
        Checksum,
        NotFound,
        Duplicate,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    StrataError() = default;
    StrataError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    StrataError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    StrataError(Code c, std::string msg, std::string h, std::string f, int l = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Prepend context ("while doing X: ") to the message
    StrataError& context(const std::string& what);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace strata

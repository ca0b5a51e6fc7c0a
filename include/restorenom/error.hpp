#pragma once

#include <string>

namespace restorenom {

struct RestoreError {
    enum Code {
        IO,
        Parse,
        Config,
        Snapshot,
        Contract,
        Duplicate,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    RestoreError() = default;
    RestoreError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    RestoreError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    RestoreError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace restorenom

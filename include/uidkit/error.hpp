#pragma once

#include <string>

namespace uidkit {

struct UidError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        InvalidNamespace
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    UidError() = default;
    UidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    UidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    UidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace uidkit

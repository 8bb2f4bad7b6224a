#include <uidkit/error.hpp>

namespace uidkit {

const char* UidError::code_name(Code c) {
    switch (c) {
        case IO:               return "IO";
        case Parse:            return "Parse";
        case Config:           return "Config";
        case InvalidArg:       return "InvalidArg";
        case InvalidNamespace: return "InvalidNamespace";
    }
    return "Unknown";
}

std::string UidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace uidkit

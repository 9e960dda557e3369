#include <strata/error.hpp>

namespace strata {

const char* StrataError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Manifest:   return "Manifest";
        case Config:     return "Config";
        case LockFile:   return "LockFile";
        case Platform:   return "Platform";
        case Relocated:  return "Relocated";
        case Install:    return "Install";
        case Uninstall:  return "Uninstall";
        case Checksum:   return "Checksum";
        case NotFound:   return "NotFound";
        case Duplicate:  return "Duplicate";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

StrataError& StrataError::context(const std::string& what) {
    message = what + ": " + message;
    return *this;
}

std::string StrataError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  help: ";
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

} // namespace strata

#include <pepver/error.hpp>

namespace pepver {

const char* PepverError::code_name(Code c) {
    switch (c) {
        case InvalidVersion: return "InvalidVersion";
        case IO:             return "IO";
        case Parse:          return "Parse";
        case Config:         return "Config";
        case InvalidArg:     return "InvalidArg";
    }
    return "Unknown";
}

std::string PepverError::format() const {
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

} // namespace pepver

#include <pkglint/error.hpp>

namespace pkglint {

const char* LintError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case Manifest:   return "Manifest";
        case Dependency: return "Dependency";
        case Network:    return "Network";
        case Compile:    return "Compile";
        case ProgramId:  return "ProgramId";
        case NotFound:   return "NotFound";
        case Cycle:      return "Cycle";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string LintError::format() const {
    std::string out = "error[";
    out += code_name(code);
    out += "]: ";
    out += message;

    if (!hint.empty()) {
        out += "\n  hint: ";
        out += hint;
    }

    if (!file.empty()) {
        out += "\n  --> ";
        out += file;
        if (line > 0) {
            out += ":";
            out += std::to_string(line);
        }
    }

    return out;
}

} // namespace pkglint

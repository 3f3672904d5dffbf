#include <treeish/error.hpp>

namespace treeish {

const char* TreeishError::code_name(Code c) {
    switch (c) {
        case Glob:       return "Glob";
        case Parse:      return "Parse";
        case Rule:       return "Rule";
        case IO:         return "IO";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

bool TreeishError::is_build_error() const {
    return code == Glob || code == Parse || code == Rule;
}

std::string TreeishError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!expression.empty()) {
        result += "\n  --> ";
        result += expression;
        if (offset != npos && offset <= expression.size()) {
            result += "\n      ";
            result.append(offset, ' ');
            result += "^";
        }
    }

    return result;
}

} // namespace treeish

#include <searchpath/error.hpp>

namespace searchpath {

SearchError SearchError::syntax(std::string pat, std::string msg, int pos) {
    SearchError e(PatternSyntax, std::move(msg));
    e.pattern = std::move(pat);
    e.position = pos;
    return e;
}

SearchError SearchError::pattern_file(std::string path, FileFault f,
                                      std::string msg, int l) {
    SearchError e(PatternFile, std::move(msg));
    e.file = std::move(path);
    e.line = l;
    e.fault = f;
    return e;
}

const char* SearchError::code_name(Code c) {
    switch (c) {
        case PatternSyntax: return "PatternSyntax";
        case PatternFile:   return "PatternFile";
        case Configuration: return "Configuration";
        case Parse:         return "Parse";
        case IO:            return "IO";
        case InvalidArg:    return "InvalidArg";
    }
    return "Unknown";
}

const char* SearchError::fault_name(FileFault f) {
    switch (f) {
        case NoFault:          return "none";
        case NotFound:         return "not-found";
        case PermissionDenied: return "permission-denied";
        case IsDirectory:      return "is-a-directory";
        case InvalidEncoding:  return "invalid-encoding";
    }
    return "unknown";
}

std::string SearchError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";

    if (code == PatternSyntax) {
        result += "invalid pattern \"" + pattern + "\"";
        if (position >= 0) {
            result += " at position " + std::to_string(position);
        }
        result += ": ";
        result += message;
    } else if (code == PatternFile) {
        result += "error in pattern file " + file;
        if (line > 0) {
            result += ":" + std::to_string(line);
        }
        result += ": ";
        result += message;
    } else {
        result += message;
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    // Pattern-file errors already name their file in the headline
    if (!file.empty() && code != PatternFile) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace searchpath

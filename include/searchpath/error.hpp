#pragma once

#include <string>

namespace searchpath {

struct SearchError {
    enum Code {
        PatternSyntax,
        PatternFile,
        Configuration,
        Parse,
        IO,
        InvalidArg
    };

    // Named failures of the strict pattern-file loader
    enum FileFault {
        NoFault,
        NotFound,
        PermissionDenied,
        IsDirectory,
        InvalidEncoding
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    // PatternSyntax only
    std::string pattern;
    int position = -1;

    // PatternFile only
    FileFault fault = NoFault;

    SearchError() = default;
    SearchError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SearchError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SearchError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Invalid pattern text; position is the offending character offset or -1
    static SearchError syntax(std::string pattern, std::string msg, int position = -1);

    // Strict pattern-file failure; line is 0 when unknown
    static SearchError pattern_file(std::string path, FileFault fault,
                                    std::string msg, int line = 0);

    std::string format() const;
    static const char* code_name(Code c);
    static const char* fault_name(FileFault f);
};

} // namespace searchpath

#pragma once

#include <searchpath/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace searchpath {

// One pattern per line. Surrounding whitespace is stripped; blank lines and
// lines starting with '#' are skipped.
std::vector<std::string> parse_pattern_lines(const std::string& text);

// 1-based line of the first byte sequence that is not valid UTF-8, or 0.
int find_invalid_utf8_line(const std::string& text);

// Strict loader for include-from / exclude-from files. Missing, unreadable,
// directory and non-UTF-8 files each fail with a PatternFile error whose
// fault names the cause.
Result<std::vector<std::string>> load_patterns(const std::filesystem::path& path);

// load_patterns over several files, concatenated in order.
Result<std::vector<std::string>> load_pattern_files(
    const std::vector<std::filesystem::path>& paths);

} // namespace searchpath

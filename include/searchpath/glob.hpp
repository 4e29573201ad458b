#pragma once

#include <searchpath/result.hpp>
#include <string>

namespace searchpath {

// Translate a glob pattern into an RE2 expression meant for full-string
// matching against forward-slash relative paths.
//
//   *      any run of characters except '/'
//   **     recursive, but only as a whole path component:
//            leading or "/**/" -> zero or more whole segments
//            trailing "/**"    -> anything, '/' included
//          anywhere else it degrades to a single '*'
//   ?      one character except '/'
//   [...]  character class; [!...] and [^...] negate and never match '/'
//
// Outside a class a backslash is an ordinary character unless
// backslash_escapes is set, in which case it makes the next character
// literal (gitignore syntax).
//
// Fails with PatternSyntax for an empty pattern, an unterminated class or a
// reversed range such as [z-a] (position = offset of the opening '[').
Result<std::string> glob_to_regex(const std::string& pattern,
                                  bool backslash_escapes = false);

// Re-encode every byte that does not belong to a well-formed UTF-8 sequence
// as the private-use code point U+10FE00 + byte. RE2 then reads each stray
// byte of a file name as one character. Valid UTF-8 comes back unchanged.
std::string escape_invalid_utf8(const std::string& text);

// Quote every RE2 metacharacter in `literal`.
std::string regex_escape(const std::string& literal);

} // namespace searchpath

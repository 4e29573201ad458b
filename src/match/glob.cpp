#include <searchpath/glob.hpp>
#include <cstdint>
#include <cstring>

namespace searchpath {

namespace {

constexpr const char* kRegexMeta = "\\.+*?^$|(){}[]";

void append_literal(std::string& out, char c) {
    if (c != '\0' && std::strchr(kRegexMeta, c)) out.push_back('\\');
    out.push_back(c);
}

constexpr uint32_t kStrayByteBase = 0x10FE00;

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the well-formed UTF-8 sequence at text[i], or 0 when the byte
// there does not start one.
size_t utf8_sequence_length(const std::string& text, size_t i) {
    const size_t n = text.size();
    auto at = [&](size_t k) { return static_cast<unsigned char>(text[k]); };
    unsigned char c = at(i);
    if (c < 0x80) return 1;

    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        if (c == 0xE0) lo = 0xA0;
        if (c == 0xED) hi = 0x9F;
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        if (c == 0xF0) lo = 0x90;
        if (c == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }

    if (i + len > n) return 0;
    if (at(i + 1) < lo || at(i + 1) > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        if (!is_continuation(at(i + k))) return 0;
    }
    return len;
}

void append_code_point(std::string& out, uint32_t cp) {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
}

// Decodes the character at text[i]; stray bytes decode to themselves.
uint32_t decode_at(const std::string& text, size_t i, size_t& len) {
    auto at = [&](size_t k) { return static_cast<unsigned char>(text[k]); };
    len = utf8_sequence_length(text, i);
    if (len == 0) {
        len = 1;
        return at(i);
    }
    switch (len) {
        case 1: return at(i);
        case 2: return ((at(i) & 0x1Fu) << 6) | (at(i + 1) & 0x3Fu);
        case 3: return ((at(i) & 0x0Fu) << 12) | ((at(i + 1) & 0x3Fu) << 6) |
                       (at(i + 2) & 0x3Fu);
        default:
            return ((at(i) & 0x07u) << 18) | ((at(i + 1) & 0x3Fu) << 12) |
                   ((at(i + 2) & 0x3Fu) << 6) | (at(i + 3) & 0x3Fu);
    }
}

// Handles both '*' and '**'. Returns the index just past what was consumed.
size_t translate_star(const std::string& pat, size_t i, std::string& out) {
    const size_t n = pat.size();
    if (i + 1 >= n || pat[i + 1] != '*') {
        out += "[^/]*";
        return i + 1;
    }

    size_t next = i + 2;
    bool at_start = (i == 0);
    bool at_end = (next >= n);
    bool after_slash = (i > 0 && pat[i - 1] == '/');
    bool before_slash = (next < n && pat[next] == '/');

    if (!((at_start || after_slash) && (at_end || before_slash))) {
        // a**b: not a whole component, behaves like '*'
        out += "[^/]*";
        return next;
    }

    if (before_slash) {
        // "**/" swallows its slash: zero or more complete segments
        out += "(?:.*/)?";
        return next + 1;
    }

    out += ".*";
    return next;
}

Result<size_t> translate_bracket(const std::string& pat, size_t i, std::string& out) {
    const size_t n = pat.size();
    const int start = static_cast<int>(i);
    auto unclosed = [&]() {
        return SearchError::syntax(pat, "unclosed bracket", start);
    };

    ++i;
    if (i >= n) return unclosed();

    std::string cls;
    if (pat[i] == '!' || pat[i] == '^') {
        cls = "[^/";
        ++i;
    } else {
        cls = "[";
    }
    if (i >= n) return unclosed();

    // Code point of the last single member, the low end of a possible range
    uint32_t prev = 0;
    bool have_prev = false;

    // ']' directly after the opener is a literal member
    if (pat[i] == ']') {
        cls += "\\]";
        prev = ']';
        have_prev = true;
        ++i;
    }

    // Appends the member at pat[k] (after any backslash) and returns its code point.
    auto append_member = [&](size_t k, bool escaped, size_t& len) {
        uint32_t cp = decode_at(pat, k, len);
        if (escaped && len == 1 && cp < 0x80) {
            cls.push_back('\\');
        } else if (!escaped && (pat[k] == '^' || pat[k] == '[')) {
            cls.push_back('\\');
        }
        cls.append(pat, k, len);
        return cp;
    };

    while (i < n && pat[i] != ']') {
        if (pat[i] == '-' && have_prev && i + 1 < n && pat[i + 1] != ']') {
            size_t k = i + 1;
            bool escaped = false;
            if (pat[k] == '\\' && k + 1 < n) {
                escaped = true;
                ++k;
            }
            cls.push_back('-');
            size_t len = 0;
            uint32_t hi = append_member(k, escaped, len);
            if (hi < prev) {
                return SearchError::syntax(pat, "invalid range", start);
            }
            have_prev = false;
            i = k + len;
        } else if (pat[i] == '-') {
            cls.push_back('-');
            have_prev = false;
            ++i;
        } else {
            size_t k = i;
            bool escaped = false;
            if (pat[k] == '\\') {
                if (k + 1 >= n) return unclosed();
                escaped = true;
                ++k;
            }
            size_t len = 0;
            prev = append_member(k, escaped, len);
            have_prev = true;
            i = k + len;
        }
    }
    if (i >= n) return unclosed();

    cls.push_back(']');
    out += cls;
    return Result<size_t>::ok(i + 1);
}

} // namespace

std::string escape_invalid_utf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        size_t len = utf8_sequence_length(text, i);
        if (len == 0) {
            append_code_point(out, kStrayByteBase + static_cast<unsigned char>(text[i]));
            ++i;
        } else {
            out.append(text, i, len);
            i += len;
        }
    }
    return out;
}

std::string regex_escape(const std::string& literal) {
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal) append_literal(out, c);
    return out;
}

Result<std::string> glob_to_regex(const std::string& pattern, bool backslash_escapes) {
    if (pattern.empty()) {
        return SearchError::syntax(pattern, "empty pattern");
    }

    std::string out;
    out.reserve(pattern.size() * 2);

    size_t i = 0;
    while (i < pattern.size()) {
        char c = pattern[i];
        if (c == '*') {
            i = translate_star(pattern, i, out);
        } else if (c == '?') {
            out += "[^/]";
            ++i;
        } else if (c == '[') {
            auto next = translate_bracket(pattern, i, out);
            if (next.is_err()) return std::move(next).error();
            i = next.value();
        } else if (c == '\\' && backslash_escapes && i + 1 < pattern.size()) {
            size_t len = 0;
            decode_at(pattern, i + 1, len);
            if (len == 1) {
                append_literal(out, pattern[i + 1]);
            } else {
                out.append(pattern, i + 1, len);
            }
            i += 1 + len;
        } else {
            append_literal(out, c);
            ++i;
        }
    }

    return Result<std::string>::ok(std::move(out));
}

} // namespace searchpath

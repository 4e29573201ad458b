#include <searchpath/pattern_file.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace searchpath {

namespace fs = std::filesystem;

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

static std::string strip(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && is_space(s[b])) b++;
    while (e > b && is_space(s[e - 1])) e--;
    return s.substr(b, e - b);
}

std::vector<std::string> parse_pattern_lines(const std::string& text) {
    std::vector<std::string> patterns;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto stripped = strip(line);
        if (stripped.empty() || stripped[0] == '#') continue;
        patterns.push_back(std::move(stripped));
    }
    return patterns;
}

int find_invalid_utf8_line(const std::string& text) {
    int line = 1;
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c == '\n') {
            line++;
            i++;
            continue;
        }
        if (c < 0x80) {
            i++;
            continue;
        }

        size_t len;
        unsigned int cp;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return line;

        if (i + len > n) return line;
        for (size_t k = 1; k < len; k++) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return line;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and out-of-range code points
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return line;
        }
        i += len;
    }
    return 0;
}

Result<std::vector<std::string>> load_patterns(const fs::path& path) {
    const std::string shown = path.string();

    std::error_code ec;
    auto st = fs::status(path, ec);
    if (st.type() == fs::file_type::not_found) {
        return SearchError::pattern_file(shown, SearchError::NotFound, "file not found");
    }
    if (ec && ec != std::errc::permission_denied) {
        return SearchError::pattern_file(shown, SearchError::NotFound,
            "file not found: " + ec.message());
    }
    if (fs::is_directory(st)) {
        return SearchError::pattern_file(shown, SearchError::IsDirectory, "is a directory");
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        if (errno == ENOENT) {
            return SearchError::pattern_file(shown, SearchError::NotFound, "file not found");
        }
        std::string detail = errno ? std::strerror(errno) : "cannot open file";
        return SearchError::pattern_file(shown, SearchError::PermissionDenied,
            "permission denied (" + detail + ")");
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    std::string content = ss.str();

    int bad_line = find_invalid_utf8_line(content);
    if (bad_line > 0) {
        return SearchError::pattern_file(shown, SearchError::InvalidEncoding,
            "invalid encoding: not valid UTF-8", bad_line);
    }

    return Result<std::vector<std::string>>::ok(parse_pattern_lines(content));
}

Result<std::vector<std::string>> load_pattern_files(const std::vector<fs::path>& paths) {
    std::vector<std::string> all;
    for (const auto& p : paths) {
        auto loaded = load_patterns(p);
        if (loaded.is_err()) return loaded;
        auto& pats = loaded.value();
        all.insert(all.end(), pats.begin(), pats.end());
    }
    return Result<std::vector<std::string>>::ok(std::move(all));
}

} // namespace searchpath

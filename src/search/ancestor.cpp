#include <searchpath/ancestor.hpp>
#include <searchpath/log.hpp>
#include <searchpath/pattern_file.hpp>
#include <fstream>
#include <sstream>

namespace searchpath {

namespace fs = std::filesystem;

std::vector<fs::path> ancestor_dirs(const fs::path& file_path, const fs::path& entry_root) {
    fs::path root = entry_root.lexically_normal();
    fs::path parent = file_path.lexically_normal().parent_path();

    // Drop a trailing separator so "a/b/" and "a/b" compare equal
    if (!root.has_filename() && root.has_relative_path()) root = root.parent_path();

    fs::path rel = parent.lexically_relative(root);
    if (rel.empty()) return {};

    auto first = rel.begin();
    if (first != rel.end() && *first == "..") return {};

    std::vector<fs::path> dirs;
    dirs.push_back(root);
    if (rel == ".") return dirs;

    fs::path current = root;
    for (const auto& part : rel) {
        if (part.empty() || part == ".") continue;
        current /= part;
        dirs.push_back(current);
    }
    return dirs;
}

std::vector<std::string> load_patterns_lenient(const fs::path& path, PatternFileCache* cache) {
    const std::string key = path.string();
    if (cache) {
        auto it = cache->find(key);
        if (it != cache->end()) return it->second;
    }

    std::vector<std::string> patterns;
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        std::ifstream file(path, std::ios::binary);
        if (file.is_open()) {
            std::ostringstream ss;
            ss << file.rdbuf();
            std::string content = ss.str();
            if (find_invalid_utf8_line(content) == 0) {
                patterns = parse_pattern_lines(content);
            } else {
                log::debug("ignoring non-UTF-8 pattern file %s", key.c_str());
            }
        } else {
            log::debug("cannot read pattern file %s, skipping", key.c_str());
        }
    }

    if (cache) (*cache)[key] = patterns;
    return patterns;
}

AncestorPatterns collect_ancestor_patterns(const fs::path& file_path,
                                           const fs::path& entry_root,
                                           const std::optional<std::string>& include_filename,
                                           const std::optional<std::string>& exclude_filename,
                                           PatternFileCache* cache) {
    AncestorPatterns out;
    if (!include_filename && !exclude_filename) return out;

    for (const auto& dir : ancestor_dirs(file_path, entry_root)) {
        if (include_filename) {
            auto pats = load_patterns_lenient(dir / *include_filename, cache);
            out.include.insert(out.include.end(), pats.begin(), pats.end());
        }
        if (exclude_filename) {
            auto pats = load_patterns_lenient(dir / *exclude_filename, cache);
            out.exclude.insert(out.exclude.end(), pats.begin(), pats.end());
        }
    }
    return out;
}

std::vector<std::string> merge_patterns(const std::vector<std::string>& ancestor,
                                        const std::vector<std::string>& inline_patterns) {
    std::vector<std::string> merged;
    merged.reserve(ancestor.size() + inline_patterns.size());
    merged.insert(merged.end(), ancestor.begin(), ancestor.end());
    merged.insert(merged.end(), inline_patterns.begin(), inline_patterns.end());
    return merged;
}

} // namespace searchpath

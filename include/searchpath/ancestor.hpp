#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace searchpath {

// Patterns gathered from per-directory pattern files between an entry root
// and a candidate. Root-to-leaf order: a child directory's patterns come
// after its parent's.
struct AncestorPatterns {
    std::vector<std::string> include;
    std::vector<std::string> exclude;

    bool empty() const { return include.empty() && exclude.empty(); }
};

// Pattern-file path -> parsed patterns. Owned by the caller; one search
// session normally shares a single cache across all candidates.
using PatternFileCache = std::unordered_map<std::string, std::vector<std::string>>;

// Directories from entry_root down to file_path's parent, inclusive.
// Empty when file_path does not lie under entry_root.
std::vector<std::filesystem::path> ancestor_dirs(const std::filesystem::path& file_path,
                                                 const std::filesystem::path& entry_root);

// Lenient loader: a missing, unreadable or undecodable file yields no
// patterns and never an error.
std::vector<std::string> load_patterns_lenient(const std::filesystem::path& path,
                                               PatternFileCache* cache = nullptr);

// Reads include_filename / exclude_filename in every directory returned by
// ancestor_dirs(). Returns immediately when both names are absent. The
// entry root is a hard upper bound: files above it are never read.
AncestorPatterns collect_ancestor_patterns(const std::filesystem::path& file_path,
                                           const std::filesystem::path& entry_root,
                                           const std::optional<std::string>& include_filename,
                                           const std::optional<std::string>& exclude_filename,
                                           PatternFileCache* cache = nullptr);

// Ancestor patterns first, inline patterns last.
std::vector<std::string> merge_patterns(const std::vector<std::string>& ancestor,
                                        const std::vector<std::string>& inline_patterns);

} // namespace searchpath

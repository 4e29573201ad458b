#pragma once

#include <searchpath/log.hpp>
#include <searchpath/matcher.hpp>
#include <searchpath/result.hpp>
#include <searchpath/search_path.hpp>
#include <searchpath/traversal.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace searchpath {

// A search described in TOML:
//
//   log-level = "debug"
//
//   [search]
//   pattern = "**/*.toml"
//   kind = "files"
//   matcher = "glob"
//   include = ["*.toml"]
//   exclude-from-ancestors = ".searchignore"
//
//   [[entries]]
//   scope = "project"
//   path = ".config/app"
//
// Relative paths resolve against the directory holding the file; a leading
// "~/" expands to $HOME.
struct SearchConfig {
    std::vector<Entry> entries;

    std::string pattern = "**";
    Kind kind = Kind::Files;
    MatcherKind matcher = MatcherKind::Glob;
    bool dedupe = true;
    bool follow_symlinks = true;

    std::vector<std::string> include;
    std::vector<std::string> exclude;
    std::vector<std::filesystem::path> include_from;
    std::vector<std::filesystem::path> exclude_from;
    std::optional<std::string> include_from_ancestors;
    std::optional<std::string> exclude_from_ancestors;

    std::optional<log::Level> log_level;

    // Which scalars were written explicitly (for merge)
    bool pattern_set = false;
    bool kind_set = false;
    bool matcher_set = false;
    bool dedupe_set = false;
    bool follow_symlinks_set = false;

    static Result<SearchConfig> parse(const std::string& toml_str,
                                      const std::filesystem::path& base_dir = {});
    static Result<SearchConfig> load(const std::string& path);

    // Layer `other` on top: its explicit scalars win, its pattern lists are
    // appended, and its entries take priority over ours.
    void merge(const SearchConfig& other);

    SearchPath search_path() const;

    // Options for SearchPath queries. `matcher` must outlive the query.
    SearchOptions options(PathMatcher* matcher = nullptr) const;
};

// ~/.config/searchpath/config.toml, or empty if HOME is unset
std::string user_config_path();

} // namespace searchpath

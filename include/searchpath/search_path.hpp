#pragma once

#include <searchpath/ancestor.hpp>
#include <searchpath/match.hpp>
#include <searchpath/matcher.hpp>
#include <searchpath/result.hpp>
#include <searchpath/traversal.hpp>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace searchpath {

// A constructor argument for SearchPath: a bare root (auto-named dirN), a
// (scope, root) pair, or nothing. Entries without a root are dropped.
struct Entry {
    std::optional<std::string> scope;
    std::optional<std::filesystem::path> root;

    Entry(std::nullopt_t) {}
    Entry(std::filesystem::path r) : root(std::move(r)) {}
    Entry(const char* r) : root(std::filesystem::path(r)) {}
    Entry(const std::string& r) : root(std::filesystem::path(r)) {}
    Entry(std::string s, std::optional<std::filesystem::path> r)
        : scope(std::move(s)), root(std::move(r)) {}

    bool is_bare() const { return !scope.has_value(); }
};

struct SearchOptions {
    Kind kind = Kind::Files;

    std::vector<std::string> include;
    std::vector<std::string> exclude;

    // Strict pattern files, appended after the inline lists
    std::vector<std::filesystem::path> include_from;
    std::vector<std::filesystem::path> exclude_from;

    // Per-directory pattern file names looked up from each entry root down
    // to every candidate's parent
    std::optional<std::string> include_from_ancestors;
    std::optional<std::string> exclude_from_ancestors;

    PathMatcher* matcher = nullptr;  // null: a fresh GlobMatcher per call
    bool follow_symlinks = true;

    // all()/matches() only: keep the first result per relative path
    bool dedupe = true;
};

// An ordered list of (scope, root) pairs searched in priority order.
class SearchPath {
public:
    using Item = std::pair<std::string, std::filesystem::path>;

    SearchPath() = default;
    SearchPath(std::initializer_list<Entry> entries);
    explicit SearchPath(const std::vector<Entry>& entries);

    static SearchPath from_items(std::vector<Item> items);

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    explicit operator bool() const { return !items_.empty(); }

    const std::vector<Item>& items() const { return items_; }
    std::vector<Item>::const_iterator begin() const { return items_.begin(); }
    std::vector<Item>::const_iterator end() const { return items_.end(); }

    std::vector<std::filesystem::path> dirs() const;
    std::vector<std::string> scopes() const;

    // Entries of this path followed by entries of `other`
    SearchPath operator+(const SearchPath& other) const;

    // Append path components to every root
    SearchPath with_suffix(const std::vector<std::string>& parts) const;

    SearchPath filter(const std::function<bool(const std::filesystem::path&)>& pred) const;
    SearchPath existing() const;

    // "scope: root, scope: root" or "(empty)"
    std::string to_string() const;

    // First candidate across entries in order
    Result<std::optional<std::filesystem::path>> first(const std::string& pattern = "**",
                                                       const SearchOptions& opts = {}) const;
    Result<std::optional<Match>> match(const std::string& pattern = "**",
                                       const SearchOptions& opts = {}) const;

    // Every candidate across entries in order
    Result<std::vector<std::filesystem::path>> all(const std::string& pattern = "**",
                                                   const SearchOptions& opts = {}) const;
    Result<std::vector<Match>> matches(const std::string& pattern = "**",
                                       const SearchOptions& opts = {}) const;

private:
    // Feeds matches to `sink` in priority order until it returns false.
    Status search(const std::string& pattern, const SearchOptions& opts,
                  const std::function<bool(Match&&)>& sink) const;

    std::vector<Item> items_;
};

// One-shot forms of the SearchPath queries.
Result<std::optional<std::filesystem::path>> first(const std::string& pattern,
                                                   const std::vector<Entry>& entries,
                                                   const SearchOptions& opts = {});
Result<std::optional<Match>> match(const std::string& pattern,
                                   const std::vector<Entry>& entries,
                                   const SearchOptions& opts = {});
Result<std::vector<std::filesystem::path>> all(const std::string& pattern,
                                               const std::vector<Entry>& entries,
                                               const SearchOptions& opts = {});
Result<std::vector<Match>> matches(const std::string& pattern,
                                   const std::vector<Entry>& entries,
                                   const SearchOptions& opts = {});

} // namespace searchpath

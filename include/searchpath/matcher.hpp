#pragma once

#include <searchpath/result.hpp>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace re2 {
class RE2;
}

namespace searchpath {

// Decides whether a relative path passes include/exclude filtering.
//
// A path passes when include is empty or at least one include pattern
// matches, and no exclude pattern matches. Paths are relative to the search
// root and always use '/' separators. Patterns match the whole path.
class PathMatcher {
public:
    virtual ~PathMatcher() = default;

    virtual bool supports_negation() const = 0;
    virtual bool supports_dir_only() const = 0;

    virtual Result<bool> matches(const std::string& path, bool is_dir,
                                 const std::vector<std::string>& include,
                                 const std::vector<std::string>& exclude) = 0;
};

// Shared machinery for matchers whose patterns compile to one RE2 program.
// Compiled programs are cached by source text for the matcher's lifetime.
class CompiledPatternMatcher : public PathMatcher {
public:
    CompiledPatternMatcher();
    ~CompiledPatternMatcher() override;

    bool supports_negation() const override { return false; }
    bool supports_dir_only() const override { return false; }

    // is_dir is accepted for interface parity and ignored
    Result<bool> matches(const std::string& path, bool is_dir,
                         const std::vector<std::string>& include,
                         const std::vector<std::string>& exclude) override;

    // Full-string test of one pattern
    Result<bool> match_pattern(const std::string& path, const std::string& pattern);

    size_t cache_size() const { return cache_.size(); }

protected:
    // Pattern text -> RE2 source
    virtual Result<std::string> translate(const std::string& pattern) const = 0;

private:
    Result<const re2::RE2*> compile(const std::string& pattern);
    // subject is a path already passed through escape_invalid_utf8
    Result<bool> full_match(const std::string& subject, const std::string& pattern);
    Result<bool> any_match(const std::string& subject,
                           const std::vector<std::string>& patterns);

    std::unordered_map<std::string, std::unique_ptr<re2::RE2>> cache_;
};

// Glob patterns (see glob_to_regex for the syntax).
class GlobMatcher : public CompiledPatternMatcher {
protected:
    Result<std::string> translate(const std::string& pattern) const override;
};

// Patterns are RE2 regular expressions, anchored at both ends.
class RegexMatcher : public CompiledPatternMatcher {
protected:
    Result<std::string> translate(const std::string& pattern) const override;
};

// One compiled rule of a gitignore-style pattern list.
struct GitignoreRule {
    std::string source;
    bool negated = false;
    bool dir_only = false;
    bool anchored = false;
    std::shared_ptr<re2::RE2> self;         // the path itself
    std::shared_ptr<re2::RE2> descendants;  // anything below a matching path

    bool matches(const std::string& path, bool is_dir) const;
};

// An ordered rule list. The last rule that matches decides; a negated
// rule un-matches.
class GitignoreSpec {
public:
    static Result<GitignoreSpec> compile(const std::vector<std::string>& lines);

    bool match_file(const std::string& path, bool is_dir) const;
    const std::vector<GitignoreRule>& rules() const { return rules_; }

private:
    std::vector<GitignoreRule> rules_;
};

// Gitignore semantics: `!pattern` negation, `dir/` directory-only rules,
// anchoring via '/', and rules applying to everything under a matching
// directory. Specs are cached by the exact ordered pattern list.
class GitignoreMatcher : public PathMatcher {
public:
    bool supports_negation() const override { return true; }
    bool supports_dir_only() const override { return true; }

    Result<bool> matches(const std::string& path, bool is_dir,
                         const std::vector<std::string>& include,
                         const std::vector<std::string>& exclude) override;

    size_t cache_size() const { return specs_.size(); }

private:
    Result<const GitignoreSpec*> spec_for(const std::vector<std::string>& patterns);

    std::map<std::vector<std::string>, GitignoreSpec> specs_;
};

enum class MatcherKind { Glob, Regex, Gitignore };

Result<MatcherKind> parse_matcher_kind(const std::string& name);
const char* matcher_kind_name(MatcherKind kind);
std::unique_ptr<PathMatcher> make_matcher(MatcherKind kind);

} // namespace searchpath

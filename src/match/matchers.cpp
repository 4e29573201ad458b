#include <searchpath/matcher.hpp>
#include <searchpath/glob.hpp>
#include <re2/re2.h>

namespace searchpath {

static RE2::Options engine_options() {
    RE2::Options opts;
    opts.set_log_errors(false);
    opts.set_dot_nl(false);
    return opts;
}

CompiledPatternMatcher::CompiledPatternMatcher() = default;
CompiledPatternMatcher::~CompiledPatternMatcher() = default;

Result<const re2::RE2*> CompiledPatternMatcher::compile(const std::string& pattern) {
    auto it = cache_.find(pattern);
    if (it != cache_.end()) {
        return Result<const re2::RE2*>::ok(it->second.get());
    }

    if (pattern.empty()) {
        return SearchError::syntax(pattern, "empty pattern");
    }

    auto source = translate(escape_invalid_utf8(pattern));
    if (source.is_err()) {
        SearchError e = std::move(source).error();
        e.pattern = pattern;
        return e;
    }

    auto re = std::make_unique<re2::RE2>(source.value(), engine_options());
    if (!re->ok()) {
        return SearchError::syntax(pattern, re->error());
    }

    const re2::RE2* raw = re.get();
    cache_.emplace(pattern, std::move(re));
    return Result<const re2::RE2*>::ok(raw);
}

Result<bool> CompiledPatternMatcher::full_match(const std::string& subject,
                                                const std::string& pattern) {
    auto re = compile(pattern);
    if (re.is_err()) return std::move(re).error();
    return Result<bool>::ok(RE2::FullMatch(subject, *re.value()));
}

Result<bool> CompiledPatternMatcher::match_pattern(const std::string& path,
                                                   const std::string& pattern) {
    return full_match(escape_invalid_utf8(path), pattern);
}

Result<bool> CompiledPatternMatcher::any_match(const std::string& subject,
                                               const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        auto hit = full_match(subject, p);
        if (hit.is_err()) return hit;
        if (hit.value()) return Result<bool>::ok(true);
    }
    return Result<bool>::ok(false);
}

Result<bool> CompiledPatternMatcher::matches(const std::string& path, bool /*is_dir*/,
                                             const std::vector<std::string>& include,
                                             const std::vector<std::string>& exclude) {
    const std::string subject = escape_invalid_utf8(path);

    if (!include.empty()) {
        auto included = any_match(subject, include);
        if (included.is_err() || !included.value()) return included;
    }

    if (!exclude.empty()) {
        auto excluded = any_match(subject, exclude);
        if (excluded.is_err()) return excluded;
        if (excluded.value()) return Result<bool>::ok(false);
    }

    return Result<bool>::ok(true);
}

Result<std::string> GlobMatcher::translate(const std::string& pattern) const {
    return glob_to_regex(pattern);
}

Result<std::string> RegexMatcher::translate(const std::string& pattern) const {
    return Result<std::string>::ok(pattern);
}

// ---- Factory ----

Result<MatcherKind> parse_matcher_kind(const std::string& name) {
    if (name == "glob") return Result<MatcherKind>::ok(MatcherKind::Glob);
    if (name == "regex") return Result<MatcherKind>::ok(MatcherKind::Regex);
    if (name == "gitignore") return Result<MatcherKind>::ok(MatcherKind::Gitignore);
    return SearchError{SearchError::InvalidArg,
        "unknown matcher: " + name,
        "expected one of: glob, regex, gitignore"};
}

const char* matcher_kind_name(MatcherKind kind) {
    switch (kind) {
        case MatcherKind::Glob:      return "glob";
        case MatcherKind::Regex:     return "regex";
        case MatcherKind::Gitignore: return "gitignore";
    }
    return "unknown";
}

std::unique_ptr<PathMatcher> make_matcher(MatcherKind kind) {
    switch (kind) {
        case MatcherKind::Regex:     return std::make_unique<RegexMatcher>();
        case MatcherKind::Gitignore: return std::make_unique<GitignoreMatcher>();
        case MatcherKind::Glob:      break;
    }
    return std::make_unique<GlobMatcher>();
}

} // namespace searchpath

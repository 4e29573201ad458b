#include <searchpath/matcher.hpp>
#include <searchpath/glob.hpp>
#include <re2/re2.h>
#include <optional>

namespace searchpath {

namespace {

// Trailing whitespace is dropped unless escaped with a backslash.
std::string trim_trailing(const std::string& line) {
    size_t end = line.size();
    while (end > 0 && (line[end - 1] == ' ' || line[end - 1] == '\t')) {
        if (end >= 2 && line[end - 2] == '\\') {
            // "\ " keeps one literal space
            return line.substr(0, end - 2) + line[end - 1];
        }
        --end;
    }
    return line.substr(0, end);
}

Result<std::shared_ptr<re2::RE2>> build_program(const std::string& pattern,
                                                const std::string& source) {
    RE2::Options opts;
    opts.set_log_errors(false);
    auto re = std::make_shared<re2::RE2>(source, opts);
    if (!re->ok()) {
        return SearchError::syntax(pattern, re->error());
    }
    return Result<std::shared_ptr<re2::RE2>>::ok(std::move(re));
}

// Returns an empty optional for comment and blank lines.
Result<std::optional<GitignoreRule>> compile_rule(const std::string& line) {
    using Out = std::optional<GitignoreRule>;

    if (line.empty()) {
        return SearchError::syntax(line, "empty pattern");
    }
    if (line[0] == '#') {
        return Result<Out>::ok(std::nullopt);
    }

    GitignoreRule rule;
    rule.source = line;

    std::string body = trim_trailing(line);
    if (body.empty()) {
        return Result<Out>::ok(std::nullopt);
    }

    // Characters removed from the front, for error offsets
    int stripped = 0;
    if (body[0] == '!') {
        rule.negated = true;
        body.erase(0, 1);
        ++stripped;
    } else if (body.size() >= 2 && body[0] == '\\' && (body[1] == '!' || body[1] == '#')) {
        body.erase(0, 1);
        ++stripped;
    }

    if (!body.empty() && body.back() == '/') {
        rule.dir_only = true;
        body.pop_back();
    }

    if (!body.empty() && body[0] == '/') {
        rule.anchored = true;
        body.erase(0, 1);
        ++stripped;
    } else {
        rule.anchored = body.find('/') != std::string::npos;
    }

    if (body.empty()) {
        return SearchError::syntax(line, "pattern matches nothing");
    }

    auto translated = glob_to_regex(escape_invalid_utf8(body), true);
    if (translated.is_err()) {
        SearchError e = std::move(translated).error();
        e.pattern = line;
        if (e.position >= 0) e.position += stripped;
        return e;
    }

    // Unanchored rules may start at any directory level
    std::string prefix = rule.anchored ? "" : "(?:.*/)?";
    std::string base = prefix + translated.value();

    auto self = build_program(line, base);
    if (self.is_err()) return std::move(self).error();
    auto below = build_program(line, base + "/.*");
    if (below.is_err()) return std::move(below).error();

    rule.self = std::move(self).value();
    rule.descendants = std::move(below).value();
    return Result<Out>::ok(std::move(rule));
}

} // namespace

bool GitignoreRule::matches(const std::string& path, bool is_dir) const {
    if (RE2::FullMatch(path, *descendants)) return true;
    if (RE2::FullMatch(path, *self)) return !dir_only || is_dir;
    return false;
}

Result<GitignoreSpec> GitignoreSpec::compile(const std::vector<std::string>& lines) {
    GitignoreSpec spec;
    for (const auto& line : lines) {
        auto rule = compile_rule(line);
        if (rule.is_err()) return std::move(rule).error();
        if (rule.value()) spec.rules_.push_back(std::move(*rule.value()));
    }
    return Result<GitignoreSpec>::ok(std::move(spec));
}

bool GitignoreSpec::match_file(const std::string& path, bool is_dir) const {
    const std::string subject = escape_invalid_utf8(path);
    bool matched = false;
    for (const auto& rule : rules_) {
        if (rule.matches(subject, is_dir)) {
            matched = !rule.negated;
        }
    }
    return matched;
}

Result<const GitignoreSpec*> GitignoreMatcher::spec_for(const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        if (p.empty()) return SearchError::syntax(p, "empty pattern");
    }

    auto it = specs_.find(patterns);
    if (it != specs_.end()) {
        return Result<const GitignoreSpec*>::ok(&it->second);
    }

    auto spec = GitignoreSpec::compile(patterns);
    if (spec.is_err()) return std::move(spec).error();

    auto inserted = specs_.emplace(patterns, std::move(spec).value());
    return Result<const GitignoreSpec*>::ok(&inserted.first->second);
}

Result<bool> GitignoreMatcher::matches(const std::string& path, bool is_dir,
                                       const std::vector<std::string>& include,
                                       const std::vector<std::string>& exclude) {
    if (!include.empty()) {
        auto spec = spec_for(include);
        if (spec.is_err()) return std::move(spec).error();
        if (!spec.value()->match_file(path, is_dir)) return Result<bool>::ok(false);
    }

    if (!exclude.empty()) {
        auto spec = spec_for(exclude);
        if (spec.is_err()) return std::move(spec).error();
        if (spec.value()->match_file(path, is_dir)) return Result<bool>::ok(false);
    }

    return Result<bool>::ok(true);
}

} // namespace searchpath

#include <catch2/catch.hpp>
#include <searchpath/matcher.hpp>

using namespace searchpath;

static bool re_match(const std::string& path, const std::string& pattern) {
    RegexMatcher m;
    auto r = m.matches(path, false, {pattern}, {});
    REQUIRE(r.is_ok());
    return r.value();
}

TEST_CASE("regex exact match", "[regex]") {
    REQUIRE(re_match("config.toml", "config.toml"));
    REQUIRE_FALSE(re_match("other.toml", "config.toml"));
    REQUIRE_FALSE(re_match("config.toml.bak", "config.toml"));
}

TEST_CASE("regex dot and dot-star", "[regex]") {
    REQUIRE(re_match("a", "."));
    REQUIRE_FALSE(re_match("ab", "."));
    REQUIRE(re_match("", ".*"));
    REQUIRE(re_match("src/main.py", ".*"));
}

TEST_CASE("regex quantifiers", "[regex]") {
    REQUIRE(re_match("a", "a+"));
    REQUIRE(re_match("aaa", "a+"));
    REQUIRE_FALSE(re_match("", "a+"));
    REQUIRE(re_match("", "a*"));
    REQUIRE_FALSE(re_match("b", "a*"));
    REQUIRE(re_match("", "a?"));
    REQUIRE_FALSE(re_match("aa", "a?"));
    REQUIRE(re_match("aaa", "a{3}"));
    REQUIRE_FALSE(re_match("aa", "a{3}"));
    REQUIRE_FALSE(re_match("aaaa", "a{3}"));
}

TEST_CASE("regex alternation covers the whole path", "[regex]") {
    REQUIRE(re_match("foo", "foo|bar"));
    REQUIRE(re_match("bar", "foo|bar"));
    REQUIRE_FALSE(re_match("foobar", "foo|bar"));
    REQUIRE_FALSE(re_match("baz", "foo|bar"));
}

TEST_CASE("regex character class", "[regex]") {
    REQUIRE(re_match("a.txt", "[abc].txt"));
    REQUIRE_FALSE(re_match("d.txt", "[abc].txt"));
}

TEST_CASE("regex pattern must match the entire path", "[regex]") {
    REQUIRE(re_match("src", "src"));
    REQUIRE_FALSE(re_match("src/main.py", "src"));
    REQUIRE_FALSE(re_match("prefix_config.toml", "config.toml"));
    REQUIRE_FALSE(re_match("config.toml_suffix", "config.toml"));
    REQUIRE_FALSE(re_match("dir/config.toml", "config.toml"));
}

TEST_CASE("regex path patterns", "[regex]") {
    REQUIRE(re_match("src/main.py", "src/.*"));
    REQUIRE(re_match("src/a/b/c.py", "src/.*"));
    REQUIRE_FALSE(re_match("other/main.py", "src/.*"));
    REQUIRE(re_match("src/main.py", "src/main\\.py"));
    REQUIRE_FALSE(re_match("src/main_py", "src/main\\.py"));
}

TEST_CASE("regex include and exclude", "[regex]") {
    RegexMatcher m;
    REQUIRE(m.matches("anything.txt", false, {}, {}).value());

    std::vector<std::string> inc{".*\\.py"};
    std::vector<std::string> exc{"test_.*", ".*_test.py"};
    REQUIRE(m.matches("main.py", false, inc, exc).value());
    REQUIRE_FALSE(m.matches("test_main.py", false, inc, exc).value());
    REQUIRE_FALSE(m.matches("main_test.py", false, inc, exc).value());
    REQUIRE_FALSE(m.matches("main.txt", false, inc, exc).value());

    std::vector<std::string> both{".*\\.py", ".*\\.txt"};
    REQUIRE(m.matches("readme.txt", false, both, {}).value());
    REQUIRE_FALSE(m.matches("config.json", false, both, {}).value());
}

TEST_CASE("regex matches names that are not valid UTF-8", "[regex]") {
    REQUIRE(re_match("\xff.txt", ".*\\.txt"));
    REQUIRE(re_match("\xff.txt", "[^/]\\.txt"));
    REQUIRE(re_match("\xff.txt", ".{5}"));

    RegexMatcher m;
    REQUIRE_FALSE(m.matches("\xff.txt", false, {}, {".*"}).value());
}

TEST_CASE("regex is_dir is accepted and ignored", "[regex]") {
    RegexMatcher m;
    REQUIRE(m.matches("dir", true, {"dir"}, {}).value());
    REQUIRE(m.matches("dir", false, {"dir"}, {}).value());
}

TEST_CASE("regex empty pattern is a syntax error", "[regex][error]") {
    RegexMatcher m;
    auto inc = m.matches("file.py", false, {""}, {});
    REQUIRE(inc.is_err());
    REQUIRE(inc.error().code == SearchError::PatternSyntax);
    REQUIRE(inc.error().pattern.empty());
    REQUIRE(inc.error().message.find("empty pattern") != std::string::npos);

    auto exc = m.matches("file.py", false, {}, {""});
    REQUIRE(exc.is_err());
    REQUIRE(exc.error().message.find("empty pattern") != std::string::npos);
}

TEST_CASE("regex invalid syntax carries the engine message", "[regex][error]") {
    RegexMatcher m;
    auto r = m.matches("file.py", false, {"[invalid"}, {});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SearchError::PatternSyntax);
    REQUIRE(r.error().pattern == "[invalid");
    REQUIRE_FALSE(r.error().message.empty());
    REQUIRE(m.cache_size() == 0);
}

TEST_CASE("regex matcher capabilities and cache", "[regex]") {
    RegexMatcher m;
    REQUIRE_FALSE(m.supports_negation());
    REQUIRE_FALSE(m.supports_dir_only());

    REQUIRE(m.match_pattern("abc", "a.c").value());
    REQUIRE(m.match_pattern("axc", "a.c").value());
    REQUIRE(m.cache_size() == 1);
}

TEST_CASE("matcher kinds parse and build", "[regex][factory]") {
    REQUIRE(parse_matcher_kind("glob").value() == MatcherKind::Glob);
    REQUIRE(parse_matcher_kind("regex").value() == MatcherKind::Regex);
    REQUIRE(parse_matcher_kind("gitignore").value() == MatcherKind::Gitignore);

    auto bad = parse_matcher_kind("fnmatch");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == SearchError::InvalidArg);

    REQUIRE(std::string(matcher_kind_name(MatcherKind::Regex)) == "regex");

    auto glob = make_matcher(MatcherKind::Glob);
    REQUIRE_FALSE(glob->supports_negation());
    REQUIRE_FALSE(glob->matches("src/a.py", false, {"*.py"}, {}).value());

    auto regex = make_matcher(MatcherKind::Regex);
    REQUIRE(regex->matches("src/a.py", false, {".*\\.py"}, {}).value());

    auto gi = make_matcher(MatcherKind::Gitignore);
    REQUIRE(gi->supports_negation());
    REQUIRE(gi->matches("src/a.py", false, {"*.py"}, {}).value());
}

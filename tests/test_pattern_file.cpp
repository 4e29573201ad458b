#include <catch2/catch.hpp>
#include <searchpath/pattern_file.hpp>
#include <searchpath/traversal.hpp>
#include "temp_dir.hpp"

#include <sys/stat.h>
#include <unistd.h>

using namespace searchpath;
using Catch::Matchers::Contains;

TEST_CASE("parse_pattern_lines strips and skips comments", "[pattern_file]") {
    auto p = parse_pattern_lines("# header\n*.py\n\n   \n  *.txt  \n\t# indented comment\n*.json\r\n");
    REQUIRE(p == std::vector<std::string>{"*.py", "*.txt", "*.json"});
}

TEST_CASE("parse_pattern_lines handles empty and comment-only input", "[pattern_file]") {
    REQUIRE(parse_pattern_lines("").empty());
    REQUIRE(parse_pattern_lines("\n  \n\t\n").empty());
    REQUIRE(parse_pattern_lines("# a\n# b\n").empty());
}

TEST_CASE("find_invalid_utf8_line reports the first bad line", "[pattern_file]") {
    REQUIRE(find_invalid_utf8_line("plain ascii\nmore\n") == 0);
    REQUIRE(find_invalid_utf8_line("caf\xc3\xa9\n\xe2\x9c\x93\n") == 0);
    REQUIRE(find_invalid_utf8_line("ok\nok\n\xff\xfe\n") == 3);
    REQUIRE(find_invalid_utf8_line("\xc3") == 1);
    // overlong '/'
    REQUIRE(find_invalid_utf8_line("a\n\xc0\xaf") == 2);
    // UTF-16 surrogate encoded in UTF-8
    REQUIRE(find_invalid_utf8_line("\xed\xa0\x80") == 1);
}

TEST_CASE("load_patterns reads a real file in order", "[pattern_file]") {
    TempDir tmp;
    auto file = tmp.write_file("patterns.txt",
        "# build outputs\n*.o\n\n  build/  \n[abc]*.txt\n!keep.o\n");

    auto r = load_patterns(file);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{"*.o", "build/", "[abc]*.txt", "!keep.o"});
}

TEST_CASE("load_patterns reports a missing file", "[pattern_file][error]") {
    TempDir tmp;
    auto r = load_patterns(tmp.path / "nope.txt");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SearchError::PatternFile);
    REQUIRE(r.error().fault == SearchError::NotFound);
    REQUIRE(r.error().file == (tmp.path / "nope.txt").string());
    REQUIRE_THAT(r.error().format(), Contains("file not found"));
}

TEST_CASE("load_patterns reports a directory", "[pattern_file][error]") {
    TempDir tmp;
    auto dir = tmp.mkdir("patterns.d");
    auto r = load_patterns(dir);
    REQUIRE(r.is_err());
    REQUIRE(r.error().fault == SearchError::IsDirectory);
    REQUIRE(r.error().message == "is a directory");
}

TEST_CASE("load_patterns reports invalid UTF-8 with a line", "[pattern_file][error]") {
    TempDir tmp;
    auto file = tmp.write_file("bad.txt", "*.py\n*.txt\n\xff\xfe bad\n");
    auto r = load_patterns(file);
    REQUIRE(r.is_err());
    REQUIRE(r.error().fault == SearchError::InvalidEncoding);
    REQUIRE(r.error().line == 3);
    REQUIRE_THAT(r.error().format(), Contains("bad.txt:3"));
}

TEST_CASE("load_patterns reports permission denied", "[pattern_file][error]") {
    if (geteuid() == 0) {
        WARN("running as root, skipping permission test");
        return;
    }
    TempDir tmp;
    auto file = tmp.write_file("secret.txt", "*.py\n");
    chmod(file.c_str(), 0);

    auto r = load_patterns(file);
    chmod(file.c_str(), 0644);

    REQUIRE(r.is_err());
    REQUIRE(r.error().fault == SearchError::PermissionDenied);
    REQUIRE_THAT(r.error().message, Contains("permission denied"));
}

TEST_CASE("load_pattern_files concatenates in order", "[pattern_file]") {
    TempDir tmp;
    auto a = tmp.write_file("a.txt", "*.py\n");
    auto b = tmp.write_file("b.txt", "*.txt\n*.md\n");

    auto r = load_pattern_files({a, b});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{"*.py", "*.txt", "*.md"});

    auto none = load_pattern_files({});
    REQUIRE(none.is_ok());
    REQUIRE(none.value().empty());
}

TEST_CASE("load_pattern_files stops at the first bad file", "[pattern_file][error]") {
    TempDir tmp;
    auto a = tmp.write_file("a.txt", "*.py\n");
    auto r = load_pattern_files({a, tmp.path / "missing.txt"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().fault == SearchError::NotFound);
}

TEST_CASE("loaded patterns drive a traversal", "[pattern_file]") {
    TempDir tmp;
    tmp.write_file("main.py");
    tmp.write_file("test_main.py");
    tmp.write_file("readme.md");
    auto excl = tmp.write_file("exclude.txt", "# tests\ntest_*\n");

    auto patterns = load_patterns(excl);
    REQUIRE(patterns.is_ok());

    TraversalOptions opts;
    opts.pattern = "*.py";
    opts.exclude = patterns.value();
    auto r = traverse(tmp.path, opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::filesystem::path>{tmp.path / "main.py"});
}

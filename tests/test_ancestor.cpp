#include <catch2/catch.hpp>
#include <searchpath/ancestor.hpp>
#include "temp_dir.hpp"

using namespace searchpath;
namespace fs = std::filesystem;

using Patterns = std::vector<std::string>;

TEST_CASE("merge_patterns puts ancestors first", "[ancestor]") {
    REQUIRE(merge_patterns({"a", "b"}, {"c", "d"}) == Patterns{"a", "b", "c", "d"});
    REQUIRE(merge_patterns({}, {"a", "b"}) == Patterns{"a", "b"});
    REQUIRE(merge_patterns({"a", "b"}, {}) == Patterns{"a", "b"});
    REQUIRE(merge_patterns({}, {}).empty());
}

TEST_CASE("ancestor_dirs lists root down to the parent", "[ancestor]") {
    fs::path root = "/work/project";

    auto at_root = ancestor_dirs(root / "file.py", root);
    REQUIRE(at_root == std::vector<fs::path>{root});

    auto nested = ancestor_dirs(root / "a" / "b" / "file.py", root);
    REQUIRE(nested == std::vector<fs::path>{root, root / "a", root / "a" / "b"});

    auto trailing = ancestor_dirs(root / "a" / "file.py", "/work/project/");
    REQUIRE(trailing == std::vector<fs::path>{root, root / "a"});
}

TEST_CASE("ancestor_dirs is empty outside the root", "[ancestor]") {
    REQUIRE(ancestor_dirs("/work/other/file.py", "/work/project").empty());
    REQUIRE(ancestor_dirs("/work/file.py", "/work/project").empty());
    REQUIRE(ancestor_dirs("/work/project-two/file.py", "/work/project").empty());
}

TEST_CASE("collect returns empty without filenames", "[ancestor]") {
    TempDir tmp;
    tmp.write_file(".include", "*.py\n");
    auto file = tmp.write_file("file.py");

    auto r = collect_ancestor_patterns(file, tmp.path, std::nullopt, std::nullopt);
    REQUIRE(r.empty());
}

TEST_CASE("collect returns empty for a file outside the root", "[ancestor]") {
    TempDir tmp;
    auto file = tmp.write_file("other/file.py");
    tmp.write_file("project/.include", "*.py\n");
    tmp.write_file("other/.include", "*.py\n");

    auto r = collect_ancestor_patterns(file, tmp.path / "project", std::string(".include"),
                                       std::nullopt);
    REQUIRE(r.empty());
}

TEST_CASE("collect loads include and exclude from the root", "[ancestor]") {
    TempDir tmp;
    tmp.write_file(".include", "*.py\n");
    tmp.write_file(".exclude", "test_*\n");
    auto file = tmp.write_file("main.py");

    auto inc_only = collect_ancestor_patterns(file, tmp.path, std::string(".include"),
                                              std::nullopt);
    REQUIRE(inc_only.include == Patterns{"*.py"});
    REQUIRE(inc_only.exclude.empty());

    auto both = collect_ancestor_patterns(file, tmp.path, std::string(".include"),
                                          std::string(".exclude"));
    REQUIRE(both.include == Patterns{"*.py"});
    REQUIRE(both.exclude == Patterns{"test_*"});
}

TEST_CASE("collect appends child patterns after parent patterns", "[ancestor]") {
    TempDir tmp;
    tmp.write_file(".pat", "root\n");
    tmp.write_file("a/.pat", "a\n");
    tmp.write_file("a/b/.pat", "b\n");
    tmp.write_file("a/b/c/.pat", "below the file\n");
    auto file = tmp.write_file("a/b/file.py");

    auto r = collect_ancestor_patterns(file, tmp.path, std::string(".pat"), std::nullopt);
    REQUIRE(r.include == Patterns{"root", "a", "b"});
}

TEST_CASE("collect skips missing pattern files", "[ancestor]") {
    TempDir tmp;
    tmp.write_file("sub/.ignore", "*.tmp\n");
    auto file = tmp.write_file("sub/deeper/file.py");

    auto r = collect_ancestor_patterns(file, tmp.path, std::nullopt, std::string(".ignore"));
    REQUIRE(r.exclude == Patterns{"*.tmp"});
}

TEST_CASE("collect never reads above the entry root", "[ancestor]") {
    TempDir tmp;
    tmp.write_file(".ignore", "*.py\n");
    tmp.write_file("project/.ignore", "*.log\n");
    auto file = tmp.write_file("project/src/main.py");

    auto r = collect_ancestor_patterns(file, tmp.path / "project", std::nullopt,
                                       std::string(".ignore"));
    REQUIRE(r.exclude == Patterns{"*.log"});
}

TEST_CASE("collect is lenient about unreadable pattern files", "[ancestor]") {
    TempDir tmp;
    tmp.mkdir(".ignore");  // a directory, not a file
    tmp.write_file("sub/.ignore", "\xff\xfe\n");
    auto file = tmp.write_file("sub/main.py");

    auto r = collect_ancestor_patterns(file, tmp.path, std::nullopt, std::string(".ignore"));
    REQUIRE(r.empty());
}

TEST_CASE("collect reuses cached pattern files", "[ancestor]") {
    TempDir tmp;
    tmp.write_file(".pat", "cached\n");
    auto file = tmp.write_file("file.py");
    PatternFileCache cache;

    auto first = collect_ancestor_patterns(file, tmp.path, std::string(".pat"), std::nullopt,
                                           &cache);
    REQUIRE(first.include == Patterns{"cached"});
    std::string key = (tmp.path / ".pat").string();
    REQUIRE(cache.count(key) == 1);
    REQUIRE(cache[key] == Patterns{"cached"});

    cache[key] = {"modified"};
    auto second = collect_ancestor_patterns(file, tmp.path, std::string(".pat"), std::nullopt,
                                            &cache);
    REQUIRE(second.include == Patterns{"modified"});
}

TEST_CASE("collect caches absent files as empty", "[ancestor]") {
    TempDir tmp;
    auto file = tmp.write_file("a/file.py");
    PatternFileCache cache;

    auto r = collect_ancestor_patterns(file, tmp.path, std::string(".pat"), std::nullopt, &cache);
    REQUIRE(r.empty());
    REQUIRE(cache.size() == 2);

    // Created after the first lookup; the cache still answers
    tmp.write_file("a/.pat", "late\n");
    auto again = collect_ancestor_patterns(file, tmp.path, std::string(".pat"), std::nullopt,
                                           &cache);
    REQUIRE(again.empty());
}

TEST_CASE("collect strips whitespace and skips comments", "[ancestor]") {
    TempDir tmp;
    tmp.write_file(".pat", "# comment\n  *.py  \n\n*.txt\n   # indented\n*.json\n");
    auto file = tmp.write_file("file.py");

    auto r = collect_ancestor_patterns(file, tmp.path, std::string(".pat"), std::nullopt);
    REQUIRE(r.include == Patterns{"*.py", "*.txt", "*.json"});
}

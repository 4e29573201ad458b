// demo_search.cpp
//
// Runs one search described by a TOML config and prints every match with
// its scope:
//
//     ./demo_search search.toml              # use the config's pattern
//     ./demo_search search.toml '**/*.md'    # override the pattern
//
// If ~/.config/searchpath/config.toml exists it is loaded first and the
// given file is layered on top. Set SEARCHPATH_LOG=debug to watch the walk.

#include <searchpath/config.hpp>
#include <searchpath/log.hpp>
#include <searchpath/result.hpp>
#include <searchpath/search_path.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace searchpath;

static Result<SearchConfig> load_layers(const std::string& path) {
    SearchConfig cfg;

    std::string user = user_config_path();
    std::error_code ec;
    if (!user.empty() && fs::is_regular_file(user, ec)) {
        auto base = SearchConfig::load(user);
        SEARCHPATH_TRY(base);
        log::debug("loaded user config %s", user.c_str());
        cfg = std::move(base).value();
    }

    auto local = SearchConfig::load(path);
    SEARCHPATH_TRY(local);
    cfg.merge(local.value());
    return Result<SearchConfig>::ok(std::move(cfg));
}

static Status run(int argc, char** argv) {
    if (argc < 2) {
        return SearchError{SearchError::InvalidArg,
            "no config file specified",
            "usage: demo_search <search.toml> [pattern]"};
    }

    auto cfg = load_layers(argv[1]);
    SEARCHPATH_TRY(cfg);
    const SearchConfig& config = cfg.value();

    if (config.log_level) log::set_level(*config.log_level);
    log::init_from_env();

    std::string pattern = argc >= 3 ? argv[2] : config.pattern;
    auto matcher = make_matcher(config.matcher);
    SearchPath sp = config.search_path();

    log::info("searching %s for '%s' (%s matcher)", sp.to_string().c_str(),
              pattern.c_str(), matcher_kind_name(config.matcher));

    auto found = sp.matches(pattern, config.options(matcher.get()));
    SEARCHPATH_TRY(found);

    for (const auto& m : found.value()) {
        std::cout << m.scope << "\t" << m.path.string() << "\n";
    }
    log::info("%zu match(es)", found.value().size());
    return ok_status();
}

int main(int argc, char** argv) {
    log::set_level(log::Info);

    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return 0;
}

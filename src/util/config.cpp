#include <searchpath/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace searchpath {

namespace fs = std::filesystem;

static SearchError config_error(const std::string& msg) {
    return SearchError{SearchError::Configuration, msg};
}

static fs::path expand_path(const std::string& raw, const fs::path& base_dir) {
    fs::path p;
    if (raw == "~" || raw.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home) {
            p = fs::path(home);
            if (raw.size() > 2) p /= raw.substr(2);
            return p;
        }
    }
    p = fs::path(raw);
    if (p.is_relative() && !base_dir.empty()) p = base_dir / p;
    return p;
}

// A string or an array of strings
static Result<std::vector<std::string>> string_list(toml::node_view<const toml::node> node,
                                                    const std::string& key) {
    std::vector<std::string> out;
    if (!node) return Result<std::vector<std::string>>::ok(std::move(out));

    if (auto s = node.value<std::string>()) {
        out.push_back(*s);
        return Result<std::vector<std::string>>::ok(std::move(out));
    }

    auto arr = node.as_array();
    if (!arr) {
        return config_error("'" + key + "' must be a string or an array of strings");
    }
    for (const auto& el : *arr) {
        auto s = el.value<std::string>();
        if (!s) return config_error("'" + key + "' must contain only strings");
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

static Result<std::optional<std::string>> optional_string(toml::node_view<const toml::node> node,
                                                          const std::string& key) {
    if (!node) return Result<std::optional<std::string>>::ok(std::nullopt);
    auto s = node.value<std::string>();
    if (!s) return config_error("'" + key + "' must be a string");
    return Result<std::optional<std::string>>::ok(std::optional<std::string>(*s));
}

static Result<std::optional<bool>> optional_bool(toml::node_view<const toml::node> node,
                                                 const std::string& key) {
    if (!node) return Result<std::optional<bool>>::ok(std::nullopt);
    auto b = node.value<bool>();
    if (!b) return config_error("'" + key + "' must be a boolean");
    return Result<std::optional<bool>>::ok(std::optional<bool>(*b));
}

static Status parse_search_table(const toml::table& search, const fs::path& base_dir,
                                 SearchConfig& cfg) {
    auto pattern = optional_string(search["pattern"], "search.pattern");
    if (pattern.is_err()) return std::move(pattern).error();
    if (pattern.value()) {
        cfg.pattern = *pattern.value();
        cfg.pattern_set = true;
    }

    auto kind = optional_string(search["kind"], "search.kind");
    if (kind.is_err()) return std::move(kind).error();
    if (kind.value()) {
        auto k = parse_kind(*kind.value());
        if (k.is_err()) return config_error(k.error().message);
        cfg.kind = k.value();
        cfg.kind_set = true;
    }

    auto matcher = optional_string(search["matcher"], "search.matcher");
    if (matcher.is_err()) return std::move(matcher).error();
    if (matcher.value()) {
        auto m = parse_matcher_kind(*matcher.value());
        if (m.is_err()) return config_error(m.error().message);
        cfg.matcher = m.value();
        cfg.matcher_set = true;
    }

    auto dedupe = optional_bool(search["dedupe"], "search.dedupe");
    if (dedupe.is_err()) return std::move(dedupe).error();
    if (dedupe.value()) {
        cfg.dedupe = *dedupe.value();
        cfg.dedupe_set = true;
    }

    auto follow = optional_bool(search["follow-symlinks"], "search.follow-symlinks");
    if (follow.is_err()) return std::move(follow).error();
    if (follow.value()) {
        cfg.follow_symlinks = *follow.value();
        cfg.follow_symlinks_set = true;
    }

    auto include = string_list(search["include"], "search.include");
    if (include.is_err()) return std::move(include).error();
    cfg.include = std::move(include).value();

    auto exclude = string_list(search["exclude"], "search.exclude");
    if (exclude.is_err()) return std::move(exclude).error();
    cfg.exclude = std::move(exclude).value();

    auto include_from = string_list(search["include-from"], "search.include-from");
    if (include_from.is_err()) return std::move(include_from).error();
    for (const auto& p : include_from.value()) cfg.include_from.push_back(expand_path(p, base_dir));

    auto exclude_from = string_list(search["exclude-from"], "search.exclude-from");
    if (exclude_from.is_err()) return std::move(exclude_from).error();
    for (const auto& p : exclude_from.value()) cfg.exclude_from.push_back(expand_path(p, base_dir));

    auto inc_anc = optional_string(search["include-from-ancestors"], "search.include-from-ancestors");
    if (inc_anc.is_err()) return std::move(inc_anc).error();
    cfg.include_from_ancestors = inc_anc.value();

    auto exc_anc = optional_string(search["exclude-from-ancestors"], "search.exclude-from-ancestors");
    if (exc_anc.is_err()) return std::move(exc_anc).error();
    cfg.exclude_from_ancestors = exc_anc.value();

    return ok_status();
}

static Status parse_entries(const toml::array& entries, const fs::path& base_dir,
                            SearchConfig& cfg) {
    std::set<std::string> seen_scopes;
    size_t index = 0;
    for (const auto& el : entries) {
        std::string where = "entries[" + std::to_string(index++) + "]";
        auto tbl = el.as_table();
        if (!tbl) return config_error(where + " must be a table");

        auto path = optional_string((*tbl)["path"], where + ".path");
        if (path.is_err()) return std::move(path).error();
        if (!path.value() || path.value()->empty()) {
            return config_error(where + " is missing 'path'");
        }
        fs::path root = expand_path(*path.value(), base_dir);

        auto scope = optional_string((*tbl)["scope"], where + ".scope");
        if (scope.is_err()) return std::move(scope).error();
        if (!scope.value()) {
            cfg.entries.emplace_back(root);
            continue;
        }

        const std::string& name = *scope.value();
        if (name.empty()) return config_error(where + " has an empty scope name");
        if (!seen_scopes.insert(name).second) {
            return config_error("duplicate scope '" + name + "'");
        }
        cfg.entries.emplace_back(name, std::optional<fs::path>(root));
    }
    return ok_status();
}

Result<SearchConfig> SearchConfig::parse(const std::string& toml_str, const fs::path& base_dir) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SearchError{SearchError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    SearchConfig cfg;

    if (auto lvl = doc["log-level"]) {
        auto s = lvl.value<std::string>();
        if (!s) return config_error("'log-level' must be a string");
        auto parsed = log::parse_level(*s);
        if (!parsed) return config_error("unknown log level: " + *s);
        cfg.log_level = parsed;
    }

    if (auto search = doc["search"]) {
        auto tbl = search.as_table();
        if (!tbl) return config_error("[search] must be a table");
        auto st = parse_search_table(*tbl, base_dir, cfg);
        if (st.is_err()) return std::move(st).error();
    }

    if (auto entries = doc["entries"]) {
        auto arr = entries.as_array();
        if (!arr) return config_error("'entries' must be an array of tables");
        auto st = parse_entries(*arr, base_dir, cfg);
        if (st.is_err()) return std::move(st).error();
    }

    return Result<SearchConfig>::ok(std::move(cfg));
}

Result<SearchConfig> SearchConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SearchError{SearchError::IO, "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = SearchConfig::parse(ss.str(), fs::absolute(fs::path(path)).parent_path());
    if (cfg.is_err()) {
        SearchError e = std::move(cfg).error();
        e.file = path;
        return e;
    }
    return cfg;
}

void SearchConfig::merge(const SearchConfig& other) {
    std::vector<Entry> merged = other.entries;
    merged.insert(merged.end(), entries.begin(), entries.end());
    entries = std::move(merged);

    if (other.pattern_set) { pattern = other.pattern; pattern_set = true; }
    if (other.kind_set) { kind = other.kind; kind_set = true; }
    if (other.matcher_set) { matcher = other.matcher; matcher_set = true; }
    if (other.dedupe_set) { dedupe = other.dedupe; dedupe_set = true; }
    if (other.follow_symlinks_set) {
        follow_symlinks = other.follow_symlinks;
        follow_symlinks_set = true;
    }

    include.insert(include.end(), other.include.begin(), other.include.end());
    exclude.insert(exclude.end(), other.exclude.begin(), other.exclude.end());
    include_from.insert(include_from.end(), other.include_from.begin(), other.include_from.end());
    exclude_from.insert(exclude_from.end(), other.exclude_from.begin(), other.exclude_from.end());

    if (other.include_from_ancestors) include_from_ancestors = other.include_from_ancestors;
    if (other.exclude_from_ancestors) exclude_from_ancestors = other.exclude_from_ancestors;
    if (other.log_level) log_level = other.log_level;
}

SearchPath SearchConfig::search_path() const {
    return SearchPath(entries);
}

SearchOptions SearchConfig::options(PathMatcher* m) const {
    SearchOptions opts;
    opts.kind = kind;
    opts.include = include;
    opts.exclude = exclude;
    opts.include_from = include_from;
    opts.exclude_from = exclude_from;
    opts.include_from_ancestors = include_from_ancestors;
    opts.exclude_from_ancestors = exclude_from_ancestors;
    opts.matcher = m;
    opts.follow_symlinks = follow_symlinks;
    opts.dedupe = dedupe;
    return opts;
}

std::string user_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/searchpath/config.toml";
}

} // namespace searchpath

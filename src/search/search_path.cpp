#include <searchpath/search_path.hpp>
#include <searchpath/log.hpp>
#include <searchpath/pattern_file.hpp>
#include <unordered_set>

namespace searchpath {

namespace fs = std::filesystem;

static bool has_root(const Entry& e) {
    return e.root.has_value() && !e.root->empty();
}

SearchPath::SearchPath(std::initializer_list<Entry> entries)
    : SearchPath(std::vector<Entry>(entries)) {}

SearchPath::SearchPath(const std::vector<Entry>& entries) {
    // Bare roots are numbered by their position among bare roots only
    size_t bare_index = 0;
    for (const auto& e : entries) {
        if (!has_root(e)) continue;
        if (e.is_bare()) {
            items_.emplace_back("dir" + std::to_string(bare_index++), *e.root);
        } else {
            items_.emplace_back(*e.scope, *e.root);
        }
    }
}

SearchPath SearchPath::from_items(std::vector<Item> items) {
    SearchPath sp;
    sp.items_ = std::move(items);
    return sp;
}

std::vector<fs::path> SearchPath::dirs() const {
    std::vector<fs::path> out;
    out.reserve(items_.size());
    for (const auto& item : items_) out.push_back(item.second);
    return out;
}

std::vector<std::string> SearchPath::scopes() const {
    std::vector<std::string> out;
    out.reserve(items_.size());
    for (const auto& item : items_) out.push_back(item.first);
    return out;
}

SearchPath SearchPath::operator+(const SearchPath& other) const {
    std::vector<Item> joined = items_;
    joined.insert(joined.end(), other.items_.begin(), other.items_.end());
    return from_items(std::move(joined));
}

SearchPath SearchPath::with_suffix(const std::vector<std::string>& parts) const {
    std::vector<Item> out;
    out.reserve(items_.size());
    for (const auto& [scope, root] : items_) {
        fs::path p = root;
        for (const auto& part : parts) p /= part;
        out.emplace_back(scope, std::move(p));
    }
    return from_items(std::move(out));
}

SearchPath SearchPath::filter(const std::function<bool(const fs::path&)>& pred) const {
    std::vector<Item> out;
    for (const auto& item : items_) {
        if (pred(item.second)) out.push_back(item);
    }
    return from_items(std::move(out));
}

SearchPath SearchPath::existing() const {
    return filter([](const fs::path& p) {
        std::error_code ec;
        return fs::exists(p, ec);
    });
}

std::string SearchPath::to_string() const {
    if (items_.empty()) return "(empty)";
    std::string out;
    for (const auto& [scope, root] : items_) {
        if (!out.empty()) out += ", ";
        out += scope + ": " + root.string();
    }
    return out;
}

Status SearchPath::search(const std::string& pattern, const SearchOptions& opts,
                          const std::function<bool(Match&&)>& sink) const {
    auto include_files = load_pattern_files(opts.include_from);
    if (include_files.is_err()) return std::move(include_files).error();
    auto exclude_files = load_pattern_files(opts.exclude_from);
    if (exclude_files.is_err()) return std::move(exclude_files).error();

    std::vector<std::string> include = merge_patterns(opts.include, include_files.value());
    std::vector<std::string> exclude = merge_patterns(opts.exclude, exclude_files.value());

    std::unique_ptr<PathMatcher> owned;
    PathMatcher* matcher = opts.matcher;
    if (!matcher) {
        owned = std::make_unique<GlobMatcher>();
        matcher = owned.get();
    }

    const bool use_ancestors = opts.include_from_ancestors || opts.exclude_from_ancestors;
    PatternFileCache cache;

    for (const auto& [scope, root] : items_) {
        TraversalOptions topts;
        topts.pattern = pattern;
        topts.kind = opts.kind;
        topts.exclude = exclude;
        topts.matcher = matcher;
        topts.follow_symlinks = opts.follow_symlinks;
        // With ancestor files, include filtering happens per candidate below
        if (!use_ancestors) topts.include = include;

        Walker walker(root, std::move(topts));
        log::debug("searching scope '%s' at %s", scope.c_str(), walker.root().string().c_str());

        WalkEntry entry;
        while (true) {
            auto more = walker.next(entry);
            if (more.is_err()) return std::move(more).error();
            if (!more.value()) break;

            if (use_ancestors) {
                auto anc = collect_ancestor_patterns(entry.path, walker.root(),
                                                     opts.include_from_ancestors,
                                                     opts.exclude_from_ancestors, &cache);
                auto keep = matcher->matches(entry.relative, entry.is_dir,
                                             merge_patterns(anc.include, include),
                                             merge_patterns(anc.exclude, exclude));
                if (keep.is_err()) return std::move(keep).error();
                if (!keep.value()) continue;
            }

            if (!sink(Match{std::move(entry.path), scope, walker.root()})) {
                return ok_status();
            }
        }
    }
    return ok_status();
}

Result<std::optional<fs::path>> SearchPath::first(const std::string& pattern,
                                                  const SearchOptions& opts) const {
    auto found = match(pattern, opts);
    if (found.is_err()) return std::move(found).error();
    std::optional<fs::path> out;
    if (found.value()) out = found.value()->path;
    return Result<std::optional<fs::path>>::ok(std::move(out));
}

Result<std::optional<Match>> SearchPath::match(const std::string& pattern,
                                               const SearchOptions& opts) const {
    std::optional<Match> found;
    auto st = search(pattern, opts, [&](Match&& m) {
        found = std::move(m);
        return false;
    });
    if (st.is_err()) return std::move(st).error();
    return Result<std::optional<Match>>::ok(std::move(found));
}

Result<std::vector<fs::path>> SearchPath::all(const std::string& pattern,
                                              const SearchOptions& opts) const {
    auto found = matches(pattern, opts);
    if (found.is_err()) return std::move(found).error();
    std::vector<fs::path> out;
    out.reserve(found.value().size());
    for (auto& m : found.value()) out.push_back(std::move(m.path));
    return Result<std::vector<fs::path>>::ok(std::move(out));
}

Result<std::vector<Match>> SearchPath::matches(const std::string& pattern,
                                               const SearchOptions& opts) const {
    std::vector<Match> out;
    std::unordered_set<std::string> seen;
    auto st = search(pattern, opts, [&](Match&& m) {
        if (opts.dedupe && !seen.insert(m.relative_key()).second) return true;
        out.push_back(std::move(m));
        return true;
    });
    if (st.is_err()) return std::move(st).error();
    return Result<std::vector<Match>>::ok(std::move(out));
}

// ---- One-shot forms ----

Result<std::optional<fs::path>> first(const std::string& pattern,
                                      const std::vector<Entry>& entries,
                                      const SearchOptions& opts) {
    return SearchPath(entries).first(pattern, opts);
}

Result<std::optional<Match>> match(const std::string& pattern,
                                   const std::vector<Entry>& entries,
                                   const SearchOptions& opts) {
    return SearchPath(entries).match(pattern, opts);
}

Result<std::vector<fs::path>> all(const std::string& pattern,
                                  const std::vector<Entry>& entries,
                                  const SearchOptions& opts) {
    return SearchPath(entries).all(pattern, opts);
}

Result<std::vector<Match>> matches(const std::string& pattern,
                                   const std::vector<Entry>& entries,
                                   const SearchOptions& opts) {
    return SearchPath(entries).matches(pattern, opts);
}

} // namespace searchpath

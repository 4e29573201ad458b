#include <searchpath/traversal.hpp>
#include <searchpath/log.hpp>
#include <algorithm>

namespace searchpath {

namespace fs = std::filesystem;

Result<Kind> parse_kind(const std::string& name) {
    if (name == "files") return Result<Kind>::ok(Kind::Files);
    if (name == "dirs") return Result<Kind>::ok(Kind::Dirs);
    if (name == "both") return Result<Kind>::ok(Kind::Both);
    return SearchError{SearchError::InvalidArg,
        "unknown kind: " + name,
        "expected one of: files, dirs, both"};
}

const char* kind_name(Kind kind) {
    switch (kind) {
        case Kind::Files: return "files";
        case Kind::Dirs:  return "dirs";
        case Kind::Both:  return "both";
    }
    return "unknown";
}

fs::path resolve_root(const fs::path& root) {
    std::error_code ec;
    fs::path abs = fs::absolute(root, ec);
    if (ec) return root;
    fs::path canon = fs::weakly_canonical(abs, ec);
    if (ec) return abs.lexically_normal();
    return canon;
}

static std::string join_rel(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

Walker::Walker(const fs::path& root, TraversalOptions opts)
    : root_(resolve_root(root)), opts_(std::move(opts)) {
    if (opts_.pattern == "**") {
        include_ = opts_.include;
    } else {
        include_.push_back(opts_.pattern);
        include_.insert(include_.end(), opts_.include.begin(), opts_.include.end());
    }

    if (opts_.matcher) {
        matcher_ = opts_.matcher;
    } else {
        owned_matcher_ = std::make_unique<GlobMatcher>();
        matcher_ = owned_matcher_.get();
    }

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        log::debug("search root %s is not a directory, skipping", root_.string().c_str());
        return;
    }

    Frame top{root_, "", {}};
    if (opts_.follow_symlinks) top.chain.push_back(root_);
    stack_.push_back(std::move(top));
}

Status Walker::expand(const Frame& frame) {
    struct Child {
        std::string name;
        bool is_link;
    };
    std::vector<Child> dirs;
    std::vector<std::string> files;

    std::error_code ec;
    fs::directory_iterator it(frame.dir, ec);
    if (ec) {
        log::debug("cannot read directory %s: %s", frame.dir.string().c_str(),
                   ec.message().c_str());
        return ok_status();
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const auto& entry = *it;
        std::string name = entry.path().filename().string();

        std::error_code lec;
        bool is_link = entry.is_symlink(lec);
        std::error_code sec;
        auto st = entry.status(sec);
        if (is_link && (sec || !fs::exists(st))) {
            log::trace("skipping broken symlink %s", entry.path().string().c_str());
            continue;
        }

        if (fs::is_directory(st)) {
            dirs.push_back({std::move(name), is_link});
        } else {
            files.push_back(std::move(name));
        }
    }
    if (ec) {
        log::debug("error while listing %s: %s", frame.dir.string().c_str(),
                   ec.message().c_str());
    }

    std::sort(dirs.begin(), dirs.end(),
              [](const Child& a, const Child& b) { return a.name < b.name; });
    std::sort(files.begin(), files.end());

    // Prune before descending; include never prunes
    if (!opts_.exclude.empty()) {
        std::vector<Child> kept;
        for (auto& d : dirs) {
            auto keep = matcher_->matches(join_rel(frame.rel, d.name), true, {}, opts_.exclude);
            if (keep.is_err()) return std::move(keep).error();
            if (keep.value()) kept.push_back(std::move(d));
        }
        dirs.swap(kept);
    }

    if (opts_.kind == Kind::Dirs || opts_.kind == Kind::Both) {
        for (const auto& d : dirs) {
            std::string rel = join_rel(frame.rel, d.name);
            auto hit = matcher_->matches(rel, true, include_, opts_.exclude);
            if (hit.is_err()) return std::move(hit).error();
            if (hit.value()) ready_.push_back({frame.dir / d.name, std::move(rel), true});
        }
    }

    if (opts_.kind == Kind::Files || opts_.kind == Kind::Both) {
        for (const auto& f : files) {
            std::string rel = join_rel(frame.rel, f);
            auto hit = matcher_->matches(rel, false, include_, opts_.exclude);
            if (hit.is_err()) return std::move(hit).error();
            if (hit.value()) ready_.push_back({frame.dir / f, std::move(rel), false});
        }
    }

    // Reverse push keeps name order when popping
    for (auto d = dirs.rbegin(); d != dirs.rend(); ++d) {
        if (d->is_link && !opts_.follow_symlinks) continue;

        Frame child{frame.dir / d->name, join_rel(frame.rel, d->name), {}};
        if (opts_.follow_symlinks) {
            std::error_code cec;
            fs::path canon = fs::canonical(child.dir, cec);
            if (cec) {
                log::debug("cannot resolve %s, skipping", child.dir.string().c_str());
                continue;
            }
            if (std::find(frame.chain.begin(), frame.chain.end(), canon) != frame.chain.end()) {
                log::debug("symlink cycle at %s, not descending", child.dir.string().c_str());
                continue;
            }
            child.chain = frame.chain;
            child.chain.push_back(std::move(canon));
        }
        stack_.push_back(std::move(child));
    }

    return ok_status();
}

Result<bool> Walker::next(WalkEntry& out) {
    while (ready_.empty()) {
        if (stack_.empty()) return Result<bool>::ok(false);
        Frame frame = std::move(stack_.back());
        stack_.pop_back();
        auto st = expand(frame);
        if (st.is_err()) {
            stack_.clear();
            ready_.clear();
            return std::move(st).error();
        }
    }

    out = std::move(ready_.front());
    ready_.pop_front();
    return Result<bool>::ok(true);
}

Result<std::vector<fs::path>> traverse(const fs::path& root, const TraversalOptions& opts) {
    Walker walker(root, opts);
    std::vector<fs::path> paths;
    WalkEntry entry;
    while (true) {
        auto more = walker.next(entry);
        if (more.is_err()) return std::move(more).error();
        if (!more.value()) break;
        paths.push_back(std::move(entry.path));
    }
    return Result<std::vector<fs::path>>::ok(std::move(paths));
}

} // namespace searchpath

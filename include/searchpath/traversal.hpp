#pragma once

#include <searchpath/matcher.hpp>
#include <searchpath/result.hpp>
#include <deque>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace searchpath {

enum class Kind { Files, Dirs, Both };

Result<Kind> parse_kind(const std::string& name);
const char* kind_name(Kind kind);

struct TraversalOptions {
    // "**" adds no constraint; anything else is OR-ed with `include`
    std::string pattern = "**";
    Kind kind = Kind::Files;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    PathMatcher* matcher = nullptr;  // null: a private GlobMatcher
    bool follow_symlinks = true;
};

struct WalkEntry {
    std::filesystem::path path;  // root / relative
    std::string relative;        // '/'-separated, relative to the root
    bool is_dir = false;
};

// Lazy, single-pass walk of one directory tree.
//
// Each directory is read once, its entries sorted by name, excluded
// subdirectories pruned (exclude patterns only), and the surviving entries
// of the requested kind filtered with the full include/exclude contract.
// Children are then visited depth-first in name order.
//
// A missing or non-directory root produces nothing. Unreadable directories
// and broken symlinks are skipped. With follow_symlinks, a symlinked
// directory that points back into its own ancestor chain is listed but not
// entered again.
class Walker {
public:
    Walker(const std::filesystem::path& root, TraversalOptions opts);

    // ok(true) and fills `out`, ok(false) when exhausted, or a pattern error.
    Result<bool> next(WalkEntry& out);

    const std::filesystem::path& root() const { return root_; }

private:
    struct Frame {
        std::filesystem::path dir;
        std::string rel;
        std::vector<std::filesystem::path> chain;  // canonical ancestors, symlink mode only
    };

    Status expand(const Frame& frame);

    std::filesystem::path root_;
    TraversalOptions opts_;
    std::vector<std::string> include_;
    std::unique_ptr<PathMatcher> owned_matcher_;
    PathMatcher* matcher_ = nullptr;
    std::vector<Frame> stack_;
    std::deque<WalkEntry> ready_;
};

// Resolve `root` to an absolute path with symlinks resolved where possible.
std::filesystem::path resolve_root(const std::filesystem::path& root);

// Collects a whole walk.
Result<std::vector<std::filesystem::path>> traverse(const std::filesystem::path& root,
                                                    const TraversalOptions& opts = {});

} // namespace searchpath

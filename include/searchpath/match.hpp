#pragma once

#include <filesystem>
#include <string>

namespace searchpath {

// One search result with its provenance.
struct Match {
    std::filesystem::path path;    // absolute
    std::string scope;             // entry that produced it
    std::filesystem::path source;  // that entry's resolved root

    std::filesystem::path relative() const { return path.lexically_relative(source); }

    // '/'-separated relative path; the deduplication key
    std::string relative_key() const { return relative().generic_string(); }

    bool operator==(const Match& o) const {
        return path == o.path && scope == o.scope && source == o.source;
    }
    bool operator!=(const Match& o) const { return !(*this == o); }
};

} // namespace searchpath

#pragma once
#include <string>
#include <vector>

#include "graph/Profile.hpp"
#include "graph/ProfileStore.hpp"

namespace netmatch {

enum class PathKind {
    Direct,
    TwoHop,
    None
};

// Heuristic relationship distance; never looks past depth 2.
struct PathClassification {
    PathKind kind = PathKind::None;
    std::string via;   // name of one mutual connection for TwoHop

    // ["direct"], ["2-hop", "<name>"] or ["no_direct_path"]
    std::vector<std::string> labels() const;
};

const char* path_kind_str(PathKind k);

// True mutuals of a and b in a's connection order, at most `limit`.
// NotFoundError if either id is unknown.
std::vector<ProfileSummary> mutual_connections(const ProfileStore& store,
                                               const std::string& a,
                                               const std::string& b,
                                               size_t limit = 5);

PathClassification classify_path(const ProfileStore& store,
                                 const std::string& a,
                                 const std::string& b);

}  // namespace netmatch

#include "graph/GraphQueries.hpp"

#include <algorithm>
#include <unordered_set>

namespace netmatch {

const char* path_kind_str(PathKind k) {
    switch (k) {
        case PathKind::Direct: return "direct";
        case PathKind::TwoHop: return "2-hop";
        case PathKind::None: return "no_direct_path";
        default: return "unknown";
    }
}

std::vector<std::string> PathClassification::labels() const {
    std::vector<std::string> out;
    out.push_back(path_kind_str(kind));
    if (kind == PathKind::TwoHop) out.push_back(via);
    return out;
}

std::vector<ProfileSummary> mutual_connections(const ProfileStore& store,
                                               const std::string& a,
                                               const std::string& b,
                                               size_t limit) {
    const Profile& pa = store.get(a);
    const Profile& pb = store.get(b);

    std::unordered_set<std::string> other(pb.connections.begin(), pb.connections.end());

    std::vector<ProfileSummary> out;
    for (const auto& id : pa.connections) {
        if (out.size() >= limit) break;
        if (id == a || id == b) continue;
        if (other.find(id) == other.end()) continue;

        const Profile* m = store.find(id);
        if (!m) continue;  // load() guarantees resolution
        out.push_back(summarize(*m));
    }
    return out;
}

PathClassification classify_path(const ProfileStore& store,
                                 const std::string& a,
                                 const std::string& b) {
    const Profile& pa = store.get(a);

    PathClassification pc;
    if (std::find(pa.connections.begin(), pa.connections.end(), b) != pa.connections.end()) {
        pc.kind = PathKind::Direct;
        return pc;
    }

    auto mutuals = mutual_connections(store, a, b, 1);
    if (!mutuals.empty()) {
        pc.kind = PathKind::TwoHop;
        pc.via = mutuals.front().name;
        return pc;
    }

    pc.kind = PathKind::None;
    return pc;
}

}  // namespace netmatch

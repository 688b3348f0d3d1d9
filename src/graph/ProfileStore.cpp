#include "graph/ProfileStore.hpp"

#include <unordered_set>
#include <utility>

#include "util/Errors.hpp"
#include "util/TextUtil.hpp"

namespace netmatch {

static void dedupe_skills(std::vector<std::string>& skills) {
    std::unordered_set<std::string> seen;
    seen.reserve(skills.size() * 2 + 8);

    std::vector<std::string> out;
    out.reserve(skills.size());
    for (auto& s : skills) {
        const std::string key = textutil::normalize_key(s);
        if (key.empty()) continue;
        if (!seen.insert(key).second) continue;
        out.push_back(std::move(s));
    }
    skills = std::move(out);
}

static void check_interactions(const Profile& p,
                               const std::unordered_map<std::string, size_t>& index) {
    for (const auto& kv : p.interactions) {
        if (kv.first == p.id) {
            throw DataIntegrityError("profile " + p.id + " records an interaction with itself");
        }
        if (index.find(kv.first) == index.end()) {
            throw DataIntegrityError("profile " + p.id + " has an interaction with unknown profile " + kv.first);
        }
        const Interaction& it = kv.second;
        if (!(it.strength >= 0.0 && it.strength <= 1.0)) {
            throw DataIntegrityError("interaction " + p.id + " -> " + kv.first + " has strength outside [0,1]");
        }
        if (it.frequency < 0) {
            throw DataIntegrityError("interaction " + p.id + " -> " + kv.first + " has negative frequency");
        }
    }
}

void ProfileStore::load(std::vector<Profile> profiles, const std::vector<ConnectionEdge>& edges) {
    // Build into locals and swap at the end so a failed load leaves the store as it was.
    std::unordered_map<std::string, size_t> index;
    index.reserve(profiles.size() * 2 + 8);

    for (size_t i = 0; i < profiles.size(); ++i) {
        const std::string& id = profiles[i].id;
        if (id.empty()) {
            throw DataIntegrityError("profile at position " + std::to_string(i) + " has an empty id");
        }
        if (!index.emplace(id, i).second) {
            throw DataIntegrityError("duplicate profile id: " + id);
        }
    }

    // Undirected adjacency as sets, remembering insertion order for stable output.
    std::vector<std::unordered_set<std::string>> adj(profiles.size());

    auto add_edge = [&](const std::string& a, const std::string& b) {
        auto ia = index.find(a);
        auto ib = index.find(b);
        if (ia == index.end()) throw DataIntegrityError("connection references unknown profile " + a);
        if (ib == index.end()) throw DataIntegrityError("connection references unknown profile " + b);
        if (a == b) throw DataIntegrityError("profile " + a + " is connected to itself");

        if (adj[ia->second].insert(b).second) profiles[ia->second].connections.push_back(b);
        if (adj[ib->second].insert(a).second) profiles[ib->second].connections.push_back(a);
    };

    // Take the listed connections away first, then re-add every edge in both directions.
    std::vector<std::vector<std::string>> listed(profiles.size());
    for (size_t i = 0; i < profiles.size(); ++i) {
        listed[i] = std::move(profiles[i].connections);
        profiles[i].connections.clear();
    }

    for (size_t i = 0; i < profiles.size(); ++i) {
        for (const auto& target : listed[i]) {
            if (index.find(target) == index.end()) {
                throw DataIntegrityError("profile " + profiles[i].id + " lists unknown connection " + target);
            }
            add_edge(profiles[i].id, target);
        }
    }

    for (const auto& e : edges) add_edge(e.a, e.b);

    for (auto& p : profiles) {
        check_interactions(p, index);
        dedupe_skills(p.skills);
    }

    m_profiles = std::move(profiles);
    m_index = std::move(index);
}

const Profile* ProfileStore::find(const std::string& id) const {
    auto it = m_index.find(id);
    if (it == m_index.end()) return nullptr;
    return &m_profiles[it->second];
}

const Profile& ProfileStore::get(const std::string& id) const {
    const Profile* p = find(id);
    if (!p) throw NotFoundError("Profile " + id + " not found");
    return *p;
}

std::vector<const Profile*> ProfileStore::all_except(const std::string& id) const {
    std::vector<const Profile*> out;
    out.reserve(m_profiles.size());
    for (const auto& p : m_profiles) {
        if (p.id != id) out.push_back(&p);
    }
    return out;
}

size_t ProfileStore::edge_count() const {
    size_t degree_sum = 0;
    for (const auto& p : m_profiles) degree_sum += p.connections.size();
    return degree_sum / 2;
}

}  // namespace netmatch

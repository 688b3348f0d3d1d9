#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "graph/Profile.hpp"

namespace netmatch {

// Arena of profiles keyed by id. Populated once by load(), read-only afterwards.
class ProfileStore {
public:
    // Builds the whole store from scratch. Missing back-edges are inserted,
    // duplicate edges collapsed. Throws DataIntegrityError on dangling ids,
    // self edges, duplicate profile ids or out-of-range interaction data; the
    // previous contents are kept in that case.
    void load(std::vector<Profile> profiles, const std::vector<ConnectionEdge>& edges = {});

    // NotFoundError if absent
    const Profile& get(const std::string& id) const;

    const Profile* find(const std::string& id) const;
    bool contains(const std::string& id) const { return m_index.count(id) != 0; }

    // every profile except `id`, in load order
    std::vector<const Profile*> all_except(const std::string& id) const;

    const std::vector<Profile>& profiles() const { return m_profiles; }
    size_t size() const { return m_profiles.size(); }
    bool empty() const { return m_profiles.empty(); }

    // sum of connection-list lengths / 2
    size_t edge_count() const;

private:
    std::vector<Profile> m_profiles;
    std::unordered_map<std::string, size_t> m_index;
};

}  // namespace netmatch

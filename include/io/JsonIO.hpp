#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "graph/Profile.hpp"
#include "match/MatchConfig.hpp"
#include "nlohmann/json.hpp"

namespace netmatch {

struct NetworkData {
    std::vector<Profile> profiles;
    std::vector<ConnectionEdge> edges;
};

// Network document:
//   {"profiles": [ {...}, ... ] | {"<id>": {...}, ...},
//    "connections": [["a","b"], ...],                        (optional)
//    "interactions": [{"source_id","target_id",...}, ...]}   (optional)
// Structural / type problems throw DataIntegrityError naming the JSON path
// ("root.profiles[3].skills[0] must be a string"). Referential checks are
// left to ProfileStore::load.
NetworkData parse_network(const nlohmann::json& j);

// runtime_error if the file cannot be read or is not JSON
NetworkData load_network(const std::string& path);

nlohmann::json profile_to_json(const Profile& p);
nlohmann::json network_to_json(const std::vector<Profile>& profiles);
void save_network(const std::filesystem::path& path, const std::vector<Profile>& profiles);

// Unknown keys are ignored, missing keys keep their defaults.
// ValidationError on wrong types or values rejected by MatchConfig::validate().
MatchConfig parse_match_config(const nlohmann::json& j);
MatchConfig load_match_config(const std::string& path);

// pretty-printed, parent directories created
void write_json(const std::filesystem::path& path, const nlohmann::json& j);

}  // namespace netmatch

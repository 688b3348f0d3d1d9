#include "io/JsonIO.hpp"

#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "match/RankingStrategy.hpp"
#include "util/Errors.hpp"

using json = nlohmann::json;

namespace netmatch {

static std::string at_index(const std::string& where, size_t i) {
    std::ostringstream oss;
    oss << where << "[" << i << "]";
    return oss.str();
}

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw DataIntegrityError(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw DataIntegrityError(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw DataIntegrityError(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw DataIntegrityError(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

// first present, non-null key out of a list of aliases
static const json* find_field(const json& j, std::initializer_list<const char*> keys, const char** used) {
    for (const char* k : keys) {
        auto it = j.find(k);
        if (it != j.end() && !it->is_null()) {
            if (used) *used = k;
            return &*it;
        }
    }
    return nullptr;
}

static std::optional<std::string> optional_string(const json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw DataIntegrityError(where + "." + std::string(key) + " must be a string");
    }
    return it->get<std::string>();
}

static std::string string_or_empty(const json& j, const char* key, const std::string& where) {
    return optional_string(j, key, where).value_or("");
}

static std::vector<std::string> string_array(const json& arr, const std::string& where) {
    require_array(arr, where);
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            throw DataIntegrityError(at_index(where, i) + " must be a string");
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

static Interaction parse_interaction(const json& j, const std::string& where) {
    require_object(j, where);

    Interaction it;
    const char* key = nullptr;

    if (const json* f = find_field(j, {"frequency", "email_frequency"}, &key)) {
        if (!f->is_number_integer()) {
            throw DataIntegrityError(where + "." + key + " must be an integer");
        }
        it.frequency = f->get<int>();
    }
    if (const json* s = find_field(j, {"strength", "relationship_strength"}, &key)) {
        if (!s->is_number()) {
            throw DataIntegrityError(where + "." + key + " must be a number");
        }
        it.strength = s->get<double>();
    }
    it.last_contact = string_or_empty(j, "last_contact", where);
    it.type = string_or_empty(j, "interaction_type", where);
    return it;
}

static Education parse_education(const json& j, const std::string& where) {
    require_object(j, where);

    Education e;
    e.university = optional_string(j, "university", where);
    e.degree = optional_string(j, "degree", where);
    e.field = optional_string(j, "field", where);
    return e;
}

static WorkEntry parse_work_entry(const json& j, const std::string& where) {
    require_object(j, where);

    WorkEntry w;
    w.company = require_string(j, "company", where);
    w.title = string_or_empty(j, "title", where);
    w.start_date = string_or_empty(j, "start_date", where);
    w.end_date = optional_string(j, "end_date", where);

    auto it = j.find("is_current");
    if (it != j.end() && !it->is_null()) {
        if (!it->is_boolean()) throw DataIntegrityError(where + ".is_current must be a boolean");
        w.is_current = it->get<bool>();
    } else {
        w.is_current = !w.end_date.has_value();
    }
    return w;
}

static Profile parse_profile(const json& j, const std::string& where) {
    require_object(j, where);

    Profile p;
    p.id = require_string(j, "id", where);
    p.name = require_string(j, "name", where);
    p.job_title = string_or_empty(j, "job_title", where);
    p.company = string_or_empty(j, "company", where);
    p.company_size = string_or_empty(j, "company_size", where);
    p.industry = string_or_empty(j, "industry", where);
    p.bio = string_or_empty(j, "bio", where);

    if (auto it = j.find("skills"); it != j.end() && !it->is_null()) {
        p.skills = string_array(*it, where + ".skills");
    }

    if (auto it = j.find("education"); it != j.end() && !it->is_null()) {
        p.education = parse_education(*it, where + ".education");
    }

    if (auto it = j.find("work_history"); it != j.end() && !it->is_null()) {
        const std::string w = where + ".work_history";
        require_array(*it, w);
        for (size_t i = 0; i < it->size(); ++i) {
            p.work_history.push_back(parse_work_entry(it->at(i), at_index(w, i)));
        }
    }

    const char* key = nullptr;
    if (const json* c = find_field(j, {"connections", "linkedin_connections"}, &key)) {
        p.connections = string_array(*c, where + "." + key);
    }

    if (const json* ints = find_field(j, {"interactions", "email_interactions"}, &key)) {
        const std::string w = where + "." + key;
        require_object(*ints, w);
        for (auto it = ints->begin(); it != ints->end(); ++it) {
            p.interactions[it.key()] = parse_interaction(it.value(), w + "." + it.key());
        }
    }

    return p;
}

static void merge_interaction_records(const json& arr, std::vector<Profile>& profiles) {
    const std::string where = "root.interactions";
    require_array(arr, where);

    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < profiles.size(); ++i) index.emplace(profiles[i].id, i);

    for (size_t i = 0; i < arr.size(); ++i) {
        const std::string w = at_index(where, i);
        const json& rec = arr.at(i);
        require_object(rec, w);

        const std::string src = require_string(rec, "source_id", w);
        const std::string dst = require_string(rec, "target_id", w);

        auto it = index.find(src);
        if (it == index.end()) {
            throw DataIntegrityError(w + ".source_id references unknown profile " + src);
        }

        // a per-profile record for the same pair wins
        profiles[it->second].interactions.emplace(dst, parse_interaction(rec, w));
    }
}

NetworkData parse_network(const json& j) {
    require_object(j, "root");

    if (!j.contains("profiles")) {
        throw DataIntegrityError("root missing required field: profiles");
    }

    NetworkData out;
    const json& ps = j.at("profiles");

    if (ps.is_array()) {
        for (size_t i = 0; i < ps.size(); ++i) {
            out.profiles.push_back(parse_profile(ps.at(i), at_index("root.profiles", i)));
        }
    } else if (ps.is_object()) {
        for (auto it = ps.begin(); it != ps.end(); ++it) {
            const std::string w = "root.profiles." + it.key();
            Profile p = parse_profile(it.value(), w);
            if (p.id != it.key()) {
                throw DataIntegrityError(w + ".id does not match its key (" + p.id + ")");
            }
            out.profiles.push_back(std::move(p));
        }
    } else {
        throw DataIntegrityError("root.profiles must be an array or an object");
    }

    if (auto it = j.find("connections"); it != j.end() && !it->is_null()) {
        require_array(*it, "root.connections");
        for (size_t i = 0; i < it->size(); ++i) {
            const std::string w = at_index("root.connections", i);
            const json& pair = it->at(i);
            if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string() || !pair[1].is_string()) {
                throw DataIntegrityError(w + " must be a [\"a\", \"b\"] pair of ids");
            }
            out.edges.push_back(ConnectionEdge{pair[0].get<std::string>(), pair[1].get<std::string>()});
        }
    }

    if (auto it = j.find("interactions"); it != j.end() && !it->is_null()) {
        merge_interaction_records(*it, out.profiles);
    }

    return out;
}

NetworkData load_network(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open network file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON in " + path + ": " + e.what());
    }

    return parse_network(j);
}

static json optional_to_json(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

json profile_to_json(const Profile& p) {
    json j;
    j["id"] = p.id;
    j["name"] = p.name;
    j["job_title"] = p.job_title;
    j["company"] = p.company;
    j["company_size"] = p.company_size;
    j["industry"] = p.industry;
    j["bio"] = p.bio;
    j["skills"] = p.skills;

    if (p.education) {
        j["education"] = {
            {"university", optional_to_json(p.education->university)},
            {"degree", optional_to_json(p.education->degree)},
            {"field", optional_to_json(p.education->field)}
        };
    } else {
        j["education"] = nullptr;
    }

    json wh = json::array();
    for (const auto& w : p.work_history) {
        wh.push_back({
            {"company", w.company},
            {"title", w.title},
            {"start_date", w.start_date},
            {"end_date", optional_to_json(w.end_date)},
            {"is_current", w.is_current}
        });
    }
    j["work_history"] = wh;

    j["connections"] = p.connections;

    json ints = json::object();
    for (const auto& kv : p.interactions) {
        json it = {
            {"frequency", kv.second.frequency},
            {"last_contact", kv.second.last_contact},
            {"strength", kv.second.strength}
        };
        if (!kv.second.type.empty()) it["interaction_type"] = kv.second.type;
        ints[kv.first] = it;
    }
    j["interactions"] = ints;

    return j;
}

json network_to_json(const std::vector<Profile>& profiles) {
    json arr = json::array();
    size_t degree_sum = 0;
    for (const auto& p : profiles) {
        arr.push_back(profile_to_json(p));
        degree_sum += p.connections.size();
    }

    json j;
    j["profiles"] = arr;
    j["metadata"] = {
        {"total_profiles", profiles.size()},
        {"total_connections", degree_sum / 2}
    };
    return j;
}

void save_network(const std::filesystem::path& path, const std::vector<Profile>& profiles) {
    write_json(path, network_to_json(profiles));
}

static double config_number(const json& j, const char* key, double def, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end()) return def;
    if (!it->is_number()) throw ValidationError(where + "." + key + " must be a number");
    return it->get<double>();
}

static size_t config_count(const json& j, const char* key, size_t def, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end()) return def;
    if (!it->is_number_integer() || it->get<long long>() < 0) {
        throw ValidationError(where + "." + key + " must be a non-negative integer");
    }
    return it->get<size_t>();
}

MatchConfig parse_match_config(const json& j) {
    if (!j.is_object()) throw ValidationError("config root must be an object");

    MatchConfig cfg;

    if (auto it = j.find("weights"); it != j.end()) {
        const json& w = *it;
        if (!w.is_object()) throw ValidationError("config.weights must be an object");
        const std::string where = "config.weights";
        cfg.weights.semantic = config_number(w, "semantic", cfg.weights.semantic, where);
        cfg.weights.relationship = config_number(w, "relationship", cfg.weights.relationship, where);
        cfg.weights.mutual = config_number(w, "mutual", cfg.weights.mutual, where);
        cfg.weights.company = config_number(w, "company", cfg.weights.company, where);
        cfg.weights.education = config_number(w, "education", cfg.weights.education, where);
        cfg.weights.query_relevance = config_number(w, "query_relevance", cfg.weights.query_relevance, where);
    }

    if (auto it = j.find("strategy"); it != j.end()) {
        if (!it->is_string()) throw ValidationError("config.strategy must be a string");
        cfg.strategy = parse_ranking_mode(it->get<std::string>());
    }

    cfg.mutual_limit = config_count(j, "mutual_limit", cfg.mutual_limit, "config");
    cfg.scoring_workers = config_count(j, "scoring_workers", cfg.scoring_workers, "config");

    if (auto it = j.find("embed_profiles"); it != j.end()) {
        if (!it->is_boolean()) throw ValidationError("config.embed_profiles must be a boolean");
        cfg.embed_profiles = it->get<bool>();
    }

    if (auto it = j.find("stats"); it != j.end()) {
        if (!it->is_object()) throw ValidationError("config.stats must be an object");
        const std::string where = "config.stats";
        cfg.stats.top_companies = config_count(*it, "top_companies", cfg.stats.top_companies, where);
        cfg.stats.top_industries = config_count(*it, "top_industries", cfg.stats.top_industries, where);
        cfg.stats.top_job_titles = config_count(*it, "top_job_titles", cfg.stats.top_job_titles, where);
    }

    cfg.validate();
    return cfg;
}

MatchConfig load_match_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ValidationError("failed to open config file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw ValidationError("failed to parse config " + path + ": " + e.what());
    }
    return parse_match_config(j);
}

void write_json(const std::filesystem::path& path, const json& j) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());

    out << j.dump(2) << "\n";
}

}  // namespace netmatch

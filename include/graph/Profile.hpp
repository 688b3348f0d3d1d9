#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace netmatch {

struct Education {
    std::optional<std::string> university;
    std::optional<std::string> degree;     // "BS", "MS", "PhD", ...
    std::optional<std::string> field;
};

struct WorkEntry {
    std::string company;
    std::string title;
    std::string start_date;                // ISO date, may be empty
    std::optional<std::string> end_date;   // absent for the current role
    bool is_current = false;
};

// Directed record: how the owning profile interacts with one target.
struct Interaction {
    int frequency = 0;          // contacts per month
    std::string last_contact;   // ISO date
    double strength = 0.0;      // 0..1
    std::string type;           // "professional" | "personal" | "mixed", may be empty
};

struct Profile {
    std::string id;             // unique, opaque
    std::string name;
    std::string job_title;
    std::string company;
    std::string company_size;   // "10000+", "100-500", ...
    std::string industry;
    std::string bio;

    std::vector<std::string> skills;
    std::optional<Education> education;
    std::vector<WorkEntry> work_history;

    // adjacency by id only; the store owns the records
    std::vector<std::string> connections;
    std::unordered_map<std::string, Interaction> interactions;
};

struct ProfileSummary {
    std::string id;
    std::string name;
    std::string job_title;
    std::string company;
};

inline ProfileSummary summarize(const Profile& p) {
    return ProfileSummary{p.id, p.name, p.job_title, p.company};
}

// Extra undirected edge supplied next to the per-profile connection lists.
struct ConnectionEdge {
    std::string a;
    std::string b;
};

}  // namespace netmatch
